#include <tether/record.hpp>

namespace tether {

bool Record::Has(std::string_view name) const {
  return attributes.find(std::string(name)) != attributes.end();
}

const AttributeValue* Record::Get(std::string_view name) const {
  auto it = attributes.find(std::string(name));
  return it == attributes.end() ? nullptr : &it->second;
}

void Record::Set(std::string name, AttributeValue value) {
  attributes[std::move(name)] = std::move(value);
}

bool Record::Erase(std::string_view name) {
  return attributes.erase(std::string(name)) > 0;
}

std::vector<std::string> Record::ReferencedIdentities() const {
  std::vector<std::string> out;
  for (const auto& [name, value] : attributes) {
    if (const auto* ref = std::get_if<Reference>(&value)) {
      out.push_back(ref->identity);
    } else if (const auto* refs = std::get_if<std::vector<Reference>>(&value)) {
      for (const auto& r : *refs) out.push_back(r.identity);
    }
  }
  return out;
}

bool operator==(const Record& a, const Record& b) {
  return a.record_type == b.record_type && a.identity == b.identity &&
         a.system.created_by == b.system.created_by &&
         a.system.created_at == b.system.created_at &&
         a.system.modified_by == b.system.modified_by &&
         a.system.modified_at == b.system.modified_at &&
         a.system.change_tag == b.system.change_tag &&
         a.attributes == b.attributes;
}

}  // namespace tether
