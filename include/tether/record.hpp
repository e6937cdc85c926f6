#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <tether/model.hpp>

namespace tether {

/** Attribute value naming another record's identity. */
struct Reference {
  std::string identity;

  bool operator==(const Reference& o) const { return identity == o.identity; }
  bool operator!=(const Reference& o) const { return identity != o.identity; }
};

/** Store-native wrapper around blob bytes. */
struct Asset {
  std::string bytes;

  bool operator==(const Asset& o) const { return bytes == o.bytes; }
  bool operator!=(const Asset& o) const { return bytes != o.bytes; }
};

using Primitive = std::variant<bool, int64_t, double, std::string, Timestamp>;

using AttributeValue = std::variant<Primitive, Asset, Reference,
                                    std::vector<Primitive>,
                                    std::vector<Asset>,
                                    std::vector<Reference>>;

/**
 * Store-native representation of one object: a flat attribute map plus the
 * identity and the five system attributes.
 */
struct Record {
  std::string record_type;
  std::string identity;  // empty until the store assigns one
  SystemFields system;
  std::map<std::string, AttributeValue> attributes;

  bool Has(std::string_view name) const;
  const AttributeValue* Get(std::string_view name) const;
  void Set(std::string name, AttributeValue value);
  bool Erase(std::string_view name);

  /** Every identity this record references, in attribute order. */
  std::vector<std::string> ReferencedIdentities() const;
};

bool operator==(const Record& a, const Record& b);
inline bool operator!=(const Record& a, const Record& b) { return !(a == b); }

}  // namespace tether
