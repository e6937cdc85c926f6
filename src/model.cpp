#include <tether/model.hpp>

namespace tether {

bool IsSystemFieldName(std::string_view name) {
  return name == kIdentityKey || name == kRecordTypeKey || name == kCreatedByKey ||
         name == kCreatedAtKey || name == kModifiedByKey || name == kModifiedAtKey ||
         name == kChangeTagKey;
}

std::string_view FieldKindName(FieldKind kind) {
  switch (kind) {
    case FieldKind::kBool: return "bool";
    case FieldKind::kInt: return "int";
    case FieldKind::kDouble: return "double";
    case FieldKind::kString: return "string";
    case FieldKind::kTimestamp: return "timestamp";
    case FieldKind::kBlob: return "blob";
    case FieldKind::kBoolList: return "bool[]";
    case FieldKind::kIntList: return "int[]";
    case FieldKind::kDoubleList: return "double[]";
    case FieldKind::kStringList: return "string[]";
    case FieldKind::kTimestampList: return "timestamp[]";
    case FieldKind::kBlobList: return "blob[]";
    case FieldKind::kReference: return "reference";
    case FieldKind::kReferenceList: return "reference[]";
    case FieldKind::kDictionary: return "dictionary";
  }
  return "unknown";
}

const FieldDescriptor* TypeDescriptor::Find(std::string_view name) const {
  for (const auto& f : fields_) {
    if (f.name == name) return &f;
  }
  return nullptr;
}

}  // namespace tether
