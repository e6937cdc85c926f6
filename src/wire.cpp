#include <tether/wire.hpp>

#include <memory>
#include <type_traits>
#include <variant>

#include <tether/internal.hpp>

namespace tether {

namespace {

constexpr const char* kAssetKey = "asset";
constexpr const char* kTimestampKey = "timestamp";

Json::Value TimestampToJson(const Timestamp& t) {
  Json::Value v(Json::objectValue);
  v[kTimestampKey] = Json::Int64(t.micros);
  return v;
}

bool IsTimestampObject(const Json::Value& v) {
  return v.isObject() && v.size() == 1 && v.isMember(kTimestampKey) &&
         v[kTimestampKey].isIntegral();
}

bool PrimitiveFromJson(const Json::Value& v, Primitive* out) {
  switch (v.type()) {
    case Json::booleanValue:
      *out = v.asBool();
      return true;
    case Json::intValue:
      *out = static_cast<int64_t>(v.asInt64());
      return true;
    case Json::uintValue:
      if (!v.isInt64()) return false;
      *out = static_cast<int64_t>(v.asInt64());
      return true;
    case Json::realValue:
      *out = v.asDouble();
      return true;
    case Json::stringValue:
      *out = v.asString();
      return true;
    case Json::objectValue:
      if (!IsTimestampObject(v)) return false;
      *out = Timestamp{static_cast<int64_t>(v[kTimestampKey].asInt64())};
      return true;
    default:
      return false;
  }
}

bool IsReferenceObject(const Json::Value& v) {
  return v.isObject() && v.size() == 1 && v.isMember(kIdentityKey) &&
         v[kIdentityKey].isString();
}

bool IsAssetObject(const Json::Value& v) {
  return v.isObject() && v.size() == 1 && v.isMember(kAssetKey) &&
         v[kAssetKey].isString();
}

bool AssetFromJson(const Json::Value& v, Asset* out) {
  return internal::Base64Decode(v[kAssetKey].asString(), &out->bytes);
}

bool ReadOptionalString(const Json::Value& json, const char* key,
                        std::optional<std::string>* out) {
  if (!json.isMember(key)) return true;
  if (!json[key].isString()) return false;
  *out = json[key].asString();
  return true;
}

bool ReadOptionalTimestamp(const Json::Value& json, const char* key,
                           std::optional<Timestamp>* out) {
  if (!json.isMember(key)) return true;
  if (!IsTimestampObject(json[key])) return false;
  *out = Timestamp{static_cast<int64_t>(json[key][kTimestampKey].asInt64())};
  return true;
}

}  // namespace

Json::Value PrimitiveToJson(const Primitive& value) {
  return std::visit(
      [](const auto& v) -> Json::Value {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, bool>) {
          return Json::Value(v);
        } else if constexpr (std::is_same_v<V, int64_t>) {
          return Json::Value(Json::Int64(v));
        } else if constexpr (std::is_same_v<V, double>) {
          return Json::Value(v);
        } else if constexpr (std::is_same_v<V, std::string>) {
          return Json::Value(v);
        } else {
          return TimestampToJson(v);
        }
      },
      value);
}

Json::Value AttributeToJson(const AttributeValue& value) {
  return std::visit(
      [](const auto& v) -> Json::Value {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, Primitive>) {
          return PrimitiveToJson(v);
        } else if constexpr (std::is_same_v<V, Asset>) {
          Json::Value a(Json::objectValue);
          a[kAssetKey] = internal::Base64Encode(v.bytes);
          return a;
        } else if constexpr (std::is_same_v<V, Reference>) {
          Json::Value r(Json::objectValue);
          r[kIdentityKey] = v.identity;
          return r;
        } else {
          Json::Value list(Json::arrayValue);
          for (const auto& item : v) list.append(AttributeToJson(AttributeValue(item)));
          return list;
        }
      },
      value);
}

bool AttributeFromJson(const Json::Value& json, AttributeValue* out) {
  if (IsReferenceObject(json)) {
    *out = Reference{json[kIdentityKey].asString()};
    return true;
  }
  if (IsAssetObject(json)) {
    Asset asset;
    if (!AssetFromJson(json, &asset)) return false;
    *out = std::move(asset);
    return true;
  }
  if (json.isArray()) {
    // Element kind is decided by the first element; an empty list is a
    // primitive list.
    if (json.empty()) {
      *out = std::vector<Primitive>{};
      return true;
    }
    const Json::Value& first = json[0];
    if (IsReferenceObject(first)) {
      std::vector<Reference> refs;
      for (const auto& item : json) {
        if (!IsReferenceObject(item)) return false;
        refs.push_back(Reference{item[kIdentityKey].asString()});
      }
      *out = std::move(refs);
      return true;
    }
    if (IsAssetObject(first)) {
      std::vector<Asset> assets;
      for (const auto& item : json) {
        Asset a;
        if (!IsAssetObject(item) || !AssetFromJson(item, &a)) return false;
        assets.push_back(std::move(a));
      }
      *out = std::move(assets);
      return true;
    }
    std::vector<Primitive> prims;
    for (const auto& item : json) {
      Primitive p;
      if (!PrimitiveFromJson(item, &p)) return false;
      prims.push_back(std::move(p));
    }
    *out = std::move(prims);
    return true;
  }

  Primitive p;
  if (!PrimitiveFromJson(json, &p)) return false;
  *out = std::move(p);
  return true;
}

Json::Value RecordToJson(const Record& record) {
  Json::Value json(Json::objectValue);
  json[kRecordTypeKey] = record.record_type;
  if (!record.identity.empty()) json[kIdentityKey] = record.identity;

  const SystemFields& sys = record.system;
  if (sys.created_by) json[kCreatedByKey] = *sys.created_by;
  if (sys.created_at) json[kCreatedAtKey] = TimestampToJson(*sys.created_at);
  if (sys.modified_by) json[kModifiedByKey] = *sys.modified_by;
  if (sys.modified_at) json[kModifiedAtKey] = TimestampToJson(*sys.modified_at);
  if (sys.change_tag) json[kChangeTagKey] = *sys.change_tag;

  for (const auto& [name, value] : record.attributes) {
    json[name] = AttributeToJson(value);
  }
  return json;
}

Status RecordFromJson(const Json::Value& json, Record* out) {
  if (!json.isObject()) {
    return Status::MappingError({}, {}, "record is not a JSON object");
  }
  if (!json[kRecordTypeKey].isString()) {
    return Status::MappingError({}, kRecordTypeKey, "missing record type");
  }

  Record record;
  record.record_type = json[kRecordTypeKey].asString();
  if (json.isMember(kIdentityKey)) {
    if (!json[kIdentityKey].isString()) {
      return Status::MappingError(record.record_type, kIdentityKey, "identity is not a string");
    }
    record.identity = json[kIdentityKey].asString();
  }

  SystemFields& sys = record.system;
  if (!ReadOptionalString(json, kCreatedByKey, &sys.created_by) ||
      !ReadOptionalTimestamp(json, kCreatedAtKey, &sys.created_at) ||
      !ReadOptionalString(json, kModifiedByKey, &sys.modified_by) ||
      !ReadOptionalTimestamp(json, kModifiedAtKey, &sys.modified_at) ||
      !ReadOptionalString(json, kChangeTagKey, &sys.change_tag)) {
    return Status::MappingError(record.record_type, {}, "malformed system attribute");
  }

  for (const auto& name : json.getMemberNames()) {
    if (IsSystemFieldName(name)) continue;
    AttributeValue value;
    if (!AttributeFromJson(json[name], &value)) {
      return Status::MappingError(record.record_type, name, "unrecognized attribute value");
    }
    record.attributes.emplace(name, std::move(value));
  }

  *out = std::move(record);
  return Status::OK();
}

std::string WriteJson(const Json::Value& json) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, json);
}

bool ParseJson(std::string_view text, Json::Value* out, std::string* error) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  std::string errs;
  bool ok = reader->parse(text.data(), text.data() + text.size(), out, &errs);
  if (!ok && error) *error = errs;
  return ok;
}

std::string SerializeRecord(const Record& record) {
  return WriteJson(RecordToJson(record));
}

Status ParseRecord(std::string_view text, Record* out) {
  Json::Value json;
  std::string error;
  if (!ParseJson(text, &json, &error)) {
    return Status::MappingError({}, {}, "invalid record JSON: " + error);
  }
  return RecordFromJson(json, out);
}

}  // namespace tether
