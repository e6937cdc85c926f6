#include <tether/codec.hpp>

#include <optional>
#include <string>
#include <type_traits>
#include <variant>

#include <tether/internal.hpp>
#include <tether/wire.hpp>

namespace tether {

namespace {

constexpr const char* kIsCycleKey = "isCycle";

// --------------------------
// Encoding helpers
// --------------------------

template <typename T>
std::vector<Primitive> ToPrimitives(const std::vector<T>& values) {
  std::vector<Primitive> out;
  out.reserve(values.size());
  for (const auto& v : values) out.emplace_back(std::in_place_type<T>, v);
  return out;
}

// Leaf field value -> record attribute. Returns false for values a record
// cannot hold (dictionaries). Absent values leave `out` empty.
bool LeafToAttribute(const FieldValue& value, std::optional<AttributeValue>* out) {
  return std::visit(
      [out](const auto& v) -> bool {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, std::monostate>) {
          return true;
        } else if constexpr (std::is_same_v<V, bool> || std::is_same_v<V, int64_t> ||
                             std::is_same_v<V, double> || std::is_same_v<V, std::string> ||
                             std::is_same_v<V, Timestamp>) {
          out->emplace(Primitive(std::in_place_type<V>, v));
          return true;
        } else if constexpr (std::is_same_v<V, Blob>) {
          out->emplace(Asset{v.bytes});
          return true;
        } else if constexpr (std::is_same_v<V, std::vector<Blob>>) {
          std::vector<Asset> assets;
          assets.reserve(v.size());
          for (const auto& b : v) assets.push_back(Asset{b.bytes});
          out->emplace(std::move(assets));
          return true;
        } else if constexpr (std::is_same_v<V, std::vector<bool>>) {
          std::vector<Primitive> prims;
          prims.reserve(v.size());
          for (bool b : v) prims.emplace_back(std::in_place_type<bool>, b);
          out->emplace(std::move(prims));
          return true;
        } else if constexpr (std::is_same_v<V, std::vector<int64_t>> ||
                             std::is_same_v<V, std::vector<double>> ||
                             std::is_same_v<V, std::vector<std::string>> ||
                             std::is_same_v<V, std::vector<Timestamp>>) {
          out->emplace(ToPrimitives(v));
          return true;
        } else {
          // NodeLink / NodeLinkList are handled by the caller; Dictionary is
          // not representable.
          return false;
        }
      },
      value);
}

std::string_view JsonKindName(const Json::Value& v) {
  switch (v.type()) {
    case Json::nullValue: return "null";
    case Json::intValue:
    case Json::uintValue: return "int";
    case Json::realValue: return "double";
    case Json::stringValue: return "string";
    case Json::booleanValue: return "bool";
    case Json::arrayValue: return "array";
    case Json::objectValue: return "object";
  }
  return "unknown";
}

bool JsonToPrimitive(const Json::Value& v, Primitive* out) {
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
    default:
      return false;
  }
}

// Custom encoders emit plain JSON: scalars and arrays of scalars.
bool CustomLeafToAttribute(const Json::Value& v, AttributeValue* out) {
  if (v.isArray()) {
    std::vector<Primitive> prims;
    for (const auto& item : v) {
      if (item.isNull()) continue;
      Primitive p;
      if (!JsonToPrimitive(item, &p)) return false;
      prims.push_back(std::move(p));
    }
    *out = std::move(prims);
    return true;
  }
  Primitive p;
  if (!JsonToPrimitive(v, &p)) return false;
  *out = std::move(p);
  return true;
}

// --------------------------
// Sanitizing helpers
// --------------------------

Json::Value SanitizePrimitive(const Primitive& p) {
  if (const auto* t = std::get_if<Timestamp>(&p)) return Json::Value(t->ToSeconds());
  return PrimitiveToJson(p);
}

// --------------------------
// Decoding helpers
// --------------------------

Status Mismatch(const TypeDescriptor& type, const FieldDescriptor& f,
                const Json::Value& v) {
  return Status::MappingError(type.record_type(), f.name,
                              "expected " + std::string(FieldKindName(f.kind)) +
                                  ", found " + std::string(JsonKindName(v)));
}

bool DecodeScalar(FieldKind kind, const Json::Value& v, FieldValue* out) {
  switch (kind) {
    case FieldKind::kBool:
    case FieldKind::kBoolList:
      if (!v.isBool()) return false;
      out->emplace<bool>(v.asBool());
      return true;
    case FieldKind::kInt:
    case FieldKind::kIntList:
      if (!v.isInt64()) return false;
      out->emplace<int64_t>(static_cast<int64_t>(v.asInt64()));
      return true;
    case FieldKind::kDouble:
    case FieldKind::kDoubleList:
      if (!v.isNumeric() || v.isBool()) return false;
      out->emplace<double>(v.asDouble());
      return true;
    case FieldKind::kString:
    case FieldKind::kStringList:
      if (!v.isString()) return false;
      out->emplace<std::string>(v.asString());
      return true;
    case FieldKind::kTimestamp:
    case FieldKind::kTimestampList:
      if (!v.isNumeric() || v.isBool()) return false;
      out->emplace<Timestamp>(Timestamp::FromSeconds(v.asDouble()));
      return true;
    case FieldKind::kBlob:
    case FieldKind::kBlobList: {
      if (!v.isString()) return false;
      Blob blob;
      if (!internal::Base64Decode(v.asString(), &blob.bytes)) return false;
      out->emplace<Blob>(std::move(blob));
      return true;
    }
    default:
      return false;
  }
}

template <typename T>
bool DecodeList(FieldKind kind, const Json::Value& v, FieldValue* out) {
  std::vector<T> list;
  list.reserve(v.size());
  for (const auto& item : v) {
    if (item.isNull()) continue;
    FieldValue element;
    if (!DecodeScalar(kind, item, &element)) return false;
    list.push_back(std::get<T>(std::move(element)));
  }
  out->emplace<std::vector<T>>(std::move(list));
  return true;
}

bool DecodeLeaf(FieldKind kind, const Json::Value& v, FieldValue* out) {
  switch (kind) {
    case FieldKind::kBoolList:
      return v.isArray() && DecodeList<bool>(kind, v, out);
    case FieldKind::kIntList:
      return v.isArray() && DecodeList<int64_t>(kind, v, out);
    case FieldKind::kDoubleList:
      return v.isArray() && DecodeList<double>(kind, v, out);
    case FieldKind::kStringList:
      return v.isArray() && DecodeList<std::string>(kind, v, out);
    case FieldKind::kTimestampList:
      return v.isArray() && DecodeList<Timestamp>(kind, v, out);
    case FieldKind::kBlobList:
      return v.isArray() && DecodeList<Blob>(kind, v, out);
    default:
      return DecodeScalar(kind, v, out);
  }
}

std::optional<Timestamp> SanitizedTimestamp(const Json::Value& json, const char* key) {
  if (!json.isMember(key) || !json[key].isNumeric()) return std::nullopt;
  return Timestamp::FromSeconds(json[key].asDouble());
}

std::optional<std::string> SanitizedString(const Json::Value& json, const char* key) {
  if (!json.isMember(key) || !json[key].isString()) return std::nullopt;
  return json[key].asString();
}

Status DecodeStaged(const Json::Value& json, const TypeDescriptor& type,
                    DecodeSession* session, NodeId* out);

Status DecodeReferenceValue(const Json::Value& v, const FieldDescriptor& f,
                            const TypeDescriptor& owner, DecodeSession* session,
                            NodeId* out) {
  if (RecordCodec::IsCycleMarker(v)) {
    const std::string identity = v[kIdentityKey].asString();
    auto it = session->nodes_by_identity.find(identity);
    if (it == session->nodes_by_identity.end()) {
      return Status::MappingError(owner.record_type(), f.name,
                                  "cycle marker names undecoded identity " + identity);
    }
    *out = it->second;
    return Status::OK();
  }

  if (v.isObject() && v.isMember(kRecordTypeKey)) {
    const TypeDescriptor* target = f.Target();
    if (!target) {
      return Status::MappingError(owner.record_type(), f.name, "field has no target type");
    }
    return DecodeStaged(v, *target, session, out);
  }

  return Status::MappingError(owner.record_type(), f.name,
                              "reference was not resolved to an object");
}

// Rewrite staged indexes in the reference fields of `model` to graph ids.
void RebaseReferences(Model* model, NodeId base) {
  for (const auto& f : model->Descriptor().fields()) {
    if (f.kind == FieldKind::kReference) {
      FieldValue v = f.get(*model);
      const auto* link = std::get_if<NodeLink>(&v);
      if (!link || link->node == kNullNode) continue;
      f.set(*model, NodeLink{base + link->node});
    } else if (f.kind == FieldKind::kReferenceList) {
      FieldValue v = f.get(*model);
      auto* list = std::get_if<NodeLinkList>(&v);
      if (!list) continue;
      for (auto& node : list->nodes) {
        if (node != kNullNode) node += base;
      }
      f.set(*model, std::move(*list));
    }
  }
}

}  // namespace

// ---------------------------------------------------------------------------
// Encode
// ---------------------------------------------------------------------------

Status RecordCodec::EncodeLeaves(const Model& model, Record* record,
                                 std::vector<ReferenceField>* references) {
  const TypeDescriptor& type = model.Descriptor();
  record->record_type = type.record_type();

  if (type.has_custom_codec()) {
    Json::Value leaves;
    Status s = type.custom_encoder()(model, &leaves);
    if (!s.ok()) return s;
    if (!leaves.isObject()) {
      return Status::MappingError(type.record_type(), {},
                                  "custom encoder must produce a JSON object");
    }
    for (const auto& name : leaves.getMemberNames()) {
      if (IsSystemFieldName(name)) continue;
      const FieldDescriptor* f = type.Find(name);
      if (f && IsReferenceKind(f->kind)) continue;  // graph-managed
      const Json::Value& v = leaves[name];
      if (v.isNull()) continue;
      AttributeValue attr;
      if (!CustomLeafToAttribute(v, &attr)) {
        return Status::UnsupportedFieldType(name, type.record_type(), JsonKindName(v));
      }
      record->Set(name, std::move(attr));
    }
  }

  for (const auto& f : type.fields()) {
    if (IsSystemFieldName(f.name)) continue;

    if (f.kind == FieldKind::kReference) {
      ReferenceField ref;
      ref.field = &f;
      FieldValue v = f.get(model);
      if (const auto* link = std::get_if<NodeLink>(&v)) ref.node = link->node;
      references->push_back(std::move(ref));
      continue;
    }
    if (f.kind == FieldKind::kReferenceList) {
      ReferenceField ref;
      ref.field = &f;
      ref.is_list = true;
      FieldValue v = f.get(model);
      if (auto* list = std::get_if<NodeLinkList>(&v)) ref.nodes = std::move(list->nodes);
      references->push_back(std::move(ref));
      continue;
    }

    if (type.has_custom_codec()) continue;

    std::optional<AttributeValue> attr;
    if (!LeafToAttribute(f.get(model), &attr)) {
      return Status::UnsupportedFieldType(f.name, type.record_type(), FieldKindName(f.kind));
    }
    if (attr) record->Set(f.name, std::move(*attr));
  }

  return Status::OK();
}

// ---------------------------------------------------------------------------
// Sanitize
// ---------------------------------------------------------------------------

Json::Value RecordCodec::SanitizeValue(const AttributeValue& value) {
  return std::visit(
      [](const auto& v) -> Json::Value {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, Primitive>) {
          return SanitizePrimitive(v);
        } else if constexpr (std::is_same_v<V, Asset>) {
          return Json::Value(internal::Base64Encode(v.bytes));
        } else if constexpr (std::is_same_v<V, Reference>) {
          Json::Value r(Json::objectValue);
          r[kIdentityKey] = v.identity;
          return r;
        } else {
          Json::Value list(Json::arrayValue);
          for (const auto& item : v) list.append(SanitizeValue(AttributeValue(item)));
          return list;
        }
      },
      value);
}

Json::Value RecordCodec::Sanitize(const Record& record) {
  Json::Value json(Json::objectValue);
  json[kRecordTypeKey] = record.record_type;
  if (!record.identity.empty()) json[kIdentityKey] = record.identity;

  const SystemFields& sys = record.system;
  if (sys.created_by) json[kCreatedByKey] = *sys.created_by;
  if (sys.created_at) json[kCreatedAtKey] = sys.created_at->ToSeconds();
  if (sys.modified_by) json[kModifiedByKey] = *sys.modified_by;
  if (sys.modified_at) json[kModifiedAtKey] = sys.modified_at->ToSeconds();
  if (sys.change_tag) json[kChangeTagKey] = *sys.change_tag;

  for (const auto& [name, value] : record.attributes) {
    json[name] = SanitizeValue(value);
  }
  return json;
}

// ---------------------------------------------------------------------------
// Decode
// ---------------------------------------------------------------------------

Status RecordCodec::DecodeObject(const Json::Value& json, const TypeDescriptor& type,
                                 DecodeSession* session, NodeId* out) {
  session->staged.clear();
  session->nodes_by_identity.clear();

  NodeId root = kNullNode;
  Status s = DecodeStaged(json, type, session, &root);
  if (!s.ok()) {
    session->staged.clear();
    session->nodes_by_identity.clear();
    return s;
  }

  const NodeId count = static_cast<NodeId>(session->staged.size());
  const NodeId base = session->graph->AddAll(std::move(session->staged));
  session->staged.clear();
  session->nodes_by_identity.clear();
  for (NodeId i = 0; i < count; ++i) RebaseReferences(session->graph->Get(base + i), base);

  *out = base + root;
  return Status::OK();
}

namespace {

Status DecodeStaged(const Json::Value& json, const TypeDescriptor& type,
                    DecodeSession* session, NodeId* out) {
  if (!json.isObject()) {
    return Status::MappingError(type.record_type(), {}, "expected a JSON object");
  }
  if (json.isMember(kRecordTypeKey) &&
      json[kRecordTypeKey].asString() != type.record_type()) {
    return Status::MappingError(type.record_type(), kRecordTypeKey,
                                "record type " + json[kRecordTypeKey].asString() +
                                    " does not match");
  }

  std::string identity;
  if (json.isMember(kIdentityKey) && json[kIdentityKey].isString()) {
    identity = json[kIdentityKey].asString();
  }

  SystemFields sys;
  sys.created_by = SanitizedString(json, kCreatedByKey);
  sys.created_at = SanitizedTimestamp(json, kCreatedAtKey);
  sys.modified_by = SanitizedString(json, kModifiedByKey);
  sys.modified_at = SanitizedTimestamp(json, kModifiedAtKey);
  sys.change_tag = SanitizedString(json, kChangeTagKey);

  // Registered before the fields are decoded so cycle markers below can
  // name this node.
  const NodeId node = static_cast<NodeId>(session->staged.size());
  session->staged.push_back(ObjectGraph::NewNode{type.Create(), identity, std::move(sys)});
  if (!identity.empty()) session->nodes_by_identity[identity] = node;
  Model* model = session->staged.back().model.get();

  if (type.has_custom_codec()) {
    Status s = type.custom_decoder()(json, model);
    if (!s.ok()) {
      if (s.IsMappingError()) return s;
      return Status::MappingError(type.record_type(), s.field(), s.ToString());
    }
  }

  for (const auto& f : type.fields()) {
    if (IsSystemFieldName(f.name)) continue;
    if (type.has_custom_codec() && !IsReferenceKind(f.kind)) continue;

    const bool present = json.isMember(f.name) && !json[f.name].isNull();

    if (f.kind == FieldKind::kReference) {
      if (!present) continue;
      NodeId child = kNullNode;
      Status s = DecodeReferenceValue(json[f.name], f, type, session, &child);
      if (!s.ok()) return s;
      f.set(*model, NodeLink{child});
      continue;
    }

    if (f.kind == FieldKind::kReferenceList) {
      if (!present) continue;
      const Json::Value& list = json[f.name];
      if (!list.isArray()) return Mismatch(type, f, list);
      NodeLinkList links;
      for (const auto& item : list) {
        if (item.isNull()) continue;
        NodeId child = kNullNode;
        Status s = DecodeReferenceValue(item, f, type, session, &child);
        if (!s.ok()) return s;
        links.nodes.push_back(child);
      }
      f.set(*model, std::move(links));
      continue;
    }

    if (!present) {
      if (f.nullable) continue;
      return Status::MappingError(type.record_type(), f.name, "missing value");
    }

    if (f.kind == FieldKind::kDictionary) {
      return Status::UnsupportedFieldType(f.name, type.record_type(), FieldKindName(f.kind));
    }

    FieldValue value;
    if (!DecodeLeaf(f.kind, json[f.name], &value)) return Mismatch(type, f, json[f.name]);
    f.set(*model, std::move(value));
  }

  *out = node;
  return Status::OK();
}

}  // namespace

Json::Value RecordCodec::CycleMarker(const std::string& identity) {
  Json::Value marker(Json::objectValue);
  marker[kIdentityKey] = identity;
  marker[kIsCycleKey] = true;
  return marker;
}

bool RecordCodec::IsCycleMarker(const Json::Value& json) {
  return json.isObject() && json.isMember(kIsCycleKey) && json[kIsCycleKey].isBool() &&
         json[kIsCycleKey].asBool() && json[kIdentityKey].isString();
}

}  // namespace tether
