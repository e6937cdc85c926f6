#pragma once

#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <json/json.h>

#include <tether/status.hpp>

namespace tether {

/** Index of an object inside an ObjectGraph. Object identity is index equality. */
using NodeId = uint32_t;
constexpr NodeId kNullNode = std::numeric_limits<NodeId>::max();

/**
 * Point in time, microseconds since the Unix epoch.
 *
 * FromSeconds(ToSeconds()) is exact while |seconds| < 2^33 (about the year
 * 2242). Past that a double cannot tell adjacent microseconds apart.
 */
struct Timestamp {
  int64_t micros = 0;

  static Timestamp FromSeconds(double seconds) {
    // Whole and fractional parts are scaled separately; seconds * 1e6 would
    // round once more once it passes 2^52.
    const double whole = std::floor(seconds);
    const int64_t fraction_us = std::llround((seconds - whole) * 1e6);
    return Timestamp{static_cast<int64_t>(whole) * 1000000 + fraction_us};
  }
  double ToSeconds() const { return static_cast<double>(micros) / 1e6; }

  bool operator==(const Timestamp& o) const { return micros == o.micros; }
  bool operator!=(const Timestamp& o) const { return micros != o.micros; }
  bool operator<(const Timestamp& o) const { return micros < o.micros; }
};

/** Opaque byte payload. Stored as an asset, sanitized to base64. */
struct Blob {
  std::string bytes;

  bool operator==(const Blob& o) const { return bytes == o.bytes; }
  bool operator!=(const Blob& o) const { return bytes != o.bytes; }
};

using Dictionary = std::map<std::string, std::string>;

/** Typed edge to another object in the same ObjectGraph. Null by default. */
template <typename T>
struct Ref {
  NodeId node = kNullNode;

  Ref() = default;
  explicit Ref(NodeId n) : node(n) {}

  bool IsNull() const { return node == kNullNode; }
  explicit operator bool() const { return !IsNull(); }

  bool operator==(const Ref& o) const { return node == o.node; }
  bool operator!=(const Ref& o) const { return node != o.node; }
};

/** Store-assigned attributes every object and record carries. Read-only to callers. */
struct SystemFields {
  std::optional<std::string> created_by;
  std::optional<Timestamp> created_at;
  std::optional<std::string> modified_by;
  std::optional<Timestamp> modified_at;
  std::optional<std::string> change_tag;
};

// Attribute names reserved for identity and system fields.
inline constexpr const char* kIdentityKey = "identity";
inline constexpr const char* kRecordTypeKey = "recordType";
inline constexpr const char* kCreatedByKey = "createdBy";
inline constexpr const char* kCreatedAtKey = "createdAt";
inline constexpr const char* kModifiedByKey = "modifiedBy";
inline constexpr const char* kModifiedAtKey = "modifiedAt";
inline constexpr const char* kChangeTagKey = "changeTag";

bool IsSystemFieldName(std::string_view name);

enum class FieldKind : uint8_t {
  kBool,
  kInt,
  kDouble,
  kString,
  kTimestamp,
  kBlob,
  kBoolList,
  kIntList,
  kDoubleList,
  kStringList,
  kTimestampList,
  kBlobList,
  kReference,
  kReferenceList,
  kDictionary,
};

std::string_view FieldKindName(FieldKind kind);

inline bool IsPrimitiveKind(FieldKind k) {
  return k == FieldKind::kBool || k == FieldKind::kInt || k == FieldKind::kDouble ||
         k == FieldKind::kString || k == FieldKind::kTimestamp;
}

inline bool IsPrimitiveListKind(FieldKind k) {
  return k == FieldKind::kBoolList || k == FieldKind::kIntList ||
         k == FieldKind::kDoubleList || k == FieldKind::kStringList ||
         k == FieldKind::kTimestampList;
}

inline bool IsBlobKind(FieldKind k) {
  return k == FieldKind::kBlob || k == FieldKind::kBlobList;
}

inline bool IsReferenceKind(FieldKind k) {
  return k == FieldKind::kReference || k == FieldKind::kReferenceList;
}

struct NodeLink {
  NodeId node = kNullNode;
};

struct NodeLinkList {
  std::vector<NodeId> nodes;
};

/**
 * Runtime value of one object field. monostate means "absent" (an empty
 * optional or a null reference).
 */
using FieldValue = std::variant<std::monostate,
                                bool, int64_t, double, std::string, Timestamp, Blob,
                                std::vector<bool>, std::vector<int64_t>,
                                std::vector<double>, std::vector<std::string>,
                                std::vector<Timestamp>, std::vector<Blob>,
                                NodeLink, NodeLinkList, Dictionary>;

class TypeDescriptor;

/** Base of every persisted application type. */
class Model {
 public:
  virtual ~Model() = default;
  virtual const TypeDescriptor& Descriptor() const = 0;
};

/** CRTP helper: `struct Person : ModelOf<Person>` with a static `Type()`. */
template <typename T>
class ModelOf : public Model {
 public:
  const TypeDescriptor& Descriptor() const override { return T::Type(); }
};

/** One persisted field: name, kind and accessors. */
struct FieldDescriptor {
  std::string name;
  FieldKind kind = FieldKind::kString;
  bool nullable = false;

  // Resolved lazily so self-referencing types can describe themselves.
  const TypeDescriptor* (*target)() = nullptr;

  std::function<FieldValue(const Model&)> get;
  std::function<void(Model&, FieldValue&&)> set;

  const TypeDescriptor* Target() const { return target ? target() : nullptr; }
};

/**
 * Explicit field list of one application type, written once per type with
 * TypeBuilder. Replaces runtime reflection.
 */
class TypeDescriptor {
 public:
  using Factory = std::function<std::unique_ptr<Model>()>;

  // Leaf-value override: the encoder returns a JSON object whose members are
  // written as primitive attributes; the decoder receives the sanitized record.
  // Reference fields stay graph-managed either way.
  using CustomEncoder = std::function<Status(const Model&, Json::Value*)>;
  using CustomDecoder = std::function<Status(const Json::Value&, Model*)>;

  const std::string& record_type() const { return record_type_; }
  const std::vector<FieldDescriptor>& fields() const { return fields_; }
  const FieldDescriptor* Find(std::string_view name) const;

  std::unique_ptr<Model> Create() const { return factory_(); }

  bool has_custom_codec() const { return custom_encoder_ && custom_decoder_; }
  const CustomEncoder& custom_encoder() const { return custom_encoder_; }
  const CustomDecoder& custom_decoder() const { return custom_decoder_; }

 private:
  template <typename T>
  friend class TypeBuilder;

  std::string record_type_;
  std::vector<FieldDescriptor> fields_;
  Factory factory_;
  CustomEncoder custom_encoder_;
  CustomDecoder custom_decoder_;
};

// ---------------------------------------------------------------------------
// Field traits: member type -> kind + accessors
// ---------------------------------------------------------------------------

template <typename M>
struct FieldTraits;  // Unsupported member types fail to compile here.

template <typename M, FieldKind K>
struct ValueFieldTraits {
  static constexpr FieldKind kKind = K;
  static constexpr bool kNullable = false;
  static const TypeDescriptor* Target() { return nullptr; }
  static FieldValue Get(const M& m) { return FieldValue(std::in_place_type<M>, m); }
  static void Set(M& m, FieldValue&& v) { m = std::get<M>(std::move(v)); }
};

template <> struct FieldTraits<bool> : ValueFieldTraits<bool, FieldKind::kBool> {};
template <> struct FieldTraits<int64_t> : ValueFieldTraits<int64_t, FieldKind::kInt> {};
template <> struct FieldTraits<double> : ValueFieldTraits<double, FieldKind::kDouble> {};
template <> struct FieldTraits<std::string> : ValueFieldTraits<std::string, FieldKind::kString> {};
template <> struct FieldTraits<Timestamp> : ValueFieldTraits<Timestamp, FieldKind::kTimestamp> {};
template <> struct FieldTraits<Blob> : ValueFieldTraits<Blob, FieldKind::kBlob> {};
template <> struct FieldTraits<std::vector<bool>>
    : ValueFieldTraits<std::vector<bool>, FieldKind::kBoolList> {};
template <> struct FieldTraits<std::vector<int64_t>>
    : ValueFieldTraits<std::vector<int64_t>, FieldKind::kIntList> {};
template <> struct FieldTraits<std::vector<double>>
    : ValueFieldTraits<std::vector<double>, FieldKind::kDoubleList> {};
template <> struct FieldTraits<std::vector<std::string>>
    : ValueFieldTraits<std::vector<std::string>, FieldKind::kStringList> {};
template <> struct FieldTraits<std::vector<Timestamp>>
    : ValueFieldTraits<std::vector<Timestamp>, FieldKind::kTimestampList> {};
template <> struct FieldTraits<std::vector<Blob>>
    : ValueFieldTraits<std::vector<Blob>, FieldKind::kBlobList> {};
template <> struct FieldTraits<Dictionary> : ValueFieldTraits<Dictionary, FieldKind::kDictionary> {};

template <typename T>
struct FieldTraits<Ref<T>> {
  static constexpr FieldKind kKind = FieldKind::kReference;
  static constexpr bool kNullable = true;
  static const TypeDescriptor* Target() { return &T::Type(); }

  static FieldValue Get(const Ref<T>& m) {
    if (m.IsNull()) return std::monostate{};
    return NodeLink{m.node};
  }
  static void Set(Ref<T>& m, FieldValue&& v) {
    if (auto* link = std::get_if<NodeLink>(&v)) {
      m = Ref<T>(link->node);
    } else {
      m = Ref<T>();
    }
  }
};

template <typename T>
struct FieldTraits<std::vector<Ref<T>>> {
  static constexpr FieldKind kKind = FieldKind::kReferenceList;
  static constexpr bool kNullable = false;
  static const TypeDescriptor* Target() { return &T::Type(); }

  static FieldValue Get(const std::vector<Ref<T>>& m) {
    NodeLinkList list;
    list.nodes.reserve(m.size());
    for (const auto& r : m) list.nodes.push_back(r.node);
    return list;
  }
  static void Set(std::vector<Ref<T>>& m, FieldValue&& v) {
    m.clear();
    if (auto* list = std::get_if<NodeLinkList>(&v)) {
      m.reserve(list->nodes.size());
      for (NodeId n : list->nodes) m.emplace_back(n);
    }
  }
};

template <typename M>
struct FieldTraits<std::optional<M>> {
  static constexpr FieldKind kKind = FieldTraits<M>::kKind;
  static constexpr bool kNullable = true;
  static const TypeDescriptor* Target() { return FieldTraits<M>::Target(); }

  static FieldValue Get(const std::optional<M>& m) {
    if (!m) return std::monostate{};
    return FieldTraits<M>::Get(*m);
  }
  static void Set(std::optional<M>& m, FieldValue&& v) {
    if (std::holds_alternative<std::monostate>(v)) {
      m.reset();
      return;
    }
    M tmp{};
    FieldTraits<M>::Set(tmp, std::move(v));
    m = std::move(tmp);
  }
};

/**
 * Builds the TypeDescriptor of T from member pointers:
 *
 *   const TypeDescriptor& Person::Type() {
 *     static const TypeDescriptor type = TypeBuilder<Person>("Person")
 *         .Field("name", &Person::name)
 *         .Field("bestFriend", &Person::best_friend)
 *         .Build();
 *     return type;
 *   }
 */
template <typename T>
class TypeBuilder {
 public:
  explicit TypeBuilder(std::string record_type) {
    desc_.record_type_ = std::move(record_type);
    desc_.factory_ = [] { return std::unique_ptr<Model>(new T()); };
  }

  template <typename M>
  TypeBuilder& Field(std::string name, M T::*member) {
    using Traits = FieldTraits<M>;
    FieldDescriptor f;
    f.name = std::move(name);
    f.kind = Traits::kKind;
    f.nullable = Traits::kNullable;
    f.target = &Traits::Target;
    f.get = [member](const Model& m) {
      return Traits::Get(static_cast<const T&>(m).*member);
    };
    f.set = [member](Model& m, FieldValue&& v) {
      Traits::Set(static_cast<T&>(m).*member, std::move(v));
    };
    desc_.fields_.push_back(std::move(f));
    return *this;
  }

  TypeBuilder& CustomCodec(TypeDescriptor::CustomEncoder encoder,
                           TypeDescriptor::CustomDecoder decoder) {
    desc_.custom_encoder_ = std::move(encoder);
    desc_.custom_decoder_ = std::move(decoder);
    return *this;
  }

  TypeDescriptor Build() { return std::move(desc_); }

 private:
  TypeDescriptor desc_;
};

}  // namespace tether
