#include <tether/store_support.hpp>

#include <algorithm>

#include <json/json.h>

#include <tether/internal.hpp>
#include <tether/wire.hpp>

namespace tether {

namespace {

constexpr const char* kAfterKey = "after";
constexpr const char* kValuesKey = "values";

bool IsNumber(const Primitive& p) {
  return std::holds_alternative<int64_t>(p) || std::holds_alternative<double>(p);
}

double AsDouble(const Primitive& p) {
  if (const auto* i = std::get_if<int64_t>(&p)) return static_cast<double>(*i);
  return std::get<double>(p);
}

template <typename T>
int ThreeWay(const T& a, const T& b) {
  if (a < b) return -1;
  if (b < a) return 1;
  return 0;
}

// The record's identity is queryable as if it were an attribute.
std::optional<Primitive> AttributeFor(const Record& record, const std::string& name) {
  if (name == kIdentityKey) return Primitive(record.identity);
  const AttributeValue* value = record.Get(name);
  if (!value) return std::nullopt;
  if (const auto* p = std::get_if<Primitive>(value)) return *p;
  if (const auto* r = std::get_if<Reference>(value)) return Primitive(r->identity);
  return std::nullopt;
}

std::optional<Primitive> SortValueOf(const QueryMatch& match, const std::string& attribute) {
  if (attribute == kIdentityKey) return Primitive(match.identity);
  return AttributeFor(match.record, attribute);
}

// Missing values sort first.
int CompareSortValues(const std::optional<Primitive>& a, const std::optional<Primitive>& b) {
  if (!a || !b) return ThreeWay(a.has_value(), b.has_value());
  return store_support::ComparePrimitives(*a, *b);
}

}  // namespace

bool Predicate::Matches(const Record& record) const {
  for (const auto& c : conditions) {
    std::optional<Primitive> actual = AttributeFor(record, c.attribute);
    if (!actual) return false;

    const bool comparable = actual->index() == c.value.index() ||
                            (IsNumber(*actual) && IsNumber(c.value));
    if (!comparable) {
      if (c.op == CompareOp::kNe) continue;
      return false;
    }

    const int cmp = store_support::ComparePrimitives(*actual, c.value);
    bool ok = false;
    switch (c.op) {
      case CompareOp::kEq: ok = cmp == 0; break;
      case CompareOp::kNe: ok = cmp != 0; break;
      case CompareOp::kLt: ok = cmp < 0; break;
      case CompareOp::kLe: ok = cmp <= 0; break;
      case CompareOp::kGt: ok = cmp > 0; break;
      case CompareOp::kGe: ok = cmp >= 0; break;
    }
    if (!ok) return false;
  }
  return true;
}

namespace store_support {

int ComparePrimitives(const Primitive& a, const Primitive& b) {
  if (IsNumber(a) && IsNumber(b)) {
    if (std::holds_alternative<int64_t>(a) && std::holds_alternative<int64_t>(b)) {
      return ThreeWay(std::get<int64_t>(a), std::get<int64_t>(b));
    }
    return ThreeWay(AsDouble(a), AsDouble(b));
  }
  if (a.index() != b.index()) return ThreeWay(a.index(), b.index());

  switch (a.index()) {
    case 0: return ThreeWay(std::get<bool>(a), std::get<bool>(b));
    case 3: return ThreeWay(std::get<std::string>(a), std::get<std::string>(b));
    case 4: return ThreeWay(std::get<Timestamp>(a).micros, std::get<Timestamp>(b).micros);
    default: return 0;
  }
}

rocksdb::Status CheckReferences(const Record& record,
                                const std::function<bool(const std::string&)>& exists) {
  for (const auto& target : record.ReferencedIdentities()) {
    if (!record.identity.empty() && target == record.identity) continue;
    if (target.empty() || !exists(target)) {
      return rocksdb::Status::InvalidArgument("reference to unknown identity", target);
    }
  }
  return rocksdb::Status::OK();
}

Record StampForSave(const Record& incoming, const Record* existing,
                    const std::string& actor, int64_t now_micros) {
  Record out = incoming;
  if (out.identity.empty()) out.identity = internal::RandomIdentity();

  if (existing) {
    out.system.created_by = existing->system.created_by;
    out.system.created_at = existing->system.created_at;
  } else {
    out.system.created_by = actor;
    out.system.created_at = Timestamp{now_micros};
  }
  out.system.modified_by = actor;
  out.system.modified_at = Timestamp{now_micros};

  // The tag covers content only, so re-saving identical content keeps it.
  Record content = out;
  content.system = SystemFields{};
  out.system.change_tag = internal::ChangeTagFor(SerializeRecord(content));
  return out;
}

SortPosition PositionOf(const std::vector<SortKey>& keys, const QueryMatch& match) {
  SortPosition pos;
  pos.identity = match.identity;
  pos.values.reserve(keys.size());
  for (const auto& key : keys) pos.values.push_back(SortValueOf(match, key.attribute));
  return pos;
}

int ComparePositions(const std::vector<SortKey>& keys, const SortPosition& a,
                     const SortPosition& b) {
  for (size_t i = 0; i < keys.size(); ++i) {
    int cmp = CompareSortValues(a.values[i], b.values[i]);
    if (cmp != 0) return keys[i].ascending ? cmp : -cmp;
  }
  return ThreeWay(a.identity, b.identity);
}

void SortMatches(const std::vector<SortKey>& keys, std::vector<QueryMatch>* matches) {
  std::vector<SortPosition> positions;
  positions.reserve(matches->size());
  for (const auto& m : *matches) positions.push_back(PositionOf(keys, m));

  std::vector<size_t> order(matches->size());
  for (size_t i = 0; i < order.size(); ++i) order[i] = i;
  std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    return ComparePositions(keys, positions[a], positions[b]) < 0;
  });

  std::vector<QueryMatch> sorted;
  sorted.reserve(matches->size());
  for (size_t i : order) sorted.push_back(std::move((*matches)[i]));
  *matches = std::move(sorted);
}

std::string EncodeCursor(const SortPosition& after) {
  Json::Value values(Json::arrayValue);
  for (const auto& v : after.values) {
    values.append(v ? PrimitiveToJson(*v) : Json::Value(Json::nullValue));
  }
  Json::Value token(Json::objectValue);
  token[kAfterKey] = after.identity;
  token[kValuesKey] = std::move(values);
  return internal::Base64Encode(WriteJson(token));
}

bool DecodeCursor(const std::string& cursor, SortPosition* after) {
  std::string text;
  if (!internal::Base64Decode(cursor, &text)) return false;
  Json::Value token;
  if (!ParseJson(text, &token, nullptr)) return false;
  if (!token.isObject() || !token[kAfterKey].isString() || !token[kValuesKey].isArray()) {
    return false;
  }

  SortPosition pos;
  pos.identity = token[kAfterKey].asString();
  for (const auto& v : token[kValuesKey]) {
    if (v.isNull()) {
      pos.values.emplace_back();
      continue;
    }
    AttributeValue value;
    if (!AttributeFromJson(v, &value)) return false;
    const auto* p = std::get_if<Primitive>(&value);
    if (!p) return false;
    pos.values.emplace_back(*p);
  }
  *after = std::move(pos);
  return true;
}

rocksdb::Status Paginate(std::vector<QueryMatch>&& sorted, const std::vector<SortKey>& keys,
                         uint64_t limit, const std::optional<std::string>& cursor,
                         QueryPage* out) {
  size_t begin = 0;
  if (cursor) {
    SortPosition after;
    if (!DecodeCursor(*cursor, &after) || after.values.size() != keys.size()) {
      return rocksdb::Status::InvalidArgument("invalid cursor");
    }
    auto first = std::upper_bound(sorted.begin(), sorted.end(), after,
                                  [&keys](const SortPosition& pos, const QueryMatch& m) {
                                    return ComparePositions(keys, pos, PositionOf(keys, m)) < 0;
                                  });
    begin = static_cast<size_t>(first - sorted.begin());
  }

  out->matches.clear();
  out->next_cursor.reset();

  const size_t total = sorted.size();
  if (begin >= total) return rocksdb::Status::OK();

  const size_t end =
      limit == 0 ? total : static_cast<size_t>(std::min<uint64_t>(total, begin + limit));
  out->matches.reserve(end - begin);
  for (size_t i = begin; i < end; ++i) out->matches.push_back(std::move(sorted[i]));
  if (end < total) out->next_cursor = EncodeCursor(PositionOf(keys, out->matches.back()));
  return rocksdb::Status::OK();
}

}  // namespace store_support
}  // namespace tether
