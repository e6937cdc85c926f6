#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <rocksdb/status.h>

#include <tether/record.hpp>

namespace tether {

enum class CompareOp { kEq, kNe, kLt, kLe, kGt, kGe };

/** One attribute comparison. A record without the attribute never matches. */
struct Condition {
  std::string attribute;
  CompareOp op = CompareOp::kEq;
  Primitive value;
};

/** Conjunction of conditions. An empty predicate matches every record. */
struct Predicate {
  std::vector<Condition> conditions;

  static Predicate All() { return Predicate{}; }

  Predicate& Where(std::string attribute, CompareOp op, Primitive value) {
    conditions.push_back(Condition{std::move(attribute), op, std::move(value)});
    return *this;
  }

  bool Matches(const Record& record) const;
};

struct SortKey {
  std::string attribute;
  bool ascending = true;
};

struct QuerySpec {
  std::string record_type;
  Predicate predicate;
  std::vector<SortKey> sort;  // identity is always the final tie-breaker
  uint64_t limit = 0;         // 0 = everything in one page
};

/** One raw query result: a record, or the error that prevented reading it. */
struct QueryMatch {
  std::string identity;
  rocksdb::Status status;
  Record record;
};

struct QueryPage {
  std::vector<QueryMatch> matches;
  std::optional<std::string> next_cursor;  // unset on the last page
};

/**
 * Backing record store. Implementations must enforce that a saved record
 * only references identities that already exist (its own excepted).
 *
 * Save() assigns an identity when the record has none, stamps the system
 * attributes and returns the stored form in `saved`. Fetch() and Delete()
 * return NotFound for an unknown identity.
 *
 * Query() returns the matches of one record type in sort-key order, identity
 * breaking ties, `spec.limit` at a time. `next_cursor` names the position of
 * the last match handed out, so the next page resumes strictly after it:
 * records inserted or deleted between pages neither repeat nor shift others
 * out of the walk. A record whose sort-key values change between pages may be
 * seen twice or not at all. Each page reads a consistent view; the walk as a
 * whole is not a snapshot.
 */
class RecordStore {
 public:
  virtual ~RecordStore() = default;

  virtual rocksdb::Status Save(const Record& record, Record* saved) = 0;
  virtual rocksdb::Status Fetch(const std::string& identity, Record* out) = 0;
  virtual rocksdb::Status Delete(const std::string& identity) = 0;
  virtual rocksdb::Status Query(const QuerySpec& spec,
                                const std::optional<std::string>& cursor,
                                QueryPage* out) = 0;
};

}  // namespace tether
