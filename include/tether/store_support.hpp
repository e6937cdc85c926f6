#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <rocksdb/status.h>

#include <tether/record.hpp>
#include <tether/record_store.hpp>

// Helpers shared by the bundled RecordStore backends.
namespace tether::store_support {

/** Three-way comparison; numbers compare numerically across int/double. */
int ComparePrimitives(const Primitive& a, const Primitive& b);

/**
 * InvalidArgument naming the first referenced identity for which `exists`
 * returns false. References to the record's own identity are allowed.
 */
rocksdb::Status CheckReferences(const Record& record,
                                const std::function<bool(const std::string&)>& exists);

/**
 * Produce the stored form of `incoming`: identity generated when empty,
 * created* copied from `existing` (or stamped now), modified* stamped now,
 * changeTag derived from the content.
 */
Record StampForSave(const Record& incoming, const Record* existing,
                    const std::string& actor, int64_t now_micros);

/** Where a match falls in query order: its sort-key values, then its identity. */
struct SortPosition {
  std::vector<std::optional<Primitive>> values;  // unset where the attribute is missing
  std::string identity;
};

SortPosition PositionOf(const std::vector<SortKey>& keys, const QueryMatch& match);

/** Three-way comparison in query order. Missing values sort first. */
int ComparePositions(const std::vector<SortKey>& keys, const SortPosition& a,
                     const SortPosition& b);

/** Sort in place by the sort keys, then by identity. */
void SortMatches(const std::vector<SortKey>& keys, std::vector<QueryMatch>* matches);

// A cursor is base64 of {"after": identity, "values": [sort-key values]}, the
// position of the last match handed out.
std::string EncodeCursor(const SortPosition& after);
bool DecodeCursor(const std::string& cursor, SortPosition* after);

/**
 * One page of sorted matches: those strictly after `cursor` in query order,
 * at most `limit` of them (0 = all). InvalidArgument for a malformed cursor or
 * one carrying a different number of sort keys.
 */
rocksdb::Status Paginate(std::vector<QueryMatch>&& sorted, const std::vector<SortKey>& keys,
                         uint64_t limit, const std::optional<std::string>& cursor,
                         QueryPage* out);

}  // namespace tether::store_support
