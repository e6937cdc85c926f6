#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <tether/clock.hpp>
#include <tether/observability.hpp>
#include <tether/record.hpp>

namespace tether {

struct CacheOptions {
  // Entries older than this are misses. 0 = entries never expire.
  uint64_t ttl_seconds = 30;

  // Advisory bound; the oldest entries are evicted past it. 0 = unbounded.
  size_t max_entries = 0;

  std::shared_ptr<MetricsSink> metrics;
  const Clock* clock = nullptr;  // RealClock when unset
};

/**
 * TTL cache of records keyed by identity, shared by every save and load of
 * an engine. One mutex guards all state.
 *
 * After Close() the cache behaves as empty: Get() misses and Put() is
 * ignored.
 */
class RecordCache {
 public:
  explicit RecordCache(CacheOptions opt = {});

  RecordCache(const RecordCache&) = delete;
  RecordCache& operator=(const RecordCache&) = delete;

  /** Copy of the cached record if it was inserted less than TTL ago. */
  bool Get(std::string_view identity, Record* out);

  /** Like Get() without copying the record or touching metrics. */
  bool Contains(std::string_view identity) const;

  void Put(const Record& record);
  void PutMany(const std::vector<Record>& records);

  /** Remove one entry. Returns false if it was not cached. */
  bool Invalidate(std::string_view identity);

  /**
   * Remove an entry and every cached entry reachable from it through stored
   * references. Only cached records are walked. Returns the number removed.
   */
  size_t InvalidateCascade(std::string_view identity);

  /** Drop expired entries. Returns the number removed. */
  size_t PurgeExpired();

  void Clear();
  void Close();
  bool closed() const;

  size_t Size() const;

  const CacheOptions& options() const { return opt_; }

 private:
  struct Entry {
    Record record;
    uint64_t inserted_at_us = 0;
    std::list<std::string>::iterator order_it;
  };

  bool ExpiredLocked(const Entry& e, uint64_t now_us) const;
  void EraseLocked(std::unordered_map<std::string, Entry>::iterator it);
  void PutLocked(const Record& record, uint64_t now_us);
  void EmitSizeLocked();

  CacheOptions opt_;
  const Clock* clock_;

  mutable std::mutex mu_;
  bool closed_ = false;
  std::unordered_map<std::string, Entry> entries_;
  std::list<std::string> insertion_order_;  // oldest first
};

}  // namespace tether
