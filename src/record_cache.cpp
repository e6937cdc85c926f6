#include <tether/record_cache.hpp>

#include <deque>
#include <iterator>
#include <unordered_set>

#include <trantor/utils/Logger.h>

namespace tether {

RecordCache::RecordCache(CacheOptions opt)
    : opt_(opt), clock_(opt.clock ? opt.clock : RealClock::Default()) {}

bool RecordCache::ExpiredLocked(const Entry& e, uint64_t now_us) const {
  if (opt_.ttl_seconds == 0) return false;
  const uint64_t ttl_us = opt_.ttl_seconds * 1000000ULL;
  if (now_us < e.inserted_at_us) return false;
  // Fresh only while strictly younger than the TTL.
  return now_us - e.inserted_at_us >= ttl_us;
}

void RecordCache::EraseLocked(std::unordered_map<std::string, Entry>::iterator it) {
  insertion_order_.erase(it->second.order_it);
  entries_.erase(it);
}

void RecordCache::EmitSizeLocked() {
  internal::EmitGauge(opt_.metrics, "tether.cache.entries",
                      static_cast<double>(entries_.size()));
}

bool RecordCache::Get(std::string_view identity, Record* out) {
  std::lock_guard<std::mutex> lock(mu_);
  if (closed_) return false;

  auto it = entries_.find(std::string(identity));
  if (it == entries_.end()) {
    internal::EmitCounter(opt_.metrics, "tether.cache.miss_total");
    return false;
  }
  if (ExpiredLocked(it->second, clock_->WallClockMicros())) {
    internal::EmitCounter(opt_.metrics, "tether.cache.expired_total");
    internal::EmitCounter(opt_.metrics, "tether.cache.miss_total");
    EraseLocked(it);
    EmitSizeLocked();
    return false;
  }

  internal::EmitCounter(opt_.metrics, "tether.cache.hit_total");
  if (out) *out = it->second.record;
  return true;
}

bool RecordCache::Contains(std::string_view identity) const {
  std::lock_guard<std::mutex> lock(mu_);
  if (closed_) return false;
  auto it = entries_.find(std::string(identity));
  return it != entries_.end() && !ExpiredLocked(it->second, clock_->WallClockMicros());
}

void RecordCache::PutLocked(const Record& record, uint64_t now_us) {
  auto it = entries_.find(record.identity);
  if (it != entries_.end()) EraseLocked(it);

  insertion_order_.push_back(record.identity);
  Entry e;
  e.record = record;
  e.inserted_at_us = now_us;
  e.order_it = std::prev(insertion_order_.end());
  entries_.emplace(record.identity, std::move(e));

  while (opt_.max_entries != 0 && entries_.size() > opt_.max_entries) {
    auto oldest = entries_.find(insertion_order_.front());
    LOG_DEBUG << "record cache evicting " << insertion_order_.front();
    internal::EmitCounter(opt_.metrics, "tether.cache.evicted_total");
    EraseLocked(oldest);
  }
}

void RecordCache::Put(const Record& record) {
  if (record.identity.empty()) return;
  std::lock_guard<std::mutex> lock(mu_);
  if (closed_) return;
  PutLocked(record, clock_->WallClockMicros());
  EmitSizeLocked();
}

void RecordCache::PutMany(const std::vector<Record>& records) {
  std::lock_guard<std::mutex> lock(mu_);
  if (closed_) return;
  const uint64_t now_us = clock_->WallClockMicros();
  for (const auto& r : records) {
    if (!r.identity.empty()) PutLocked(r, now_us);
  }
  EmitSizeLocked();
}

bool RecordCache::Invalidate(std::string_view identity) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(std::string(identity));
  if (it == entries_.end()) return false;
  EraseLocked(it);
  internal::EmitCounter(opt_.metrics, "tether.cache.invalidated_total");
  EmitSizeLocked();
  return true;
}

size_t RecordCache::InvalidateCascade(std::string_view identity) {
  std::lock_guard<std::mutex> lock(mu_);

  size_t removed = 0;
  std::unordered_set<std::string> visited;
  std::deque<std::string> queue;
  queue.emplace_back(identity);
  visited.emplace(identity);

  while (!queue.empty()) {
    std::string id = std::move(queue.front());
    queue.pop_front();

    auto it = entries_.find(id);
    if (it == entries_.end()) continue;  // not cached: its references are unknown

    for (auto& child : it->second.record.ReferencedIdentities()) {
      if (visited.insert(child).second) queue.push_back(std::move(child));
    }
    EraseLocked(it);
    ++removed;
  }

  if (removed > 0) {
    internal::EmitCounter(opt_.metrics, "tether.cache.invalidated_total", removed);
    EmitSizeLocked();
  }
  return removed;
}

size_t RecordCache::PurgeExpired() {
  std::lock_guard<std::mutex> lock(mu_);
  const uint64_t now_us = clock_->WallClockMicros();
  size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (ExpiredLocked(it->second, now_us)) {
      insertion_order_.erase(it->second.order_it);
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  if (removed > 0) {
    internal::EmitCounter(opt_.metrics, "tether.cache.expired_total", removed);
    EmitSizeLocked();
  }
  return removed;
}

void RecordCache::Clear() {
  std::lock_guard<std::mutex> lock(mu_);
  entries_.clear();
  insertion_order_.clear();
  EmitSizeLocked();
}

void RecordCache::Close() {
  std::lock_guard<std::mutex> lock(mu_);
  closed_ = true;
  entries_.clear();
  insertion_order_.clear();
}

bool RecordCache::closed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return closed_;
}

size_t RecordCache::Size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

}  // namespace tether
