#include <tether/memory_store.hpp>

#include <tether/store_support.hpp>

namespace tether {

MemoryRecordStore::MemoryRecordStore(MemoryStoreOptions opt)
    : opt_(std::move(opt)), clock_(opt_.clock ? opt_.clock : RealClock::Default()) {}

rocksdb::Status MemoryRecordStore::Save(const Record& record, Record* saved) {
  if (record.record_type.empty()) {
    return rocksdb::Status::InvalidArgument("record type is empty");
  }

  std::lock_guard<std::mutex> lock(mu_);

  rocksdb::Status s = store_support::CheckReferences(
      record, [this](const std::string& id) { return records_.count(id) > 0; });
  if (!s.ok()) return s;

  const Record* existing = nullptr;
  if (!record.identity.empty()) {
    auto it = records_.find(record.identity);
    if (it != records_.end()) {
      if (it->second.record_type != record.record_type) {
        return rocksdb::Status::InvalidArgument("identity belongs to another record type",
                                                it->second.record_type);
      }
      existing = &it->second;
    }
  }

  Record stored = store_support::StampForSave(
      record, existing, opt_.actor, static_cast<int64_t>(clock_->WallClockMicros()));
  records_[stored.identity] = stored;
  if (saved) *saved = std::move(stored);
  return rocksdb::Status::OK();
}

rocksdb::Status MemoryRecordStore::Fetch(const std::string& identity, Record* out) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = records_.find(identity);
  if (it == records_.end()) return rocksdb::Status::NotFound(identity);
  if (out) *out = it->second;
  return rocksdb::Status::OK();
}

rocksdb::Status MemoryRecordStore::Delete(const std::string& identity) {
  std::lock_guard<std::mutex> lock(mu_);
  if (records_.erase(identity) == 0) return rocksdb::Status::NotFound(identity);
  return rocksdb::Status::OK();
}

rocksdb::Status MemoryRecordStore::Query(const QuerySpec& spec,
                                         const std::optional<std::string>& cursor,
                                         QueryPage* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::vector<QueryMatch> matches;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& [identity, record] : records_) {
      if (record.record_type != spec.record_type) continue;
      if (!spec.predicate.Matches(record)) continue;
      matches.push_back(QueryMatch{identity, rocksdb::Status::OK(), record});
    }
  }

  store_support::SortMatches(spec.sort, &matches);
  return store_support::Paginate(std::move(matches), spec.sort, spec.limit, cursor, out);
}

size_t MemoryRecordStore::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return records_.size();
}

}  // namespace tether
