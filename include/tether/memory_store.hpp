#pragma once

#include <map>
#include <mutex>
#include <string>

#include <tether/clock.hpp>
#include <tether/record_store.hpp>

namespace tether {

struct MemoryStoreOptions {
  std::string actor = "tether";  // written to createdBy / modifiedBy
  const Clock* clock = nullptr;  // RealClock when unset
};

/** In-process RecordStore guarded by a single mutex. */
class MemoryRecordStore : public RecordStore {
 public:
  explicit MemoryRecordStore(MemoryStoreOptions opt = {});

  rocksdb::Status Save(const Record& record, Record* saved) override;
  rocksdb::Status Fetch(const std::string& identity, Record* out) override;
  rocksdb::Status Delete(const std::string& identity) override;
  rocksdb::Status Query(const QuerySpec& spec,
                        const std::optional<std::string>& cursor,
                        QueryPage* out) override;

  size_t size() const;

 private:
  MemoryStoreOptions opt_;
  const Clock* clock_;

  mutable std::mutex mu_;
  std::map<std::string, Record> records_;
};

}  // namespace tether
