#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <rocksdb/cache.h>
#include <rocksdb/options.h>
#include <rocksdb/status.h>
#include <rocksdb/utilities/transaction_db.h>

#include <tether/clock.hpp>
#include <tether/observability.hpp>
#include <tether/record_store.hpp>

namespace tether {

/**
 * Options for the RocksDB-backed record store.
 *
 * Records live in their own column family as wire JSON keyed by identity;
 * a second column family indexes identities by record type for queries.
 */
struct RocksStoreOptions {
  // RocksDB performance knobs
  size_t block_cache_bytes = 64ull * 1024ull * 1024ull;
  int bloom_bits_per_key = 10;

  // Transaction behavior
  int lock_timeout_ms = 2000;
  int max_retries = 16;

  std::string actor = "tether";

  std::shared_ptr<MetricsSink> metrics;
  const Clock* clock = nullptr;
};

class RocksRecordStore : public RecordStore {
 public:
  static rocksdb::Status Open(const std::string& db_path,
                              std::unique_ptr<RocksRecordStore>* out,
                              const RocksStoreOptions& opt = RocksStoreOptions{});

  ~RocksRecordStore() override;

  RocksRecordStore(const RocksRecordStore&) = delete;
  RocksRecordStore& operator=(const RocksRecordStore&) = delete;

  rocksdb::Status Save(const Record& record, Record* saved) override;
  rocksdb::Status Fetch(const std::string& identity, Record* out) override;
  rocksdb::Status Delete(const std::string& identity) override;
  rocksdb::Status Query(const QuerySpec& spec,
                        const std::optional<std::string>& cursor,
                        QueryPage* out) override;

  /** Number of stored records of one type. */
  rocksdb::Status Count(const std::string& record_type, uint64_t* out) const;

  void Close();

 private:
  explicit RocksRecordStore(const RocksStoreOptions& opt);

  rocksdb::Status ListIdentities(const std::string& record_type,
                                 const rocksdb::Snapshot* snapshot,
                                 std::vector<std::string>* out) const;

  RocksStoreOptions opt_;
  const Clock* clock_;

  rocksdb::TransactionDB* db_ = nullptr;
  std::vector<rocksdb::ColumnFamilyHandle*> handles_;

  rocksdb::ColumnFamilyHandle* records_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* type_index_cf_ = nullptr;
};

}  // namespace tether
