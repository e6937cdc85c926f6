#include <tether/rocks_store.hpp>

#include <rocksdb/filter_policy.h>
#include <rocksdb/table.h>
#include <rocksdb/utilities/transaction.h>

#include <tether/internal.hpp>
#include <tether/store_support.hpp>
#include <tether/wire.hpp>

namespace tether {

namespace {

constexpr const char* kRecordsCF   = "tether_records";
constexpr const char* kTypeIndexCF = "tether_type_index";

// Helper: build a ColumnFamilyOptions with shared cache + bloom
rocksdb::ColumnFamilyOptions MakeCFOptions(const std::shared_ptr<rocksdb::Cache>& cache,
                                           int bloom_bits_per_key) {
  rocksdb::BlockBasedTableOptions table;
  table.block_cache = cache;
  table.filter_policy.reset(rocksdb::NewBloomFilterPolicy(bloom_bits_per_key, false));
  table.whole_key_filtering = true;

  rocksdb::ColumnFamilyOptions cfo;
  cfo.table_factory.reset(rocksdb::NewBlockBasedTableFactory(table));
  return cfo;
}

// record type + NUL + identity
std::string TypeIndexKey(const std::string& record_type, const std::string& identity) {
  std::string key;
  key.reserve(record_type.size() + 1 + identity.size());
  key.append(record_type);
  key.push_back('\0');
  key.append(identity);
  return key;
}

std::string TypeIndexPrefix(const std::string& record_type) {
  std::string prefix = record_type;
  prefix.push_back('\0');
  return prefix;
}

rocksdb::Status DecodeStored(const std::string& bytes, Record* out) {
  Status s = ParseRecord(bytes, out);
  if (!s.ok()) return rocksdb::Status::Corruption("stored record is not valid", s.ToString());
  return rocksdb::Status::OK();
}

}  // namespace

RocksRecordStore::RocksRecordStore(const RocksStoreOptions& opt)
    : opt_(opt), clock_(opt.clock ? opt.clock : RealClock::Default()) {}

RocksRecordStore::~RocksRecordStore() { Close(); }

rocksdb::Status RocksRecordStore::Open(const std::string& db_path,
                                       std::unique_ptr<RocksRecordStore>* out,
                                       const RocksStoreOptions& opt) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (opt.max_retries <= 0) return rocksdb::Status::InvalidArgument("max_retries must be positive");

  auto store = std::unique_ptr<RocksRecordStore>(new RocksRecordStore(opt));

  rocksdb::Options options;
  options.create_if_missing = true;
  options.create_missing_column_families = true;

  rocksdb::TransactionDBOptions txn_opts;

  // Shared cache for all CFs
  auto cache = rocksdb::NewLRUCache(opt.block_cache_bytes);

  std::vector<rocksdb::ColumnFamilyDescriptor> cfs;
  cfs.emplace_back(rocksdb::kDefaultColumnFamilyName, MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kRecordsCF, MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kTypeIndexCF, MakeCFOptions(cache, opt.bloom_bits_per_key));

  std::vector<rocksdb::ColumnFamilyHandle*> handles;
  rocksdb::TransactionDB* db = nullptr;

  rocksdb::Status s = rocksdb::TransactionDB::Open(options, txn_opts, db_path, cfs, &handles, &db);
  if (!s.ok()) {
    for (auto* h : handles) delete h;
    return s;
  }

  store->db_ = db;
  store->handles_ = std::move(handles);

  // Descriptor order = handle order
  store->records_cf_    = store->handles_[1];
  store->type_index_cf_ = store->handles_[2];

  *out = std::move(store);
  return rocksdb::Status::OK();
}

void RocksRecordStore::Close() {
  if (!db_) return;
  for (auto* h : handles_) delete h;
  handles_.clear();
  delete db_;
  db_ = nullptr;
  records_cf_ = type_index_cf_ = nullptr;
}

rocksdb::Status RocksRecordStore::Save(const Record& record, Record* saved) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (record.record_type.empty()) return rocksdb::Status::InvalidArgument("record type is empty");

  internal::EmitCounter(opt_.metrics, "tether.store.save.calls");
  const uint64_t op_start_us = clock_->NowMicros();
  int attempts_used = 0;

  auto finish = [&](const rocksdb::Status& st) -> rocksdb::Status {
    internal::EmitHistogram(opt_.metrics, "tether.store.save.latency_us",
                            clock_->NowMicros() - op_start_us);
    internal::EmitHistogram(opt_.metrics, "tether.store.save.attempts",
                            static_cast<uint64_t>(attempts_used));
    if (st.ok()) {
      internal::EmitCounter(opt_.metrics, "tether.store.save.ok_total");
    } else if (st.IsTimedOut() || st.IsBusy()) {
      internal::EmitCounter(opt_.metrics, "tether.store.save.timed_out_total");
    } else {
      internal::EmitCounter(opt_.metrics, "tether.store.save.error_total");
    }
    return st;
  };

  rocksdb::WriteOptions wo;
  rocksdb::ReadOptions ro;

  rocksdb::TransactionOptions to;
  to.lock_timeout = opt_.lock_timeout_ms;

  rocksdb::Status last_retryable;
  for (int attempt = 0; attempt < opt_.max_retries; ++attempt) {
    attempts_used = attempt + 1;

    std::unique_ptr<rocksdb::Transaction> txn(db_->BeginTransaction(wo, to));
    if (!txn) return finish(rocksdb::Status::IOError("BeginTransaction returned null"));

    // Lock the record itself (detect create vs. overwrite)
    Record existing;
    bool had_existing = false;
    if (!record.identity.empty()) {
      std::string bytes;
      rocksdb::Status s = txn->GetForUpdate(ro, records_cf_, rocksdb::Slice(record.identity), &bytes);
      if (s.ok()) {
        s = DecodeStored(bytes, &existing);
        if (!s.ok()) return finish(s);
        if (existing.record_type != record.record_type) {
          return finish(rocksdb::Status::InvalidArgument(
              "identity belongs to another record type", existing.record_type));
        }
        had_existing = true;
      } else if (!s.IsNotFound()) {
        if (internal::IsRetryableTxnStatus(s)) {
          internal::EmitCounter(opt_.metrics, "tether.store.save.retry_total");
          last_retryable = s;
          continue;
        }
        return finish(s);
      }
    }

    // Lock every referenced record so it cannot vanish before commit
    rocksdb::Status lookup_error;
    rocksdb::Status s = store_support::CheckReferences(
        record, [&](const std::string& target) {
          std::string ignored;
          rocksdb::Status gs = txn->GetForUpdate(ro, records_cf_, rocksdb::Slice(target), &ignored);
          if (gs.ok()) return true;
          if (gs.IsNotFound()) return false;
          lookup_error = gs;
          return true;
        });
    if (!lookup_error.ok()) {
      if (internal::IsRetryableTxnStatus(lookup_error)) {
        internal::EmitCounter(opt_.metrics, "tether.store.save.retry_total");
        last_retryable = lookup_error;
        continue;
      }
      return finish(lookup_error);
    }
    if (!s.ok()) return finish(s);

    Record stored = store_support::StampForSave(
        record, had_existing ? &existing : nullptr, opt_.actor,
        static_cast<int64_t>(clock_->WallClockMicros()));

    s = txn->Put(records_cf_, rocksdb::Slice(stored.identity),
                 rocksdb::Slice(SerializeRecord(stored)));
    if (!s.ok()) return finish(s);

    s = txn->Put(type_index_cf_,
                 rocksdb::Slice(TypeIndexKey(stored.record_type, stored.identity)),
                 rocksdb::Slice());
    if (!s.ok()) return finish(s);

    s = txn->Commit();
    if (s.ok()) {
      if (saved) *saved = std::move(stored);
      return finish(rocksdb::Status::OK());
    }
    if (internal::IsRetryableTxnStatus(s)) {
      internal::EmitCounter(opt_.metrics, "tether.store.save.retry_total");
      last_retryable = s;
      continue;
    }
    return finish(s);
  }

  return finish(last_retryable.ok() ? rocksdb::Status::Busy("max retries exceeded")
                                    : last_retryable);
}

rocksdb::Status RocksRecordStore::Fetch(const std::string& identity, Record* out) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::string bytes;
  rocksdb::Status s = db_->Get(rocksdb::ReadOptions(), records_cf_, rocksdb::Slice(identity), &bytes);
  internal::EmitCounter(opt_.metrics, s.ok() ? "tether.store.fetch.ok_total"
                                             : "tether.store.fetch.miss_total");
  if (!s.ok()) return s;
  return DecodeStored(bytes, out);
}

rocksdb::Status RocksRecordStore::Delete(const std::string& identity) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");

  rocksdb::WriteOptions wo;
  rocksdb::ReadOptions ro;
  rocksdb::TransactionOptions to;
  to.lock_timeout = opt_.lock_timeout_ms;

  rocksdb::Status last = rocksdb::Status::Busy("max retries exceeded");
  for (int attempt = 0; attempt < opt_.max_retries; ++attempt) {
    std::unique_ptr<rocksdb::Transaction> txn(db_->BeginTransaction(wo, to));
    if (!txn) return rocksdb::Status::IOError("BeginTransaction returned null");

    std::string bytes;
    rocksdb::Status s = txn->GetForUpdate(ro, records_cf_, rocksdb::Slice(identity), &bytes);
    if (s.IsNotFound()) return s;
    if (!s.ok()) {
      if (internal::IsRetryableTxnStatus(s)) {
        last = s;
        continue;
      }
      return s;
    }

    Record existing;
    s = DecodeStored(bytes, &existing);
    if (s.ok()) {
      s = txn->Delete(type_index_cf_,
                      rocksdb::Slice(TypeIndexKey(existing.record_type, identity)));
      if (!s.ok()) return s;
    }
    // A corrupt record is still removed; its index entry cannot be located.

    s = txn->Delete(records_cf_, rocksdb::Slice(identity));
    if (!s.ok()) return s;

    s = txn->Commit();
    if (s.ok()) {
      internal::EmitCounter(opt_.metrics, "tether.store.delete.ok_total");
      return s;
    }
    if (internal::IsRetryableTxnStatus(s)) {
      last = s;
      continue;
    }
    return s;
  }
  return last;
}

rocksdb::Status RocksRecordStore::ListIdentities(const std::string& record_type,
                                                 const rocksdb::Snapshot* snapshot,
                                                 std::vector<std::string>* out) const {
  rocksdb::ReadOptions ro;
  ro.snapshot = snapshot;

  const std::string prefix = TypeIndexPrefix(record_type);
  rocksdb::Slice prefix_slice(prefix);

  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro, type_index_cf_));
  for (it->Seek(prefix_slice); it->Valid(); it->Next()) {
    if (!it->key().starts_with(prefix_slice)) break;
    out->emplace_back(it->key().data() + prefix.size(), it->key().size() - prefix.size());
  }
  return it->status();
}

rocksdb::Status RocksRecordStore::Query(const QuerySpec& spec,
                                        const std::optional<std::string>& cursor,
                                        QueryPage* out) {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  internal::EmitCounter(opt_.metrics, "tether.store.query.calls");

  const rocksdb::Snapshot* snapshot = db_->GetSnapshot();
  rocksdb::ReadOptions ro;
  ro.snapshot = snapshot;

  std::vector<std::string> identities;
  rocksdb::Status s = ListIdentities(spec.record_type, snapshot, &identities);

  std::vector<QueryMatch> matches;
  if (s.ok()) {
    for (const auto& identity : identities) {
      std::string bytes;
      rocksdb::Status gs = db_->Get(ro, records_cf_, rocksdb::Slice(identity), &bytes);
      if (gs.IsNotFound()) continue;  // stale index entry
      if (!gs.ok()) {
        s = gs;
        break;
      }

      QueryMatch match;
      match.identity = identity;
      match.status = DecodeStored(bytes, &match.record);
      if (match.status.ok() && !spec.predicate.Matches(match.record)) continue;
      matches.push_back(std::move(match));
    }
  }

  db_->ReleaseSnapshot(snapshot);
  if (!s.ok()) return s;

  store_support::SortMatches(spec.sort, &matches);
  return store_support::Paginate(std::move(matches), spec.sort, spec.limit, cursor, out);
}

rocksdb::Status RocksRecordStore::Count(const std::string& record_type, uint64_t* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("db is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  const rocksdb::Snapshot* snapshot = db_->GetSnapshot();
  std::vector<std::string> identities;
  rocksdb::Status s = ListIdentities(record_type, snapshot, &identities);
  db_->ReleaseSnapshot(snapshot);
  if (!s.ok()) return s;

  *out = identities.size();
  return rocksdb::Status::OK();
}

}  // namespace tether
