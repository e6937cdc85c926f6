#include <tether/engine.hpp>

#include <utility>

#include <trantor/utils/Logger.h>

namespace tether {

namespace {

bool ParseLogLevel(const std::string& name, trantor::Logger::LogLevel* out) {
  if (name == "trace") {
    *out = trantor::Logger::kTrace;
  } else if (name == "debug") {
    *out = trantor::Logger::kDebug;
  } else if (name == "info") {
    *out = trantor::Logger::kInfo;
  } else if (name == "warn") {
    *out = trantor::Logger::kWarn;
  } else if (name == "error") {
    *out = trantor::Logger::kError;
  } else {
    return false;
  }
  return true;
}

CacheOptions MakeCacheOptions(const Options& opt) {
  CacheOptions c;
  c.ttl_seconds = opt.cache_ttl_seconds;
  c.max_entries = opt.cache_max_entries;
  c.metrics = opt.metrics;
  c.clock = opt.clock;
  return c;
}

Status ClosedError() { return Status::InvalidArgument("engine is closed"); }

}  // namespace

Engine::Engine(std::unique_ptr<RecordStore> store, const Options& opt)
    : opt_(opt),
      store_(std::move(store)),
      cache_(MakeCacheOptions(opt_)),
      save_(store_.get(), &cache_, &inflight_, opt_),
      load_(store_.get(), &cache_, opt_) {}

Engine::~Engine() { Close(); }

Status Engine::Open(std::unique_ptr<RecordStore> store, const Options& opt,
                    std::unique_ptr<Engine>* out) {
  if (!out) return Status::InvalidArgument("out is null");
  out->reset();
  if (!store) return Status::InvalidArgument("store is null");

  trantor::Logger::LogLevel level;
  if (!ParseLogLevel(opt.log_level, &level)) {
    return Status::InvalidArgument("invalid log_level: " + opt.log_level);
  }
  trantor::Logger::setLogLevel(level);

  if (opt.identity_strategy == IdentityStrategy::kCustomGenerator &&
      !opt.identity_generator) {
    return Status::InvalidArgument("identity_generator is required for kCustomGenerator");
  }
  if (opt.identity_strategy == IdentityStrategy::kKeyField &&
      opt.identity_key_field.empty()) {
    return Status::InvalidArgument("identity_key_field is required for kKeyField");
  }

  out->reset(new Engine(std::move(store), opt));
  return Status::OK();
}

// ---------------------------------------------------------------------------
// Save
// ---------------------------------------------------------------------------

Status Engine::Run(SaveMode mode, ObjectGraph& graph, NodeId node, Record* saved,
                   const CancelToken* cancel) {
  if (closed()) return ClosedError();
  return save_.Run(mode, &graph, node, saved, cancel);
}

Status Engine::Save(ObjectGraph& graph, NodeId node, Record* saved,
                    const CancelToken* cancel) {
  return Run(SaveMode::kSave, graph, node, saved, cancel);
}

Status Engine::Insert(ObjectGraph& graph, NodeId node, Record* saved,
                      const CancelToken* cancel) {
  return Run(SaveMode::kInsert, graph, node, saved, cancel);
}

Status Engine::Update(ObjectGraph& graph, NodeId node, Record* saved,
                      const CancelToken* cancel) {
  return Run(SaveMode::kUpdate, graph, node, saved, cancel);
}

Status Engine::Upsert(ObjectGraph& graph, NodeId node, Record* saved,
                      const CancelToken* cancel) {
  return Run(SaveMode::kUpsert, graph, node, saved, cancel);
}

std::future<Status> Engine::SaveAsync(ObjectGraph& graph, NodeId node, CancelToken cancel) {
  ObjectGraph* g = &graph;
  return Spawn<Status>(
      [this, g, node, cancel]() {
        return save_.Run(SaveMode::kSave, g, node, nullptr, &cancel);
      },
      ClosedError());
}

// ---------------------------------------------------------------------------
// Load
// ---------------------------------------------------------------------------

Status Engine::Load(ObjectGraph& graph, const TypeDescriptor& type,
                    const std::string& identity, NodeId* out,
                    const CancelToken* cancel) {
  if (closed()) return ClosedError();
  return load_.LoadByIdentity(&graph, type, identity, out, cancel);
}

Status Engine::LoadInlined(const TypeDescriptor& type, const std::string& identity,
                           Json::Value* out, const CancelToken* cancel) {
  if (closed()) return ClosedError();
  return load_.LoadInlined(type, identity, out, cancel);
}

Status Engine::LoadAll(ObjectGraph& graph, const TypeDescriptor& type,
                       const LoadQuery& query, const std::optional<std::string>& cursor,
                       LoadPage* out, const CancelToken* cancel) {
  if (closed()) return ClosedError();
  return load_.LoadAll(&graph, type, query, cursor, out, cancel);
}

Status Engine::LoadAllExhaustive(ObjectGraph& graph, const TypeDescriptor& type,
                                 const LoadQuery& query, LoadPage* out,
                                 const CancelToken* cancel) {
  if (closed()) return ClosedError();
  return load_.LoadAllExhaustive(&graph, type, query, out, cancel);
}

std::future<LoadResult> Engine::LoadAsync(ObjectGraph& graph, const TypeDescriptor& type,
                                          std::string identity, CancelToken cancel) {
  ObjectGraph* g = &graph;
  const TypeDescriptor* t = &type;
  return Spawn<LoadResult>(
      [this, g, t, identity = std::move(identity), cancel]() {
        LoadResult r;
        r.status = load_.LoadByIdentity(g, *t, identity, &r.node, &cancel);
        return r;
      },
      LoadResult{ClosedError(), kNullNode});
}

std::future<PageResult> Engine::LoadAllAsync(ObjectGraph& graph, const TypeDescriptor& type,
                                             LoadQuery query,
                                             std::optional<std::string> cursor,
                                             CancelToken cancel) {
  ObjectGraph* g = &graph;
  const TypeDescriptor* t = &type;
  return Spawn<PageResult>(
      [this, g, t, query = std::move(query), cursor = std::move(cursor), cancel]() {
        PageResult r;
        r.status = load_.LoadAll(g, *t, query, cursor, &r.page, &cancel);
        return r;
      },
      PageResult{ClosedError(), LoadPage{}});
}

// ---------------------------------------------------------------------------
// Delete / refresh
// ---------------------------------------------------------------------------

Status Engine::Delete(ObjectGraph& graph, NodeId node, const CancelToken* cancel) {
  if (closed()) return ClosedError();
  const Model* model = graph.Get(node);
  if (!model) return Status::InvalidArgument("unknown node " + std::to_string(node));
  const std::optional<std::string> identity = graph.Identity(node);
  if (!identity) {
    return Status::InvalidArgument("cannot delete an unsaved " +
                                   model->Descriptor().record_type());
  }
  if (cancel && cancel->cancelled()) {
    return Status::StoreOperationFailed("delete", rocksdb::Status::Aborted("cancelled"),
                                        *identity);
  }

  rocksdb::Status rs = store_->Delete(*identity);
  if (!rs.ok()) {
    return Status::FromStore("delete", rs, *identity, model->Descriptor().record_type());
  }
  cache_.Invalidate(*identity);
  return Status::OK();
}

Status Engine::DeleteCascade(ObjectGraph& graph, NodeId node, const CancelToken* cancel) {
  if (closed()) return ClosedError();
  const Model* model = graph.Get(node);
  if (!model) return Status::InvalidArgument("unknown node " + std::to_string(node));
  const std::string& type_name = model->Descriptor().record_type();
  const std::optional<std::string> identity = graph.Identity(node);
  if (!identity) return Status::InvalidArgument("cannot delete an unsaved " + type_name);

  auto cancelled = [&](const std::string& id) -> Status {
    if (cancel && cancel->cancelled()) {
      return Status::StoreOperationFailed("delete", rocksdb::Status::Aborted("cancelled"), id);
    }
    return Status::OK();
  };

  Record record;
  if (!cache_.Get(*identity, &record)) {
    Status s = cancelled(*identity);
    if (!s.ok()) return s;
    rocksdb::Status rs = store_->Fetch(*identity, &record);
    if (rs.IsNotFound()) return Status::OK();
    if (!rs.ok()) return Status::FromStore("fetch", rs, *identity, type_name);
  }

  // Only children that are cached are deleted.
  for (const auto& child : record.ReferencedIdentities()) {
    if (child == *identity || !cache_.Contains(child)) continue;
    Status s = cancelled(child);
    if (!s.ok()) return s;
    rocksdb::Status rs = store_->Delete(child);
    if (!rs.ok() && !rs.IsNotFound()) {
      LOG_ERROR << "cascade delete of " << child << " failed: " << rs.ToString();
    }
  }

  Status s = cancelled(*identity);
  if (!s.ok()) return s;
  rocksdb::Status rs = store_->Delete(*identity);
  if (!rs.ok() && !rs.IsNotFound()) {
    return Status::FromStore("delete", rs, *identity, type_name);
  }
  cache_.InvalidateCascade(*identity);
  return Status::OK();
}

std::future<Status> Engine::DeleteAsync(ObjectGraph& graph, NodeId node, CancelToken cancel) {
  ObjectGraph* g = &graph;
  return Spawn<Status>([this, g, node, cancel]() { return Delete(*g, node, &cancel); },
                       ClosedError());
}

Status Engine::Refresh(ObjectGraph& graph, NodeId node, NodeId* out,
                       const CancelToken* cancel) {
  if (closed()) return ClosedError();
  const Model* model = graph.Get(node);
  if (!model) return Status::InvalidArgument("unknown node " + std::to_string(node));
  const std::optional<std::string> identity = graph.Identity(node);
  if (!identity) {
    return Status::InvalidArgument("cannot refresh an unsaved " +
                                   model->Descriptor().record_type());
  }
  cache_.InvalidateCascade(*identity);
  return load_.LoadByIdentity(&graph, model->Descriptor(), *identity, out, cancel);
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

bool Engine::BeginTask() {
  std::lock_guard<std::mutex> lock(tasks_mu_);
  if (closed_.load()) return false;
  ++outstanding_;
  return true;
}

void Engine::EndTask() {
  std::lock_guard<std::mutex> lock(tasks_mu_);
  if (--outstanding_ == 0) tasks_cv_.notify_all();
}

void Engine::Close() {
  {
    std::unique_lock<std::mutex> lock(tasks_mu_);
    closed_.store(true);
    tasks_cv_.wait(lock, [this] { return outstanding_ == 0; });
  }
  cache_.Close();
}

}  // namespace tether
