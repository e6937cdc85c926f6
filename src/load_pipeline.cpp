#include <tether/load_pipeline.hpp>

#include <trantor/utils/Logger.h>

#include <tether/cycle_detector.hpp>
#include <tether/internal.hpp>

namespace tether {

LoadPipeline::LoadPipeline(RecordStore* store, RecordCache* cache, const Options& opt)
    : store_(store), cache_(cache), opt_(opt) {}

Status LoadPipeline::CheckCancelled(const CancelToken* cancel, const char* operation,
                                    const std::string& identity) const {
  if (cancel && cancel->cancelled()) {
    return Status::StoreOperationFailed(operation, rocksdb::Status::Aborted("cancelled"),
                                        identity);
  }
  return Status::OK();
}

Status LoadPipeline::FetchRecord(const std::string& identity, const std::string& type_name,
                                 Record* out, bool* fetched, const CancelToken* cancel) {
  *fetched = false;
  if (cache_->Get(identity, out)) return Status::OK();

  Status s = CheckCancelled(cancel, "fetch", identity);
  if (!s.ok()) return s;

  rocksdb::Status rs = store_->Fetch(identity, out);
  if (!rs.ok()) return Status::FromStore("fetch", rs, identity, type_name);

  *fetched = true;
  cache_->Put(*out);
  return Status::OK();
}

// ---------------------------------------------------------------------------
// Inlining
// ---------------------------------------------------------------------------

Status LoadPipeline::Inline(const Record& record, const TypeDescriptor& type,
                            ResolvingSet* resolving, Json::Value* out,
                            const CancelToken* cancel) {
  // Never erased: a record reached again through another path (a diamond)
  // becomes a marker and decodes to the node built the first time.
  if (!record.identity.empty()) resolving->insert(record.identity);

  *out = RecordCodec::Sanitize(record);

  for (const auto& f : type.fields()) {
    if (!IsReferenceKind(f.kind)) continue;
    if (!out->isMember(f.name)) continue;
    Json::Value& value = (*out)[f.name];
    if (value.isNull()) continue;

    if (f.kind == FieldKind::kReference) {
      Json::Value inlined;
      Status s = InlineReference(value, f, type.record_type(), resolving, &inlined, cancel);
      if (!s.ok()) return s;
      value = std::move(inlined);
      continue;
    }

    if (!value.isArray()) continue;  // DecodeObject reports the mismatch
    Json::Value list(Json::arrayValue);
    for (const auto& item : value) {
      Json::Value inlined;
      Status s = InlineReference(item, f, type.record_type(), resolving, &inlined, cancel);
      if (!s.ok()) return s;
      if (!inlined.isNull()) list.append(std::move(inlined));
    }
    value = std::move(list);
  }
  return Status::OK();
}

Status LoadPipeline::InlineReference(const Json::Value& ref, const FieldDescriptor& field,
                                     const std::string& owner_type, ResolvingSet* resolving,
                                     Json::Value* out, const CancelToken* cancel) {
  if (!ref.isObject() || !ref[kIdentityKey].isString()) {
    *out = ref;
    return Status::OK();
  }
  const std::string identity = ref[kIdentityKey].asString();

  if (resolving->count(identity)) {
    internal::EmitCounter(opt_.metrics, "tether.load.cycle_marker_total");
    *out = RecordCodec::CycleMarker(identity);
    return Status::OK();
  }

  const TypeDescriptor* target = field.Target();
  if (!target) {
    return Status::MappingError(owner_type, field.name, "field has no target type");
  }

  Record record;
  bool fetched = false;
  Status s = FetchRecord(identity, target->record_type(), &record, &fetched, cancel);
  if (s.IsRecordNotFound()) {
    LOG_WARN << "dangling reference " << owner_type << "." << field.name << " -> "
             << identity;
    *out = Json::Value(Json::nullValue);
    return Status::OK();
  }
  if (!s.ok()) return s;

  if (record.record_type != target->record_type()) {
    return Status::MappingError(owner_type, field.name,
                                "referenced record " + identity + " is a " +
                                    record.record_type + ", expected " +
                                    target->record_type());
  }
  return Inline(record, *target, resolving, out, cancel);
}

Status LoadPipeline::LoadRoot(const TypeDescriptor& type, const std::string& identity,
                              Json::Value* tree, bool* fetched,
                              const CancelToken* cancel) {
  Record record;
  Status s = FetchRecord(identity, type.record_type(), &record, fetched, cancel);
  if (!s.ok()) return s;

  if (*fetched && opt_.reject_cyclic_fetches) {
    auto lookup = [this](const std::string& id, Record* r) { return cache_->Get(id, r); };
    if (CycleDetector::RecordGraphHasCycle(record, lookup)) {
      cache_->Invalidate(identity);
      return Status::CircularReferenceRejected(identity, type.record_type());
    }
  }

  if (record.record_type != type.record_type()) {
    return Status::MappingError(type.record_type(), kRecordTypeKey,
                                "record " + identity + " is a " + record.record_type);
  }

  ResolvingSet resolving;
  return Inline(record, type, &resolving, tree, cancel);
}

Status LoadPipeline::LoadInlined(const TypeDescriptor& type, const std::string& identity,
                                 Json::Value* out, const CancelToken* cancel) {
  bool fetched = false;
  return LoadRoot(type, identity, out, &fetched, cancel);
}

Status LoadPipeline::DecodeTree(ObjectGraph* graph, const TypeDescriptor& type,
                                const Json::Value& tree, NodeId* out) const {
  DecodeSession session;
  session.graph = graph;
  Status s = RecordCodec::DecodeObject(tree, type, &session, out);
  if (!s.ok() && !s.IsMappingError()) {
    return Status::MappingError(type.record_type(), s.field(), s.ToString());
  }
  return s;
}

// ---------------------------------------------------------------------------
// Single-record load
// ---------------------------------------------------------------------------

Status LoadPipeline::LoadByIdentity(ObjectGraph* graph, const TypeDescriptor& type,
                                    const std::string& identity, NodeId* out,
                                    const CancelToken* cancel) {
  if (!graph) return Status::InvalidArgument("graph is null");
  if (identity.empty()) return Status::InvalidArgument("identity is empty");

  const Clock* clock = opt_.clock ? opt_.clock : RealClock::Default();
  internal::EmitCounter(opt_.metrics, "tether.load.calls");
  const uint64_t op_start_us = clock->NowMicros();

  std::unique_ptr<TraceSpan> span;
  if (opt_.tracer) span = opt_.tracer->StartSpan("tether.Load");
  internal::SpanAttr(span.get(), "record_type", type.record_type());

  auto finish = [&](const Status& st) -> Status {
    const uint64_t dur_us = clock->NowMicros() - op_start_us;
    internal::EmitHistogram(opt_.metrics, "tether.load.latency_us", dur_us);
    if (!st.ok()) internal::EmitCounter(opt_.metrics, "tether.load.error_total");
    if (span) {
      internal::SpanAttr(span.get(), "latency_us", dur_us);
      internal::SpanAttr(span.get(), "status", Status::CodeName(st.code()));
      span->End(st);
    }
    return st;
  };

  Json::Value tree;
  bool fetched = false;
  Status s = LoadRoot(type, identity, &tree, &fetched, cancel);
  if (!s.ok()) return finish(s);

  s = DecodeTree(graph, type, tree, out);
  if (!s.ok()) {
    // A record that does not decode is not kept around for the next load.
    if (fetched) cache_->Invalidate(identity);
    return finish(s);
  }
  return finish(Status::OK());
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

Status LoadPipeline::LoadAll(ObjectGraph* graph, const TypeDescriptor& type,
                             const LoadQuery& query,
                             const std::optional<std::string>& cursor, LoadPage* out,
                             const CancelToken* cancel) {
  if (!graph) return Status::InvalidArgument("graph is null");
  *out = LoadPage{};

  std::unique_ptr<TraceSpan> span;
  if (opt_.tracer) span = opt_.tracer->StartSpan("tether.LoadPage");
  internal::SpanAttr(span.get(), "record_type", type.record_type());

  auto finish = [&](const Status& st) -> Status {
    if (!st.ok()) internal::EmitCounter(opt_.metrics, "tether.load.error_total");
    if (span) {
      internal::SpanAttr(span.get(), "matches", static_cast<uint64_t>(out->nodes.size()));
      internal::SpanAttr(span.get(), "partial_errors",
                         static_cast<uint64_t>(out->partial_errors.size()));
      span->End(st);
    }
    return st;
  };

  Status s = CheckCancelled(cancel, "query", {});
  if (!s.ok()) return finish(s);

  QuerySpec spec;
  spec.record_type = type.record_type();
  spec.predicate = query.predicate;
  spec.sort = query.sort;
  spec.limit = query.limit;

  QueryPage page;
  rocksdb::Status rs = store_->Query(spec, cursor, &page);
  if (!rs.ok()) return finish(Status::StoreOperationFailed("query", rs));

  std::vector<Record> fresh;
  fresh.reserve(page.matches.size());

  for (auto& match : page.matches) {
    if (!match.status.ok()) {
      internal::EmitCounter(opt_.metrics, "tether.load.partial_error_total");
      out->partial_errors.emplace(
          match.identity, Status::StoreOperationFailed("query", match.status, match.identity));
      continue;
    }

    ResolvingSet resolving;
    Json::Value tree;
    s = Inline(match.record, type, &resolving, &tree, cancel);
    NodeId node = kNullNode;
    if (s.ok()) s = DecodeTree(graph, type, tree, &node);
    if (!s.ok()) {
      if (s.IsCancelled()) return finish(s);
      LOG_WARN << "skipping " << type.record_type() << " " << match.identity << ": "
               << s.ToString();
      internal::EmitCounter(opt_.metrics, "tether.load.partial_error_total");
      out->partial_errors.emplace(match.identity, std::move(s));
      continue;
    }

    out->nodes.push_back(node);
    fresh.push_back(std::move(match.record));
  }

  cache_->PutMany(fresh);
  out->next_cursor = std::move(page.next_cursor);
  return finish(Status::OK());
}

Status LoadPipeline::LoadAllExhaustive(ObjectGraph* graph, const TypeDescriptor& type,
                                       const LoadQuery& query, LoadPage* out,
                                       const CancelToken* cancel) {
  *out = LoadPage{};
  std::optional<std::string> cursor;

  do {
    LoadPage page;
    Status s = LoadAll(graph, type, query, cursor, &page, cancel);
    if (!s.ok()) {
      *out = LoadPage{};
      return s;
    }
    out->nodes.insert(out->nodes.end(), page.nodes.begin(), page.nodes.end());
    for (auto& [identity, error] : page.partial_errors) {
      out->partial_errors.emplace(identity, std::move(error));
    }
    cursor = std::move(page.next_cursor);
  } while (cursor);

  return Status::OK();
}

}  // namespace tether
