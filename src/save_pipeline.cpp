#include <tether/save_pipeline.hpp>

#include <algorithm>
#include <cinttypes>
#include <cstdio>

#include <trantor/utils/Logger.h>

#include <tether/cycle_detector.hpp>
#include <tether/internal.hpp>

namespace tether {

namespace {

std::string IdentityKey(const std::string& identity) { return "id:" + identity; }

bool OnStack(const std::vector<NodeId>& stack, NodeId node) {
  return std::find(stack.begin(), stack.end(), node) != stack.end();
}

// Low-cardinality status names for span attributes.
std::string_view StatusKind(const Status& s) {
  return Status::CodeName(s.code());
}

}  // namespace

SavePipeline::SavePipeline(RecordStore* store, RecordCache* cache,
                           InFlightSaves* inflight, const Options& opt)
    : store_(store), cache_(cache), inflight_(inflight), opt_(opt) {}

Status SavePipeline::Run(SaveMode mode, ObjectGraph* graph, NodeId node,
                         Record* saved, const CancelToken* cancel) {
  if (!graph) return Status::InvalidArgument("graph is null");
  const Model* model = graph->Get(node);
  if (!model) return Status::InvalidArgument("unknown node " + std::to_string(node));
  const std::string& type_name = model->Descriptor().record_type();

  const Clock* clock = opt_.clock ? opt_.clock : RealClock::Default();
  internal::EmitCounter(opt_.metrics, "tether.save.calls");
  const uint64_t op_start_us = clock->NowMicros();

  std::unique_ptr<TraceSpan> span;
  if (opt_.tracer) span = opt_.tracer->StartSpan("tether.Save");
  internal::SpanAttr(span.get(), "record_type", type_name);

  auto finish = [&](const Status& st) -> Status {
    const uint64_t dur_us = clock->NowMicros() - op_start_us;
    internal::EmitHistogram(opt_.metrics, "tether.save.latency_us", dur_us);
    if (st.ok()) {
      internal::EmitCounter(opt_.metrics, "tether.save.ok_total");
    } else {
      internal::EmitCounter(opt_.metrics, "tether.save.error_total");
      LOG_ERROR << "save of " << type_name << " failed: " << st.ToString();
    }
    if (span) {
      internal::SpanAttr(span.get(), "latency_us", dur_us);
      internal::SpanAttr(span.get(), "status", StatusKind(st));
      span->End(st);
    }
    return st;
  };

  Context ctx;
  ctx.graph = graph;
  ctx.session = inflight_->NewSession();
  ctx.cancel = cancel;

  const std::optional<std::string> identity = graph->Identity(node);
  switch (mode) {
    case SaveMode::kInsert:
      if (identity) return finish(Status::RecordAlreadyExists(*identity, type_name));
      break;
    case SaveMode::kUpdate:
      if (!identity) return finish(Status::RecordDoesNotExist({}, type_name));
      break;
    case SaveMode::kUpsert:
      if (identity) {
        Status s = CheckCancelled(&ctx, "fetch");
        if (!s.ok()) return finish(s);
        Record existing;
        rocksdb::Status fs = store_->Fetch(*identity, &existing);
        if (fs.IsNotFound()) {
          // Unknown to the store: created under the caller's identity.
          LOG_DEBUG << "upsert creates " << type_name << " " << *identity;
        } else if (!fs.ok()) {
          return finish(Status::StoreOperationFailed("fetch", fs, *identity));
        }
      }
      break;
    case SaveMode::kSave:
      break;
  }

  Record out;
  Status s = SaveNode(&ctx, node, &out);
  if (s.ok() && saved) *saved = std::move(out);
  return finish(s);
}

std::string SavePipeline::RegistryKey(const Context* ctx, NodeId node) const {
  if (auto identity = ctx->graph->Identity(node)) return IdentityKey(*identity);
  char buf[64];
  std::snprintf(buf, sizeof(buf), "node:%p:%" PRIu32,
                static_cast<const void*>(ctx->graph), node);
  return buf;
}

Status SavePipeline::SaveNode(Context* ctx, NodeId node, Record* saved) {
  // Already being saved further up this session's chain: hand back what is
  // known instead of recursing again.
  if (OnStack(ctx->stack, node)) {
    auto identity = ctx->graph->Identity(node);
    if (identity && !cache_->Get(*identity, saved)) saved->identity = *identity;
    return Status::OK();
  }

  if (!opt_.deduplicate_concurrent_saves) {
    ctx->stack.push_back(node);
    Status s = BuildNode(ctx, node, saved);
    ctx->stack.pop_back();
    return s;
  }

  const std::string key = RegistryKey(ctx, node);
  InFlightSaves::Outcome joined;
  const InFlightSaves::Claim claim = inflight_->Acquire(key, ctx->session, &joined);

  if (claim == InFlightSaves::Claim::kJoined) {
    internal::EmitCounter(opt_.metrics, "tether.save.joined_total");
    if (!joined.status.ok()) return joined.status;

    Status s = ctx->graph->AssignIdentity(node, joined.identity);
    if (!s.ok()) return s;
    if (!cache_->Get(joined.identity, saved)) {
      s = CheckCancelled(ctx, "fetch");
      if (!s.ok()) return s;
      rocksdb::Status fs = store_->Fetch(joined.identity, saved);
      if (!fs.ok()) return Status::FromStore("fetch", fs, joined.identity);
      cache_->Put(*saved);
    }
    ctx->graph->SetSystem(node, saved->system);
    return Status::OK();
  }

  if (claim == InFlightSaves::Claim::kWaitCycle) {
    LOG_DEBUG << "save of " << key << " proceeds without waiting (wait cycle)";
  }

  const bool holds_claim = claim != InFlightSaves::Claim::kWaitCycle;
  if (holds_claim) ctx->claims.emplace(node, key);

  ctx->stack.push_back(node);
  Status s = BuildNode(ctx, node, saved);
  ctx->stack.pop_back();

  if (holds_claim) {
    if (claim == InFlightSaves::Claim::kOwner) ctx->claims.erase(node);
    inflight_->Release(key, ctx->session,
                       InFlightSaves::Outcome{s, s.ok() ? saved->identity : std::string()});
  }
  return s;
}

Status SavePipeline::BuildNode(Context* ctx, NodeId node, Record* saved) {
  const Model* model = ctx->graph->Get(node);
  const TypeDescriptor& type = model->Descriptor();

  const std::optional<std::string> existing = ctx->graph->Identity(node);
  const bool had_identity = existing.has_value();

  Record record;
  record.record_type = type.record_type();
  if (had_identity) {
    record.identity = *existing;
  } else {
    Status s = ResolveIdentity(*model, &record.identity);
    if (!s.ok()) return s;
  }

  std::vector<PendingReference> pending;
  Status s = Prepare(ctx, node, had_identity, &record, &pending);
  if (!s.ok()) return s;

  Record stored;
  s = Persist(ctx, record, &stored);
  if (!s.ok()) return s;

  // The claim must answer for the identity before other sessions can see it
  // on the node.
  if (!had_identity) {
    auto claim = ctx->claims.find(node);
    if (claim != ctx->claims.end()) {
      inflight_->Alias(claim->second, IdentityKey(stored.identity), ctx->session);
    }
  }

  s = ctx->graph->AssignIdentity(node, stored.identity);
  if (!s.ok()) return s;
  ctx->graph->SetSystem(node, stored.system);

  if (!pending.empty()) {
    s = DispatchPending(ctx, node, pending, &stored);
    if (!s.ok()) return s;
  }

  *saved = std::move(stored);
  return Status::OK();
}

Status SavePipeline::ResolveIdentity(const Model& model, std::string* identity) const {
  const TypeDescriptor& type = model.Descriptor();

  switch (opt_.identity_strategy) {
    case IdentityStrategy::kStoreGenerated:
      identity->clear();
      return Status::OK();

    case IdentityStrategy::kClientGenerated:
      *identity = internal::RandomIdentity();
      return Status::OK();

    case IdentityStrategy::kCustomGenerator:
      if (!opt_.identity_generator) {
        return Status::InvalidArgument("identity_generator is not set");
      }
      *identity = opt_.identity_generator(model);
      if (identity->empty()) {
        return Status::InvalidArgument("identity_generator returned an empty identity for " +
                                       type.record_type());
      }
      return Status::OK();

    case IdentityStrategy::kKeyField: {
      const FieldDescriptor* f = type.Find(opt_.identity_key_field);
      if (!f) {
        return Status::InvalidArgument(type.record_type() + " has no key field '" +
                                       opt_.identity_key_field + "'");
      }
      FieldValue v = f->get(model);
      if (const auto* str = std::get_if<std::string>(&v)) {
        *identity = *str;
      } else if (const auto* num = std::get_if<int64_t>(&v)) {
        *identity = std::to_string(*num);
      } else {
        return Status::InvalidArgument("key field '" + f->name + "' of " +
                                       type.record_type() + " is not a string or int");
      }
      if (identity->empty()) {
        return Status::InvalidArgument("key field '" + f->name + "' of " +
                                       type.record_type() + " is empty");
      }
      return Status::OK();
    }
  }
  return Status::InvalidArgument("unknown identity strategy");
}

Status SavePipeline::Prepare(Context* ctx, NodeId node, bool had_identity,
                             Record* record, std::vector<PendingReference>* pending) {
  const Model* model = ctx->graph->Get(node);
  const std::string& type_name = model->Descriptor().record_type();

  std::vector<ReferenceField> references;
  Status s = RecordCodec::EncodeLeaves(*model, record, &references);
  if (!s.ok()) return s;

  for (const auto& ref : references) {
    s = ref.is_list ? ResolveReferenceList(ctx, node, had_identity, ref, record)
                    : ResolveReference(ctx, node, had_identity, ref, record, pending);
    if (!s.ok()) return Status::FieldProcessingFailed(ref.field->name, type_name, s);
  }
  return Status::OK();
}

Status SavePipeline::ResolveReference(Context* ctx, NodeId parent, bool had_identity,
                                      const ReferenceField& ref, Record* record,
                                      std::vector<PendingReference>* pending) {
  if (ref.node == kNullNode) return Status::OK();

  const std::string& field = ref.field->name;
  const std::string& type_name = record->record_type;

  // a. Target already stored and cached.
  const std::optional<std::string> target = ctx->graph->Identity(ref.node);
  if (target && cache_->Contains(*target)) {
    record->Set(field, Reference{*target});
    return Status::OK();
  }

  // b. This record is addressable, so the target can be saved first.
  if (had_identity) {
    std::string identity;
    Status s = SaveBranch(ctx, ref.node, field, type_name, &identity);
    if (!s.ok()) return s;
    record->Set(field, Reference{identity});
    return Status::OK();
  }

  // c. The target leads back here: write this record without the edge and
  //    patch it in afterwards.
  CycleDetector detector(*ctx->graph);
  if (detector.HasPathBackTo(ref.node, parent)) {
    LOG_DEBUG << "deferring cyclic reference " << type_name << "." << field;
    internal::EmitCounter(opt_.metrics, "tether.save.deferred_total");
    pending->push_back(PendingReference{ref.field, ref.node});
    return Status::OK();
  }

  // d. No cycle and no identity yet.
  if (opt_.unresolved_references == UnresolvedReferencePolicy::kSkip) {
    LOG_WARN << "skipping unresolved reference " << type_name << "." << field;
    internal::EmitCounter(opt_.metrics, "tether.save.skipped_reference_total");
    return Status::OK();
  }
  LOG_DEBUG << "deferring reference " << type_name << "." << field;
  internal::EmitCounter(opt_.metrics, "tether.save.deferred_total");
  pending->push_back(PendingReference{ref.field, ref.node});
  return Status::OK();
}

Status SavePipeline::ResolveReferenceList(Context* ctx, NodeId parent, bool had_identity,
                                          const ReferenceField& ref, Record* record) {
  const std::string& type_name = record->record_type;
  CycleDetector detector(*ctx->graph);

  std::vector<Reference> references;
  references.reserve(ref.nodes.size());
  for (size_t i = 0; i < ref.nodes.size(); ++i) {
    const NodeId element = ref.nodes[i];
    if (element == kNullNode) continue;
    const std::string indexed = ref.field->name + "[" + std::to_string(i) + "]";

    const std::optional<std::string> target = ctx->graph->Identity(element);
    if (target && cache_->Contains(*target)) {
      references.push_back(Reference{*target});
      continue;
    }

    // List elements are never deferred.
    if (!had_identity &&
        (OnStack(ctx->stack, element) || detector.HasPathBackTo(element, parent))) {
      return Status::ReferenceSavingFailed(
          indexed, type_name,
          Status::InvalidReference(indexed, type_name,
                                   "element needs this record saved first"));
    }

    std::string identity;
    Status s = SaveBranch(ctx, element, indexed, type_name, &identity);
    if (!s.ok()) return s;
    references.push_back(Reference{identity});
  }

  record->Set(ref.field->name, std::move(references));
  return Status::OK();
}

Status SavePipeline::SaveBranch(Context* ctx, NodeId target, const std::string& field,
                                const std::string& owner_type, std::string* identity) {
  Record branch;
  Status s = SaveNode(ctx, target, &branch);
  if (!s.ok()) return Status::ReferenceSavingFailed(field, owner_type, s);
  if (branch.identity.empty()) {
    return Status::InvalidReference(field, owner_type, "branch save produced no identity");
  }
  *identity = branch.identity;
  return Status::OK();
}

Status SavePipeline::DispatchPending(Context* ctx, NodeId node,
                                     const std::vector<PendingReference>& pending,
                                     Record* record) {
  const std::string type_name = record->record_type;

  for (const auto& item : pending) {
    const std::string& field = item.field->name;
    std::string identity;
    const std::optional<std::string> target = ctx->graph->Identity(item.node);
    if (target && cache_->Contains(*target)) {
      // Stored meanwhile by another branch of this save.
      identity = *target;
    } else {
      Status s = SaveBranch(ctx, item.node, field, type_name, &identity);
      if (!s.ok()) return Status::FieldProcessingFailed(field, type_name, s);
    }

    auto it = record->attributes.find(field);
    if (it != record->attributes.end()) {
      if (auto* list = std::get_if<std::vector<Reference>>(&it->second)) {
        list->push_back(Reference{identity});
        internal::EmitCounter(opt_.metrics, "tether.save.patched_total");
        continue;
      }
    }
    record->Set(field, Reference{identity});
    internal::EmitCounter(opt_.metrics, "tether.save.patched_total");
  }

  Record stored;
  Status s = Persist(ctx, *record, &stored);
  if (!s.ok()) return s;
  ctx->graph->SetSystem(node, stored.system);
  *record = std::move(stored);
  return Status::OK();
}

Status SavePipeline::Persist(Context* ctx, const Record& record, Record* saved) {
  Status s = CheckCancelled(ctx, "save");
  if (!s.ok()) return s;

  rocksdb::Status rs = store_->Save(record, saved);
  if (!rs.ok()) return Status::FromStore("save", rs, record.identity, record.record_type);

  cache_->Put(*saved);
  return Status::OK();
}

Status SavePipeline::CheckCancelled(const Context* ctx, const char* operation) const {
  if (ctx->cancel && ctx->cancel->cancelled()) {
    return Status::StoreOperationFailed(operation, rocksdb::Status::Aborted("cancelled"));
  }
  return Status::OK();
}

}  // namespace tether
