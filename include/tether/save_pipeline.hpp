#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <tether/cancel.hpp>
#include <tether/codec.hpp>
#include <tether/inflight.hpp>
#include <tether/object_graph.hpp>
#include <tether/options.hpp>
#include <tether/record.hpp>
#include <tether/record_cache.hpp>
#include <tether/record_store.hpp>
#include <tether/status.hpp>

namespace tether {

enum class SaveMode {
  kSave,    // create or overwrite
  kInsert,  // fails with RecordAlreadyExists if the object has an identity
  kUpdate,  // fails with RecordDoesNotExist if it has none
  kUpsert,  // looks the identity up, then inserts or updates
};

/**
 * Writes an object graph as a sequence of single-record saves that never
 * reference an identity the store does not have yet.
 *
 * A reference from an object without identity to an object that cannot be
 * saved first (because it leads back to the parent) is recorded as pending.
 * The parent is persisted without that edge, then each pending branch is
 * saved and the edge is patched in with a second write of the parent.
 *
 * Saves run one store call at a time. Branch saves are nested in the same
 * session; independent Run() calls may proceed concurrently.
 */
class SavePipeline {
 public:
  SavePipeline(RecordStore* store, RecordCache* cache, InFlightSaves* inflight,
               const Options& opt);

  Status Run(SaveMode mode, ObjectGraph* graph, NodeId node, Record* saved,
             const CancelToken* cancel = nullptr);

  Status Save(ObjectGraph* graph, NodeId node, Record* saved = nullptr,
              const CancelToken* cancel = nullptr) {
    return Run(SaveMode::kSave, graph, node, saved, cancel);
  }

 private:
  struct Context {
    ObjectGraph* graph = nullptr;
    uint64_t session = 0;
    const CancelToken* cancel = nullptr;
    std::vector<NodeId> stack;  // nodes being saved by this session
    std::map<NodeId, std::string> claims;  // registry keys this session holds
  };

  // A reference edge left out of the first write of its parent.
  struct PendingReference {
    const FieldDescriptor* field = nullptr;
    NodeId node = kNullNode;
  };

  Status SaveNode(Context* ctx, NodeId node, Record* saved);
  Status BuildNode(Context* ctx, NodeId node, Record* saved);

  Status ResolveIdentity(const Model& model, std::string* identity) const;

  Status Prepare(Context* ctx, NodeId node, bool had_identity, Record* record,
                 std::vector<PendingReference>* pending);

  Status ResolveReference(Context* ctx, NodeId parent, bool had_identity,
                          const ReferenceField& ref, Record* record,
                          std::vector<PendingReference>* pending);

  Status ResolveReferenceList(Context* ctx, NodeId parent, bool had_identity,
                              const ReferenceField& ref, Record* record);

  /** Save `target` and return its identity; errors name the referring field. */
  Status SaveBranch(Context* ctx, NodeId target, const std::string& field,
                    const std::string& owner_type, std::string* identity);

  Status DispatchPending(Context* ctx, NodeId node,
                         const std::vector<PendingReference>& pending,
                         Record* record);

  Status Persist(Context* ctx, const Record& record, Record* saved);

  Status CheckCancelled(const Context* ctx, const char* operation) const;

  std::string RegistryKey(const Context* ctx, NodeId node) const;

  RecordStore* store_;
  RecordCache* cache_;
  InFlightSaves* inflight_;
  const Options& opt_;
};

}  // namespace tether
