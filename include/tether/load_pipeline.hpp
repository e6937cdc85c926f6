#pragma once

#include <map>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include <json/json.h>

#include <tether/cancel.hpp>
#include <tether/codec.hpp>
#include <tether/object_graph.hpp>
#include <tether/options.hpp>
#include <tether/record.hpp>
#include <tether/record_cache.hpp>
#include <tether/record_store.hpp>
#include <tether/status.hpp>

namespace tether {

struct LoadQuery {
  Predicate predicate;
  std::vector<SortKey> sort;
  uint64_t limit = 0;  // records per page, 0 = unbounded
};

/**
 * Objects decoded by a query, in arrival order. Records that came back but
 * could not be decoded are reported per identity in `partial_errors`.
 */
struct LoadPage {
  std::vector<NodeId> nodes;
  std::optional<std::string> next_cursor;
  std::map<std::string, Status> partial_errors;
};

/**
 * Read side: cache read-through, decoding and reference inlining.
 *
 * Referenced records are inlined recursively. One set of identities being
 * resolved is threaded through a whole decode; meeting one of them again
 * yields a cycle marker that decodes to the node already built for it, so
 * a cyclic stored graph becomes a cyclic object graph.
 */
class LoadPipeline {
 public:
  LoadPipeline(RecordStore* store, RecordCache* cache, const Options& opt);

  Status LoadByIdentity(ObjectGraph* graph, const TypeDescriptor& type,
                        const std::string& identity, NodeId* out,
                        const CancelToken* cancel = nullptr);

  /** The sanitized, inlined JSON tree LoadByIdentity() decodes from. */
  Status LoadInlined(const TypeDescriptor& type, const std::string& identity,
                     Json::Value* out, const CancelToken* cancel = nullptr);

  /** One page of a query over `type`. Store errors fail the whole page. */
  Status LoadAll(ObjectGraph* graph, const TypeDescriptor& type,
                 const LoadQuery& query, const std::optional<std::string>& cursor,
                 LoadPage* out, const CancelToken* cancel = nullptr);

  /** Follows cursors to the end. On a page error only the error is returned. */
  Status LoadAllExhaustive(ObjectGraph* graph, const TypeDescriptor& type,
                           const LoadQuery& query, LoadPage* out,
                           const CancelToken* cancel = nullptr);

  /**
   * Cached record if fresh, otherwise fetched from the store and cached.
   * `fetched` reports which path was taken.
   */
  Status FetchRecord(const std::string& identity, const std::string& type_name,
                     Record* out, bool* fetched, const CancelToken* cancel);

 private:
  using ResolvingSet = std::unordered_set<std::string>;

  Status LoadRoot(const TypeDescriptor& type, const std::string& identity,
                  Json::Value* tree, bool* fetched, const CancelToken* cancel);

  Status Inline(const Record& record, const TypeDescriptor& type,
                ResolvingSet* resolving, Json::Value* out,
                const CancelToken* cancel);

  Status InlineReference(const Json::Value& ref, const FieldDescriptor& field,
                         const std::string& owner_type, ResolvingSet* resolving,
                         Json::Value* out, const CancelToken* cancel);

  Status DecodeTree(ObjectGraph* graph, const TypeDescriptor& type,
                    const Json::Value& tree, NodeId* out) const;

  Status CheckCancelled(const CancelToken* cancel, const char* operation,
                        const std::string& identity) const;

  RecordStore* store_;
  RecordCache* cache_;
  const Options& opt_;
};

}  // namespace tether
