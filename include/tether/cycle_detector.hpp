#pragma once

#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

#include <tether/object_graph.hpp>
#include <tether/record.hpp>

namespace tether {

/**
 * Reachability checks over reference fields.
 *
 * Object-side checks compare NodeIds, so only true reference cycles count,
 * never structurally equal objects. Cycles that do not pass through `root`
 * are tolerated: a revisited node simply ends that branch.
 */
class CycleDetector {
 public:
  explicit CycleDetector(const ObjectGraph& graph) : graph_(graph) {}

  /** True if following references from `candidate` leads back to `root`. */
  bool HasPathBackTo(NodeId candidate, NodeId root) const;
  bool HasPathBackTo(NodeId candidate, NodeId root,
                     std::unordered_set<NodeId>* visited) const;

  /** Non-null targets of every reference field of `node`, in field order. */
  std::vector<NodeId> Children(NodeId node) const;

  using RecordLookup = std::function<bool(const std::string& identity, Record* out)>;

  /**
   * True if the reference subgraph reachable from `root` contains any
   * cycle. Records are resolved through `lookup`; identities it cannot
   * resolve are treated as leaves.
   */
  static bool RecordGraphHasCycle(const Record& root, const RecordLookup& lookup);

 private:
  const ObjectGraph& graph_;
};

}  // namespace tether
