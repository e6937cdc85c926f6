#include <tether/cycle_detector.hpp>

#include <unordered_map>
#include <utility>

namespace tether {

std::vector<NodeId> CycleDetector::Children(NodeId node) const {
  std::vector<NodeId> out;
  const Model* model = graph_.Get(node);
  if (!model) return out;

  for (const auto& f : model->Descriptor().fields()) {
    if (f.kind == FieldKind::kReference) {
      FieldValue v = f.get(*model);
      if (const auto* link = std::get_if<NodeLink>(&v)) {
        if (link->node != kNullNode) out.push_back(link->node);
      }
    } else if (f.kind == FieldKind::kReferenceList) {
      FieldValue v = f.get(*model);
      if (const auto* list = std::get_if<NodeLinkList>(&v)) {
        for (NodeId n : list->nodes) {
          if (n != kNullNode) out.push_back(n);
        }
      }
    }
  }
  return out;
}

bool CycleDetector::HasPathBackTo(NodeId candidate, NodeId root) const {
  std::unordered_set<NodeId> visited;
  return HasPathBackTo(candidate, root, &visited);
}

bool CycleDetector::HasPathBackTo(NodeId candidate, NodeId root,
                                  std::unordered_set<NodeId>* visited) const {
  if (candidate == kNullNode) return false;

  // Iterative depth-first walk; object graphs can be deep.
  std::vector<NodeId> stack{candidate};
  while (!stack.empty()) {
    NodeId node = stack.back();
    stack.pop_back();

    if (node == root) return true;
    if (!visited->insert(node).second) continue;

    std::vector<NodeId> children = Children(node);
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
      if (*it == root) return true;
      if (!visited->count(*it)) stack.push_back(*it);
    }
  }
  return false;
}

bool CycleDetector::RecordGraphHasCycle(const Record& root, const RecordLookup& lookup) {
  enum class Mark { kInProgress, kDone };
  std::unordered_map<std::string, Mark> marks;

  struct Frame {
    std::string identity;
    std::vector<std::string> children;
    size_t next = 0;
  };

  std::vector<Frame> stack;
  stack.push_back(Frame{root.identity, root.ReferencedIdentities(), 0});
  marks[root.identity] = Mark::kInProgress;

  while (!stack.empty()) {
    Frame& top = stack.back();
    if (top.next == top.children.size()) {
      marks[top.identity] = Mark::kDone;
      stack.pop_back();
      continue;
    }

    std::string child = top.children[top.next++];
    auto it = marks.find(child);
    if (it != marks.end()) {
      if (it->second == Mark::kInProgress) return true;
      continue;
    }

    Record record;
    if (!lookup(child, &record)) {
      marks[child] = Mark::kDone;  // unresolvable: leaf
      continue;
    }
    marks[child] = Mark::kInProgress;
    std::vector<std::string> grandchildren = record.ReferencedIdentities();
    stack.push_back(Frame{std::move(child), std::move(grandchildren), 0});
  }
  return false;
}

}  // namespace tether
