#include <tether/object_graph.hpp>

namespace tether {

NodeId ObjectGraph::Add(std::unique_ptr<Model> model) {
  std::lock_guard<std::mutex> lock(mu_);
  nodes_.push_back(Node{std::move(model), std::nullopt, SystemFields{}});
  return static_cast<NodeId>(nodes_.size() - 1);
}

NodeId ObjectGraph::Add(std::unique_ptr<Model> model, std::string identity,
                        SystemFields system) {
  std::lock_guard<std::mutex> lock(mu_);
  Node node{std::move(model), std::nullopt, std::move(system)};
  if (!identity.empty()) node.identity = std::move(identity);
  nodes_.push_back(std::move(node));
  return static_cast<NodeId>(nodes_.size() - 1);
}

NodeId ObjectGraph::AddAll(std::vector<NewNode> nodes) {
  std::lock_guard<std::mutex> lock(mu_);
  const NodeId first = static_cast<NodeId>(nodes_.size());
  for (auto& n : nodes) {
    Node node{std::move(n.model), std::nullopt, std::move(n.system)};
    if (!n.identity.empty()) node.identity = std::move(n.identity);
    nodes_.push_back(std::move(node));
  }
  return first;
}

Model* ObjectGraph::Get(NodeId node) {
  std::lock_guard<std::mutex> lock(mu_);
  if (node == kNullNode || node >= nodes_.size()) return nullptr;
  return nodes_[node].model.get();
}

const Model* ObjectGraph::Get(NodeId node) const {
  std::lock_guard<std::mutex> lock(mu_);
  if (node == kNullNode || node >= nodes_.size()) return nullptr;
  return nodes_[node].model.get();
}

bool ObjectGraph::Contains(NodeId node) const {
  std::lock_guard<std::mutex> lock(mu_);
  return node != kNullNode && node < nodes_.size();
}

size_t ObjectGraph::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return nodes_.size();
}

std::optional<std::string> ObjectGraph::Identity(NodeId node) const {
  std::lock_guard<std::mutex> lock(mu_);
  if (node == kNullNode || node >= nodes_.size()) return std::nullopt;
  return nodes_[node].identity;
}

Status ObjectGraph::AssignIdentity(NodeId node, const std::string& identity) {
  if (identity.empty()) return Status::InvalidArgument("identity is empty");

  std::lock_guard<std::mutex> lock(mu_);
  if (node == kNullNode || node >= nodes_.size()) {
    return Status::InvalidArgument("unknown node " + std::to_string(node));
  }
  auto& current = nodes_[node].identity;
  if (current && *current != identity) {
    return Status::InvalidArgument("identity of node " + std::to_string(node) +
                                   " is already " + *current);
  }
  current = identity;
  return Status::OK();
}

SystemFields ObjectGraph::System(NodeId node) const {
  std::lock_guard<std::mutex> lock(mu_);
  if (node == kNullNode || node >= nodes_.size()) return SystemFields{};
  return nodes_[node].system;
}

void ObjectGraph::SetSystem(NodeId node, SystemFields system) {
  std::lock_guard<std::mutex> lock(mu_);
  if (node == kNullNode || node >= nodes_.size()) return;
  nodes_[node].system = std::move(system);
}

}  // namespace tether
