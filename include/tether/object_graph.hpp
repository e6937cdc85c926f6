#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <tether/model.hpp>
#include <tether/status.hpp>

namespace tether {

/**
 * Arena of model instances addressed by NodeId.
 *
 * Edges between objects are Ref<T> values holding a NodeId, so two
 * references point at the same object exactly when their ids are equal.
 * Each node also carries the object's identity (unset until first save)
 * and its store-assigned system fields.
 *
 * Node insertion and identity/system-field access are thread-safe. Domain
 * fields are plain members of the model and must not be mutated while a
 * save that includes the node is running.
 */
class ObjectGraph {
 public:
  ObjectGraph() = default;
  ObjectGraph(const ObjectGraph&) = delete;
  ObjectGraph& operator=(const ObjectGraph&) = delete;

  NodeId Add(std::unique_ptr<Model> model);
  NodeId Add(std::unique_ptr<Model> model, std::string identity,
             SystemFields system);

  struct NewNode {
    std::unique_ptr<Model> model;
    std::string identity;
    SystemFields system;
  };

  /** Append `nodes` as one contiguous run; returns the id of the first. */
  NodeId AddAll(std::vector<NewNode> nodes);

  template <typename T>
  Ref<T> Add(T value) {
    return Ref<T>(Add(std::unique_ptr<Model>(new T(std::move(value)))));
  }

  /** Nullptr for a null or unknown node. */
  Model* Get(NodeId node);
  const Model* Get(NodeId node) const;

  /** Nullptr for a null ref, an unknown node, or a node of another type. */
  template <typename T>
  T* Get(Ref<T> ref) {
    Model* m = Get(ref.node);
    if (!m || &m->Descriptor() != &T::Type()) return nullptr;
    return static_cast<T*>(m);
  }

  template <typename T>
  const T* Get(Ref<T> ref) const {
    const Model* m = Get(ref.node);
    if (!m || &m->Descriptor() != &T::Type()) return nullptr;
    return static_cast<const T*>(m);
  }

  /** Typed view of an untyped node, null if the node holds another type. */
  template <typename T>
  Ref<T> As(NodeId node) const {
    const Model* m = Get(node);
    if (!m || &m->Descriptor() != &T::Type()) return Ref<T>();
    return Ref<T>(node);
  }

  bool Contains(NodeId node) const;
  size_t size() const;

  std::optional<std::string> Identity(NodeId node) const;

  /**
   * Set the identity of a node. Assigning the same identity again is a
   * no-op; assigning a different one fails with InvalidArgument.
   */
  Status AssignIdentity(NodeId node, const std::string& identity);

  SystemFields System(NodeId node) const;
  void SetSystem(NodeId node, SystemFields system);

 private:
  struct Node {
    std::unique_ptr<Model> model;
    std::optional<std::string> identity;
    SystemFields system;
  };

  mutable std::mutex mu_;
  std::deque<Node> nodes_;  // deque keeps Model* stable across insertions
};

}  // namespace tether
