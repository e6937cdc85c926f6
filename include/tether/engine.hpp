#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>

#include <tether/cancel.hpp>
#include <tether/inflight.hpp>
#include <tether/load_pipeline.hpp>
#include <tether/object_graph.hpp>
#include <tether/options.hpp>
#include <tether/record_cache.hpp>
#include <tether/record_store.hpp>
#include <tether/save_pipeline.hpp>
#include <tether/status.hpp>

namespace tether {

struct LoadResult {
  Status status;
  NodeId node = kNullNode;
};

struct PageResult {
  Status status;
  LoadPage page;
};

/**
 * Object-graph persistence engine.
 *
 * Bundles a record store, the record cache, the in-flight save registry and
 * both pipelines. Every call has a synchronous form; the *Async forms run
 * the same call on a separate thread and return a future. The graph passed
 * to an asynchronous call must outlive the future.
 *
 * Close() waits for outstanding asynchronous calls, then closes the cache.
 * Calls made after Close() fail with InvalidArgument.
 */
class Engine {
 public:
  static Status Open(std::unique_ptr<RecordStore> store, const Options& opt,
                     std::unique_ptr<Engine>* out);

  ~Engine();

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  // ---------------------------------------------------------------------------
  // Save
  // ---------------------------------------------------------------------------

  Status Save(ObjectGraph& graph, NodeId node, Record* saved = nullptr,
              const CancelToken* cancel = nullptr);
  Status Insert(ObjectGraph& graph, NodeId node, Record* saved = nullptr,
                const CancelToken* cancel = nullptr);
  Status Update(ObjectGraph& graph, NodeId node, Record* saved = nullptr,
                const CancelToken* cancel = nullptr);
  Status Upsert(ObjectGraph& graph, NodeId node, Record* saved = nullptr,
                const CancelToken* cancel = nullptr);

  template <typename T>
  Status Save(ObjectGraph& graph, Ref<T> ref, Record* saved = nullptr,
              const CancelToken* cancel = nullptr) {
    return Save(graph, ref.node, saved, cancel);
  }

  std::future<Status> SaveAsync(ObjectGraph& graph, NodeId node,
                                CancelToken cancel = CancelToken());

  // ---------------------------------------------------------------------------
  // Load
  // ---------------------------------------------------------------------------

  Status Load(ObjectGraph& graph, const TypeDescriptor& type,
              const std::string& identity, NodeId* out,
              const CancelToken* cancel = nullptr);

  template <typename T>
  Status Load(ObjectGraph& graph, const std::string& identity, Ref<T>* out,
              const CancelToken* cancel = nullptr) {
    NodeId node = kNullNode;
    Status s = Load(graph, T::Type(), identity, &node, cancel);
    if (s.ok()) *out = Ref<T>(node);
    return s;
  }

  // Cyclic edges appear as {"identity": id, "isCycle": true}.
  Status LoadInlined(const TypeDescriptor& type, const std::string& identity,
                     Json::Value* out, const CancelToken* cancel = nullptr);

  Status LoadAll(ObjectGraph& graph, const TypeDescriptor& type,
                 const LoadQuery& query, const std::optional<std::string>& cursor,
                 LoadPage* out, const CancelToken* cancel = nullptr);

  Status LoadAllExhaustive(ObjectGraph& graph, const TypeDescriptor& type,
                           const LoadQuery& query, LoadPage* out,
                           const CancelToken* cancel = nullptr);

  std::future<LoadResult> LoadAsync(ObjectGraph& graph, const TypeDescriptor& type,
                                    std::string identity,
                                    CancelToken cancel = CancelToken());

  std::future<PageResult> LoadAllAsync(ObjectGraph& graph, const TypeDescriptor& type,
                                       LoadQuery query,
                                       std::optional<std::string> cursor,
                                       CancelToken cancel = CancelToken());

  // ---------------------------------------------------------------------------
  // Delete / refresh
  // ---------------------------------------------------------------------------

  /** Delete the object's record and drop it from the cache. */
  Status Delete(ObjectGraph& graph, NodeId node, const CancelToken* cancel = nullptr);

  /**
   * Delete the object's record and every record it references that is
   * cached. A record that is already gone is not an error.
   */
  Status DeleteCascade(ObjectGraph& graph, NodeId node,
                       const CancelToken* cancel = nullptr);

  std::future<Status> DeleteAsync(ObjectGraph& graph, NodeId node,
                                  CancelToken cancel = CancelToken());

  /** Drop the object's cached subgraph and load it again into a new node. */
  Status Refresh(ObjectGraph& graph, NodeId node, NodeId* out,
                 const CancelToken* cancel = nullptr);

  void Close();
  bool closed() const { return closed_.load(); }

  RecordCache& cache() { return cache_; }
  RecordStore* store() { return store_.get(); }
  const Options& options() const { return opt_; }

 private:
  Engine(std::unique_ptr<RecordStore> store, const Options& opt);

  Status Run(SaveMode mode, ObjectGraph& graph, NodeId node, Record* saved,
             const CancelToken* cancel);

  // Outstanding asynchronous calls, drained by Close().
  bool BeginTask();
  void EndTask();

  struct TaskEnd {
    Engine* engine;
    ~TaskEnd() { engine->EndTask(); }
  };

  template <typename R, typename Fn>
  std::future<R> Spawn(Fn fn, R if_closed) {
    if (!BeginTask()) {
      std::promise<R> ready;
      ready.set_value(std::move(if_closed));
      return ready.get_future();
    }
    try {
      return std::async(std::launch::async, [this, fn = std::move(fn)]() mutable {
        TaskEnd end{this};
        return fn();
      });
    } catch (const std::system_error&) {
      EndTask();
      throw;
    }
  }

  Options opt_;
  std::unique_ptr<RecordStore> store_;
  RecordCache cache_;
  InFlightSaves inflight_;
  SavePipeline save_;
  LoadPipeline load_;

  std::atomic<bool> closed_{false};
  std::mutex tasks_mu_;
  std::condition_variable tasks_cv_;
  uint64_t outstanding_ = 0;
};

}  // namespace tether
