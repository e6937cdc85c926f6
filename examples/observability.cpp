#include <tether/engine.hpp>
#include <tether/memory_store.hpp>

#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace {

// Tallies tether's signals by subsystem, keyed on the second name segment
// ("tether.save.deferred_total" -> "save").
class SubsystemTally final : public tether::MetricsSink {
 public:
  void Counter(std::string_view name, uint64_t delta) override {
    std::lock_guard<std::mutex> lk(mu_);
    counters_[Subsystem(name)][std::string(name)] += delta;
  }

  void Histogram(std::string_view name, uint64_t value) override {
    std::lock_guard<std::mutex> lk(mu_);
    auto& worst = slowest_us_[std::string(name)];
    if (value > worst) worst = value;
  }

  void Gauge(std::string_view name, double value) override {
    std::lock_guard<std::mutex> lk(mu_);
    if (name == "tether.cache.entries" && value > peak_cache_entries_) {
      peak_cache_entries_ = value;
    }
  }

  uint64_t Get(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto sub = counters_.find(Subsystem(name));
    if (sub == counters_.end()) return 0;
    auto it = sub->second.find(name);
    return it == sub->second.end() ? 0 : it->second;
  }

  void Report(std::ostream& os) const {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [subsystem, counters] : counters_) {
      os << "[" << subsystem << "]\n";
      for (const auto& [name, value] : counters) os << "  " << name << " " << value << "\n";
    }
    for (const auto& [name, us] : slowest_us_) os << "slowest " << name << " " << us << "us\n";
    os << "peak tether.cache.entries " << peak_cache_entries_ << "\n";
  }

 private:
  static std::string Subsystem(std::string_view name) {
    const size_t first = name.find('.');
    if (first == std::string_view::npos) return std::string(name);
    const size_t second = name.find('.', first + 1);
    return std::string(name.substr(first + 1, second - first - 1));
  }

  mutable std::mutex mu_;
  std::map<std::string, std::map<std::string, uint64_t>> counters_;
  std::map<std::string, uint64_t> slowest_us_;
  double peak_cache_entries_ = 0;
};

// Keeps finished spans so the example can show what a page load reports.
struct FinishedSpan {
  std::string name;
  std::map<std::string, std::string> attributes;
  std::string status;
};

class CollectingTracer final : public tether::Tracer {
 public:
  std::unique_ptr<tether::TraceSpan> StartSpan(std::string_view name) override {
    return std::make_unique<Span>(this, name);
  }

  std::vector<FinishedSpan> Named(std::string_view name) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<FinishedSpan> out;
    for (const auto& span : finished_) {
      if (span.name == name) out.push_back(span);
    }
    return out;
  }

 private:
  class Span final : public tether::TraceSpan {
   public:
    Span(CollectingTracer* owner, std::string_view name) : owner_(owner) {
      span_.name = std::string(name);
    }

    void SetAttribute(std::string_view key, uint64_t value) override {
      span_.attributes[std::string(key)] = std::to_string(value);
    }
    void SetAttribute(std::string_view key, std::string_view value) override {
      span_.attributes[std::string(key)] = std::string(value);
    }
    void AddEvent(std::string_view) override {}

    void End(const tether::Status& status) override {
      span_.status = status.ok() ? "ok" : status.ToString();
      std::lock_guard<std::mutex> lk(owner_->mu_);
      owner_->finished_.push_back(std::move(span_));
    }

   private:
    CollectingTracer* owner_;
    FinishedSpan span_;
  };

  mutable std::mutex mu_;
  std::vector<FinishedSpan> finished_;
};

struct Node : tether::ModelOf<Node> {
  std::string label;
  tether::Ref<Node> next;

  static const tether::TypeDescriptor& Type() {
    static const tether::TypeDescriptor type = tether::TypeBuilder<Node>("Node")
        .Field("label", &Node::label)
        .Field("next", &Node::next)
        .Build();
    return type;
  }
};

}  // namespace

int main() {
  auto metrics = std::make_shared<SubsystemTally>();
  auto tracer = std::make_shared<CollectingTracer>();

  tether::Options opt;
  opt.metrics = metrics;
  opt.tracer = tracer;

  std::unique_ptr<tether::Engine> engine;
  auto s = tether::Engine::Open(std::make_unique<tether::MemoryRecordStore>(), opt, &engine);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  // A ring of three: one edge has to be deferred and patched in afterwards.
  tether::ObjectGraph graph;
  std::vector<tether::Ref<Node>> ring;
  for (const char* label : {"a", "b", "c"}) {
    Node n;
    n.label = label;
    ring.push_back(graph.Add(n));
  }
  for (size_t i = 0; i < ring.size(); ++i) {
    graph.Get(ring[i])->next = ring[(i + 1) % ring.size()];
  }

  s = engine->Save(graph, ring[0]);
  if (!s.ok()) {
    std::cerr << "Save failed: " << s.ToString() << "\n";
    return 1;
  }
  std::cout << "deferred edges: " << metrics->Get("tether.save.deferred_total")
            << ", patched: " << metrics->Get("tether.save.patched_total") << "\n";

  // Concurrent saves of one unsaved node build it once; an overlapping call
  // joins the first instead of writing again.
  Node lone;
  lone.label = "lone";
  auto d = graph.Add(lone);
  auto first = engine->SaveAsync(graph, d.node);
  auto second = engine->SaveAsync(graph, d.node);
  if (!first.get().ok() || !second.get().ok()) {
    std::cerr << "Concurrent save failed\n";
    return 1;
  }
  std::cout << "joined saves: " << metrics->Get("tether.save.joined_total") << "\n";

  // Served from the cache, then refetched after invalidation.
  const std::string head = *graph.Identity(ring[0].node);
  tether::ObjectGraph loaded;
  tether::Ref<Node> ref;
  s = engine->Load(loaded, head, &ref);
  if (s.ok()) {
    engine->cache().Invalidate(head);
    s = engine->Load(loaded, head, &ref);
  }
  if (!s.ok()) {
    std::cerr << "Load failed: " << s.ToString() << "\n";
    return 1;
  }

  tether::LoadQuery query;
  query.limit = 2;
  tether::LoadPage page;
  s = engine->LoadAllExhaustive(loaded, Node::Type(), query, &page);
  if (!s.ok()) {
    std::cerr << "Query failed: " << s.ToString() << "\n";
    return 1;
  }

  for (const auto& span : tracer->Named("tether.LoadPage")) {
    std::cout << span.name << " status=" << span.status;
    for (const auto& [key, value] : span.attributes) std::cout << " " << key << "=" << value;
    std::cout << "\n";
  }

  metrics->Report(std::cout);
  return 0;
}
