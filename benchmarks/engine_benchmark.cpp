// Performance benchmarks for the tether engine
// Uses Google Benchmark for accurate measurement and CI regression tracking
//
// Organization:
// 1. MICROBENCHMARKS: CPU-bound pieces (codec, cycle detection, cache)
//    - No store calls
// 2. MACROBENCHMARKS: Graph saves and loads through an Engine
//    - In-memory store, and the RocksDB store for end-to-end numbers
//
// Benchmark hygiene:
// - Build graphs outside timing loops
// - Use state.PauseTiming()/ResumeTiming() for necessary setup
// - Use fixed dataset sizes for reproducible results

#include <benchmark/benchmark.h>

#include <tether/codec.hpp>
#include <tether/cycle_detector.hpp>
#include <tether/engine.hpp>
#include <tether/internal.hpp>
#include <tether/memory_store.hpp>
#include <tether/record_cache.hpp>
#include <tether/rocks_store.hpp>
#include <tether/test_utils.hpp>
#include <tether/wire.hpp>

#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace {

using tether::testing::Person;

// Linked list of `n` people; with `ring` the last points back at the first.
std::vector<tether::Ref<Person>> BuildChain(tether::ObjectGraph* graph, int n, bool ring) {
  std::vector<tether::Ref<Person>> people;
  people.reserve(n);
  for (int i = 0; i < n; ++i) {
    Person p;
    p.name = "person-" + std::to_string(i);
    p.age = i;
    p.tags = {"a", "b", "c"};
    people.push_back(graph->Add(std::move(p)));
  }
  for (int i = 0; i + 1 < n; ++i) graph->Get(people[i])->best_friend = people[i + 1];
  if (ring && n > 1) graph->Get(people[n - 1])->best_friend = people[0];
  return people;
}

// =============================================================================
// PART 1: MICROBENCHMARKS
// =============================================================================

static void BM_EncodeLeaves(benchmark::State& state) {
  tether::ObjectGraph graph;
  auto people = BuildChain(&graph, 2, false);
  const Person* p = graph.Get(people[0]);

  for (auto _ : state) {
    tether::Record record;
    std::vector<tether::ReferenceField> refs;
    auto s = tether::RecordCodec::EncodeLeaves(*p, &record, &refs);
    benchmark::DoNotOptimize(s);
    benchmark::DoNotOptimize(record);
  }
}
BENCHMARK(BM_EncodeLeaves);

static void BM_SerializeRecord(benchmark::State& state) {
  tether::Record record;
  record.record_type = "Person";
  record.identity = tether::internal::RandomIdentity();
  record.Set("name", tether::Primitive(std::string("Ada")));
  record.Set("age", tether::Primitive(int64_t{36}));
  record.Set("bestFriend", tether::Reference{tether::internal::RandomIdentity()});

  for (auto _ : state) {
    auto text = tether::SerializeRecord(record);
    benchmark::DoNotOptimize(text);
  }
}
BENCHMARK(BM_SerializeRecord);

static void BM_DecodeObject(benchmark::State& state) {
  tether::Record record;
  record.record_type = "Person";
  record.identity = tether::internal::RandomIdentity();
  record.Set("name", tether::Primitive(std::string("Ada")));
  record.Set("age", tether::Primitive(int64_t{36}));
  record.Set("tags", std::vector<tether::Primitive>{std::string("x"), std::string("y")});
  const Json::Value json = tether::RecordCodec::Sanitize(record);

  for (auto _ : state) {
    tether::ObjectGraph graph;
    tether::DecodeSession session;
    session.graph = &graph;
    tether::NodeId node = tether::kNullNode;
    auto s = tether::RecordCodec::DecodeObject(json, Person::Type(), &session, &node);
    benchmark::DoNotOptimize(s);
  }
}
BENCHMARK(BM_DecodeObject);

static void BM_HasPathBackTo_Ring(benchmark::State& state) {
  tether::ObjectGraph graph;
  auto people = BuildChain(&graph, static_cast<int>(state.range(0)), true);
  tether::CycleDetector detector(graph);

  for (auto _ : state) {
    bool found = detector.HasPathBackTo(people[1].node, people[0].node);
    benchmark::DoNotOptimize(found);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_HasPathBackTo_Ring)->Range(8, 4096);

static void BM_HasPathBackTo_Chain(benchmark::State& state) {
  tether::ObjectGraph graph;
  auto people = BuildChain(&graph, static_cast<int>(state.range(0)), false);
  tether::CycleDetector detector(graph);

  for (auto _ : state) {
    bool found = detector.HasPathBackTo(people[1].node, people[0].node);
    benchmark::DoNotOptimize(found);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_HasPathBackTo_Chain)->Range(8, 4096);

static void BM_Cache_GetHit(benchmark::State& state) {
  tether::RecordCache cache;
  std::vector<std::string> ids;
  for (int i = 0; i < state.range(0); ++i) {
    tether::Record r;
    r.record_type = "Person";
    r.identity = tether::internal::RandomIdentity();
    r.Set("name", tether::Primitive(std::string("p")));
    cache.Put(r);
    ids.push_back(r.identity);
  }

  size_t i = 0;
  for (auto _ : state) {
    tether::Record out;
    bool hit = cache.Get(ids[i++ % ids.size()], &out);
    benchmark::DoNotOptimize(hit);
  }
}
BENCHMARK(BM_Cache_GetHit)->Range(16, 1 << 14);

static void BM_Cache_Put(benchmark::State& state) {
  tether::CacheOptions opt;
  opt.max_entries = 1024;
  tether::RecordCache cache(opt);

  std::vector<tether::Record> records(4096);
  for (auto& r : records) {
    r.record_type = "Person";
    r.identity = tether::internal::RandomIdentity();
  }

  size_t i = 0;
  for (auto _ : state) {
    cache.Put(records[i++ % records.size()]);
  }
}
BENCHMARK(BM_Cache_Put);

// =============================================================================
// PART 2: MACROBENCHMARKS
// =============================================================================

static void BM_SaveRing_Memory(benchmark::State& state) {
  std::unique_ptr<tether::Engine> engine;
  auto s = tether::Engine::Open(std::make_unique<tether::MemoryRecordStore>(),
                                tether::Options{}, &engine);
  if (!s.ok()) {
    state.SkipWithError(s.ToString().c_str());
    return;
  }

  for (auto _ : state) {
    state.PauseTiming();
    tether::ObjectGraph graph;
    auto people = BuildChain(&graph, static_cast<int>(state.range(0)), true);
    state.ResumeTiming();

    s = engine->Save(graph, people[0]);
    if (!s.ok()) {
      state.SkipWithError(s.ToString().c_str());
      break;
    }
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_SaveRing_Memory)->Range(2, 256);

static void BM_LoadRing_Memory(benchmark::State& state) {
  tether::Options opt;
  opt.cache_ttl_seconds = 0;
  std::unique_ptr<tether::Engine> engine;
  auto s = tether::Engine::Open(std::make_unique<tether::MemoryRecordStore>(), opt, &engine);
  if (!s.ok()) {
    state.SkipWithError(s.ToString().c_str());
    return;
  }

  tether::ObjectGraph graph;
  auto people = BuildChain(&graph, static_cast<int>(state.range(0)), true);
  s = engine->Save(graph, people[0]);
  if (!s.ok()) {
    state.SkipWithError(s.ToString().c_str());
    return;
  }
  const std::string root = *graph.Identity(people[0].node);

  for (auto _ : state) {
    tether::ObjectGraph loaded;
    tether::Ref<Person> ref;
    s = engine->Load(loaded, root, &ref);
    benchmark::DoNotOptimize(s);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_LoadRing_Memory)->Range(2, 256);

class RocksEngineBenchmark : public benchmark::Fixture {
 protected:
  void SetUp(const benchmark::State&) override {
    std::error_code ec;
    std::filesystem::path temp_base = std::filesystem::temp_directory_path(ec);
    if (ec || temp_base.empty()) temp_base = ".";
    std::mt19937 gen(std::random_device{}());
    test_dir_ = temp_base / ("tether_bench_" + std::to_string(gen() % 1000000));
    std::filesystem::create_directories(test_dir_, ec);

    std::unique_ptr<tether::RocksRecordStore> store;
    auto rs = tether::RocksRecordStore::Open((test_dir_ / "bench_db").string(), &store);
    if (!rs.ok()) return;
    auto s = tether::Engine::Open(std::move(store), tether::Options{}, &engine_);
    if (!s.ok()) engine_.reset();
  }

  void TearDown(const benchmark::State&) override {
    engine_.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  std::filesystem::path test_dir_;
  std::unique_ptr<tether::Engine> engine_;
};

BENCHMARK_DEFINE_F(RocksEngineBenchmark, SaveRing)(benchmark::State& state) {
  if (!engine_) {
    state.SkipWithError("failed to open engine");
    return;
  }
  for (auto _ : state) {
    state.PauseTiming();
    tether::ObjectGraph graph;
    auto people = BuildChain(&graph, static_cast<int>(state.range(0)), true);
    state.ResumeTiming();

    auto s = engine_->Save(graph, people[0]);
    if (!s.ok()) {
      state.SkipWithError(s.ToString().c_str());
      break;
    }
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(RocksEngineBenchmark, SaveRing)->Range(2, 64);

}  // namespace

BENCHMARK_MAIN();
