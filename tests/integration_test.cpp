// Integration tests for tether Engine
// Tests: save/load through the engine, async calls, delete and cascade,
// refresh, close semantics, RocksDB end-to-end

#include <gtest/gtest.h>

#include <tether/engine.hpp>
#include <tether/memory_store.hpp>
#include <tether/rocks_store.hpp>
#include <tether/test_utils.hpp>

#include <atomic>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace tether {
namespace {

using testing::CountingStore;
using testing::Person;
using testing::Pet;

Person MakePerson(const std::string& name, int64_t age = 30) {
  Person p;
  p.name = name;
  p.age = age;
  return p;
}

Pet MakePet(const std::string& name) {
  Pet p;
  p.name = name;
  p.weight = 3.5;
  return p;
}

class SaveCallCounter : public MetricsSink {
 public:
  void Counter(std::string_view name, uint64_t delta) override {
    if (name == "tether.save.calls") calls_ += delta;
  }
  void Histogram(std::string_view, uint64_t) override {}
  void Gauge(std::string_view, double) override {}

  uint64_t calls() const { return calls_.load(); }

 private:
  std::atomic<uint64_t> calls_{0};
};

// One field of every leaf kind.
struct Specimen : ModelOf<Specimen> {
  bool sealed = false;
  int64_t count = 0;
  double ratio = 0.0;
  std::string label;
  Timestamp collected;
  Blob scan;
  std::vector<bool> checks;
  std::vector<int64_t> counts;
  std::vector<double> ratios;
  std::vector<std::string> labels;
  std::vector<Timestamp> visits;
  std::vector<Blob> scans;
  std::optional<std::string> note;
  std::optional<Timestamp> discarded;
  Ref<Person> collector;

  static const TypeDescriptor& Type() {
    static const TypeDescriptor type = TypeBuilder<Specimen>("Specimen")
        .Field("sealed", &Specimen::sealed)
        .Field("count", &Specimen::count)
        .Field("ratio", &Specimen::ratio)
        .Field("label", &Specimen::label)
        .Field("collected", &Specimen::collected)
        .Field("scan", &Specimen::scan)
        .Field("checks", &Specimen::checks)
        .Field("counts", &Specimen::counts)
        .Field("ratios", &Specimen::ratios)
        .Field("labels", &Specimen::labels)
        .Field("visits", &Specimen::visits)
        .Field("scans", &Specimen::scans)
        .Field("note", &Specimen::note)
        .Field("discarded", &Specimen::discarded)
        .Field("collector", &Specimen::collector)
        .Build();
    return type;
  }
};

// =============================================================================
// Test Fixture
// =============================================================================

class EngineTest : public ::testing::Test {
 protected:
  void SetUp() override { ASSERT_TRUE(OpenEngine().ok()); }

  Status OpenEngine(const Options& opt = Options{}) {
    engine_.reset();
    memory_ = new MemoryRecordStore();
    counting_ = new CountingStore(std::unique_ptr<RecordStore>(memory_));
    return Engine::Open(std::unique_ptr<RecordStore>(counting_), opt, &engine_);
  }

  std::string IdentityOf(NodeId node) {
    auto id = graph_.Identity(node);
    return id ? *id : std::string();
  }

  ObjectGraph graph_;
  MemoryRecordStore* memory_ = nullptr;  // owned by engine_
  CountingStore* counting_ = nullptr;    // owned by engine_
  std::unique_ptr<Engine> engine_;
};

// =============================================================================
// Open
// =============================================================================

TEST_F(EngineTest, OpenValidatesArguments) {
  std::unique_ptr<Engine> engine;
  EXPECT_TRUE(Engine::Open(nullptr, Options{}, &engine).IsInvalidArgument());
  EXPECT_TRUE(Engine::Open(std::unique_ptr<RecordStore>(new MemoryRecordStore()), Options{},
                           nullptr)
                  .IsInvalidArgument());

  Options bad_level;
  bad_level.log_level = "loud";
  EXPECT_TRUE(Engine::Open(std::unique_ptr<RecordStore>(new MemoryRecordStore()), bad_level,
                           &engine)
                  .IsInvalidArgument());
  EXPECT_EQ(engine, nullptr);

  Options no_generator;
  no_generator.identity_strategy = IdentityStrategy::kCustomGenerator;
  EXPECT_TRUE(Engine::Open(std::unique_ptr<RecordStore>(new MemoryRecordStore()),
                           no_generator, &engine)
                  .IsInvalidArgument());

  Options no_key;
  no_key.identity_strategy = IdentityStrategy::kKeyField;
  EXPECT_TRUE(Engine::Open(std::unique_ptr<RecordStore>(new MemoryRecordStore()), no_key,
                           &engine)
                  .IsInvalidArgument());
}

TEST_F(EngineTest, EngineKeepsMetricsSinkAlive) {
  auto sink = std::make_shared<SaveCallCounter>();
  std::weak_ptr<SaveCallCounter> watch = sink;

  Options opt;
  opt.metrics = std::move(sink);
  ASSERT_TRUE(OpenEngine(opt).ok());
  opt.metrics.reset();
  ASSERT_FALSE(watch.expired());

  ASSERT_TRUE(engine_->Save(graph_, graph_.Add(MakePerson("Ada"))).ok());
  EXPECT_EQ(watch.lock()->calls(), 1u);

  engine_.reset();
  EXPECT_TRUE(watch.expired());
}

// =============================================================================
// Save / Load
// =============================================================================

TEST_F(EngineTest, SaveThenLoadIntoAnotherGraph) {
  Person ada = MakePerson("Ada", 36);
  ada.pet = graph_.Add(MakePet("Rex"));
  auto a = graph_.Add(ada);
  graph_.Get(ada.pet)->owner = a;

  Record saved;
  ASSERT_TRUE(engine_->Save(graph_, a, &saved).ok());
  EXPECT_EQ(saved.identity, IdentityOf(a.node));

  ObjectGraph other;
  Ref<Person> loaded;
  ASSERT_TRUE(engine_->Load(other, saved.identity, &loaded).ok());
  const Person* p = other.Get(loaded);
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(p->name, "Ada");
  EXPECT_EQ(other.Get(other.Get(p->pet)->owner), p);
}

TEST_F(EngineTest, InsertUpdateUpsert) {
  auto a = graph_.Add(MakePerson("Ada"));
  EXPECT_TRUE(engine_->Update(graph_, a.node).IsRecordDoesNotExist());
  ASSERT_TRUE(engine_->Insert(graph_, a.node).ok());
  EXPECT_TRUE(engine_->Insert(graph_, a.node).IsRecordAlreadyExists());

  graph_.Get(a)->age = 31;
  ASSERT_TRUE(engine_->Update(graph_, a.node).ok());
  graph_.Get(a)->age = 32;
  ASSERT_TRUE(engine_->Upsert(graph_, a.node).ok());

  Record stored;
  ASSERT_TRUE(memory_->Fetch(IdentityOf(a.node), &stored).ok());
  EXPECT_EQ(std::get<int64_t>(std::get<Primitive>(*stored.Get("age"))), 32);
  EXPECT_EQ(memory_->size(), 1u);
}

TEST_F(EngineTest, KeyFieldUpsertMergesByNaturalKey) {
  Options opt;
  opt.identity_strategy = IdentityStrategy::kKeyField;
  opt.identity_key_field = "name";
  ASSERT_TRUE(OpenEngine(opt).ok());

  auto first = graph_.Add(MakePerson("Ada", 36));
  auto second = graph_.Add(MakePerson("Ada", 37));
  ASSERT_TRUE(engine_->Upsert(graph_, first.node).ok());
  ASSERT_TRUE(engine_->Upsert(graph_, second.node).ok());

  EXPECT_EQ(IdentityOf(first.node), "Ada");
  EXPECT_EQ(IdentityOf(second.node), "Ada");
  EXPECT_EQ(memory_->size(), 1u);
}

TEST_F(EngineTest, LoadAllExhaustiveAcrossPages) {
  for (int i = 0; i < 7; ++i) {
    auto p = graph_.Add(MakePerson("p" + std::to_string(i), i));
    ASSERT_TRUE(engine_->Save(graph_, p).ok());
  }

  LoadQuery query;
  query.limit = 3;
  ObjectGraph other;
  LoadPage page;
  ASSERT_TRUE(engine_->LoadAllExhaustive(other, Person::Type(), query, &page).ok());
  EXPECT_EQ(page.nodes.size(), 7u);
  EXPECT_TRUE(page.partial_errors.empty());
}

TEST_F(EngineTest, LoadInlinedMarksMutualReference) {
  auto a = graph_.Add(MakePerson("Ada"));
  auto b = graph_.Add(MakePerson("Bob"));
  graph_.Get(a)->best_friend = b;
  graph_.Get(b)->best_friend = a;
  ASSERT_TRUE(engine_->Save(graph_, a).ok());

  Json::Value tree;
  ASSERT_TRUE(engine_->LoadInlined(Person::Type(), IdentityOf(a.node), &tree).ok());
  EXPECT_EQ(tree["bestFriend"]["name"].asString(), "Bob");
  const Json::Value& back = tree["bestFriend"]["bestFriend"];
  EXPECT_TRUE(back["isCycle"].asBool());
  EXPECT_EQ(back["identity"].asString(), IdentityOf(a.node));
}

// =============================================================================
// Async
// =============================================================================

TEST_F(EngineTest, AsyncSaveAndLoad) {
  auto a = graph_.Add(MakePerson("Ada"));
  auto b = graph_.Add(MakePerson("Bob"));
  graph_.Get(a)->best_friend = b;
  graph_.Get(b)->best_friend = a;

  Status s = engine_->SaveAsync(graph_, a.node).get();
  ASSERT_TRUE(s.ok()) << s.ToString();

  ObjectGraph other;
  LoadResult r = engine_->LoadAsync(other, Person::Type(), IdentityOf(b.node)).get();
  ASSERT_TRUE(r.status.ok()) << r.status.ToString();
  const Person* bob = other.Get(other.As<Person>(r.node));
  ASSERT_NE(bob, nullptr);
  EXPECT_EQ(bob->name, "Bob");
  EXPECT_EQ(other.Get(other.Get(bob->best_friend)->best_friend), bob);
}

TEST_F(EngineTest, AsyncPageLoad) {
  for (int i = 0; i < 4; ++i) {
    ASSERT_TRUE(engine_->Save(graph_, graph_.Add(MakePerson("p" + std::to_string(i)))).ok());
  }

  LoadQuery query;
  query.limit = 3;
  ObjectGraph other;
  PageResult first = engine_->LoadAllAsync(other, Person::Type(), query, std::nullopt).get();
  ASSERT_TRUE(first.status.ok());
  EXPECT_EQ(first.page.nodes.size(), 3u);
  ASSERT_TRUE(first.page.next_cursor.has_value());

  PageResult second =
      engine_->LoadAllAsync(other, Person::Type(), query, first.page.next_cursor).get();
  ASSERT_TRUE(second.status.ok());
  EXPECT_EQ(second.page.nodes.size(), 1u);
  EXPECT_FALSE(second.page.next_cursor.has_value());
}

TEST_F(EngineTest, ConcurrentAsyncSavesShareOneRecord) {
  auto a = graph_.Add(MakePerson("Ada"));

  std::vector<std::future<Status>> futures;
  for (int i = 0; i < 8; ++i) futures.push_back(engine_->SaveAsync(graph_, a.node));
  for (auto& f : futures) {
    Status s = f.get();
    EXPECT_TRUE(s.ok()) << s.ToString();
  }
  EXPECT_EQ(memory_->size(), 1u);
}

TEST_F(EngineTest, CancelledAsyncSaveWritesNothing) {
  auto a = graph_.Add(MakePerson("Ada"));
  CancelToken cancel;
  cancel.Cancel();

  Status s = engine_->SaveAsync(graph_, a.node, cancel).get();
  EXPECT_TRUE(s.IsCancelled()) << s.ToString();
  EXPECT_EQ(memory_->size(), 0u);
}

// =============================================================================
// Delete / Refresh
// =============================================================================

TEST_F(EngineTest, DeleteRemovesRecordAndCacheEntry) {
  auto a = graph_.Add(MakePerson("Ada"));
  ASSERT_TRUE(engine_->Save(graph_, a).ok());
  const std::string id = IdentityOf(a.node);

  ASSERT_TRUE(engine_->Delete(graph_, a.node).ok());
  EXPECT_FALSE(engine_->cache().Contains(id));
  EXPECT_EQ(memory_->size(), 0u);

  Status again = engine_->Delete(graph_, a.node);
  EXPECT_TRUE(again.IsRecordNotFound()) << again.ToString();
}

TEST_F(EngineTest, DeleteOfUnsavedObjectRejected) {
  auto a = graph_.Add(MakePerson("Ada"));
  EXPECT_TRUE(engine_->Delete(graph_, a.node).IsInvalidArgument());
  EXPECT_TRUE(engine_->DeleteCascade(graph_, a.node).IsInvalidArgument());
  EXPECT_TRUE(engine_->Delete(graph_, 999).IsInvalidArgument());
}

TEST_F(EngineTest, DeleteAsync) {
  auto a = graph_.Add(MakePerson("Ada"));
  ASSERT_TRUE(engine_->Save(graph_, a).ok());
  ASSERT_TRUE(engine_->DeleteAsync(graph_, a.node).get().ok());
  EXPECT_EQ(memory_->size(), 0u);
}

TEST_F(EngineTest, DeleteCascadeRemovesCachedChildren) {
  auto b = graph_.Add(MakePerson("Bob"));
  Person ada = MakePerson("Ada");
  ada.pet = graph_.Add(MakePet("Rex"));
  ada.friends = {b};
  auto a = graph_.Add(ada);
  ASSERT_TRUE(engine_->Save(graph_, a).ok());
  ASSERT_EQ(memory_->size(), 3u);

  ASSERT_TRUE(engine_->DeleteCascade(graph_, a.node).ok());
  EXPECT_EQ(memory_->size(), 0u);
  EXPECT_EQ(engine_->cache().Size(), 0u);
}

TEST_F(EngineTest, DeleteCascadeKeepsUncachedChildren) {
  Person ada = MakePerson("Ada");
  auto rex = graph_.Add(MakePet("Rex"));
  ada.pet = rex;
  auto a = graph_.Add(ada);
  ASSERT_TRUE(engine_->Save(graph_, a).ok());
  engine_->cache().Invalidate(IdentityOf(rex.node));

  ASSERT_TRUE(engine_->DeleteCascade(graph_, a.node).ok());
  Record out;
  EXPECT_TRUE(memory_->Fetch(IdentityOf(rex.node), &out).ok());
  EXPECT_TRUE(memory_->Fetch(IdentityOf(a.node), &out).IsNotFound());
}

TEST_F(EngineTest, DeleteCascadeOfCycle) {
  auto a = graph_.Add(MakePerson("Ada"));
  Pet rex = MakePet("Rex");
  rex.owner = a;
  graph_.Get(a)->pet = graph_.Add(rex);
  ASSERT_TRUE(engine_->Save(graph_, a).ok());

  ASSERT_TRUE(engine_->DeleteCascade(graph_, a.node).ok());
  EXPECT_EQ(memory_->size(), 0u);
}

TEST_F(EngineTest, DeleteCascadeOfMissingRecordIsOk) {
  auto a = graph_.Add(MakePerson("Ada"));
  ASSERT_TRUE(engine_->Save(graph_, a).ok());
  ASSERT_TRUE(engine_->Delete(graph_, a.node).ok());
  EXPECT_TRUE(engine_->DeleteCascade(graph_, a.node).ok());
}

TEST_F(EngineTest, RefreshReloadsFromStore) {
  auto a = graph_.Add(MakePerson("Ada", 36));
  ASSERT_TRUE(engine_->Save(graph_, a).ok());

  Record changed;
  ASSERT_TRUE(memory_->Fetch(IdentityOf(a.node), &changed).ok());
  changed.Set("age", Primitive(int64_t{50}));
  ASSERT_TRUE(memory_->Save(changed, nullptr).ok());
  counting_->ResetCounts();

  NodeId refreshed = kNullNode;
  ASSERT_TRUE(engine_->Refresh(graph_, a.node, &refreshed).ok());
  EXPECT_NE(refreshed, a.node);
  EXPECT_EQ(graph_.Get(graph_.As<Person>(refreshed))->age, 50);
  EXPECT_EQ(graph_.Get(a)->age, 36);
  EXPECT_EQ(counting_->fetches(), 1u);
}

// =============================================================================
// Close
// =============================================================================

TEST_F(EngineTest, CallsAfterCloseFail) {
  auto a = graph_.Add(MakePerson("Ada"));
  ASSERT_TRUE(engine_->Save(graph_, a).ok());
  engine_->Close();
  EXPECT_TRUE(engine_->closed());

  EXPECT_TRUE(engine_->Save(graph_, a).IsInvalidArgument());
  NodeId node = kNullNode;
  EXPECT_TRUE(engine_->Load(graph_, Person::Type(), IdentityOf(a.node), &node)
                  .IsInvalidArgument());
  EXPECT_TRUE(engine_->Delete(graph_, a.node).IsInvalidArgument());
  EXPECT_TRUE(engine_->SaveAsync(graph_, a.node).get().IsInvalidArgument());
  EXPECT_TRUE(engine_->LoadAsync(graph_, Person::Type(), IdentityOf(a.node))
                  .get()
                  .status.IsInvalidArgument());
  EXPECT_EQ(memory_->size(), 1u);

  engine_->Close();  // idempotent
}

TEST_F(EngineTest, CloseWaitsForOutstandingAsyncCalls) {
  std::vector<Ref<Person>> people;
  for (int i = 0; i < 16; ++i) people.push_back(graph_.Add(MakePerson("p" + std::to_string(i))));

  std::vector<std::future<Status>> futures;
  for (const auto& p : people) futures.push_back(engine_->SaveAsync(graph_, p.node));
  engine_->Close();

  // Every call was accepted before Close(), so every one ran to completion.
  for (auto& f : futures) EXPECT_TRUE(f.get().ok());
  EXPECT_EQ(memory_->size(), 16u);
  EXPECT_TRUE(engine_->cache().closed());
}

// =============================================================================
// RocksDB End-to-end
// =============================================================================

class RocksEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = std::filesystem::temp_directory_path() / ("tether_int_test_" + RandomSuffix());
    std::filesystem::create_directories(test_dir_);
    db_path_ = (test_dir_ / "test_db").string();
  }

  void TearDown() override {
    engine_.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  Status OpenEngine() {
    engine_.reset();
    std::unique_ptr<RocksRecordStore> store;
    rocksdb::Status s = RocksRecordStore::Open(db_path_, &store);
    if (!s.ok()) return Status::StoreOperationFailed("open", s);
    return Engine::Open(std::move(store), Options{}, &engine_);
  }

  std::string RandomSuffix() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 999999);
    return std::to_string(dis(gen));
  }

  std::filesystem::path test_dir_;
  std::string db_path_;
  std::unique_ptr<Engine> engine_;
};

TEST_F(RocksEngineTest, CyclicGraphSurvivesReopen) {
  ASSERT_TRUE(OpenEngine().ok());

  ObjectGraph graph;
  auto a = graph.Add(MakePerson("A"));
  auto b = graph.Add(MakePerson("B"));
  auto c = graph.Add(MakePerson("C"));
  graph.Get(a)->best_friend = b;
  graph.Get(b)->best_friend = c;
  graph.Get(c)->best_friend = a;
  ASSERT_TRUE(engine_->Save(graph, a).ok());
  const std::string id = *graph.Identity(a.node);

  ASSERT_TRUE(OpenEngine().ok());

  ObjectGraph other;
  Ref<Person> loaded;
  Status s = engine_->Load(other, id, &loaded);
  ASSERT_TRUE(s.ok()) << s.ToString();
  EXPECT_EQ(other.size(), 3u);

  const Person* pa = other.Get(loaded);
  const Person* pb = other.Get(pa->best_friend);
  const Person* pc = other.Get(pb->best_friend);
  ASSERT_NE(pc, nullptr);
  EXPECT_EQ(pb->name, "B");
  EXPECT_EQ(pc->name, "C");
  EXPECT_EQ(pc->best_friend, loaded);
}

TEST_F(RocksEngineTest, EveryLeafKindSurvivesReopen) {
  ASSERT_TRUE(OpenEngine().ok());

  ObjectGraph graph;
  Specimen in;
  in.sealed = true;
  in.count = -9007199254740993LL;
  in.ratio = 0.1;
  in.label = "caf\xc3\xa9 \"quoted\"";
  in.collected = Timestamp{1700000000123457LL};
  in.scan = Blob{std::string("\x00\xff\n\x7f", 4)};
  in.checks = {true, false, true};
  in.counts = {0, -1, 4611686018427387904LL};
  in.ratios = {1.0 / 3.0, -2.5e-300};
  in.labels = {"", "b"};
  in.visits = {Timestamp{-1}, Timestamp{7258118400000001LL}};
  in.scans = {Blob{""}, Blob{std::string("\0", 1)}};
  in.note = "fragile";
  in.collector = graph.Add(MakePerson("Mary", 44));
  auto s = graph.Add(in);
  ASSERT_TRUE(engine_->Save(graph, s).ok());
  const std::string id = *graph.Identity(s.node);

  ASSERT_TRUE(OpenEngine().ok());

  ObjectGraph other;
  Ref<Specimen> loaded;
  Status st = engine_->Load(other, id, &loaded);
  ASSERT_TRUE(st.ok()) << st.ToString();
  const Specimen* out = other.Get(loaded);
  ASSERT_NE(out, nullptr);
  EXPECT_EQ(out->sealed, in.sealed);
  EXPECT_EQ(out->count, in.count);
  EXPECT_EQ(out->ratio, in.ratio);
  EXPECT_EQ(out->label, in.label);
  EXPECT_EQ(out->collected, in.collected);
  EXPECT_EQ(out->scan, in.scan);
  EXPECT_EQ(out->checks, in.checks);
  EXPECT_EQ(out->counts, in.counts);
  EXPECT_EQ(out->ratios, in.ratios);
  EXPECT_EQ(out->labels, in.labels);
  EXPECT_EQ(out->visits, in.visits);
  EXPECT_EQ(out->scans, in.scans);
  EXPECT_EQ(out->note, in.note);
  EXPECT_FALSE(out->discarded.has_value());

  const Person* mary = other.Get(out->collector);
  ASSERT_NE(mary, nullptr);
  EXPECT_EQ(mary->name, "Mary");
  EXPECT_EQ(mary->age, 44);
}

TEST_F(RocksEngineTest, QueryAfterReopen) {
  ASSERT_TRUE(OpenEngine().ok());
  ObjectGraph graph;
  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(engine_->Save(graph, graph.Add(MakePerson("p" + std::to_string(i), i))).ok());
  }

  ASSERT_TRUE(OpenEngine().ok());
  LoadQuery query;
  query.predicate.Where("age", CompareOp::kGe, Primitive(int64_t{3}));
  query.sort.push_back(SortKey{"age", true});

  ObjectGraph other;
  LoadPage page;
  ASSERT_TRUE(engine_->LoadAll(other, Person::Type(), query, std::nullopt, &page).ok());
  ASSERT_EQ(page.nodes.size(), 2u);
  EXPECT_EQ(other.Get(other.As<Person>(page.nodes[0]))->name, "p3");
  EXPECT_EQ(other.Get(other.As<Person>(page.nodes[1]))->name, "p4");
}

}  // namespace
}  // namespace tether
