// Unit tests for RecordCache
// Tests: TTL, eviction, cascade invalidation, purge, close, metrics

#include <gtest/gtest.h>

#include <tether/record_cache.hpp>
#include <tether/test_utils.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace tether {
namespace {

// =============================================================================
// Test Fixture
// =============================================================================

class CountingMetrics : public MetricsSink {
 public:
  void Counter(std::string_view name, uint64_t delta) override {
    std::lock_guard<std::mutex> lk(mu_);
    counters_[std::string(name)] += delta;
  }
  void Histogram(std::string_view, uint64_t) override {}
  void Gauge(std::string_view name, double value) override {
    std::lock_guard<std::mutex> lk(mu_);
    gauges_[std::string(name)] = value;
  }

  uint64_t counter(const std::string& name) {
    std::lock_guard<std::mutex> lk(mu_);
    return counters_[name];
  }
  double gauge(const std::string& name) {
    std::lock_guard<std::mutex> lk(mu_);
    return gauges_[name];
  }

 private:
  std::mutex mu_;
  std::map<std::string, uint64_t> counters_;
  std::map<std::string, double> gauges_;
};

class CacheTest : public ::testing::Test {
 protected:
  CacheOptions Opts(uint64_t ttl_seconds = 30, size_t max_entries = 0) {
    CacheOptions opt;
    opt.ttl_seconds = ttl_seconds;
    opt.max_entries = max_entries;
    opt.clock = &clock_;
    opt.metrics = metrics_;
    return opt;
  }

  static Record MakeRecord(const std::string& id, std::vector<std::string> refs = {}) {
    Record r;
    r.record_type = "Person";
    r.identity = id;
    r.Set("name", Primitive(id));
    if (!refs.empty()) {
      std::vector<Reference> list;
      for (auto& ref : refs) list.push_back(Reference{ref});
      r.Set("friends", std::move(list));
    }
    return r;
  }

  testing::FakeClock clock_;
  std::shared_ptr<CountingMetrics> metrics_ = std::make_shared<CountingMetrics>();
};

// =============================================================================
// TTL Tests
// =============================================================================

TEST_F(CacheTest, HitWithinTTL) {
  RecordCache cache(Opts(30));
  cache.Put(MakeRecord("a"));

  clock_.AdvanceSec(29);
  Record out;
  ASSERT_TRUE(cache.Get("a", &out));
  EXPECT_EQ(out.identity, "a");
  EXPECT_EQ(metrics_->counter("tether.cache.hit_total"), 1u);
}

TEST_F(CacheTest, MissAtExactlyTTL) {
  RecordCache cache(Opts(30));
  cache.Put(MakeRecord("a"));

  clock_.AdvanceSec(30);
  Record out;
  EXPECT_FALSE(cache.Get("a", &out));
  EXPECT_EQ(metrics_->counter("tether.cache.expired_total"), 1u);
  EXPECT_EQ(metrics_->counter("tether.cache.miss_total"), 1u);
  // Expired entries are dropped on read.
  EXPECT_EQ(cache.Size(), 0u);
}

TEST_F(CacheTest, TTLZeroMeansNoExpiration) {
  RecordCache cache(Opts(0));
  cache.Put(MakeRecord("a"));

  clock_.AdvanceSec(365ull * 24 * 3600);
  EXPECT_TRUE(cache.Get("a", nullptr));
  EXPECT_TRUE(cache.Contains("a"));
}

TEST_F(CacheTest, PutRefreshesInsertionTime) {
  RecordCache cache(Opts(30));
  cache.Put(MakeRecord("a"));
  clock_.AdvanceSec(20);
  cache.Put(MakeRecord("a"));
  clock_.AdvanceSec(20);
  EXPECT_TRUE(cache.Get("a", nullptr));
}

TEST_F(CacheTest, ContainsDoesNotTouchMetrics) {
  RecordCache cache(Opts(30));
  cache.Put(MakeRecord("a"));
  EXPECT_TRUE(cache.Contains("a"));
  EXPECT_FALSE(cache.Contains("b"));
  EXPECT_EQ(metrics_->counter("tether.cache.hit_total"), 0u);
  EXPECT_EQ(metrics_->counter("tether.cache.miss_total"), 0u);

  clock_.AdvanceSec(31);
  EXPECT_FALSE(cache.Contains("a"));
}

TEST_F(CacheTest, EmptyIdentityIsIgnored) {
  RecordCache cache(Opts());
  cache.Put(MakeRecord(""));
  EXPECT_EQ(cache.Size(), 0u);
}

TEST_F(CacheTest, PurgeExpired) {
  RecordCache cache(Opts(10));
  cache.Put(MakeRecord("old1"));
  cache.Put(MakeRecord("old2"));
  clock_.AdvanceSec(5);
  cache.Put(MakeRecord("new"));
  clock_.AdvanceSec(6);

  EXPECT_EQ(cache.PurgeExpired(), 2u);
  EXPECT_EQ(cache.Size(), 1u);
  EXPECT_TRUE(cache.Contains("new"));
  EXPECT_DOUBLE_EQ(metrics_.gauge("tether.cache.entries"), 1.0);
}

// =============================================================================
// Eviction Tests
// =============================================================================

TEST_F(CacheTest, EvictsOldestPastBound) {
  RecordCache cache(Opts(0, 2));
  cache.Put(MakeRecord("a"));
  cache.Put(MakeRecord("b"));
  cache.Put(MakeRecord("c"));

  EXPECT_EQ(cache.Size(), 2u);
  EXPECT_FALSE(cache.Contains("a"));
  EXPECT_TRUE(cache.Contains("b"));
  EXPECT_TRUE(cache.Contains("c"));
  EXPECT_EQ(metrics_->counter("tether.cache.evicted_total"), 1u);
}

TEST_F(CacheTest, ReinsertMovesToNewest) {
  RecordCache cache(Opts(0, 2));
  cache.Put(MakeRecord("a"));
  cache.Put(MakeRecord("b"));
  cache.Put(MakeRecord("a"));
  cache.Put(MakeRecord("c"));

  EXPECT_TRUE(cache.Contains("a"));
  EXPECT_FALSE(cache.Contains("b"));
}

TEST_F(CacheTest, PutManyUsesOneTimestamp) {
  RecordCache cache(Opts(10));
  cache.PutMany({MakeRecord("a"), MakeRecord("b"), MakeRecord("")});
  EXPECT_EQ(cache.Size(), 2u);
  clock_.AdvanceSec(10);
  EXPECT_EQ(cache.PurgeExpired(), 2u);
}

// =============================================================================
// Invalidation Tests
// =============================================================================

TEST_F(CacheTest, InvalidateSingle) {
  RecordCache cache(Opts());
  cache.Put(MakeRecord("a", {"b"}));
  cache.Put(MakeRecord("b"));

  EXPECT_TRUE(cache.Invalidate("a"));
  EXPECT_FALSE(cache.Invalidate("a"));
  EXPECT_FALSE(cache.Contains("a"));
  EXPECT_TRUE(cache.Contains("b"));
}

TEST_F(CacheTest, InvalidateCascadeFollowsCachedReferences) {
  RecordCache cache(Opts());
  // a -> b -> c, b -> d (not cached) -> e
  cache.Put(MakeRecord("a", {"b"}));
  cache.Put(MakeRecord("b", {"c", "d"}));
  cache.Put(MakeRecord("c"));
  cache.Put(MakeRecord("e"));
  cache.Put(MakeRecord("unrelated"));

  EXPECT_EQ(cache.InvalidateCascade("a"), 3u);
  EXPECT_FALSE(cache.Contains("a"));
  EXPECT_FALSE(cache.Contains("b"));
  EXPECT_FALSE(cache.Contains("c"));
  // "d" is not cached, so nothing is known about what it references.
  EXPECT_TRUE(cache.Contains("e"));
  EXPECT_TRUE(cache.Contains("unrelated"));
}

TEST_F(CacheTest, InvalidateCascadeTerminatesOnCycles) {
  RecordCache cache(Opts());
  cache.Put(MakeRecord("a", {"b"}));
  cache.Put(MakeRecord("b", {"a"}));

  EXPECT_EQ(cache.InvalidateCascade("b"), 2u);
  EXPECT_EQ(cache.Size(), 0u);
}

TEST_F(CacheTest, InvalidateCascadeOfUncachedRoot) {
  RecordCache cache(Opts());
  cache.Put(MakeRecord("b"));
  EXPECT_EQ(cache.InvalidateCascade("a"), 0u);
  EXPECT_TRUE(cache.Contains("b"));
}

// =============================================================================
// Lifecycle Tests
// =============================================================================

TEST_F(CacheTest, ClosedCacheBehavesEmpty) {
  RecordCache cache(Opts());
  cache.Put(MakeRecord("a"));
  cache.Close();

  EXPECT_TRUE(cache.closed());
  EXPECT_FALSE(cache.Get("a", nullptr));
  cache.Put(MakeRecord("b"));
  EXPECT_EQ(cache.Size(), 0u);
}

TEST_F(CacheTest, ClearKeepsCacheUsable) {
  RecordCache cache(Opts());
  cache.Put(MakeRecord("a"));
  cache.Clear();
  EXPECT_EQ(cache.Size(), 0u);
  cache.Put(MakeRecord("b"));
  EXPECT_TRUE(cache.Contains("b"));
}

TEST_F(CacheTest, ConcurrentPutAndGet) {
  RecordCache cache(Opts(0, 64));
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&cache, t] {
      for (int i = 0; i < 1000; ++i) {
        std::string id = std::to_string(t) + ":" + std::to_string(i % 100);
        cache.Put(MakeRecord(id));
        Record out;
        cache.Get(id, &out);
      }
    });
  }
  for (auto& th : threads) th.join();
  EXPECT_LE(cache.Size(), 64u);
}

}  // namespace
}  // namespace tether
