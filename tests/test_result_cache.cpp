#include "cache/in_memory_cache_backend.hpp"
#include "cache/result_cache.hpp"
#include "fixtures/synthetic_series.hpp"

#include <gtest/gtest.h>

using namespace cache;

namespace {

// Backend whose every call throws, standing in for an unreachable store
class BrokenBackend : public ICacheBackend {
public:
  std::optional<std::string> get(const std::string &) override {
    throw std::runtime_error("connection refused");
  }
  bool set(const std::string &, std::string, std::chrono::seconds) override {
    throw std::runtime_error("connection refused");
  }
  bool erase(const std::string &) override {
    throw std::runtime_error("connection refused");
  }
  size_t erase_prefix(const std::string &) override {
    throw std::runtime_error("connection refused");
  }
  bool is_healthy() const override { return false; }
};

class ResultCacheTest : public ::testing::Test {
protected:
  void SetUp() override {
    backend = std::make_shared<InMemoryCacheBackend>(
        1000, [this] { return now_ms; });
    cache = std::make_unique<ResultCache>(backend, Config::CacheConfig{});
  }

  TimeSeriesData compute_series(const std::string &subject) {
    calls++;
    TimeSeriesData data;
    data.subject_id = subject;
    data.points = {{1000, 1.5, "power", "watts"}, {2000, 2.5, "power", "watts"}};
    data.total_points = 2;
    return data;
  }

  uint64_t now_ms = 1000000;
  int calls = 0;
  std::shared_ptr<InMemoryCacheBackend> backend;
  std::unique_ptr<ResultCache> cache;
};

} // namespace

TEST_F(ResultCacheTest, SecondLookupIsServedFromCache) {
  auto key = CacheKeys::time_series("meter", "0-1", "1h");
  auto first = cache->get_or_compute<TimeSeriesData>(
      CacheOperation::TIME_SERIES, key, [&] { return compute_series("meter"); });
  auto second = cache->get_or_compute<TimeSeriesData>(
      CacheOperation::TIME_SERIES, key, [&] { return compute_series("meter"); });

  EXPECT_EQ(calls, 1);
  ASSERT_EQ(second.points.size(), 2u);
  EXPECT_DOUBLE_EQ(second.points[1].value, 2.5);
  EXPECT_EQ(second.points[0].unit, "watts");
  EXPECT_EQ(second.subject_id, first.subject_id);
}

TEST_F(ResultCacheTest, EntriesExpireAfterTheirTtl) {
  auto key = CacheKeys::time_series("meter", "0-1", "1h");
  auto compute = [&] { return compute_series("meter"); };
  cache->get_or_compute<TimeSeriesData>(CacheOperation::TIME_SERIES, key, compute);

  now_ms += 3599 * 1000ULL;
  cache->get_or_compute<TimeSeriesData>(CacheOperation::TIME_SERIES, key, compute);
  EXPECT_EQ(calls, 1);

  now_ms += 1000;
  cache->get_or_compute<TimeSeriesData>(CacheOperation::TIME_SERIES, key, compute);
  EXPECT_EQ(calls, 2);
}

TEST_F(ResultCacheTest, FailedResultsAreNotStored) {
  auto key = CacheKeys::time_series("meter", "0-1", "1h");
  auto failing = [&] {
    calls++;
    TimeSeriesData data;
    data.success = false;
    data.error_message = "offline";
    return data;
  };
  cache->get_or_compute<TimeSeriesData>(CacheOperation::TIME_SERIES, key, failing);
  cache->get_or_compute<TimeSeriesData>(CacheOperation::TIME_SERIES, key, failing);
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(backend->get_stats().entries, 0u);
}

TEST_F(ResultCacheTest, UndecodableEntryIsRecomputed) {
  auto key = CacheKeys::time_series("meter", "0-1", "1h");
  backend->set(key, "{not json", std::chrono::seconds(60));
  auto result = cache->get_or_compute<TimeSeriesData>(
      CacheOperation::TIME_SERIES, key, [&] { return compute_series("meter"); });
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(result.points.size(), 2u);
}

TEST_F(ResultCacheTest, PrefixInvalidation) {
  backend->set("pattern:device:heater:1", "{}", std::chrono::seconds(60));
  backend->set("pattern:device:heater:2", "{}", std::chrono::seconds(60));
  backend->set("pattern:device:heater-2:1", "{}", std::chrono::seconds(60));
  backend->set("anomaly:heater", "{}", std::chrono::seconds(60));

  EXPECT_EQ(cache->invalidate_prefix("pattern:device:heater:"), 2u);
  EXPECT_TRUE(backend->get("pattern:device:heater-2:1").has_value());
  cache->invalidate("anomaly:heater");
  EXPECT_FALSE(backend->get("anomaly:heater").has_value());
}

TEST_F(ResultCacheTest, DisabledCacheAlwaysComputes) {
  Config::CacheConfig disabled;
  disabled.enabled = false;
  ResultCache passthrough(backend, disabled);
  auto key = CacheKeys::time_series("meter", "0-1", "1h");
  for (int i = 0; i < 3; ++i)
    passthrough.get_or_compute<TimeSeriesData>(
        CacheOperation::TIME_SERIES, key, [&] { return compute_series("meter"); });
  EXPECT_EQ(calls, 3);
}

TEST(ResultCacheFailureTest, BrokenBackendDegradesToCompute) {
  ResultCache cache(std::make_shared<BrokenBackend>(), Config::CacheConfig{});
  int calls = 0;
  for (int i = 0; i < 2; ++i) {
    auto result = cache.get_or_compute<TimeSeriesData>(
        CacheOperation::TIME_SERIES, "timeseries:x:y", [&] {
          calls++;
          return TimeSeriesData{};
        });
    EXPECT_TRUE(result.success);
  }
  EXPECT_EQ(calls, 2);
  EXPECT_FALSE(cache.is_healthy());
  EXPECT_EQ(cache.invalidate_prefix("timeseries:"), 0u);
}

TEST(InMemoryCacheBackendTest, EvictsEarliestExpiryAtCapacity) {
  uint64_t now = 0;
  InMemoryCacheBackend backend(2, [&now] { return now; });
  backend.set("short", "1", std::chrono::seconds(10));
  backend.set("long", "2", std::chrono::seconds(100));
  backend.set("newest", "3", std::chrono::seconds(50));

  EXPECT_FALSE(backend.get("short").has_value());
  EXPECT_TRUE(backend.get("long").has_value());
  EXPECT_TRUE(backend.get("newest").has_value());
  EXPECT_EQ(backend.get_stats().evictions, 1u);
  EXPECT_FALSE(backend.set("zero", "4", std::chrono::seconds(0)));
}

TEST(CacheKeysTest, NamespacesAndOrderIndependence) {
  EXPECT_EQ(CacheKeys::anomaly("heater"), "anomaly:heater");
  EXPECT_EQ(CacheKeys::behavioral_model("house-a"), "pattern:household:house-a:model");
  EXPECT_EQ(CacheKeys::correlation({"b", "a"}, "r"),
            CacheKeys::correlation({"a", "b"}, "r"));
  EXPECT_NE(CacheKeys::statistical("x", {"1d"}), CacheKeys::statistical("x", {"1w"}));
  EXPECT_EQ(CacheKeys::stats("u1", "0-5"), "stats:u1:0-5");
  EXPECT_EQ(ttl_for(Config::CacheConfig{}, CacheOperation::RANKING).count(), 900);
  EXPECT_STREQ(operation_to_string(CacheOperation::TIME_SERIES), "timeseries");
}
