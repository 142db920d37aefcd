#include "fake_clock.hpp"
#include "status_cache/status_cache.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <stdexcept>
#include <thread>

using namespace status_cache;
using status_cache::testing::FakeClock;

namespace {
CacheConfig config(std::size_t capacity, Duration ttl) {
  CacheConfig cfg;
  cfg.capacity = capacity;
  cfg.ttl = ttl;
  return cfg;
}

using Ids = std::vector<std::string>;
} // namespace

TEST_CASE("capacity overflow evicts least recently updated device",
          "[cache][lru]") {
  FakeClock clock;
  StatusCache cache(config(3, std::chrono::seconds(5)), {}, clock.fn());
  cache.update("D1", Status::WorkingNormally);
  cache.update("D2", Status::NeedsAttention);
  cache.update("D3", Status::Enabled);
  cache.update("D4", Status::Disabled);

  CHECK(cache.size() == 3);
  CHECK(cache.query_by_status(Status::NeedsAttention) == Ids{"D2"});
  CHECK(cache.query_by_status(Status::Enabled) == Ids{"D3"});
  CHECK(cache.query_by_status(Status::WorkingNormally).empty());
  CHECK(cache.query_by_status(Status::Disabled) == Ids{"D4"});
  CHECK(cache.stats().evictions == 1);
}

TEST_CASE("re-updating a device refreshes its recency", "[cache][lru]") {
  FakeClock clock;
  StatusCache cache(config(3, std::chrono::seconds(5)), {}, clock.fn());
  cache.update("a", Status::Enabled);
  cache.update("b", Status::Enabled);
  cache.update("c", Status::Enabled);
  cache.update("a", Status::Enabled);
  CHECK(cache.recency_order() == Ids{"b", "c", "a"});

  cache.update("d", Status::Enabled);
  CHECK(cache.query_by_status(Status::Enabled) == Ids{"a", "c", "d"});
}

TEST_CASE("status reassignment moves device between buckets",
          "[cache][membership]") {
  FakeClock clock;
  StatusCache cache(config(10, std::chrono::seconds(5)), {}, clock.fn());
  cache.update("dev", Status::WorkingNormally);
  cache.update("dev", Status::Unreachable);

  CHECK(cache.query_by_status(Status::WorkingNormally).empty());
  CHECK(cache.query_by_status(Status::Unreachable) == Ids{"dev"});
  CHECK(cache.bucket_size(Status::WorkingNormally) == 0);
  CHECK(cache.status_of("dev") == Status::Unreachable);
  CHECK(cache.size() == 1);
}

TEST_CASE("query results are sorted lexicographically", "[cache][membership]") {
  FakeClock clock;
  StatusCache cache(config(10, std::chrono::seconds(5)), {}, clock.fn());
  cache.update("zeta", Status::Enabled);
  cache.update("alpha", Status::Enabled);
  cache.update("mid", Status::Enabled);
  cache.update("other", Status::Disabled);
  CHECK(cache.query_by_status(Status::Enabled) == Ids{"alpha", "mid", "zeta"});
}

TEST_CASE("stale entries are purged when their bucket is queried",
          "[cache][ttl]") {
  FakeClock clock;
  StatusCache cache(config(10, std::chrono::seconds(1)), {}, clock.fn());
  cache.update("old", Status::Enabled);
  cache.update("idle", Status::Disabled);
  clock.advance(std::chrono::milliseconds(600));
  cache.update("new", Status::Enabled);

  clock.advance(std::chrono::milliseconds(500));
  CHECK(cache.query_by_status(Status::Enabled) == Ids{"new"});
  CHECK(cache.size() == 2);
  CHECK(cache.stats().expirations == 1);

  // Lazy expiry leaves unqueried buckets alone.
  CHECK(cache.bucket_size(Status::Disabled) == 1);
  CHECK(cache.query_by_status(Status::Disabled).empty());
  CHECK(cache.size() == 1);
}

TEST_CASE("entry exactly at ttl age is still live", "[cache][ttl]") {
  FakeClock clock;
  StatusCache cache(config(10, std::chrono::seconds(1)), {}, clock.fn());
  cache.update("edge", Status::Enabled);
  clock.advance(std::chrono::seconds(1));
  CHECK(cache.query_by_status(Status::Enabled) == Ids{"edge"});
  clock.advance(std::chrono::milliseconds(1));
  CHECK(cache.query_by_status(Status::Enabled).empty());
}

TEST_CASE("update refreshes the ttl", "[cache][ttl]") {
  FakeClock clock;
  StatusCache cache(config(10, std::chrono::seconds(1)), {}, clock.fn());
  cache.update("dev", Status::Enabled);
  clock.advance(std::chrono::milliseconds(800));
  cache.update("dev", Status::Enabled);
  clock.advance(std::chrono::milliseconds(800));
  CHECK(cache.query_by_status(Status::Enabled) == Ids{"dev"});
}

TEST_CASE("real clock ttl expiry frees capacity", "[cache][ttl][slow]") {
  StatusCache cache(config(10, std::chrono::seconds(1)));
  cache.update("D1", Status::Enabled);
  std::this_thread::sleep_for(std::chrono::seconds(2));
  CHECK(cache.query_by_status(Status::Enabled).empty());
  CHECK(cache.size() == 0);
}

TEST_CASE("status_of expires stale entries", "[cache][ttl]") {
  FakeClock clock;
  StatusCache cache(config(10, std::chrono::seconds(1)), {}, clock.fn());
  cache.update("dev", Status::Unreachable);
  CHECK(cache.status_of("dev") == Status::Unreachable);
  CHECK_FALSE(cache.status_of("missing").has_value());
  clock.advance(std::chrono::seconds(2));
  CHECK_FALSE(cache.status_of("dev").has_value());
  CHECK(cache.size() == 0);
}

TEST_CASE("remove is idempotent and leaves other entries", "[cache][remove]") {
  FakeClock clock;
  StatusCache cache(config(10, std::chrono::seconds(5)), {}, clock.fn());
  cache.update("a", Status::Enabled);
  cache.update("b", Status::Enabled);

  CHECK(cache.remove("a"));
  CHECK_FALSE(cache.remove("a"));
  CHECK_FALSE(cache.remove("never"));
  CHECK(cache.query_by_status(Status::Enabled) == Ids{"b"});
  CHECK(cache.recency_order() == Ids{"b"});
  CHECK(cache.stats().removals == 1);
}

TEST_CASE("tick sweeps a bounded number of expired entries", "[cache][tick]") {
  FakeClock clock;
  auto cfg = config(100, std::chrono::seconds(1));
  cfg.ttl_cleanup_per_tick = 4;
  StatusCache cache(cfg, {}, clock.fn());
  for (int i = 0; i < 10; ++i)
    cache.update("old" + std::to_string(i), Status::Enabled);
  clock.advance(std::chrono::seconds(2));
  cache.update("fresh", Status::Enabled);

  CHECK(cache.tick() == 4);
  CHECK(cache.tick() == 4);
  CHECK(cache.tick() == 2);
  CHECK(cache.tick() == 0);
  CHECK(cache.recency_order() == Ids{"fresh"});
}

TEST_CASE("tick skips live entries moved by reads", "[cache][tick]") {
  FakeClock clock;
  auto cfg = config(100, std::chrono::seconds(1));
  cfg.touch_on_query = true;
  cfg.ttl_cleanup_per_tick = 2;
  StatusCache cache(cfg, {}, clock.fn());
  for (const auto *id : {"a", "b", "c", "d"})
    cache.update(id, Status::Enabled);
  clock.advance(std::chrono::milliseconds(900));
  cache.update("e", Status::Enabled);
  // Reading "a" moves it to the most recent end without refreshing it.
  CHECK(cache.status_of("a") == Status::Enabled);
  CHECK(cache.recency_order() == Ids{"b", "c", "d", "e", "a"});

  clock.advance(std::chrono::milliseconds(200));
  CHECK(cache.tick() == 2);
  CHECK(cache.recency_order() == Ids{"d", "e", "a"});
  CHECK(cache.tick() == 2);
  CHECK(cache.recency_order() == Ids{"e"});
  CHECK(cache.tick() == 0);
  CHECK(cache.stats().expirations == 4);
}

TEST_CASE("touch_on_query bumps recency of returned ids", "[cache][lru]") {
  FakeClock clock;
  auto cfg = config(2, std::chrono::seconds(5));
  cfg.touch_on_query = true;
  StatusCache cache(cfg, {}, clock.fn());
  cache.update("a", Status::Enabled);
  cache.update("b", Status::Disabled);
  CHECK(cache.query_by_status(Status::Enabled) == Ids{"a"});
  cache.update("c", Status::Enabled);
  CHECK_FALSE(cache.status_of("b").has_value());
  CHECK(cache.status_of("a") == Status::Enabled);
}

TEST_CASE("invalid arguments fail fast", "[cache][errors]") {
  const auto bogus = static_cast<Status>(42);
  StatusCache cache(config(2, std::chrono::seconds(5)));
  CHECK_THROWS_AS(cache.update("x", bogus), std::invalid_argument);
  CHECK_THROWS_AS(cache.query_by_status(bogus), std::invalid_argument);
  CHECK(cache.size() == 0);

  CHECK_THROWS_AS(StatusCache(config(0, std::chrono::seconds(5))),
                  std::invalid_argument);
  CHECK_THROWS_AS(StatusCache(config(5, Duration::zero())),
                  std::invalid_argument);
}

TEST_CASE("clear drops entries but keeps counters", "[cache]") {
  StatusCache cache(config(5, std::chrono::seconds(5)));
  cache.update("a", Status::Enabled);
  cache.update("b", Status::Disabled);
  cache.clear();
  CHECK(cache.size() == 0);
  CHECK(cache.snapshot().empty());
  CHECK(cache.query_by_status(Status::Enabled).empty());
  CHECK(cache.stats().updates == 2);
}

TEST_CASE("snapshot and info describe live state", "[cache][info]") {
  FakeClock clock;
  StatusCache cache(config(5, std::chrono::seconds(5)), {}, clock.fn());
  cache.update("a", Status::Enabled);
  clock.advance(std::chrono::milliseconds(10));
  cache.update("b", Status::NeedsAttention);

  auto snap = cache.snapshot();
  REQUIRE(snap.size() == 2);
  CHECK(snap[0].id == "a");
  CHECK(snap[0].status == Status::Enabled);
  CHECK(snap[1].last_updated - snap[0].last_updated ==
        std::chrono::milliseconds(10));

  auto i = cache.info();
  CHECK(i.find("keys:2\n") != std::string::npos);
  CHECK(i.find("bucket_NEEDS_ATTENTION:1\n") != std::string::npos);
  CHECK(i.find("policy_mode:lru\n") != std::string::npos);
  CHECK(cache.info() == i);
}
