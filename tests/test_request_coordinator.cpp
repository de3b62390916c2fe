#include <catch2/catch.hpp>
#include "cache/request_coordinator.hpp"
#include "test_support.hpp"
#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using namespace chanview;
using namespace std::chrono_literals;

using StringCoordinator = RequestCoordinator<std::string, std::string>;

namespace {

CoordinatorOptions test_options(bool drop_stale = false) {
    CoordinatorOptions o;
    o.name = "test";
    o.ttl = 300s;
    o.cooldown = 30s;
    o.drop_stale_after_clear = drop_stale;
    return o;
}

// Coordinator wired to a stub fetcher, manual clock and deferred spawner
struct Fixture {
    std::shared_ptr<StubFetcher> fetcher = std::make_shared<StubFetcher>();
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    DeferredSpawner workers;
    StringCoordinator coord;

    explicit Fixture(bool drop_stale = false)
        : coord(test_options(drop_stale), fetcher, clock, workers.spawner()) {}

    // Request, run the worker, drain: the usual one-key round trip
    void load(const std::string& key) {
        coord.request(key);
        workers.run_all();
        coord.process_pending();
    }
};

} // namespace

// ── Construction ────────────────────────────────────────────────

TEST_CASE("RequestCoordinator: rejects missing collaborators", "[coordinator]") {
    auto fetcher = std::make_shared<StubFetcher>();
    auto clock = std::make_shared<ManualClock>();
    REQUIRE_THROWS_AS(StringCoordinator(test_options(), nullptr, clock, inline_spawner()),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(StringCoordinator(test_options(), fetcher, nullptr, inline_spawner()),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(StringCoordinator(test_options(), fetcher, clock, Spawner()),
                      std::invalid_argument);
}

TEST_CASE("RequestCoordinator: exposes its name and options", "[coordinator]") {
    Fixture f;
    REQUIRE(f.coord.name() == "test");
    REQUIRE(f.coord.options().ttl == std::chrono::duration_cast<Duration>(300s));
    REQUIRE(f.coord.size() == 0);
    REQUIRE(f.coord.pending_count() == 0);
    REQUIRE_FALSE(f.coord.last_error().has_value());
}

// ── Cold start ──────────────────────────────────────────────────

TEST_CASE("RequestCoordinator: cold start loads through the channel", "[coordinator]") {
    Fixture f;
    f.fetcher->values["us"] = "United States";

    f.coord.request("us");
    REQUIRE(f.coord.is_loading("us"));
    REQUIRE_FALSE(f.coord.get("us").has_value());
    REQUIRE(f.workers.size() == 1);

    f.workers.run_all();
    // Nothing lands until the consumer drains
    REQUIRE(f.coord.is_loading("us"));
    REQUIRE_FALSE(f.coord.get("us").has_value());

    auto report = f.coord.process_pending();
    REQUIRE(report.loaded == std::vector<std::string>{"us"});
    REQUIRE(report.failed.empty());
    REQUIRE(f.coord.get("us") == std::optional<std::string>("United States"));
    REQUIRE_FALSE(f.coord.is_loading("us"));
    REQUIRE(f.coord.is_fresh("us"));
}

// ── Coalescing ──────────────────────────────────────────────────

TEST_CASE("RequestCoordinator: repeated requests spawn one worker", "[coordinator]") {
    Fixture f;
    for (int i = 0; i < 10; i++) f.coord.request("k");

    REQUIRE(f.workers.size() == 1);
    REQUIRE(f.coord.pending_count() == 1);
}

TEST_CASE("RequestCoordinator: distinct keys each get a worker", "[coordinator]") {
    Fixture f;
    f.coord.request_batch({"a", "b", "c", "a", "b"});
    REQUIRE(f.workers.size() == 3);
    REQUIRE(f.coord.pending_count() == 3);
}

TEST_CASE("RequestCoordinator: a key stays pending until its message is drained",
          "[coordinator]") {
    Fixture f;
    f.coord.request("k");
    f.workers.run_all();
    f.coord.request("k");
    REQUIRE(f.workers.empty());

    f.coord.process_pending();
    REQUIRE_FALSE(f.coord.is_loading("k"));
}

// ── TTL gating ──────────────────────────────────────────────────

TEST_CASE("RequestCoordinator: fresh value suppresses refetch", "[coordinator]") {
    Fixture f;
    f.load("k");
    REQUIRE(f.fetcher->fetch_count == 1);

    f.clock->advance(300s - 1ms);
    f.coord.request("k");
    REQUIRE(f.workers.empty());
    REQUIRE_FALSE(f.coord.is_loading("k"));
}

TEST_CASE("RequestCoordinator: stale value triggers refetch", "[coordinator]") {
    Fixture f;
    f.load("k");

    f.clock->advance(300s + 1ms);
    f.coord.request("k");
    REQUIRE(f.workers.size() == 1);
    REQUIRE(f.coord.is_loading("k"));
    // The stale value is still served while refreshing
    REQUIRE(f.coord.get("k").has_value());
}

TEST_CASE("RequestCoordinator: entry_age follows the clock", "[coordinator]") {
    Fixture f;
    REQUIRE_FALSE(f.coord.entry_age("k").has_value());
    f.load("k");
    f.clock->advance(42s);
    REQUIRE(f.coord.entry_age("k") == std::optional<Duration>(42s));
}

// ── Failures and cooldown ───────────────────────────────────────

TEST_CASE("RequestCoordinator: failure records error and cooldown", "[coordinator]") {
    Fixture f;
    f.fetcher->errors["k"] = "Unable to connect. Check your internet connection.";

    f.coord.request("k");
    f.workers.run_all();
    auto report = f.coord.process_pending();

    REQUIRE(report.loaded.empty());
    REQUIRE(report.failed.size() == 1);
    REQUIRE(report.failed[0].first == "k");
    REQUIRE(report.failed[0].second == "Unable to connect. Check your internet connection.");
    REQUIRE_FALSE(f.coord.is_loading("k"));
    REQUIRE_FALSE(f.coord.get("k").has_value());
    REQUIRE(f.coord.last_error() ==
            std::optional<std::string>("Unable to connect. Check your internet connection."));
}

TEST_CASE("RequestCoordinator: cooldown gates retries", "[coordinator]") {
    Fixture f;
    f.fetcher->errors["k"] = "boom";
    f.load("k");

    f.clock->advance(30s - 1ms);
    f.coord.request("k");
    REQUIRE(f.workers.empty());

    f.clock->advance(2ms);
    f.coord.request("k");
    REQUIRE(f.workers.size() == 1);
}

TEST_CASE("RequestCoordinator: failed refresh keeps the stale value", "[coordinator]") {
    Fixture f;
    f.fetcher->values["k"] = "v1";
    f.load("k");

    f.clock->advance(301s);
    f.fetcher->errors["k"] = "API error: 500";
    f.load("k");

    REQUIRE(f.coord.get("k") == std::optional<std::string>("v1"));
    REQUIRE(f.coord.last_error() == std::optional<std::string>("API error: 500"));
}

TEST_CASE("RequestCoordinator: success clears cooldown and last error", "[coordinator]") {
    Fixture f;
    f.fetcher->errors["k"] = "boom";
    f.load("k");
    REQUIRE(f.coord.last_error().has_value());

    f.fetcher->errors.clear();
    f.clock->advance(31s);
    f.load("k");

    REQUIRE_FALSE(f.coord.last_error().has_value());
    REQUIRE(f.coord.get("k").has_value());

    // No lingering cooldown: once stale, the key refetches immediately
    f.clock->advance(301s);
    f.coord.request("k");
    REQUIRE(f.workers.size() == 1);
}

TEST_CASE("RequestCoordinator: non-standard exceptions become failures", "[coordinator]") {
    struct ThrowingFetcher : Fetcher<std::string, std::string> {
        std::string fetch(const std::string&) override { throw 42; }
        std::string source_name() const override { return "odd"; }
    };
    auto clock = std::make_shared<ManualClock>();
    StringCoordinator coord(test_options(), std::make_shared<ThrowingFetcher>(),
                            clock, inline_spawner());

    coord.request("k");
    auto report = coord.process_pending();
    REQUIRE(report.failed.size() == 1);
    REQUIRE(coord.last_error() == std::optional<std::string>("unknown error"));
}

TEST_CASE("RequestCoordinator: spawn failure is treated as a failed fetch", "[coordinator]") {
    auto fetcher = std::make_shared<StubFetcher>();
    auto clock = std::make_shared<ManualClock>();
    Spawner broken = [](Task) { throw std::runtime_error("Resource temporarily unavailable"); };
    StringCoordinator coord(test_options(), fetcher, clock, broken);

    coord.request("k");
    REQUIRE_FALSE(coord.is_loading("k"));
    REQUIRE(coord.last_error() ==
            std::optional<std::string>("Failed to start worker: Resource temporarily unavailable"));

    // Cooling down, so the next frame doesn't hammer thread creation
    coord.request("k");
    REQUIRE_FALSE(coord.is_loading("k"));
    REQUIRE(fetcher->fetch_count == 0);
}

// ── Unavailable source ──────────────────────────────────────────

TEST_CASE("RequestCoordinator: unavailable source spawns nothing", "[coordinator]") {
    Fixture f;
    f.fetcher->unavailable = "Database not found. Run Soccer-Scraper to fetch fixtures.";

    f.coord.request("today");
    REQUIRE(f.workers.empty());
    REQUIRE_FALSE(f.coord.is_loading("today"));
    REQUIRE(f.coord.last_error() ==
            std::optional<std::string>("Database not found. Run Soccer-Scraper to fetch fixtures."));

    f.fetcher->unavailable.reset();
    f.coord.request("today");
    REQUIRE(f.workers.size() == 1);
}

// ── Drain ───────────────────────────────────────────────────────

TEST_CASE("RequestCoordinator: one drain takes every queued message", "[coordinator]") {
    Fixture f;
    f.fetcher->errors["bad"] = "nope";
    f.coord.request_batch({"a", "b", "bad", "c"});
    f.workers.run_all();

    auto report = f.coord.process_pending();
    REQUIRE(report.delivered() == 4);
    REQUIRE(report.loaded.size() == 3);
    REQUIRE(report.failed.size() == 1);
    REQUIRE(f.coord.pending_count() == 0);

    REQUIRE(f.coord.process_pending().empty());
}

TEST_CASE("RequestCoordinator: drain returns immediately with workers in flight",
          "[coordinator]") {
    Fixture f;
    f.coord.request_batch({"a", "b"});
    f.workers.run_next();

    auto report = f.coord.process_pending();
    REQUIRE(report.loaded == std::vector<std::string>{"a"});
    REQUIRE(f.coord.is_loading("b"));
}

// ── clear / forget / refresh_all ────────────────────────────────

TEST_CASE("RequestCoordinator: clear resets all state", "[coordinator]") {
    Fixture f;
    f.fetcher->errors["bad"] = "nope";
    f.load("a");
    f.load("bad");
    f.coord.request("pending");

    f.coord.clear();

    REQUIRE(f.coord.size() == 0);
    REQUIRE(f.coord.pending_count() == 0);
    REQUIRE_FALSE(f.coord.last_error().has_value());
    REQUIRE(f.coord.generation() == 1);

    // Cooldown gone as well
    f.coord.request("bad");
    REQUIRE(f.coord.is_loading("bad"));
}

TEST_CASE("RequestCoordinator: late delivery after clear repopulates by default",
          "[coordinator]") {
    Fixture f;
    f.coord.request("k");
    f.coord.clear();

    f.workers.run_all();
    auto report = f.coord.process_pending();

    REQUIRE(report.loaded.size() == 1);
    REQUIRE(report.dropped == 0);
    REQUIRE(f.coord.get("k").has_value());
}

TEST_CASE("RequestCoordinator: late delivery after clear is dropped when enabled",
          "[coordinator]") {
    Fixture f(true);
    f.coord.request("k");
    f.coord.clear();
    // Re-requested after the clear: a second, current-generation worker
    f.coord.request("k");
    REQUIRE(f.workers.size() == 2);

    f.workers.run_next();
    auto stale = f.coord.process_pending();
    REQUIRE(stale.dropped == 1);
    REQUIRE(stale.loaded.empty());
    REQUIRE_FALSE(f.coord.get("k").has_value());
    REQUIRE(f.coord.is_loading("k"));

    f.workers.run_next();
    auto fresh = f.coord.process_pending();
    REQUIRE(fresh.loaded.size() == 1);
    REQUIRE(f.coord.get("k").has_value());
}

TEST_CASE("RequestCoordinator: forget drops one key and its cooldown", "[coordinator]") {
    Fixture f;
    f.fetcher->errors["bad"] = "nope";
    f.load("a");
    f.load("b");
    f.load("bad");

    f.coord.forget("a");
    f.coord.forget("bad");

    REQUIRE_FALSE(f.coord.get("a").has_value());
    REQUIRE(f.coord.get("b").has_value());

    f.coord.request("bad");
    REQUIRE(f.coord.is_loading("bad"));
}

TEST_CASE("RequestCoordinator: refresh_all refetches while values stay readable",
          "[coordinator]") {
    Fixture f;
    f.fetcher->values["a"] = "old-a";
    f.fetcher->values["b"] = "old-b";
    f.load("a");
    f.load("b");

    f.fetcher->values["a"] = "new-a";
    f.fetcher->values["b"] = "new-b";
    f.coord.refresh_all();

    REQUIRE(f.workers.size() == 2);
    REQUIRE(f.coord.get("a") == std::optional<std::string>("old-a"));

    f.workers.run_all();
    f.coord.process_pending();
    REQUIRE(f.coord.get("a") == std::optional<std::string>("new-a"));
    REQUIRE(f.coord.get("b") == std::optional<std::string>("new-b"));
    REQUIRE(f.coord.is_fresh("a"));
}

// ── Real threads ────────────────────────────────────────────────

TEST_CASE("RequestCoordinator: detached workers deliver to a polling consumer",
          "[coordinator][threads]") {
    auto fetcher = std::make_shared<StubFetcher>();
    StringCoordinator coord(test_options(), fetcher);

    coord.request_batch({"a", "b", "c"});

    // Render loop: poll until everything lands (bounded)
    for (int frame = 0; frame < 500 && coord.size() < 3; frame++) {
        coord.process_pending();
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE(coord.size() == 3);
    REQUIRE(coord.pending_count() == 0);
    REQUIRE(coord.get("b") == std::optional<std::string>("value:b"));
}

TEST_CASE("RequestCoordinator: workers outliving the coordinator are harmless",
          "[coordinator][threads]") {
    struct SlowFetcher : Fetcher<std::string, std::string> {
        std::atomic<bool> finished{false};
        std::string fetch(const std::string& key) override {
            std::this_thread::sleep_for(50ms);
            finished = true;
            return key;
        }
        std::string source_name() const override { return "slow"; }
    };
    auto fetcher = std::make_shared<SlowFetcher>();
    {
        StringCoordinator coord(test_options(), fetcher);
        coord.request("k");
    }
    for (int i = 0; i < 200 && !fetcher->finished; i++) std::this_thread::sleep_for(5ms);
    REQUIRE(fetcher->finished);
}
