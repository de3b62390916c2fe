#include <catch2/catch.hpp>
#include "event_bus.hpp"
#include <string>
#include <vector>

using namespace chanview;

// ── Basic publish / subscribe ───────────────────────────────────

TEST_CASE("EventBus: subscribe and publish", "[event_bus]") {
    EventBus bus;
    int count = 0;
    bus.subscribe(ContentLoadedEvent::TAG, [&](const Event&) { count++; });

    ContentLoadedEvent ev;
    ev.source = "tmdb";
    bus.publish(ev);

    REQUIRE(count == 1);
}

TEST_CASE("EventBus: subscribers run in subscription order", "[event_bus]") {
    EventBus bus;
    std::vector<int> order;
    bus.subscribe(RepaintRequestedEvent::TAG, [&](const Event&) { order.push_back(1); });
    bus.subscribe(RepaintRequestedEvent::TAG, [&](const Event&) { order.push_back(2); });

    bus.publish(RepaintRequestedEvent{});
    REQUIRE(order == std::vector<int>{1, 2});
}

TEST_CASE("EventBus: publish without subscribers is a no-op", "[event_bus]") {
    EventBus bus;
    bus.publish(CacheClearedEvent{});
    REQUIRE_FALSE(bus.has_subscribers(CacheClearedEvent::TAG));
}

TEST_CASE("EventBus: tags are independent", "[event_bus]") {
    EventBus bus;
    int loaded = 0;
    int failed = 0;
    bus.subscribe(ContentLoadedEvent::TAG, [&](const Event&) { loaded++; });
    bus.subscribe(ContentFailedEvent::TAG, [&](const Event&) { failed++; });

    bus.publish(ContentLoadedEvent{});
    bus.publish(ContentLoadedEvent{});
    bus.publish(ContentFailedEvent{});

    REQUIRE(loaded == 2);
    REQUIRE(failed == 1);
}

// ── has_subscribers ─────────────────────────────────────────────

TEST_CASE("EventBus: has_subscribers is per tag", "[event_bus]") {
    EventBus bus;
    REQUIRE_FALSE(bus.has_subscribers(ContentLoadedEvent::TAG));

    subscribe<ContentLoadedEvent>(bus, [](const ContentLoadedEvent&) {});
    REQUIRE(bus.has_subscribers(ContentLoadedEvent::TAG));
    REQUIRE_FALSE(bus.has_subscribers(ContentFailedEvent::TAG));
}

// ── Typed subscribe ─────────────────────────────────────────────

TEST_CASE("EventBus: typed subscribe sees event fields", "[event_bus]") {
    EventBus bus;
    std::string seen;
    subscribe<ContentFailedEvent>(bus, [&](const ContentFailedEvent& ev) {
        seen = ev.source + "/" + ev.key + ": " + ev.error;
    });

    ContentFailedEvent ev;
    ev.source = "epg";
    ev.key = "1234";
    ev.error = "EPG API returned status: 503";
    bus.publish(ev);

    REQUIRE(seen == "epg/1234: EPG API returned status: 503");
}

TEST_CASE("EventBus: handler may subscribe while being called", "[event_bus]") {
    EventBus bus;
    int inner = 0;
    bus.subscribe(RepaintRequestedEvent::TAG, [&](const Event&) {
        bus.subscribe(RepaintRequestedEvent::TAG, [&](const Event&) { inner++; });
    });

    bus.publish(RepaintRequestedEvent{});
    REQUIRE(inner == 0);
    bus.publish(RepaintRequestedEvent{});
    REQUIRE(inner == 1);
}

TEST_CASE("EventBus: handler may publish another event", "[event_bus]") {
    EventBus bus;
    std::vector<std::string> seen;
    subscribe<ContentFailedEvent>(bus, [&](const ContentFailedEvent& ev) {
        seen.push_back("failed " + ev.key);
        CacheClearedEvent cleared;
        cleared.source = ev.source;
        bus.publish(cleared);
    });
    subscribe<CacheClearedEvent>(bus, [&](const CacheClearedEvent& ev) {
        seen.push_back("cleared " + ev.source);
    });

    ContentFailedEvent ev;
    ev.source = "epg";
    ev.key = "7";
    bus.publish(ev);
    REQUIRE(seen == std::vector<std::string>{"failed 7", "cleared epg"});
}
