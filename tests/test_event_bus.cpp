#include <catch2/catch.hpp>
#include "event_bus.hpp"
#include <stdexcept>
#include <thread>
#include <vector>
#include <atomic>

using namespace graphmem;

// ── Basic publish / subscribe ───────────────────────────────────

TEST_CASE("EventBus: subscribe and publish", "[event_bus]") {
    EventBus bus;
    int count = 0;

    bus.subscribe(MessageRecordedEvent::TAG, [&](const Event&) {
        count++;
    });

    MessageRecordedEvent ev;
    ev.session_id = "s1";
    bus.publish(ev);

    REQUIRE(count == 1);
}

TEST_CASE("EventBus: multiple subscribers called in order", "[event_bus]") {
    EventBus bus;
    std::vector<int> order;

    bus.subscribe(JobStatusChangedEvent::TAG, [&](const Event&) {
        order.push_back(1);
    });
    bus.subscribe(JobStatusChangedEvent::TAG, [&](const Event&) {
        order.push_back(2);
    });

    JobStatusChangedEvent ev;
    bus.publish(ev);

    REQUIRE(order == std::vector<int>{1, 2});
}

TEST_CASE("EventBus: publish with no subscribers is a no-op", "[event_bus]") {
    EventBus bus;
    KnowledgeCreatedEvent ev;
    bus.publish(ev);
    REQUIRE(bus.subscriber_count(KnowledgeCreatedEvent::TAG) == 0);
}

TEST_CASE("EventBus: different tags are independent", "[event_bus]") {
    EventBus bus;
    int recorded = 0;
    int progress = 0;

    bus.subscribe(MessageRecordedEvent::TAG, [&](const Event&) { recorded++; });
    bus.subscribe(JobProgressEvent::TAG, [&](const Event&) { progress++; });

    MessageRecordedEvent ev1;
    bus.publish(ev1);
    bus.publish(ev1);

    JobProgressEvent ev2;
    bus.publish(ev2);

    REQUIRE(recorded == 2);
    REQUIRE(progress == 1);
}

// ── Unsubscribe ─────────────────────────────────────────────────

TEST_CASE("EventBus: unsubscribe removes handler", "[event_bus]") {
    EventBus bus;
    int count = 0;

    uint64_t id = bus.subscribe(StoreHealthChangedEvent::TAG, [&](const Event&) {
        count++;
    });

    StoreHealthChangedEvent ev;
    bus.publish(ev);
    REQUIRE(count == 1);

    REQUIRE(bus.unsubscribe(id));
    bus.publish(ev);
    REQUIRE(count == 1);
}

TEST_CASE("EventBus: unsubscribe returns false for unknown id", "[event_bus]") {
    EventBus bus;
    REQUIRE_FALSE(bus.unsubscribe(999));
}

// ── Clear ───────────────────────────────────────────────────────

TEST_CASE("EventBus: clear removes all subscriptions", "[event_bus]") {
    EventBus bus;
    int count = 0;

    bus.subscribe(MessageRecordedEvent::TAG, [&](const Event&) { count++; });
    bus.subscribe(JobProgressEvent::TAG, [&](const Event&) { count++; });

    bus.clear();

    MessageRecordedEvent ev1;
    JobProgressEvent ev2;
    bus.publish(ev1);
    bus.publish(ev2);
    REQUIRE(count == 0);
}

// ── subscriber_count ────────────────────────────────────────────

TEST_CASE("EventBus: subscriber_count", "[event_bus]") {
    EventBus bus;
    REQUIRE(bus.subscriber_count(JobStatusChangedEvent::TAG) == 0);

    bus.subscribe(JobStatusChangedEvent::TAG, [](const Event&) {});
    bus.subscribe(JobStatusChangedEvent::TAG, [](const Event&) {});
    REQUIRE(bus.subscriber_count(JobStatusChangedEvent::TAG) == 2);
    REQUIRE(bus.subscriber_count(JobProgressEvent::TAG) == 0);
}

// ── Failing handlers ────────────────────────────────────────────

TEST_CASE("EventBus: throwing handler does not stop later handlers", "[event_bus]") {
    EventBus bus;
    int reached = 0;

    bus.subscribe(KnowledgeCreatedEvent::TAG, [](const Event&) {
        throw std::runtime_error("subscriber broke");
    });
    bus.subscribe(KnowledgeCreatedEvent::TAG, [&](const Event&) { reached++; });

    KnowledgeCreatedEvent ev;
    REQUIRE_NOTHROW(bus.publish(ev));
    REQUIRE(reached == 1);
}

TEST_CASE("EventBus: handler may subscribe during publish", "[event_bus]") {
    EventBus bus;
    int late = 0;

    bus.subscribe(JobProgressEvent::TAG, [&](const Event&) {
        bus.subscribe(JobProgressEvent::TAG, [&](const Event&) { late++; });
    });

    JobProgressEvent ev;
    bus.publish(ev);
    REQUIRE(late == 0);
    REQUIRE(bus.subscriber_count(JobProgressEvent::TAG) == 2);
}

// ── Type-safe helpers ───────────────────────────────────────────

TEST_CASE("EventBus: type-safe subscribe template", "[event_bus]") {
    EventBus bus;
    std::string job;
    std::string status;

    subscribe<JobStatusChangedEvent>(bus, [&](const JobStatusChangedEvent& ev) {
        job = ev.job_id;
        status = ev.status;
    });

    JobStatusChangedEvent ev;
    ev.job_id = "job-1";
    ev.status = "completed";
    bus.publish(ev);

    REQUIRE(job == "job-1");
    REQUIRE(status == "completed");
}

TEST_CASE("EventBus: store health event carries reason and backlog", "[event_bus]") {
    EventBus bus;
    bool reachable = true;
    std::string reason;
    size_t pending = 0;

    subscribe<StoreHealthChangedEvent>(bus, [&](const StoreHealthChangedEvent& ev) {
        reachable = ev.reachable;
        reason = ev.reason;
        pending = ev.pending;
    });

    StoreHealthChangedEvent ev;
    ev.reachable = false;
    ev.reason = "database is locked";
    ev.pending = 3;
    bus.publish(ev);

    REQUIRE_FALSE(reachable);
    REQUIRE(reason == "database is locked");
    REQUIRE(pending == 3);
}

TEST_CASE("EventBus: publish to null bus is a no-op", "[event_bus]") {
    MessageRecordedEvent ev;
    REQUIRE_NOTHROW(publish(nullptr, ev));

    EventBus bus;
    int count = 0;
    subscribe<MessageRecordedEvent>(bus, [&](const MessageRecordedEvent&) { count++; });
    publish(&bus, ev);
    REQUIRE(count == 1);
}

TEST_CASE("EventBus: concurrent publishers", "[event_bus]") {
    EventBus bus;
    std::atomic<int> count{0};
    subscribe<JobProgressEvent>(bus, [&](const JobProgressEvent&) { count++; });

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&] {
            for (int i = 0; i < 100; i++) {
                JobProgressEvent ev;
                bus.publish(ev);
            }
        });
    }
    for (auto& th : threads) th.join();

    REQUIRE(count == 400);
}
