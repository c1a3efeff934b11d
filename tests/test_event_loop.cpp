#include <catch2/catch.hpp>
#include "event_loop.hpp"
#include "mock_transport.hpp"
#include <thread>
#include <vector>

using namespace chansync;

// ── Posted tasks ────────────────────────────────────────────────

TEST_CASE("EventLoop: posted tasks run in order on the next tick", "[event_loop]") {
    ManualClock clock;
    std::vector<int> order;
    clock.loop.post([&] { order.push_back(1); });
    clock.loop.post([&] { order.push_back(2); });
    REQUIRE(order.empty());

    REQUIRE(clock.loop.run_pending() == 2);
    REQUIRE(order == std::vector<int>{1, 2});
}

TEST_CASE("EventLoop: task posted from a task runs on the following tick", "[event_loop]") {
    ManualClock clock;
    int inner = 0;
    clock.loop.post([&] { clock.loop.post([&] { inner++; }); });

    clock.loop.run_pending();
    REQUIRE(inner == 0);
    clock.loop.run_pending();
    REQUIRE(inner == 1);
}

TEST_CASE("EventLoop: post is safe from another thread", "[event_loop]") {
    EventLoop loop;
    int count = 0;
    std::thread worker([&] {
        for (int i = 0; i < 50; ++i) loop.post([&] { count++; });
    });
    worker.join();
    REQUIRE(loop.run_until([&] { return count == 50; }, 2000));
}

// ── Timers ──────────────────────────────────────────────────────

TEST_CASE("EventLoop: call_after fires once at its deadline", "[event_loop]") {
    ManualClock clock;
    int fired = 0;
    auto id = clock.loop.call_after(100, [&] { fired++; });
    REQUIRE(clock.loop.has_timer(id));

    clock.advance(99);
    REQUIRE(fired == 0);
    clock.advance(1);
    REQUIRE(fired == 1);
    REQUIRE_FALSE(clock.loop.has_timer(id));

    clock.advance(500);
    REQUIRE(fired == 1);
}

TEST_CASE("EventLoop: call_every repeats until cancelled", "[event_loop]") {
    ManualClock clock;
    int fired = 0;
    auto id = clock.loop.call_every(10, [&] { fired++; });

    clock.advance(35);
    REQUIRE(fired == 3);

    REQUIRE(clock.loop.cancel(id));
    clock.advance(100);
    REQUIRE(fired == 3);
    REQUIRE_FALSE(clock.loop.cancel(id));
}

TEST_CASE("EventLoop: periodic timer may cancel itself", "[event_loop]") {
    ManualClock clock;
    int fired = 0;
    EventLoop::TimerId id = 0;
    id = clock.loop.call_every(10, [&] {
        if (++fired == 2) clock.loop.cancel(id);
    });
    clock.advance(100);
    REQUIRE(fired == 2);
    REQUIRE(clock.loop.timer_count() == 0);
}

TEST_CASE("EventLoop: timers fire in deadline order", "[event_loop]") {
    ManualClock clock;
    std::vector<int> order;
    clock.loop.call_after(30, [&] { order.push_back(30); });
    clock.loop.call_after(10, [&] { order.push_back(10); });
    clock.loop.call_after(20, [&] { order.push_back(20); });

    clock.advance(50);
    REQUIRE(order == std::vector<int>{10, 20, 30});
}

// ── run_until / stop ────────────────────────────────────────────

TEST_CASE("EventLoop: run_until returns true once the predicate holds", "[event_loop]") {
    ManualClock clock;
    bool ready = false;
    clock.loop.call_after(250, [&] { ready = true; });

    int64_t start = clock.now_ms;
    REQUIRE(clock.loop.run_until([&] { return ready; }, 1000));
    REQUIRE(clock.now_ms - start == 250);
}

TEST_CASE("EventLoop: run_until times out", "[event_loop]") {
    ManualClock clock;
    int64_t start = clock.now_ms;
    REQUIRE_FALSE(clock.loop.run_until([] { return false; }, 500));
    REQUIRE(clock.now_ms - start >= 500);
}

TEST_CASE("EventLoop: stop ends run()", "[event_loop]") {
    ManualClock clock;
    int ticks = 0;
    clock.loop.call_every(10, [&] {
        if (++ticks == 5) clock.loop.stop();
    });
    clock.loop.run();
    REQUIRE(ticks == 5);
    REQUIRE(clock.loop.stopped());
}
