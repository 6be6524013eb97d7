#include <catch2/catch_test_macros.hpp>

#include "mcprt/core/timer_service.hpp"
#include "support/manual_timer_service.hpp"
#include "support/test_helpers.hpp"

#include <asio/io_context.hpp>

#include <chrono>
#include <vector>

using namespace mcprt;
using namespace std::chrono_literals;

TEST_CASE("AsioTimerService fires after the delay", "[timer]") {
    asio::io_context io;
    AsioTimerService timers(io.get_executor());

    int fired = 0;
    const auto id = timers.schedule(0ms, [&] { ++fired; });
    REQUIRE(id != 0);
    REQUIRE(timers.active_timers() == 1);

    io.run_for(200ms);
    REQUIRE(fired == 1);
    REQUIRE(timers.active_timers() == 0);
}

TEST_CASE("AsioTimerService cancel prevents the callback", "[timer]") {
    asio::io_context io;
    AsioTimerService timers(io.get_executor());

    bool fired = false;
    const auto id = timers.schedule(10ms, [&] { fired = true; });
    timers.cancel(id);
    timers.cancel(id);
    timers.cancel(12345);

    io.run_for(50ms);
    REQUIRE_FALSE(fired);
    REQUIRE(timers.active_timers() == 0);
}

TEST_CASE("ManualTimerService fires in due order", "[timer][manual]") {
    mcprt::test::ManualTimerService timers;
    std::vector<int> order;

    (void)timers.schedule(30ms, [&] { order.push_back(30); });
    (void)timers.schedule(10ms, [&] { order.push_back(10); });
    const auto start = timers.now();

    timers.advance(20ms);
    REQUIRE(order == std::vector<int>{10});
    REQUIRE(timers.now() - start == 20ms);

    timers.advance(10ms);
    REQUIRE(order == std::vector<int>{10, 30});
}

TEST_CASE("ManualTimerService lets callbacks reschedule", "[timer][manual]") {
    mcprt::test::ManualTimerService timers;
    int fired = 0;

    (void)timers.schedule(10ms, [&] {
        ++fired;
        (void)timers.schedule(10ms, [&] { ++fired; });
    });

    timers.advance(15ms);
    REQUIRE(fired == 1);
    timers.advance(5ms);
    REQUIRE(fired == 2);
    REQUIRE(timers.active_timers() == 0);
}
