#include <catch2/catch.hpp>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

#include "monitor/event_loop.hpp"

using namespace plantop;  // NOLINT

TEST_CASE("EventLoop: alarms fire in deadline order", "[event_loop]") {
    EventLoop loop;
    std::vector<int> fired;

    loop.set_alarm_in(0.03, [&] { fired.push_back(3); });
    loop.set_alarm_in(0.01, [&] { fired.push_back(1); });
    loop.set_alarm_in(0.0, [&] { fired.push_back(0); });
    loop.set_alarm_in(0.0, [&] { fired.push_back(10); });

    loop.run();

    CHECK(fired == std::vector<int>{0, 10, 1, 3});
    CHECK(loop.pending() == 0);
}

TEST_CASE("EventLoop: callbacks can re-arm", "[event_loop]") {
    EventLoop loop;
    int ticks = 0;
    std::function<void()> tick = [&] {
        if (++ticks < 3) loop.set_alarm_in(0.001, tick);
    };
    loop.set_alarm_in(0.0, tick);

    loop.run();
    CHECK(ticks == 3);
}

TEST_CASE("EventLoop: stop leaves remaining alarms", "[event_loop]") {
    EventLoop loop;
    int fired = 0;
    loop.set_alarm_in(0.0, [&] {
        fired++;
        loop.stop();
    });
    loop.set_alarm_in(60.0, [&] { fired++; });

    loop.run();
    CHECK(fired == 1);
    CHECK(loop.stop_requested());
    CHECK(loop.pending() == 1);
}

TEST_CASE("EventLoop: a throwing callback does not stop the loop", "[event_loop]") {
    EventLoop loop;
    int fired = 0;
    loop.set_alarm_in(0.0, [] { throw std::runtime_error("listener failed"); });
    loop.set_alarm_in(0.001, [&] { fired++; });

    loop.run();
    CHECK(fired == 1);
    CHECK(loop.alarm_failures() == 1);
    CHECK(loop.pending() == 0);
}

TEST_CASE("EventLoop: non-finite delay is rejected", "[event_loop]") {
    EventLoop loop;
    CHECK_THROWS_AS(loop.set_alarm_in(std::numeric_limits<double>::infinity(), [] {}),
                    std::invalid_argument);
    CHECK_THROWS_AS(loop.set_alarm_in(std::nan(""), [] {}), std::invalid_argument);
    CHECK(loop.pending() == 0);
}
