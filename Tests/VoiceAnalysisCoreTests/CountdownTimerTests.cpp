/**
 * @file CountdownTimerTests.cpp
 * @brief Unit tests for the generation-stamped periodic timer
 */

#include "CountdownTimer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <thread>

using namespace va;
using std::chrono::milliseconds;

namespace {

template <typename Pred>
bool wait_for(Pred pred, milliseconds timeout = milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(milliseconds(5));
    }
    return true;
}

}  // namespace

TEST_CASE("timer: ticks until stopped", "[timer]") {
    CountdownTimer timer;
    std::atomic<int> ticks{0};

    const uint64_t gen = timer.start(milliseconds(10), [&](uint64_t) { ++ticks; });
    CHECK(gen != 0);
    CHECK(timer.generation() == gen);
    CHECK(timer.is_running());

    REQUIRE(wait_for([&] { return ticks.load() >= 3; }));

    timer.stop();
    timer.join();
    CHECK_FALSE(timer.is_running());
    CHECK(timer.generation() == 0);

    const int after_stop = ticks.load();
    std::this_thread::sleep_for(milliseconds(50));
    CHECK(ticks.load() == after_stop);
}

TEST_CASE("timer: restart issues a new generation", "[timer]") {
    CountdownTimer timer;
    std::atomic<uint64_t> last_seen{0};

    const uint64_t first = timer.start(milliseconds(10), [&](uint64_t g) { last_seen = g; });
    const uint64_t second = timer.start(milliseconds(10), [&](uint64_t g) { last_seen = g; });
    timer.join();

    CHECK(second > first);
    REQUIRE(wait_for([&] { return last_seen.load() == second; }));

    timer.stop();
    timer.join();
}

TEST_CASE("timer: stop and join from inside the callback", "[timer]") {
    CountdownTimer timer;
    std::atomic<int> ticks{0};

    timer.start(milliseconds(10), [&](uint64_t) {
        ++ticks;
        timer.stop();
        timer.join();
    });

    REQUIRE(wait_for([&] { return !timer.is_running(); }));
    std::this_thread::sleep_for(milliseconds(50));
    CHECK(ticks.load() == 1);
}

TEST_CASE("timer: destructor stops a running timer", "[timer]") {
    std::atomic<int> ticks{0};
    {
        CountdownTimer timer;
        timer.start(milliseconds(5), [&](uint64_t) { ++ticks; });
        std::this_thread::sleep_for(milliseconds(20));
    }
    const int after = ticks.load();
    std::this_thread::sleep_for(milliseconds(30));
    CHECK(ticks.load() == after);
}
