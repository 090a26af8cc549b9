#include <catch2/catch_test_macros.hpp>

#include "timer_queue.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

bool wait_for(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(2ms);
    }
    return pred();
}

} // namespace

TEST_CASE("TimerQueue", "[timer]") {
    TimerQueue timers;

    SECTION("Fires") {
        std::atomic<int> fired{0};
        timers.schedule(10ms, [&] { ++fired; });
        REQUIRE(timers.pending() == 1);
        REQUIRE(wait_for([&] { return fired.load() == 1; }));
        REQUIRE(timers.pending() == 0);
    }

    SECTION("FiresInDeadlineOrder") {
        std::mutex mutex;
        std::vector<int> order;
        auto record = [&](int n) {
            return [&, n] {
                std::lock_guard lock(mutex);
                order.push_back(n);
            };
        };
        timers.schedule(60ms, record(3));
        timers.schedule(20ms, record(1));
        timers.schedule(40ms, record(2));

        REQUIRE(wait_for([&] {
            std::lock_guard lock(mutex);
            return order.size() == 3;
        }));
        std::lock_guard lock(mutex);
        REQUIRE(order == std::vector<int>{1, 2, 3});
    }

    SECTION("Cancel") {
        std::atomic<int> fired{0};
        auto id = timers.schedule(30ms, [&] { ++fired; });
        REQUIRE(timers.cancel(id));
        REQUIRE_FALSE(timers.cancel(id));
        REQUIRE(timers.pending() == 0);
        std::this_thread::sleep_for(60ms);
        REQUIRE(fired.load() == 0);
    }

    SECTION("CancelAfterFiringFails") {
        std::atomic<int> fired{0};
        auto id = timers.schedule(1ms, [&] { ++fired; });
        REQUIRE(wait_for([&] { return fired.load() == 1; }));
        REQUIRE_FALSE(timers.cancel(id));
        REQUIRE_FALSE(timers.cancel(9999));
    }

    SECTION("CallbackMayScheduleAnother") {
        std::atomic<int> fired{0};
        timers.schedule(5ms, [&] {
            ++fired;
            timers.schedule(5ms, [&] { ++fired; });
        });
        REQUIRE(wait_for([&] { return fired.load() == 2; }));
    }

    SECTION("ThrowingCallbackDoesNotStopWorker") {
        std::atomic<int> fired{0};
        timers.schedule(5ms, [] { throw std::runtime_error("boom"); });
        timers.schedule(15ms, [&] { ++fired; });
        REQUIRE(wait_for([&] { return fired.load() == 1; }));
    }

    SECTION("NonStandardThrowDoesNotStopWorker") {
        std::atomic<int> fired{0};
        timers.schedule(5ms, [] { throw 42; });
        timers.schedule(15ms, [&] { ++fired; });
        REQUIRE(wait_for([&] { return fired.load() == 1; }));
    }

    SECTION("ShutdownDiscardsPending") {
        std::atomic<int> fired{0};
        timers.schedule(1h, [&] { ++fired; });
        timers.shutdown();
        REQUIRE(timers.pending() == 0);
        REQUIRE(fired.load() == 0);
        timers.shutdown();
    }
}
