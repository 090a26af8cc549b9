#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

// Runs delayed callbacks on a single worker thread. Callbacks run without the
// queue lock held, so they may schedule or cancel other timers.
class TimerQueue {
public:
    using TimerId = uint64_t;
    using Callback = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    TimerQueue();
    ~TimerQueue();

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    TimerId schedule(std::chrono::milliseconds delay, Callback cb);

    // Returns false if the timer already fired (or is firing) or never existed.
    bool cancel(TimerId id);

    size_t pending() const;

    // Stop the worker. Pending timers are discarded.
    void shutdown();

private:
    void run(std::stop_token stop);

    struct Entry {
        Clock::time_point deadline;
        Callback cb;
    };

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::multimap<Clock::time_point, TimerId> deadlines_;
    std::unordered_map<TimerId, Entry> entries_;
    TimerId next_id_ = 1;
    std::jthread worker_;
};
