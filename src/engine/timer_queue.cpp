#include "timer_queue.hpp"

#include <exception>
#include <print>

TimerQueue::TimerQueue()
    : worker_([this](std::stop_token stop) { run(stop); }) {}

TimerQueue::~TimerQueue() {
    shutdown();
}

TimerQueue::TimerId TimerQueue::schedule(std::chrono::milliseconds delay, Callback cb) {
    TimerId id;
    {
        std::lock_guard lock(mutex_);
        id = next_id_++;
        auto deadline = Clock::now() + delay;
        deadlines_.emplace(deadline, id);
        entries_.emplace(id, Entry{.deadline = deadline, .cb = std::move(cb)});
    }
    cv_.notify_one();
    return id;
}

bool TimerQueue::cancel(TimerId id) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return false;

    auto [first, last] = deadlines_.equal_range(it->second.deadline);
    for (auto d = first; d != last; ++d) {
        if (d->second == id) {
            deadlines_.erase(d);
            break;
        }
    }
    entries_.erase(it);
    return true;
}

size_t TimerQueue::pending() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

void TimerQueue::shutdown() {
    if (worker_.joinable()) {
        worker_.request_stop();
        cv_.notify_all();
        worker_.join();
    }
    std::lock_guard lock(mutex_);
    deadlines_.clear();
    entries_.clear();
}

void TimerQueue::run(std::stop_token stop) {
    std::unique_lock lock(mutex_);

    while (!stop.stop_requested()) {
        if (deadlines_.empty()) {
            cv_.wait(lock, stop, [this] { return !deadlines_.empty(); });
            continue;
        }

        auto next = deadlines_.begin()->first;
        if (Clock::now() < next) {
            // Wakes early if an earlier timer is scheduled or one is cancelled.
            cv_.wait_until(lock, stop, next, [this, next] {
                return deadlines_.empty() || deadlines_.begin()->first < next;
            });
            continue;
        }

        TimerId id = deadlines_.begin()->second;
        deadlines_.erase(deadlines_.begin());
        auto node = entries_.extract(id);
        if (node.empty()) continue;

        lock.unlock();
        try {
            node.mapped().cb();
        } catch (const std::exception& e) {
            std::println(stderr, "timer: callback threw: {}", e.what());
        } catch (...) {
            std::println(stderr, "timer: callback threw an unknown exception");
        }
        lock.lock();
    }
}
