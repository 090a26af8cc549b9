#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

// Per-session state table. The map itself is guarded by one mutex; each
// session's state has its own mutex, so different sessions can be processed
// concurrently while calls for the same session are serialized.
//
// Locking order: map mutex -> slot mutex (the map lock is released before the
// slot callback runs).
template <typename State>
class SessionMap {
public:
    // Run fn(State&) on the session's state, creating it first if needed.
    template <typename Fn>
    decltype(auto) with(const std::string& id, Fn&& fn) {
        for (;;) {
            auto slot = get_or_create(id);
            std::lock_guard lock(slot->mutex);
            // Lost a race with erase(); the next lookup allocates a fresh slot.
            if (slot->erased) continue;
            return fn(slot->state);
        }
    }

    // Run fn(State&) only if the session exists. Returns false otherwise.
    template <typename Fn>
    bool with_existing(const std::string& id, Fn&& fn) {
        auto slot = find(id);
        if (!slot) return false;
        std::lock_guard lock(slot->mutex);
        if (slot->erased) return false;
        fn(slot->state);
        return true;
    }

    // Remove the session. Blocks until any in-flight callback for it finishes,
    // so nothing observes the state after erase() returns.
    bool erase(const std::string& id) {
        std::shared_ptr<Slot> slot;
        {
            std::lock_guard lock(mutex_);
            auto it = slots_.find(id);
            if (it == slots_.end()) return false;
            slot = std::move(it->second);
            slots_.erase(it);
        }
        std::lock_guard lock(slot->mutex);
        slot->erased = true;
        return true;
    }

    // Remove the session, handing its final state to fn(State&) first.
    template <typename Fn>
    bool erase(const std::string& id, Fn&& fn) {
        std::shared_ptr<Slot> slot;
        {
            std::lock_guard lock(mutex_);
            auto it = slots_.find(id);
            if (it == slots_.end()) return false;
            slot = std::move(it->second);
            slots_.erase(it);
        }
        std::lock_guard lock(slot->mutex);
        slot->erased = true;
        fn(slot->state);
        return true;
    }

    bool contains(const std::string& id) const {
        std::lock_guard lock(mutex_);
        return slots_.contains(id);
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return slots_.size();
    }

    // Run fn(id, State&) for every session. Slots are locked one at a time.
    template <typename Fn>
    void for_each(Fn&& fn) {
        std::unordered_map<std::string, std::shared_ptr<Slot>> snapshot;
        {
            std::lock_guard lock(mutex_);
            snapshot = slots_;
        }
        for (auto& [id, slot] : snapshot) {
            std::lock_guard lock(slot->mutex);
            if (!slot->erased) fn(id, slot->state);
        }
    }

private:
    struct Slot {
        std::mutex mutex;
        State state;
        bool erased = false;
    };

    std::shared_ptr<Slot> get_or_create(const std::string& id) {
        std::lock_guard lock(mutex_);
        auto& slot = slots_[id];
        if (!slot) slot = std::make_shared<Slot>();
        return slot;
    }

    std::shared_ptr<Slot> find(const std::string& id) const {
        std::lock_guard lock(mutex_);
        auto it = slots_.find(id);
        return it == slots_.end() ? nullptr : it->second;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
};
