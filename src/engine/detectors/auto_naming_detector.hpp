#pragma once

#include "config.hpp"
#include "output_detector.hpp"
#include "session_map.hpp"
#include "summarizer/backend.hpp"
#include "timer_queue.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Suggests a terminal name once output goes quiet. Every chunk restarts a
// debounce timer; when it fires, the buffered output is summarized and a
// new name is delivered through the on_async_event() callback.
//
// The callback runs on the timer thread with the session's state locked, so
// it must not call cleanup() for the same session.
class AutoNamingDetector : public OutputDetector {
public:
    using EventCallback = std::function<void(const DetectedEvent&)>;

    explicit AutoNamingDetector(Config::Naming config = {}, bool verbose = false);
    ~AutoNamingDetector() override;

    const std::string& id() const override { return id_; }

    void set_summarizer(std::shared_ptr<Summarizer> summarizer);
    void on_async_event(EventCallback callback);

    // Always empty: names are delivered through the callback.
    std::vector<DetectedEvent> process_output(const std::string& terminal_id,
                                              std::string_view data) override;
    std::vector<DetectedEvent> on_exit(const std::string& terminal_id, int exit_code) override;
    void cleanup(const std::string& terminal_id) override;

    bool has_session(const std::string& terminal_id) const { return sessions_.contains(terminal_id); }
    std::optional<std::string> current_name(const std::string& terminal_id);
    size_t pending_timers() const { return timers_.pending(); }

private:
    struct SessionState {
        std::string buffer;
        std::optional<TimerQueue::TimerId> timer;
        // Identifies the latest scheduled debounce; older firings are stale.
        uint64_t token = 0;
        int64_t last_name_change = 0;
        std::optional<std::string> current_name;
    };

    void on_debounce(const std::string& terminal_id, uint64_t token);

    void log(const std::string& msg) const;

    std::string id_ = "auto-naming-detector";
    Config::Naming config_;
    bool verbose_;

    mutable std::mutex mutex_; // guards summarizer_ and callback_
    std::shared_ptr<Summarizer> summarizer_;
    EventCallback callback_;

    std::atomic<uint64_t> next_token_{1};
    SessionMap<SessionState> sessions_;
    // Last member: its worker is joined before the state above goes away.
    TimerQueue timers_;
};
