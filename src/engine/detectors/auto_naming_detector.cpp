#include "detectors/auto_naming_detector.hpp"

#include "pty_json.hpp"

#include <chrono>
#include <format>
#include <print>

AutoNamingDetector::AutoNamingDetector(Config::Naming config, bool verbose)
    : config_(config), verbose_(verbose) {}

AutoNamingDetector::~AutoNamingDetector() {
    timers_.shutdown();
}

void AutoNamingDetector::set_summarizer(std::shared_ptr<Summarizer> summarizer) {
    std::lock_guard lock(mutex_);
    summarizer_ = std::move(summarizer);
}

void AutoNamingDetector::on_async_event(EventCallback callback) {
    std::lock_guard lock(mutex_);
    callback_ = std::move(callback);
}

std::vector<DetectedEvent> AutoNamingDetector::process_output(const std::string& terminal_id,
                                                              std::string_view data) {
    sessions_.with(terminal_id, [&](SessionState& state) {
        state.buffer += pty_json::strip_ansi(data);
        pty_json::trim_front(state.buffer, config_.max_buffer_chars);

        if (state.timer) timers_.cancel(*state.timer);

        uint64_t token = next_token_++;
        state.token = token;
        state.timer = timers_.schedule(std::chrono::milliseconds(config_.debounce_ms),
                                       [this, terminal_id, token] { on_debounce(terminal_id, token); });
    });
    return {};
}

std::vector<DetectedEvent> AutoNamingDetector::on_exit(const std::string& terminal_id, int) {
    cleanup(terminal_id);
    return {};
}

void AutoNamingDetector::cleanup(const std::string& terminal_id) {
    bool erased = sessions_.erase(terminal_id, [&](SessionState& state) {
        if (state.timer) timers_.cancel(*state.timer);
    });
    if (erased) log(std::format("cleaned up {}", terminal_id));
}

std::optional<std::string> AutoNamingDetector::current_name(const std::string& terminal_id) {
    std::optional<std::string> name;
    sessions_.with_existing(terminal_id, [&](SessionState& state) { name = state.current_name; });
    return name;
}

void AutoNamingDetector::on_debounce(const std::string& terminal_id, uint64_t token) {
    std::string text;
    std::shared_ptr<Summarizer> summarizer;
    int64_t now = now_ms();

    bool ready = false;
    sessions_.with_existing(terminal_id, [&](SessionState& state) {
        if (state.token != token) return;
        state.timer.reset();

        if (state.buffer.size() < config_.min_output_chars) {
            log(std::format("{}: only {} chars buffered", terminal_id, state.buffer.size()));
            return;
        }
        auto since_change = now - state.last_name_change;
        if (since_change < static_cast<int64_t>(config_.cooldown_ms)) {
            log(std::format("{}: cooldown, {}s left", terminal_id,
                            (config_.cooldown_ms - since_change) / 1000));
            return;
        }
        {
            std::lock_guard lock(mutex_);
            summarizer = summarizer_;
        }
        if (!summarizer) {
            log("no summarizer set, cannot name sessions");
            return;
        }
        text = state.buffer;
        ready = true;
    });
    if (!ready) return;

    // The model call can take seconds; don't hold the session while it runs.
    auto name = summarizer->generate_short_name(text);
    if (!name) {
        std::println(stderr, "naming: {}: {}", terminal_id, name.error());
        return;
    }

    sessions_.with_existing(terminal_id, [&](SessionState& state) {
        // Cleaned up, or more output arrived and a newer debounce is pending.
        if (state.token != token) return;
        if (state.current_name == *name) return;

        state.current_name = *name;
        state.last_name_change = now;

        auto event = make_event(terminal_id, EventType::NameSuggested, {{"suggestedName", *name}});

        EventCallback callback;
        {
            std::lock_guard lock(mutex_);
            callback = callback_;
        }
        if (!callback) {
            log(std::format("{}: suggested \"{}\" but no callback is set", terminal_id, *name));
            return;
        }
        log(std::format("{}: suggested \"{}\"", terminal_id, *name));
        callback(event);
    });
}

void AutoNamingDetector::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[{}] {}", id_, msg);
    }
}
