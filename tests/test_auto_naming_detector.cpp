#include <catch2/catch_test_macros.hpp>

#include "detectors/auto_naming_detector.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <expected>
#include <functional>
#include <latch>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

// Returns the configured names in turn (repeating the last one), or an error
// if none are configured.
class FakeSummarizer : public Summarizer {
public:
    explicit FakeSummarizer(std::vector<std::string> names) : names_(std::move(names)) {}

    std::expected<std::string, std::string> generate_short_name(const std::string& text) override {
        size_t n = calls++;
        {
            std::lock_guard lock(mutex_);
            last_text_ = text;
        }
        if (names_.empty()) return std::unexpected("model offline");
        return names_[std::min(n, names_.size() - 1)];
    }

    std::string last_text() {
        std::lock_guard lock(mutex_);
        return last_text_;
    }

    std::atomic<size_t> calls{0};

private:
    std::vector<std::string> names_;
    std::mutex mutex_;
    std::string last_text_;
};

// Holds the first call until release(); later calls return at once.
class BlockingSummarizer : public Summarizer {
public:
    explicit BlockingSummarizer(std::vector<std::string> names) : names_(std::move(names)) {}

    std::expected<std::string, std::string> generate_short_name(const std::string&) override {
        size_t n = calls++;
        if (n == 0) gate_.wait();
        ++returned;
        return names_[std::min(n, names_.size() - 1)];
    }

    void release() {
        if (!released_.exchange(true)) gate_.count_down();
    }

    std::atomic<size_t> calls{0};
    std::atomic<size_t> returned{0};

private:
    std::vector<std::string> names_;
    std::latch gate_{1};
    std::atomic<bool> released_{false};
};

// Unblocks the summarizer on scope exit so a failed REQUIRE can't leave the
// timer thread stuck when the detector joins it.
struct ReleaseOnExit {
    BlockingSummarizer& summarizer;
    ~ReleaseOnExit() { summarizer.release(); }
};

struct Collected {
    std::mutex mutex;
    std::vector<DetectedEvent> events;

    size_t size() {
        std::lock_guard lock(mutex);
        return events.size();
    }
};

bool wait_for(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

Config::Naming fast_config() {
    Config::Naming config;
    config.debounce_ms = 20;
    config.cooldown_ms = 0;
    config.min_output_chars = 10;
    return config;
}

const std::string kOutput = "$ npm run build\r\n> vite build\r\n\x1b[32mbuilt in 1.2s\x1b[0m\r\n";

} // namespace

TEST_CASE("AutoNamingDetector", "[naming]") {
    auto collected = std::make_shared<Collected>();
    auto on_event = [collected](const DetectedEvent& e) {
        std::lock_guard lock(collected->mutex);
        collected->events.push_back(e);
    };

    SECTION("NamesSessionAfterQuietPeriod") {
        AutoNamingDetector d(fast_config());
        auto fake = std::make_shared<FakeSummarizer>(std::vector<std::string>{"Vite Build"});
        d.set_summarizer(fake);
        d.on_async_event(on_event);

        REQUIRE(d.process_output("t1", kOutput).empty());
        REQUIRE(wait_for([&] { return collected->size() == 1; }));

        std::lock_guard lock(collected->mutex);
        const auto& e = collected->events[0];
        REQUIRE(e.terminal_id == "t1");
        REQUIRE(to_string(e.type) == "terminal-name-auto");
        REQUIRE(e.data["suggestedName"] == "Vite Build");
        REQUIRE(fake->last_text().find("\x1b") == std::string::npos);
        REQUIRE(d.current_name("t1") == "Vite Build");
    }

    SECTION("ShortOutputIsNotNamed") {
        AutoNamingDetector d(fast_config());
        auto fake = std::make_shared<FakeSummarizer>(std::vector<std::string>{"Anything"});
        d.set_summarizer(fake);
        d.on_async_event(on_event);

        d.process_output("t1", "$ ls\r\n");
        REQUIRE(wait_for([&] { return d.pending_timers() == 0; }));
        std::this_thread::sleep_for(50ms);
        REQUIRE(fake->calls.load() == 0);
        REQUIRE(collected->size() == 0);
    }

    SECTION("DebounceRestartsOnOutput") {
        auto config = fast_config();
        config.debounce_ms = 200;
        AutoNamingDetector d(config);
        auto fake = std::make_shared<FakeSummarizer>(std::vector<std::string>{"Long Job"});
        d.set_summarizer(fake);
        d.on_async_event(on_event);

        for (int i = 0; i < 5; ++i) {
            d.process_output("t1", kOutput);
            std::this_thread::sleep_for(10ms);
        }
        REQUIRE(wait_for([&] { return collected->size() == 1; }));
        std::this_thread::sleep_for(250ms);
        REQUIRE(fake->calls.load() == 1);
    }

    SECTION("SameNameIsNotRepeated") {
        AutoNamingDetector d(fast_config());
        auto fake = std::make_shared<FakeSummarizer>(std::vector<std::string>{"Test Runner"});
        d.set_summarizer(fake);
        d.on_async_event(on_event);

        d.process_output("t1", kOutput);
        REQUIRE(wait_for([&] { return collected->size() == 1; }));
        d.process_output("t1", kOutput);
        REQUIRE(wait_for([&] { return fake->calls.load() == 2; }));
        std::this_thread::sleep_for(50ms);
        REQUIRE(collected->size() == 1);
    }

    SECTION("CooldownBlocksRename") {
        auto config = fast_config();
        config.cooldown_ms = 60000;
        AutoNamingDetector d(config);
        auto fake = std::make_shared<FakeSummarizer>(std::vector<std::string>{"First", "Second"});
        d.set_summarizer(fake);
        d.on_async_event(on_event);

        d.process_output("t1", kOutput);
        REQUIRE(wait_for([&] { return collected->size() == 1; }));
        d.process_output("t1", kOutput);
        REQUIRE(wait_for([&] { return d.pending_timers() == 0; }));
        std::this_thread::sleep_for(50ms);
        REQUIRE(fake->calls.load() == 1);
        REQUIRE(d.current_name("t1") == "First");
    }

    SECTION("SummarizerFailureEmitsNothing") {
        AutoNamingDetector d(fast_config());
        auto fake = std::make_shared<FakeSummarizer>(std::vector<std::string>{});
        d.set_summarizer(fake);
        d.on_async_event(on_event);

        d.process_output("t1", kOutput);
        REQUIRE(wait_for([&] { return fake->calls.load() == 1; }));
        std::this_thread::sleep_for(50ms);
        REQUIRE(collected->size() == 0);
        REQUIRE_FALSE(d.current_name("t1").has_value());
    }

    SECTION("NoSummarizerIsHarmless") {
        AutoNamingDetector d(fast_config());
        d.on_async_event(on_event);
        d.process_output("t1", kOutput);
        REQUIRE(wait_for([&] { return d.pending_timers() == 0; }));
        std::this_thread::sleep_for(50ms);
        REQUIRE(collected->size() == 0);
    }

    SECTION("CleanupCancelsPendingTimer") {
        auto config = fast_config();
        config.debounce_ms = 50;
        AutoNamingDetector d(config);
        auto fake = std::make_shared<FakeSummarizer>(std::vector<std::string>{"Never"});
        d.set_summarizer(fake);
        d.on_async_event(on_event);

        d.process_output("t1", kOutput);
        REQUIRE(d.pending_timers() == 1);
        d.cleanup("t1");
        REQUIRE(d.pending_timers() == 0);
        REQUIRE_FALSE(d.has_session("t1"));
        d.cleanup("t1");

        std::this_thread::sleep_for(150ms);
        REQUIRE(fake->calls.load() == 0);
        REQUIRE(collected->size() == 0);
    }

    SECTION("CleanupDuringSummarizeDropsResult") {
        auto fake = std::make_shared<BlockingSummarizer>(std::vector<std::string>{"Stale Name"});
        AutoNamingDetector d(fast_config());
        ReleaseOnExit guard{*fake};
        d.set_summarizer(fake);
        d.on_async_event(on_event);

        d.process_output("t1", kOutput);
        REQUIRE(wait_for([&] { return fake->calls.load() == 1; }));
        d.cleanup("t1");
        fake->release();

        REQUIRE(wait_for([&] { return fake->returned.load() == 1; }));
        std::this_thread::sleep_for(50ms);
        REQUIRE(collected->size() == 0);
        REQUIRE_FALSE(d.has_session("t1"));
    }

    SECTION("FreshOutputDuringSummarizeSupersedesResult") {
        auto fake = std::make_shared<BlockingSummarizer>(
            std::vector<std::string>{"Stale Name", "Fresh Name"});
        AutoNamingDetector d(fast_config());
        ReleaseOnExit guard{*fake};
        d.set_summarizer(fake);
        d.on_async_event(on_event);

        d.process_output("t1", kOutput);
        REQUIRE(wait_for([&] { return fake->calls.load() == 1; }));
        d.cleanup("t1");
        d.process_output("t1", kOutput);
        fake->release();

        REQUIRE(wait_for([&] { return fake->returned.load() == 2; }));
        REQUIRE(wait_for([&] { return collected->size() == 1; }));
        std::this_thread::sleep_for(50ms);

        std::lock_guard lock(collected->mutex);
        REQUIRE(collected->events.size() == 1);
        REQUIRE(collected->events[0].data["suggestedName"] == "Fresh Name");
        REQUIRE(d.current_name("t1") == "Fresh Name");
    }

    SECTION("ExitCleansUp") {
        AutoNamingDetector d(fast_config());
        d.process_output("t1", kOutput);
        REQUIRE(d.on_exit("t1", 0).empty());
        REQUIRE_FALSE(d.has_session("t1"));
        REQUIRE(d.pending_timers() == 0);
    }
}
