#include "detector_manager.hpp"

#include "detectors/auto_naming_detector.hpp"
#include "detectors/codex_stream_detector.hpp"
#include "detectors/review_detector.hpp"
#include "detectors/server_detector.hpp"
#include "detectors/stream_json_detector.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <iterator>
#include <print>

DetectorManager::DetectorManager(bool verbose) : verbose_(verbose) {}

void DetectorManager::register_detector(std::shared_ptr<OutputDetector> detector) {
    if (!detector) return;
    std::string id = detector->id();
    {
        std::lock_guard lock(mutex_);
        auto it = std::ranges::find_if(detectors_, [&](const auto& d) { return d->id() == id; });
        if (it != detectors_.end()) {
            *it = std::move(detector);
        } else {
            detectors_.push_back(std::move(detector));
        }
    }
    log(std::format("registered {}", id));
}

bool DetectorManager::unregister_detector(const std::string& id) {
    std::lock_guard lock(mutex_);
    auto removed = std::erase_if(detectors_, [&](const auto& d) { return d->id() == id; });
    return removed > 0;
}

std::shared_ptr<OutputDetector> DetectorManager::detector(const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto it = std::ranges::find_if(detectors_, [&](const auto& d) { return d->id() == id; });
    return it == detectors_.end() ? nullptr : *it;
}

std::vector<std::string> DetectorManager::detector_ids() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& d : detectors_) ids.push_back(d->id());
    return ids;
}

std::function<void()> DetectorManager::subscribe(EventCallback callback) {
    std::lock_guard lock(mutex_);
    uint64_t id = next_subscriber_++;
    subscribers_.emplace_back(id, std::move(callback));
    return [this, id] {
        std::lock_guard lock(mutex_);
        std::erase_if(subscribers_, [id](const auto& s) { return s.first == id; });
    };
}

std::vector<DetectedEvent> DetectorManager::process_output(const std::string& terminal_id,
                                                           std::string_view data) {
    std::vector<DetectedEvent> events;
    for (const auto& detector : snapshot()) {
        try {
            auto produced = detector->process_output(terminal_id, data);
            events.insert(events.end(), std::make_move_iterator(produced.begin()),
                          std::make_move_iterator(produced.end()));
        } catch (const std::exception& e) {
            std::println(stderr, "[termstream] detector {} failed on output for {}: {}",
                         detector->id(), terminal_id, e.what());
        } catch (...) {
            std::println(stderr, "[termstream] detector {} failed on output for {}: unknown exception",
                         detector->id(), terminal_id);
        }
    }
    dispatch(events);
    return events;
}

std::vector<DetectedEvent> DetectorManager::handle_exit(const std::string& terminal_id,
                                                        int exit_code) {
    std::vector<DetectedEvent> events;
    for (const auto& detector : snapshot()) {
        try {
            auto produced = detector->on_exit(terminal_id, exit_code);
            events.insert(events.end(), std::make_move_iterator(produced.begin()),
                          std::make_move_iterator(produced.end()));
        } catch (const std::exception& e) {
            std::println(stderr, "[termstream] detector {} failed on exit of {}: {}",
                         detector->id(), terminal_id, e.what());
        } catch (...) {
            std::println(stderr, "[termstream] detector {} failed on exit of {}: unknown exception",
                         detector->id(), terminal_id);
        }
    }
    dispatch(events);
    return events;
}

void DetectorManager::cleanup_session(const std::string& terminal_id) {
    for (const auto& detector : snapshot()) {
        try {
            detector->cleanup(terminal_id);
        } catch (const std::exception& e) {
            std::println(stderr, "[termstream] detector {} failed to clean up {}: {}",
                         detector->id(), terminal_id, e.what());
        } catch (...) {
            std::println(stderr, "[termstream] detector {} failed to clean up {}: unknown exception",
                         detector->id(), terminal_id);
        }
    }
    log(std::format("cleaned up {}", terminal_id));
}

void DetectorManager::publish(const std::vector<DetectedEvent>& events) {
    dispatch(events);
}

std::vector<std::shared_ptr<OutputDetector>> DetectorManager::snapshot() const {
    std::lock_guard lock(mutex_);
    return detectors_;
}

void DetectorManager::dispatch(const std::vector<DetectedEvent>& events) {
    if (events.empty()) return;

    std::vector<EventCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, cb] : subscribers_) callbacks.push_back(cb);
    }

    for (const auto& event : events) {
        for (const auto& cb : callbacks) {
            try {
                cb(event);
            } catch (const std::exception& e) {
                std::println(stderr, "[termstream] subscriber failed on {}: {}",
                             to_string(event.type), e.what());
            } catch (...) {
                std::println(stderr, "[termstream] subscriber failed on {}: unknown exception",
                             to_string(event.type));
            }
        }
    }
}

void DetectorManager::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[termstream] {}", msg);
    }
}

void register_default_detectors(DetectorManager& manager, const Config& config,
                                std::shared_ptr<Summarizer> summarizer, bool verbose) {
    if (config.detector_enabled("server-detector")) {
        manager.register_detector(std::make_shared<ServerDetector>(config.server, verbose));
    }
    if (config.detector_enabled("stream-json-detector")) {
        manager.register_detector(std::make_shared<StreamJsonDetector>(verbose));
    }
    if (config.detector_enabled("codex-stream-detector")) {
        manager.register_detector(std::make_shared<CodexStreamDetector>(verbose));
    }
    if (config.detector_enabled("review-detector")) {
        manager.register_detector(std::make_shared<ReviewDetector>(config.review, verbose));
    }
    if (config.detector_enabled("auto-naming-detector")) {
        auto naming = std::make_shared<AutoNamingDetector>(config.naming, verbose);
        naming->set_summarizer(std::move(summarizer));
        naming->on_async_event([&manager](const DetectedEvent& event) { manager.publish({event}); });
        manager.register_detector(std::move(naming));
    }
}
