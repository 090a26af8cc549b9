#pragma once

#include "config.hpp"
#include "output_detector.hpp"
#include "summarizer/backend.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// Fans terminal output out to every registered detector and the resulting
// events out to every subscriber. A detector or subscriber that throws is
// logged and skipped; the others still run.
class DetectorManager {
public:
    using EventCallback = std::function<void(const DetectedEvent&)>;

    explicit DetectorManager(bool verbose = false);

    // Replaces (in place) a detector already registered under the same id.
    void register_detector(std::shared_ptr<OutputDetector> detector);
    bool unregister_detector(const std::string& id);

    std::shared_ptr<OutputDetector> detector(const std::string& id) const;
    std::vector<std::string> detector_ids() const;

    // Returns a function that removes the subscription.
    std::function<void()> subscribe(EventCallback callback);

    std::vector<DetectedEvent> process_output(const std::string& terminal_id, std::string_view data);
    std::vector<DetectedEvent> handle_exit(const std::string& terminal_id, int exit_code);
    void cleanup_session(const std::string& terminal_id);

    // Deliver events produced outside process_output/handle_exit (timers).
    void publish(const std::vector<DetectedEvent>& events);

private:
    std::vector<std::shared_ptr<OutputDetector>> snapshot() const;
    void dispatch(const std::vector<DetectedEvent>& events);

    void log(const std::string& msg) const;

    bool verbose_;
    mutable std::mutex mutex_;
    std::vector<std::pair<uint64_t, EventCallback>> subscribers_;
    uint64_t next_subscriber_ = 1;
    // Declared last so detectors (and their timer threads) go first.
    std::vector<std::shared_ptr<OutputDetector>> detectors_;
};

// Register the detectors enabled in config, in the standard order, with the
// naming detector's events routed through manager.publish().
void register_default_detectors(DetectorManager& manager, const Config& config,
                                std::shared_ptr<Summarizer> summarizer, bool verbose = false);
