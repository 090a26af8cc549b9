#pragma once

#include "config.hpp"
#include "output_detector.hpp"
#include "session_map.hpp"

#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct ReviewFinding {
    std::string file;
    std::optional<int> line;
    std::optional<int> end_line;
    std::string severity; // critical, warning, info or suggestion
    std::string category = "General";
    std::string title;
    std::string description;
    std::optional<std::string> suggestion;
};

nlohmann::json to_json(const ReviewFinding& finding);

// Validate raw records. Records missing a required field, with an unknown
// severity, or that look like the prompt's template example are dropped.
// `templates_dropped` receives the number of template examples skipped.
std::vector<ReviewFinding> validate_findings(const nlohmann::json& records,
                                             size_t* templates_dropped = nullptr);

// Try, in order: a ```json fenced array, the first balanced [...] that parses
// as a non-empty array, then "no issues" phrasing (or a literal []). nullopt
// means nothing recognizable yet.
std::optional<std::vector<ReviewFinding>> extract_findings(std::string_view buffer);

// Captures the output of an AI code review run in a terminal and turns the
// JSON findings list it prints into a review-completed event.
class ReviewDetector : public OutputDetector {
public:
    static constexpr size_t kKeptBuffers = 10;

    explicit ReviewDetector(Config::Review config = {}, bool verbose = false);

    const std::string& id() const override { return id_; }

    // Arm the detector: output for terminal_id is captured until findings
    // are emitted or the process exits.
    void register_review(const std::string& terminal_id, const std::string& review_id);

    std::vector<DetectedEvent> process_output(const std::string& terminal_id,
                                              std::string_view data) override;
    std::vector<DetectedEvent> on_exit(const std::string& terminal_id, int exit_code) override;
    void cleanup(const std::string& terminal_id) override;

    // Captured output of a review, live or finished.
    std::optional<std::string> buffer_for_review(const std::string& review_id);
    std::optional<std::string> buffer_for_session(const std::string& terminal_id);

    // Forget all but the newest kKeptBuffers finished buffers.
    void clear_old_buffers();
    size_t completed_buffer_count() const;

private:
    struct SessionState {
        std::string buffer;
        std::optional<std::string> review_id;
        bool capturing = false;
        bool emitted = false;
    };

    DetectedEvent completed_event(const std::string& terminal_id, const std::string& review_id,
                                  const std::vector<ReviewFinding>& findings) const;
    void keep_buffer(const std::string& review_id, const std::string& buffer);

    void log(const std::string& msg) const;

    std::string id_ = "review-detector";
    Config::Review config_;
    bool verbose_;
    SessionMap<SessionState> sessions_;

    mutable std::mutex completed_mutex_;
    std::vector<std::pair<std::string, std::string>> completed_; // review id -> buffer, oldest first
};
