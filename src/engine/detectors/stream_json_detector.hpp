#pragma once

#include "detectors/token_usage.hpp"
#include "output_detector.hpp"
#include "session_map.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Normalizes Claude CLI `--output-format stream-json` output. Streaming mode
// sends message_start / content_block_* / message_delta / message_stop
// (optionally wrapped in {"type":"stream_event","event":{...}}); print mode
// sends one `assistant` record per message.
class StreamJsonDetector : public OutputDetector {
public:
    static constexpr size_t kMaxPendingChars = 1 << 20;

    explicit StreamJsonDetector(bool verbose = false);

    const std::string& id() const override { return id_; }

    std::vector<DetectedEvent> process_output(const std::string& terminal_id,
                                              std::string_view data) override;
    // Closes an open message only; agent-process-exit comes from the codex detector.
    std::vector<DetectedEvent> on_exit(const std::string& terminal_id, int exit_code) override;
    void cleanup(const std::string& terminal_id) override;

    bool has_session(const std::string& terminal_id) const { return sessions_.contains(terminal_id); }

private:
    struct SessionState {
        std::string buffer;
        bool message_open = false;
        std::optional<std::string> message_id;
        std::optional<std::string> model;
        int block_index = -1;
        std::string block_type; // "text", "thinking", "tool_use" or empty
        std::optional<TokenUsage> usage;
        std::optional<std::string> stop_reason;
        int64_t last_event_time = 0;
    };

    std::vector<DetectedEvent> process_record(const std::string& terminal_id,
                                              SessionState& state,
                                              const nlohmann::json& event);

    void handle_assistant(const std::string& terminal_id, SessionState& state,
                          const nlohmann::json& message, std::vector<DetectedEvent>& events);

    void reset_message(SessionState& state);

    void log(const std::string& msg) const;

    std::string id_ = "stream-json-detector";
    bool verbose_;
    SessionMap<SessionState> sessions_;
};

// Event type for a content_block_start of the given block type.
EventType block_start_event_type(const std::string& block_type);

// Event type for a content_block_delta: by current block type if known,
// otherwise by the delta's own type.
EventType delta_event_type(const std::string& block_type, const std::string& delta_type);
