#pragma once

#include "detectors/token_usage.hpp"
#include "output_detector.hpp"
#include "session_map.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class TurnPhase { Idle, SessionOpen, TurnOpen, TurnClosed };

// Normalizes Codex CLI `--json` output:
//
//   thread.started -> turn.started -> item.started/updated/completed -> turn.completed
//
// into agent-* events. Items become content blocks (text, thinking or
// tool_use); a turn becomes one message. JSON-RPC approval requests that
// share the stream are passed through as agent-approval-request.
class CodexStreamDetector : public OutputDetector {
public:
    static constexpr size_t kMaxPendingChars = 1 << 20;

    explicit CodexStreamDetector(bool verbose = false);

    const std::string& id() const override { return id_; }

    std::vector<DetectedEvent> process_output(const std::string& terminal_id,
                                              std::string_view data) override;
    // Always ends with agent-process-exit, for every session, agent or not.
    std::vector<DetectedEvent> on_exit(const std::string& terminal_id, int exit_code) override;
    void cleanup(const std::string& terminal_id) override;

    bool has_session(const std::string& terminal_id) const { return sessions_.contains(terminal_id); }
    std::optional<TurnPhase> phase(const std::string& terminal_id);

private:
    struct SessionState {
        std::string buffer;
        std::optional<std::string> session_id;
        TurnPhase phase = TurnPhase::Idle;
        bool turn_start_seen = false;
        bool emitted_message_start = false;
        // Running block index for the current turn; -1 before the first item.
        int block_index = -1;
        // Items seen this turn -> text streamed so far.
        std::unordered_map<std::string, std::string> active_items;
        std::optional<TokenUsage> usage;
        int64_t last_event_time = 0;
    };

    std::vector<DetectedEvent> process_record(const std::string& terminal_id,
                                              SessionState& state,
                                              const nlohmann::json& record);

    // JSON-RPC request: has `method` instead of `type`.
    static DetectedEvent approval_request(const std::string& terminal_id,
                                          const nlohmann::json& request);

    void ensure_message_start(const std::string& terminal_id, SessionState& state,
                              std::vector<DetectedEvent>& events);
    void close_turn(SessionState& state);

    // First record seen for an item: advance the block index, emit the start.
    void open_item(const std::string& terminal_id, SessionState& state,
                   const nlohmann::json& item, std::vector<DetectedEvent>& events);

    DetectedEvent item_start_event(const std::string& terminal_id, const SessionState& state,
                                   const nlohmann::json& item) const;
    void item_delta_events(const std::string& terminal_id, SessionState& state,
                           const nlohmann::json& item, bool completed,
                           std::vector<DetectedEvent>& events) const;

    // Text not yet streamed for this item; the whole text if the new snapshot
    // doesn't extend what was sent.
    static std::string unstreamed(SessionState& state, const std::string& item_id,
                                  const std::string& full);

    void log(const std::string& msg) const;

    std::string id_ = "codex-stream-detector";
    bool verbose_;
    SessionMap<SessionState> sessions_;
};

// "text", "thinking" or "tool_use".
std::string codex_block_type(const std::string& item_type);
