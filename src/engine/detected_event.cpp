#include "detected_event.hpp"

#include <chrono>

std::string_view to_string(EventType type) {
    switch (type) {
        case EventType::SessionInit: return "agent-session-init";
        case EventType::MessageStart: return "agent-message-start";
        case EventType::MessageEnd: return "agent-message-end";
        case EventType::TextStart: return "agent-text-start";
        case EventType::TextDelta: return "agent-text-delta";
        case EventType::ThinkingStart: return "agent-thinking-start";
        case EventType::ThinkingDelta: return "agent-thinking-delta";
        case EventType::ToolStart: return "agent-tool-start";
        case EventType::ToolInputDelta: return "agent-tool-input-delta";
        case EventType::BlockStart: return "agent-block-start";
        case EventType::ContentDelta: return "agent-content-delta";
        case EventType::BlockEnd: return "agent-block-end";
        case EventType::Error: return "agent-error";
        case EventType::ProcessExit: return "agent-process-exit";
        case EventType::ApprovalRequest: return "agent-approval-request";
        case EventType::ServerDetected: return "server-detected";
        case EventType::ServerError: return "server-error";
        case EventType::ServerCrashed: return "server-crashed";
        case EventType::ReviewCompleted: return "review-completed";
        case EventType::ReviewFailed: return "review-failed";
        case EventType::NameSuggested: return "terminal-name-auto";
    }
    return "unknown";
}

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

DetectedEvent make_event(const std::string& terminal_id, EventType type, nlohmann::json data) {
    return DetectedEvent{
        .terminal_id = terminal_id,
        .type = type,
        .timestamp = now_ms(),
        .data = std::move(data),
    };
}

nlohmann::json to_json(const DetectedEvent& event) {
    return {
        {"terminalId", event.terminal_id},
        {"type", std::string(to_string(event.type))},
        {"timestamp", event.timestamp},
        {"data", event.data},
    };
}
