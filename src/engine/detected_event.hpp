#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

enum class EventType {
    SessionInit,
    MessageStart,
    MessageEnd,
    TextStart,
    TextDelta,
    ThinkingStart,
    ThinkingDelta,
    ToolStart,
    ToolInputDelta,
    BlockStart,   // block of a kind we don't recognize
    ContentDelta, // delta of a kind we don't recognize
    BlockEnd,
    Error,
    ProcessExit,
    ApprovalRequest,
    ServerDetected,
    ServerError,
    ServerCrashed,
    ReviewCompleted,
    ReviewFailed,
    NameSuggested,
};

// Wire name, e.g. "agent-message-start".
std::string_view to_string(EventType type);

struct DetectedEvent {
    std::string terminal_id;
    EventType type;
    int64_t timestamp = 0; // ms since epoch
    nlohmann::json data;
};

int64_t now_ms();

DetectedEvent make_event(const std::string& terminal_id, EventType type, nlohmann::json data);

// {"terminalId": ..., "type": ..., "timestamp": ..., "data": ...}
nlohmann::json to_json(const DetectedEvent& event);
