#include "detectors/stream_json_detector.hpp"

#include "detectors/json_fields.hpp"
#include "pty_json.hpp"

#include <format>
#include <iterator>
#include <limits>
#include <print>

using json = nlohmann::json;

EventType block_start_event_type(const std::string& block_type) {
    if (block_type == "text") return EventType::TextStart;
    if (block_type == "thinking") return EventType::ThinkingStart;
    if (block_type == "tool_use") return EventType::ToolStart;
    return EventType::BlockStart;
}

EventType delta_event_type(const std::string& block_type, const std::string& delta_type) {
    if (block_type == "text") return EventType::TextDelta;
    if (block_type == "thinking") return EventType::ThinkingDelta;
    if (block_type == "tool_use") return EventType::ToolInputDelta;

    if (delta_type == "text_delta") return EventType::TextDelta;
    if (delta_type == "thinking_delta") return EventType::ThinkingDelta;
    if (delta_type == "input_json_delta") return EventType::ToolInputDelta;
    return EventType::ContentDelta;
}

static json opt(const std::optional<std::string>& value) {
    if (value) return *value;
    return nullptr;
}

static std::optional<TokenUsage> read_usage(const json& u) {
    if (!u.is_object()) return std::nullopt;
    return TokenUsage{
        .input_tokens = json_fields::int64(u, "input_tokens").value_or(0),
        .output_tokens = json_fields::int64(u, "output_tokens").value_or(0),
    };
}

StreamJsonDetector::StreamJsonDetector(bool verbose) : verbose_(verbose) {}

std::vector<DetectedEvent> StreamJsonDetector::process_output(const std::string& terminal_id,
                                                              std::string_view data) {
    return sessions_.with(terminal_id, [&](SessionState& state) {
        std::vector<DetectedEvent> events;

        state.buffer += pty_json::strip_ansi(data);
        auto extraction = pty_json::extract_objects(state.buffer);
        state.buffer = std::move(extraction.remaining);

        if (state.buffer.size() > kMaxPendingChars) {
            log(std::format("dropping {} chars of unterminated output for {}",
                            state.buffer.size(), terminal_id));
            state.buffer.clear();
        }

        for (const auto& text : extraction.objects) {
            try {
                auto parsed = json::parse(text);
                if (!parsed.is_object()) continue;

                // {"type":"stream_event","event":{"type":"message_start",...}}
                const json& event = json_fields::str(parsed, "type") == "stream_event" &&
                                            parsed.contains("event") && parsed["event"].is_object()
                                        ? parsed["event"]
                                        : parsed;

                auto produced = process_record(terminal_id, state, event);
                events.insert(events.end(), std::make_move_iterator(produced.begin()),
                              std::make_move_iterator(produced.end()));
            } catch (const json::exception&) {
                // Not a record we understand; skip it.
            }
        }
        return events;
    });
}

std::vector<DetectedEvent> StreamJsonDetector::on_exit(const std::string& terminal_id,
                                                       int exit_code) {
    std::vector<DetectedEvent> events;

    sessions_.with_existing(terminal_id, [&](SessionState& state) {
        if (state.message_open) {
            events.push_back(make_event(terminal_id, EventType::MessageEnd, {
                {"messageId", opt(state.message_id)},
                {"model", opt(state.model)},
                {"stopReason", "terminal_exit"},
                {"exitCode", exit_code},
                {"usage", usage_json(state.usage)},
            }));
            log(std::format("{} exited mid-message, closed message", terminal_id));
            reset_message(state);
        }
    });

    return events;
}

void StreamJsonDetector::cleanup(const std::string& terminal_id) {
    sessions_.erase(terminal_id);
}

std::vector<DetectedEvent> StreamJsonDetector::process_record(const std::string& terminal_id,
                                                              SessionState& state,
                                                              const json& event) {
    std::vector<DetectedEvent> events;
    std::string type = json_fields::str(event, "type");
    if (type.empty()) return events;

    state.last_event_time = now_ms();

    if (type == "message_start") {
        if (!event.contains("message") || !event["message"].is_object()) return events;
        const auto& msg = event["message"];

        state.message_open = true;
        state.message_id = json_fields::str(msg, "id");
        state.model = json_fields::str(msg, "model");
        state.block_index = -1;
        state.block_type.clear();
        state.stop_reason.reset();
        if (msg.contains("usage")) {
            if (auto usage = read_usage(msg["usage"])) state.usage = usage;
        }

        events.push_back(make_event(terminal_id, EventType::MessageStart, {
            {"messageId", opt(state.message_id)},
            {"model", opt(state.model)},
            {"usage", usage_json(state.usage)},
        }));

    } else if (type == "content_block_start") {
        if (!event.contains("content_block") || !event["content_block"].is_object()) return events;
        const auto& block = event["content_block"];

        auto index = json_fields::int64(event, "index");
        if (index && (*index < 0 || *index > std::numeric_limits<int>::max())) index.reset();
        state.block_index = index ? static_cast<int>(*index) : state.block_index + 1;
        state.block_type = json_fields::str(block, "type");

        json data = {
            {"messageId", opt(state.message_id)},
            {"blockIndex", state.block_index},
            {"blockType", state.block_type.empty() ? json(nullptr) : json(state.block_type)},
        };
        if (json_fields::has(block, "id")) {
            data["blockId"] = block["id"];
            data["toolId"] = block["id"];
        }
        if (json_fields::has(block, "name")) {
            data["toolName"] = block["name"];
            data["name"] = block["name"];
        }
        if (json_fields::has(block, "text")) data["text"] = block["text"];
        if (json_fields::has(block, "thinking")) data["thinking"] = block["thinking"];

        events.push_back(make_event(terminal_id, block_start_event_type(state.block_type),
                                    std::move(data)));

    } else if (type == "content_block_delta") {
        if (!event.contains("delta") || !event["delta"].is_object()) return events;
        const auto& delta = event["delta"];

        json data = {
            {"messageId", opt(state.message_id)},
            {"blockIndex", state.block_index},
            {"blockType", state.block_type.empty() ? json(nullptr) : json(state.block_type)},
        };
        if (json_fields::has(delta, "text")) data["text"] = delta["text"];
        if (json_fields::has(delta, "thinking")) data["thinking"] = delta["thinking"];
        if (json_fields::has(delta, "partial_json")) data["partialJson"] = delta["partial_json"];

        events.push_back(make_event(terminal_id,
                                    delta_event_type(state.block_type, json_fields::str(delta, "type")),
                                    std::move(data)));

    } else if (type == "content_block_stop") {
        events.push_back(make_event(terminal_id, EventType::BlockEnd, {
            {"messageId", opt(state.message_id)},
            {"blockIndex", state.block_index},
            {"blockType", state.block_type.empty() ? json(nullptr) : json(state.block_type)},
        }));

    } else if (type == "message_delta") {
        if (event.contains("delta")) {
            auto reason = json_fields::str(event["delta"], "stop_reason");
            if (!reason.empty()) state.stop_reason = reason;
        }
        if (event.contains("usage")) {
            if (auto out = json_fields::int64(event["usage"], "output_tokens")) {
                if (state.usage) {
                    state.usage->output_tokens = *out;
                } else {
                    state.usage = TokenUsage{.input_tokens = 0, .output_tokens = *out};
                }
            }
        }

    } else if (type == "message_stop") {
        if (state.message_open) {
            events.push_back(make_event(terminal_id, EventType::MessageEnd, {
                {"messageId", opt(state.message_id)},
                {"model", opt(state.model)},
                {"stopReason", opt(state.stop_reason)},
                {"usage", usage_json(state.usage)},
            }));
        }
        reset_message(state);

    } else if (type == "system") {
        auto session_id = json_fields::str(event, "session_id");
        if (json_fields::str(event, "subtype") == "init" && !session_id.empty()) {
            state.message_id = session_id;
            auto model = json_fields::str(event, "model");
            if (model.empty()) {
                state.model.reset();
            } else {
                state.model = model;
            }
            events.push_back(make_event(terminal_id, EventType::SessionInit, {
                {"sessionId", session_id},
                {"model", model},
            }));
            log(std::format("{} session {}", terminal_id, session_id));
        }

    } else if (type == "assistant") {
        if (event.contains("message") && event["message"].is_object()) {
            handle_assistant(terminal_id, state, event["message"], events);
        }

    } else if (type == "error") {
        std::string message;
        std::string error_type;
        if (event.contains("error") && event["error"].is_object()) {
            message = json_fields::str(event["error"], "message");
            error_type = json_fields::str(event["error"], "type");
        } else {
            message = json_fields::str(event, "error");
        }
        if (message.empty()) message = "Unknown error";

        json data = {{"error", message}};
        if (!error_type.empty()) data["errorType"] = error_type;
        events.push_back(make_event(terminal_id, EventType::Error, std::move(data)));

        if (state.message_open) {
            events.push_back(make_event(terminal_id, EventType::MessageEnd, {
                {"messageId", opt(state.message_id)},
                {"model", opt(state.model)},
                {"stopReason", "error"},
                {"usage", usage_json(state.usage)},
            }));
        }
        reset_message(state);
    }
    // ping, result: nothing to emit

    return events;
}

void StreamJsonDetector::handle_assistant(const std::string& terminal_id, SessionState& state,
                                          const json& msg, std::vector<DetectedEvent>& events) {
    auto id = json_fields::str(msg, "id");
    if (!id.empty()) state.message_id = id;
    auto model = json_fields::str(msg, "model");
    if (!model.empty()) state.model = model;

    json usage = nullptr;
    if (msg.contains("usage") && msg["usage"].is_object()) usage = usage_json(read_usage(msg["usage"]));

    events.push_back(make_event(terminal_id, EventType::MessageStart, {
        {"messageId", opt(state.message_id)},
        {"model", opt(state.model)},
        {"usage", usage},
    }));

    if (msg.contains("content") && msg["content"].is_array()) {
        int index = 0;
        for (const auto& block : msg["content"]) {
            auto block_type = json_fields::str(block, "type");
            auto text = json_fields::str(block, "text");
            auto thinking = json_fields::str(block, "thinking");

            if (block_type == "text" && !text.empty()) {
                events.push_back(make_event(terminal_id, EventType::TextDelta, {
                    {"messageId", opt(state.message_id)},
                    {"blockIndex", index},
                    {"blockType", "text"},
                    {"text", text},
                }));
            } else if (block_type == "thinking" && !thinking.empty()) {
                events.push_back(make_event(terminal_id, EventType::ThinkingDelta, {
                    {"messageId", opt(state.message_id)},
                    {"blockIndex", index},
                    {"blockType", "thinking"},
                    {"thinking", thinking},
                }));
            } else if (block_type == "tool_use") {
                json start = {
                    {"messageId", opt(state.message_id)},
                    {"blockIndex", index},
                    {"blockType", "tool_use"},
                };
                if (json_fields::has(block, "id")) start["toolId"] = block["id"];
                if (json_fields::has(block, "name")) {
                    start["name"] = block["name"];
                    start["toolName"] = block["name"];
                }
                events.push_back(make_event(terminal_id, EventType::ToolStart, std::move(start)));

                if (json_fields::truthy(block, "input")) {
                    events.push_back(make_event(terminal_id, EventType::ToolInputDelta, {
                        {"messageId", opt(state.message_id)},
                        {"blockIndex", index},
                        {"partialJson", block["input"].dump()},
                    }));
                }
            }
            ++index;
        }
    }

    auto stop_reason = json_fields::str(msg, "stop_reason");
    events.push_back(make_event(terminal_id, EventType::MessageEnd, {
        {"messageId", opt(state.message_id)},
        {"model", opt(state.model)},
        {"stopReason", stop_reason.empty() ? json(nullptr) : json(stop_reason)},
        {"usage", usage},
    }));
}

void StreamJsonDetector::reset_message(SessionState& state) {
    state.message_open = false;
    state.message_id.reset();
    state.model.reset();
    state.block_index = -1;
    state.block_type.clear();
    state.usage.reset();
    state.stop_reason.reset();
}

void StreamJsonDetector::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[{}] {}", id_, msg);
    }
}
