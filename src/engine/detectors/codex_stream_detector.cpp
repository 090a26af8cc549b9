#include "detectors/codex_stream_detector.hpp"

#include "detectors/json_fields.hpp"
#include "pty_json.hpp"

#include <format>
#include <iterator>
#include <print>

using json = nlohmann::json;

std::string codex_block_type(const std::string& item_type) {
    if (item_type == "agent_message" || item_type == "plan_update") return "text";
    if (item_type == "reasoning") return "thinking";
    // command_execution, file_change, mcp_tool_call, web_search, anything new
    return "tool_use";
}

static std::string item_id(const json& item) {
    auto it = item.find("id");
    if (it == item.end() || it->is_null()) return {};
    return it->is_string() ? it->get<std::string>() : it->dump();
}

static json message_id(const std::optional<std::string>& session_id) {
    if (session_id) return *session_id;
    return nullptr;
}

CodexStreamDetector::CodexStreamDetector(bool verbose) : verbose_(verbose) {}

std::vector<DetectedEvent> CodexStreamDetector::process_output(const std::string& terminal_id,
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
                auto record = json::parse(text);
                if (!record.is_object()) continue;

                if (record.contains("method") && record["method"].is_string() &&
                    record.contains("id") && record["id"].is_number()) {
                    events.push_back(approval_request(terminal_id, record));
                    continue;
                }

                auto produced = process_record(terminal_id, state, record);
                events.insert(events.end(), std::make_move_iterator(produced.begin()),
                              std::make_move_iterator(produced.end()));
            } catch (const json::exception&) {
                // Not a record we understand; skip it.
            }
        }
        return events;
    });
}

std::vector<DetectedEvent> CodexStreamDetector::on_exit(const std::string& terminal_id,
                                                        int exit_code) {
    std::vector<DetectedEvent> events;

    sessions_.with_existing(terminal_id, [&](SessionState& state) {
        if (state.emitted_message_start) {
            events.push_back(make_event(terminal_id, EventType::MessageEnd, {
                {"messageId", message_id(state.session_id)},
                {"model", nullptr},
                {"stopReason", "terminal_exit"},
                {"exitCode", exit_code},
                {"usage", usage_json(state.usage)},
            }));
            log(std::format("{} exited mid-turn, closed message", terminal_id));
        }
        close_turn(state);
        state.phase = TurnPhase::Idle;
    });

    events.push_back(make_event(terminal_id, EventType::ProcessExit, {{"exitCode", exit_code}}));
    return events;
}

void CodexStreamDetector::cleanup(const std::string& terminal_id) {
    sessions_.erase(terminal_id);
}

std::optional<TurnPhase> CodexStreamDetector::phase(const std::string& terminal_id) {
    std::optional<TurnPhase> result;
    sessions_.with_existing(terminal_id, [&](SessionState& state) { result = state.phase; });
    return result;
}

DetectedEvent CodexStreamDetector::approval_request(const std::string& terminal_id,
                                                    const json& request) {
    std::string method = request["method"].get<std::string>();
    json params = request.contains("params") && request["params"].is_object()
                      ? request["params"]
                      : json::object();

    std::string tool_name;
    if (method.find("commandExecution") != std::string::npos) {
        tool_name = "command_execution";
    } else if (method.find("fileChange") != std::string::npos) {
        tool_name = "file_change";
    } else {
        auto slash = method.rfind('/');
        tool_name = slash == std::string::npos ? method : method.substr(slash + 1);
        if (tool_name.empty()) tool_name = "unknown";
    }

    // Readable fields first, then every param on top.
    json tool_input = json::object();
    if (json_fields::truthy(params, "command")) tool_input["command"] = params["command"];
    if (json_fields::truthy(params, "parsedCmd")) tool_input["command"] = params["parsedCmd"];
    if (json_fields::truthy(params, "reason")) tool_input["reason"] = params["reason"];
    if (json_fields::truthy(params, "risk")) tool_input["risk"] = params["risk"];
    tool_input.update(params);

    std::string command = json_fields::str(tool_input, "command");
    std::string reason = json_fields::str(params, "reason");
    std::string summary;
    if (!command.empty()) {
        summary = "Run command: " + command;
    } else if (tool_name == "file_change") {
        summary = "Apply file changes";
    } else {
        summary = "Approve " + tool_name;
    }
    if (!reason.empty()) summary += " (" + reason + ")";

    return make_event(terminal_id, EventType::ApprovalRequest, {
        {"jsonRpcId", request["id"]},
        {"method", method},
        {"toolName", tool_name},
        {"toolInput", tool_input},
        {"summary", summary},
        {"params", params},
    });
}

std::vector<DetectedEvent> CodexStreamDetector::process_record(const std::string& terminal_id,
                                                               SessionState& state,
                                                               const json& record) {
    std::vector<DetectedEvent> events;
    state.last_event_time = now_ms();
    std::string type = json_fields::str(record, "type");

    if (type == "thread.started") {
        state.session_id = json_fields::str(record, "thread_id");
        state.phase = TurnPhase::SessionOpen;
        events.push_back(make_event(terminal_id, EventType::SessionInit, {
            {"sessionId", *state.session_id},
            {"model", ""},
        }));
        log(std::format("{} thread {}", terminal_id, *state.session_id));

    } else if (type == "turn.started") {
        if (state.emitted_message_start && !state.turn_start_seen) {
            // Items of this turn arrived first; the message is already open.
            state.turn_start_seen = true;
            return events;
        }
        state.phase = TurnPhase::TurnOpen;
        state.turn_start_seen = true;
        state.emitted_message_start = false;
        state.block_index = -1;
        state.active_items.clear();
        state.usage.reset();

    } else if (type == "turn.completed") {
        if (record.contains("usage") && record["usage"].is_object()) {
            const auto& u = record["usage"];
            state.usage = TokenUsage{
                .input_tokens = json_fields::int64(u, "input_tokens").value_or(0),
                .output_tokens = json_fields::int64(u, "output_tokens").value_or(0),
                .cached_input_tokens = json_fields::int64(u, "cached_input_tokens"),
            };
        }
        if (state.emitted_message_start) {
            events.push_back(make_event(terminal_id, EventType::MessageEnd, {
                {"messageId", message_id(state.session_id)},
                {"model", nullptr},
                {"stopReason", "end_turn"},
                {"usage", usage_json(state.usage)},
            }));
        }
        close_turn(state);

    } else if (type == "turn.failed" || type == "error") {
        std::string error;
        if (type == "turn.failed") {
            // `error` is a string in older CLIs and {"message": ...} in newer ones.
            error = record.contains("error") && record["error"].is_object()
                        ? json_fields::str(record["error"], "message")
                        : json_fields::str(record, "error");
            if (error.empty()) error = "Turn failed";
        } else {
            error = json_fields::str(record, "message");
            if (error.empty()) error = json_fields::str(record, "error");
            if (error.empty()) error = "Unknown error";
        }
        events.push_back(make_event(terminal_id, EventType::Error, {{"error", error}}));

        if (state.emitted_message_start) {
            events.push_back(make_event(terminal_id, EventType::MessageEnd, {
                {"messageId", message_id(state.session_id)},
                {"model", nullptr},
                {"stopReason", "error"},
                {"usage", usage_json(state.usage)},
            }));
        }
        close_turn(state);

    } else if (type == "item.started" || type == "item.updated" || type == "item.completed") {
        if (!record.contains("item") || !record["item"].is_object()) return events;
        const auto& item = record["item"];
        auto id = item_id(item);

        // Tolerates a missing or late turn.started.
        ensure_message_start(terminal_id, state, events);

        if (type == "item.started") {
            // A repeated item.started for the same id still opens a new block.
            state.active_items.erase(id);
            open_item(terminal_id, state, item, events);
        } else if (!state.active_items.contains(id)) {
            open_item(terminal_id, state, item, events);
        }

        if (type == "item.updated") {
            item_delta_events(terminal_id, state, item, false, events);
        } else if (type == "item.completed") {
            item_delta_events(terminal_id, state, item, true, events);

            // Best-effort index: the turn's running index, not necessarily the
            // index this item was opened with.
            events.push_back(make_event(terminal_id, EventType::BlockEnd, {
                {"messageId", message_id(state.session_id)},
                {"blockIndex", state.block_index},
                {"blockType", codex_block_type(json_fields::str(item, "type"))},
            }));
            state.active_items.erase(id);
        }
    }

    return events;
}

void CodexStreamDetector::ensure_message_start(const std::string& terminal_id,
                                               SessionState& state,
                                               std::vector<DetectedEvent>& events) {
    if (state.emitted_message_start) return;
    state.emitted_message_start = true;
    state.phase = TurnPhase::TurnOpen;
    events.push_back(make_event(terminal_id, EventType::MessageStart, {
        {"messageId", message_id(state.session_id)},
        {"model", nullptr},
        {"usage", nullptr},
    }));
}

void CodexStreamDetector::close_turn(SessionState& state) {
    if (state.phase == TurnPhase::TurnOpen) state.phase = TurnPhase::TurnClosed;
    state.turn_start_seen = false;
    state.emitted_message_start = false;
    state.block_index = -1;
    state.active_items.clear();
}

void CodexStreamDetector::open_item(const std::string& terminal_id, SessionState& state,
                                    const json& item, std::vector<DetectedEvent>& events) {
    state.active_items.emplace(item_id(item), std::string{});
    state.block_index++;
    events.push_back(item_start_event(terminal_id, state, item));
}

DetectedEvent CodexStreamDetector::item_start_event(const std::string& terminal_id,
                                                    const SessionState& state,
                                                    const json& item) const {
    std::string type = json_fields::str(item, "type");
    std::string block_type = codex_block_type(type);
    json data = {
        {"messageId", message_id(state.session_id)},
        {"blockIndex", state.block_index},
        {"blockType", block_type},
    };

    if (block_type == "text") return make_event(terminal_id, EventType::TextStart, std::move(data));
    if (block_type == "thinking") return make_event(terminal_id, EventType::ThinkingStart, std::move(data));

    std::string name = type;
    if (type == "mcp_tool_call") {
        auto tool = json_fields::str(item, "tool_name");
        if (!tool.empty()) name = tool;
    }
    data["toolId"] = item_id(item);
    data["name"] = name;
    data["toolName"] = name;
    return make_event(terminal_id, EventType::ToolStart, std::move(data));
}

void CodexStreamDetector::item_delta_events(const std::string& terminal_id, SessionState& state,
                                            const json& item, bool completed,
                                            std::vector<DetectedEvent>& events) const {
    std::string type = json_fields::str(item, "type");
    auto id = item_id(item);

    auto text_delta = [&](EventType event_type, const char* key, const char* out_key,
                          const char* block_type) {
        auto full = json_fields::str(item, key);
        if (full.empty()) return;
        auto delta = unstreamed(state, id, full);
        if (delta.empty()) return;
        events.push_back(make_event(terminal_id, event_type, {
            {"messageId", message_id(state.session_id)},
            {"blockIndex", state.block_index},
            {"blockType", block_type},
            {out_key, delta},
        }));
    };

    auto input_delta = [&](const json& snapshot) {
        events.push_back(make_event(terminal_id, EventType::ToolInputDelta, {
            {"messageId", message_id(state.session_id)},
            {"blockIndex", state.block_index},
            {"partialJson", snapshot.dump()},
        }));
    };

    if (type == "agent_message") {
        text_delta(EventType::TextDelta, "text", "text", "text");
    } else if (type == "plan_update") {
        text_delta(EventType::TextDelta, "plan", "text", "text");
    } else if (type == "reasoning") {
        text_delta(EventType::ThinkingDelta, "reasoning", "thinking", "thinking");
    } else if (type == "command_execution") {
        if (!completed) {
            if (json_fields::truthy(item, "command")) {
                input_delta({{"command", item["command"]}});
            }
        } else if (json_fields::truthy(item, "command") || json_fields::truthy(item, "output")) {
            json snapshot = json::object();
            if (json_fields::has(item, "command")) snapshot["command"] = item["command"];
            if (json_fields::truthy(item, "output")) snapshot["output"] = item["output"];
            if (json_fields::has(item, "exit_code")) snapshot["exit_code"] = item["exit_code"];
            input_delta(snapshot);
        }
    } else if (type == "file_change") {
        if (json_fields::truthy(item, "filename")) {
            json snapshot = {{"filename", item["filename"]}};
            if (json_fields::truthy(item, "diff")) snapshot["diff"] = item["diff"];
            if (completed && json_fields::truthy(item, "content")) snapshot["content"] = item["content"];
            input_delta(snapshot);
        }
    } else if (type == "mcp_tool_call") {
        if (json_fields::truthy(item, "arguments")) {
            input_delta(item["arguments"]);
        }
    }
}

std::string CodexStreamDetector::unstreamed(SessionState& state, const std::string& item_id,
                                            const std::string& full) {
    auto& streamed = state.active_items[item_id];
    std::string delta = full.starts_with(streamed) ? full.substr(streamed.size()) : full;
    streamed = full;
    return delta;
}

void CodexStreamDetector::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[{}] {}", id_, msg);
    }
}
