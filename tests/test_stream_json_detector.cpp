#include <catch2/catch_test_macros.hpp>

#include "detectors/stream_json_detector.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

std::vector<std::string> types(const std::vector<DetectedEvent>& events) {
    std::vector<std::string> out;
    for (const auto& e : events) out.emplace_back(to_string(e.type));
    return out;
}

std::vector<DetectedEvent> feed(StreamJsonDetector& d, const std::string& id,
                                const std::vector<std::string>& lines) {
    std::vector<DetectedEvent> all;
    for (const auto& line : lines) {
        auto events = d.process_output(id, line + "\n");
        all.insert(all.end(), events.begin(), events.end());
    }
    return all;
}

const std::string kMessageStart =
    R"({"type":"message_start","message":{"id":"msg_1","model":"claude-sonnet","usage":{"input_tokens":42,"output_tokens":1}}})";

} // namespace

TEST_CASE("StreamJsonDetector streaming mode", "[stream-json]") {
    StreamJsonDetector d;

    SECTION("FullMessage") {
        auto events = feed(d, "t1", {
            kMessageStart,
            R"({"type":"content_block_start","index":0,"content_block":{"type":"thinking","thinking":""}})",
            R"({"type":"content_block_delta","index":0,"delta":{"type":"thinking_delta","thinking":"Let me look"}})",
            R"({"type":"content_block_stop","index":0})",
            R"({"type":"content_block_start","index":1,"content_block":{"type":"text","text":""}})",
            R"({"type":"content_block_delta","index":1,"delta":{"type":"text_delta","text":"Done."}})",
            R"({"type":"content_block_stop","index":1})",
            R"({"type":"message_delta","delta":{"stop_reason":"end_turn"},"usage":{"output_tokens":15}})",
            R"({"type":"message_stop"})",
        });
        REQUIRE(types(events) == std::vector<std::string>{
            "agent-message-start",
            "agent-thinking-start", "agent-thinking-delta", "agent-block-end",
            "agent-text-start", "agent-text-delta", "agent-block-end",
            "agent-message-end"});

        REQUIRE(events[0].data["messageId"] == "msg_1");
        REQUIRE(events[0].data["model"] == "claude-sonnet");
        REQUIRE(events[0].data["usage"]["inputTokens"] == 42);
        REQUIRE(events[2].data["thinking"] == "Let me look");
        REQUIRE(events[5].data["text"] == "Done.");
        REQUIRE(events[5].data["blockIndex"] == 1);

        const auto& end = events.back().data;
        REQUIRE(end["stopReason"] == "end_turn");
        REQUIRE(end["usage"]["inputTokens"] == 42);
        REQUIRE(end["usage"]["outputTokens"] == 15);
    }

    SECTION("StreamEventWrapperIsUnwrapped") {
        auto events = feed(d, "t1", {
            R"({"type":"stream_event","event":{"type":"message_start","message":{"id":"msg_2","model":"m"}}})",
            R"({"type":"stream_event","event":{"type":"content_block_start","index":0,"content_block":{"type":"tool_use","id":"toolu_1","name":"Bash"}}})",
            R"({"type":"stream_event","event":{"type":"content_block_delta","index":0,"delta":{"type":"input_json_delta","partial_json":"{\"command\":"}}})",
        });
        REQUIRE(types(events) == std::vector<std::string>{
            "agent-message-start", "agent-tool-start", "agent-tool-input-delta"});
        REQUIRE(events[1].data["toolName"] == "Bash");
        REQUIRE(events[1].data["blockId"] == "toolu_1");
        REQUIRE(events[2].data["partialJson"] == "{\"command\":");
    }

    SECTION("MissingIndexFollowsPrevious") {
        auto events = feed(d, "t1", {
            kMessageStart,
            R"({"type":"content_block_start","content_block":{"type":"text"}})",
            R"({"type":"content_block_start","content_block":{"type":"text"}})",
        });
        REQUIRE(events[1].data["blockIndex"] == 0);
        REQUIRE(events[2].data["blockIndex"] == 1);
    }

    SECTION("OutOfRangeIndexFollowsPrevious") {
        auto events = feed(d, "t1", {
            kMessageStart,
            R"({"type":"content_block_start","index":3,"content_block":{"type":"text"}})",
            R"({"type":"content_block_start","index":1e20,"content_block":{"type":"text"}})",
            R"({"type":"message_delta","delta":{"stop_reason":"end_turn"},"usage":{"output_tokens":-1e30}})",
            R"({"type":"message_stop"})",
        });
        REQUIRE(events[2].data["blockIndex"] == 4);
        REQUIRE(events.back().data["usage"]["outputTokens"] == 1);
    }

    SECTION("UnknownBlockKinds") {
        auto events = feed(d, "t1", {
            kMessageStart,
            R"({"type":"content_block_start","index":0,"content_block":{"type":"server_tool_use"}})",
            R"({"type":"content_block_delta","index":0,"delta":{"type":"citations_delta"}})",
        });
        REQUIRE(types(events) == std::vector<std::string>{
            "agent-message-start", "agent-block-start", "agent-content-delta"});
    }

    SECTION("MessageStopWithoutStartIsIgnored") {
        auto events = feed(d, "t1", {R"({"type":"message_stop"})", R"({"type":"ping"})"});
        REQUIRE(events.empty());
    }

    SECTION("ErrorClosesOpenMessage") {
        auto events = feed(d, "t1", {
            kMessageStart,
            R"({"type":"error","error":{"type":"overloaded_error","message":"Overloaded"}})",
        });
        REQUIRE(types(events) == std::vector<std::string>{
            "agent-message-start", "agent-error", "agent-message-end"});
        REQUIRE(events[1].data["error"] == "Overloaded");
        REQUIRE(events[1].data["errorType"] == "overloaded_error");
        REQUIRE(events[2].data["stopReason"] == "error");
    }
}

TEST_CASE("StreamJsonDetector print mode", "[stream-json]") {
    StreamJsonDetector d;

    SECTION("SystemInit") {
        auto events = feed(d, "t1", {
            R"({"type":"system","subtype":"init","session_id":"sess-9","model":"claude-opus","tools":[]})",
        });
        REQUIRE(types(events) == std::vector<std::string>{"agent-session-init"});
        REQUIRE(events[0].data["sessionId"] == "sess-9");
        REQUIRE(events[0].data["model"] == "claude-opus");
    }

    SECTION("AssistantRecord") {
        auto events = feed(d, "t1", {
            R"({"type":"assistant","message":{"id":"msg_3","model":"m","content":[)"
            R"({"type":"text","text":"I'll list the files."},)"
            R"({"type":"tool_use","id":"toolu_2","name":"Bash","input":{"command":"ls"}}],)"
            R"("stop_reason":"tool_use","usage":{"input_tokens":5,"output_tokens":9}}})",
            R"({"type":"result","subtype":"success","result":"ok"})",
        });
        REQUIRE(types(events) == std::vector<std::string>{
            "agent-message-start", "agent-text-delta", "agent-tool-start",
            "agent-tool-input-delta", "agent-message-end"});
        REQUIRE(events[1].data["text"] == "I'll list the files.");
        REQUIRE(events[2].data["toolId"] == "toolu_2");
        REQUIRE(events[2].data["blockIndex"] == 1);
        REQUIRE(json::parse(events[3].data["partialJson"].get<std::string>())["command"] == "ls");
        REQUIRE(events[4].data["stopReason"] == "tool_use");
        REQUIRE(events[4].data["usage"]["outputTokens"] == 9);
    }
}

TEST_CASE("StreamJsonDetector exit", "[stream-json]") {
    StreamJsonDetector d;

    SECTION("ExitMidMessage") {
        feed(d, "t1", {
            kMessageStart,
            R"({"type":"content_block_start","index":0,"content_block":{"type":"text"}})",
        });
        auto events = d.on_exit("t1", 130);
        REQUIRE(types(events) == std::vector<std::string>{"agent-message-end"});
        REQUIRE(events[0].data["stopReason"] == "terminal_exit");
        REQUIRE(events[0].data["exitCode"] == 130);
        REQUIRE(events[0].data["usage"]["inputTokens"] == 42);
    }

    SECTION("ExitAfterCompleteMessage") {
        feed(d, "t1", {kMessageStart, R"({"type":"message_stop"})"});
        REQUIRE(d.on_exit("t1", 0).empty());
    }

    SECTION("PlainShellExitIsSilent") {
        d.process_output("t1", "$ ls\r\nMakefile  src\r\n");
        REQUIRE(d.on_exit("t1", 0).empty());
        REQUIRE(d.on_exit("unknown", 0).empty());
    }

    SECTION("CleanupGivesFreshState") {
        feed(d, "t1", {kMessageStart});
        d.cleanup("t1");
        REQUIRE_FALSE(d.has_session("t1"));
        REQUIRE(feed(d, "t1", {R"({"type":"message_stop"})"}).empty());
    }
}
