#include <catch2/catch.hpp>
#include "protocol.hpp"
#include <stdexcept>

using namespace chansync;
using json = nlohmann::json;

static ProtocolEvent parse(const std::string& type, const json& data = json::object()) {
    auto ev = parse_event(json{{"type", type}, {"data", data}});
    REQUIRE(ev.has_value());
    return *ev;
}

// ── Frame validation ────────────────────────────────────────────

TEST_CASE("Protocol: frame without type throws", "[protocol]") {
    REQUIRE_THROWS_AS(parse_event(json::object()), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_event(json{{"type", 3}}), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_event(json::array()), std::invalid_argument);
}

TEST_CASE("Protocol: unknown type yields nullopt", "[protocol]") {
    REQUIRE_FALSE(parse_event(json{{"type", "mystery"}}).has_value());
}

TEST_CASE("Protocol: missing data object is tolerated", "[protocol]") {
    auto ev = parse_event(json{{"type", "streaming_chunk"}});
    REQUIRE(ev.has_value());
    REQUIRE(std::get<StreamingChunk>(*ev).content.empty());
}

// ── Streaming ───────────────────────────────────────────────────

TEST_CASE("Protocol: processing and loading map to Loading", "[protocol]") {
    REQUIRE(std::holds_alternative<Loading>(parse("processing")));
    auto ev = parse("loading", {{"stream_id", "s1"}});
    REQUIRE(std::get<Loading>(ev).stream_id == "s1");
}

TEST_CASE("Protocol: streaming_chunk fields", "[protocol]") {
    auto ev = parse("streaming_chunk",
                    {{"stream_id", "s1"}, {"content", "Hel"}, {"execution_id", "e1"}});
    const auto& chunk = std::get<StreamingChunk>(ev);
    REQUIRE(chunk.stream_id == "s1");
    REQUIRE(chunk.content == "Hel");
    REQUIRE(chunk.execution_id == "e1");
    REQUIRE(is_delta(ev));
    REQUIRE(std::string(event_type_name(ev)) == "streaming_chunk");
}

TEST_CASE("Protocol: thinking_chunk is a delta, streaming_end is not", "[protocol]") {
    REQUIRE(is_delta(parse("thinking_chunk", {{"stream_id", "s"}, {"content", "x"}})));
    REQUIRE_FALSE(is_delta(parse("streaming_end", {{"stream_id", "s"}})));
}

// ── Messages ────────────────────────────────────────────────────

TEST_CASE("Protocol: message without status defaults to completed", "[protocol]") {
    auto ev = parse("message", {{"id", "123e4567-e89b-12d3-a456-426614174000"},
                                {"role", "user"}, {"content", "hi"}, {"client_id", "c-1"}});
    const auto& m = std::get<MessageReceived>(ev);
    REQUIRE(m.client_id == "c-1");
    REQUIRE(m.message.role == Role::User);
    REQUIRE(m.message.status == MessageStatus::Completed);
    REQUIRE(m.message.server_id);
}

TEST_CASE("Protocol: message_ack fields", "[protocol]") {
    auto ev = parse("message_ack", {{"message_id", "m-1"}, {"client_id", "c-1"}});
    REQUIRE(std::get<MessageAck>(ev).message_id == "m-1");
    REQUIRE(std::get<MessageAck>(ev).client_id == "c-1");
}

TEST_CASE("Protocol: tool_call_response accepts both id spellings", "[protocol]") {
    auto a = parse("tool_call_response",
                   {{"toolCallId", "tc1"}, {"status", "completed"}, {"result", {{"ok", true}}}});
    const auto& ra = std::get<ToolCallResponse>(a);
    REQUIRE(ra.tool_call_id == "tc1");
    REQUIRE(ra.status == ToolCallStatus::Completed);
    REQUIRE(json::parse(ra.result) == json{{"ok", true}});

    auto b = parse("tool_call_response", {{"tool_call_id", "tc2"}, {"status", "failed"}});
    REQUIRE(std::get<ToolCallResponse>(b).tool_call_id == "tc2");
    REQUIRE(std::get<ToolCallResponse>(b).status == ToolCallStatus::Failed);
}

TEST_CASE("Protocol: tool_call_request with numeric timestamp", "[protocol]") {
    auto ev = parse("tool_call_request", {{"id", "tc1"}, {"name", "search"},
                                          {"arguments", {{"q", "x"}}},
                                          {"status", "waiting_confirmation"},
                                          {"timestamp", 1700000000}});
    const auto& req = std::get<ToolCallRequest>(ev);
    REQUIRE(req.call.id == "tc1");
    REQUIRE(req.call.status == ToolCallStatus::WaitingConfirmation);
    REQUIRE(req.call.arguments["q"] == "x");
    REQUIRE(req.call.timestamp == "1700000000");
}

// ── Errors and agent events ─────────────────────────────────────

TEST_CASE("Protocol: parallel_chat_limit keeps missing counts empty", "[protocol]") {
    auto ev = parse("parallel_chat_limit", {{"current", 3}});
    const auto& lim = std::get<ParallelChatLimit>(ev);
    REQUIRE(lim.current == int64_t{3});
    REQUIRE_FALSE(lim.limit.has_value());
}

TEST_CASE("Protocol: agent context is parsed", "[protocol]") {
    auto ev = parse("subagent_start", {
        {"subagent_id", "sub1"}, {"subagent_name", "Researcher"},
        {"context", {{"execution_id", "e2"}, {"parent_execution_id", "e1"},
                     {"depth", 1}, {"execution_path", {"root", "researcher"}}}}});
    const auto& sub = std::get<SubagentStart>(ev);
    REQUIRE(sub.subagent_id == "sub1");
    REQUIRE(sub.context.parent_execution_id == "e1");
    REQUIRE(sub.context.depth == 1);
    REQUIRE(sub.context.execution_path.size() == 2);
}

TEST_CASE("Protocol: node_end serializes object summaries", "[protocol]") {
    auto ev = parse("node_end", {{"node_id", "n"}, {"status", "completed"},
                                 {"output_summary", {{"k", 1}}},
                                 {"context", {{"execution_id", "e1"}}}});
    REQUIRE(json::parse(std::get<NodeEnd>(ev).output_summary) == json{{"k", 1}});
}

// ── Outbound ────────────────────────────────────────────────────

TEST_CASE("Protocol: chat message omits empty optional fields", "[protocol]") {
    auto p = make_chat_message("hello", "c-1");
    REQUIRE(p == json{{"message", "hello"}, {"client_id", "c-1"}});
}

TEST_CASE("Protocol: chat message carries files and context", "[protocol]") {
    ChatContext ctx;
    ctx.knowledge_set_id = "ks1";
    ctx.folder_name = "Docs";
    auto p = make_chat_message("hello", "c-1", {"f1", "f2"}, ctx);
    REQUIRE(p["file_ids"] == json::array({"f1", "f2"}));
    REQUIRE(p["context"]["knowledge_set_id"] == "ks1");
    REQUIRE(p["context"]["folder_name"] == "Docs");
    REQUIRE_FALSE(p["context"].contains("folder_id"));
}

TEST_CASE("Protocol: control commands", "[protocol]") {
    REQUIRE(make_abort() == json{{"type", "abort"}});
    REQUIRE(make_pong() == json{{"type", "pong"}});
    REQUIRE(make_regenerate() == json{{"type", "regenerate"}});
    REQUIRE(make_tool_call_confirm("tc1") ==
            json{{"type", "tool_call_confirm"}, {"data", {{"toolCallId", "tc1"}}}});
    auto cancel = make_tool_call_cancel("tc1", "Cancelled by user");
    REQUIRE(cancel["data"]["reason"] == "Cancelled by user");
}
