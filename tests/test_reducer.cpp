#include <catch2/catch.hpp>
#include "reducer.hpp"
#include "channel_state.hpp"
#include <string>

using namespace chansync;

static const std::string kUuid1 = "123e4567-e89b-12d3-a456-426614174001";
static const std::string kUuid2 = "123e4567-e89b-12d3-a456-426614174002";

static Channel make_channel() {
    Channel ch;
    ch.id = "topic-1";
    ch.session_id = "session-1";
    return ch;
}

static Message user_message(const std::string& client_id, MessageStatus status) {
    Message m;
    m.id = client_id;
    m.client_id = client_id;
    m.role = Role::User;
    m.content = "hello";
    m.status = status;
    return m;
}

static AgentContext context_for(const std::string& execution_id) {
    AgentContext ctx;
    ctx.agent_id = "agent-a";
    ctx.agent_name = "Researcher";
    ctx.agent_type = "graph";
    ctx.execution_id = execution_id;
    return ctx;
}

// Applies the event and checks that responding was recomputed.
static ReduceResult step(Channel& ch, const ProtocolEvent& ev) {
    ReduceResult r = reduce(ch, ev);
    REQUIRE(ch.responding == derive_responding(ch));
    return r;
}

// ── Plain streaming ─────────────────────────────────────────────

TEST_CASE("Reducer: loading inserts a single placeholder", "[reducer]") {
    auto ch = make_channel();
    step(ch, Loading{});
    REQUIRE(ch.messages.size() == 1);
    REQUIRE(ch.messages[0].is_loading);
    REQUIRE(ch.messages[0].status == MessageStatus::Pending);
    REQUIRE(ch.messages[0].id.rfind("loading-", 0) == 0);
    REQUIRE(ch.responding);

    step(ch, Loading{});
    REQUIRE(ch.messages.size() == 1);
}

TEST_CASE("Reducer: stream lifecycle on a placeholder", "[reducer]") {
    auto ch = make_channel();
    step(ch, Loading{});
    step(ch, StreamingStart{"s1", ""});
    REQUIRE(ch.messages.size() == 1);
    REQUIRE(ch.messages[0].id == "s1");
    REQUIRE(ch.messages[0].status == MessageStatus::Streaming);
    REQUIRE_FALSE(ch.messages[0].is_loading);

    step(ch, StreamingChunk{"s1", "Hel", ""});
    step(ch, StreamingChunk{"s1", "lo", ""});
    REQUIRE(ch.messages[0].content == "Hello");
    REQUIRE(ch.responding);

    step(ch, StreamingEnd{"s1", "2024-01-01T00:00:00Z", ""});
    REQUIRE(ch.messages[0].status == MessageStatus::Completed);
    REQUIRE_FALSE(ch.messages[0].is_streaming);
    REQUIRE(ch.messages[0].created_at == "2024-01-01T00:00:00Z");
    REQUIRE_FALSE(ch.responding);
}

TEST_CASE("Reducer: chunk without a start creates the message", "[reducer]") {
    auto ch = make_channel();
    step(ch, StreamingChunk{"s9", "orphan", ""});
    REQUIRE(ch.messages.size() == 1);
    REQUIRE(ch.messages[0].id == "s9");
    REQUIRE(ch.messages[0].content == "orphan");
    REQUIRE(ch.messages[0].is_streaming);
}

TEST_CASE("Reducer: streaming_end for an unknown stream ends the sole stream", "[reducer]") {
    auto ch = make_channel();
    step(ch, StreamingChunk{"s1", "text", ""});
    step(ch, StreamingEnd{"other", "", ""});
    REQUIRE(ch.messages[0].status == MessageStatus::Completed);
    REQUIRE_FALSE(ch.messages[0].created_at.empty());
}

TEST_CASE("Reducer: thinking lifecycle", "[reducer]") {
    auto ch = make_channel();
    step(ch, Loading{});
    step(ch, ThinkingStart{"s1"});
    REQUIRE(ch.messages[0].id == "s1");
    REQUIRE(ch.messages[0].status == MessageStatus::Thinking);
    REQUIRE(ch.messages[0].is_thinking);

    step(ch, ThinkingChunk{"s1", "Let me "});
    step(ch, ThinkingChunk{"s1", "think"});
    REQUIRE(ch.messages[0].thinking_content == "Let me think");

    step(ch, ThinkingEnd{"s1"});
    REQUIRE_FALSE(ch.messages[0].is_thinking);
    REQUIRE(ch.messages[0].status == MessageStatus::Thinking);
    REQUIRE(ch.responding);

    step(ch, StreamingStart{"s1", ""});
    step(ch, StreamingChunk{"s1", "answer", ""});
    step(ch, StreamingEnd{"s1", "", ""});
    REQUIRE(ch.messages.size() == 1);
    REQUIRE(ch.messages[0].content == "answer");
    REQUIRE(ch.messages[0].thinking_content == "Let me think");
    REQUIRE(ch.messages[0].status == MessageStatus::Completed);
    REQUIRE_FALSE(ch.responding);
}

TEST_CASE("Reducer: message_saved binds the persisted id", "[reducer]") {
    auto ch = make_channel();
    step(ch, StreamingChunk{"s1", "answer", ""});
    step(ch, StreamingEnd{"s1", "", ""});
    step(ch, MessageSaved{"s1", kUuid1, "2024-02-02T00:00:00Z"});
    REQUIRE(ch.messages[0].id == kUuid1);
    REQUIRE(ch.messages[0].server_id == kUuid1);
    REQUIRE(ch.messages[0].created_at == "2024-02-02T00:00:00Z");
}

// ── Agent executions ────────────────────────────────────────────

TEST_CASE("Reducer: agent run streams into the fallback phase", "[reducer]") {
    auto ch = make_channel();
    step(ch, Loading{});
    step(ch, AgentStart{context_for("e1")});
    REQUIRE(ch.messages.size() == 1);
    REQUIRE(ch.messages[0].id == "agent-e1");
    REQUIRE(ch.messages[0].status == MessageStatus::Pending);
    REQUIRE(ch.messages[0].has_running_execution());

    step(ch, StreamingStart{"s1", "e1"});
    const Message& m = ch.messages[0];
    REQUIRE(m.id == "s1");
    REQUIRE(m.execution->phases.size() == 1);
    REQUIRE(m.execution->phases[0].id == "response");

    step(ch, StreamingChunk{"s1", "Part one. ", "e1"});
    step(ch, StreamingChunk{"s1", "Part two.", "e1"});
    REQUIRE(ch.messages[0].content.empty());
    REQUIRE(ch.messages[0].execution->phases[0].streamed_content == "Part one. Part two.");

    step(ch, StreamingEnd{"s1", "", "e1"});
    REQUIRE(ch.messages[0].content == "Part one. Part two.");
    REQUIRE(ch.messages[0].has_running_execution());
    REQUIRE(ch.responding);

    step(ch, AgentEnd{context_for("e1"), "completed", int64_t{1234}});
    REQUIRE(ch.messages[0].execution->status == ExecutionStatus::Completed);
    REQUIRE(ch.messages[0].execution->duration_ms == int64_t{1234});
    REQUIRE(ch.messages[0].execution->phases[0].status == PhaseStatus::Completed);
    REQUIRE(ch.messages[0].status == MessageStatus::Completed);
    REQUIRE_FALSE(ch.responding);
}

TEST_CASE("Reducer: restated chunk replaces phase content", "[reducer]") {
    auto ch = make_channel();
    step(ch, AgentStart{context_for("e1")});
    step(ch, StreamingStart{"s1", "e1"});

    std::string first(120, 'a');
    step(ch, StreamingChunk{"s1", first, "e1"});
    std::string restated(150, 'a');
    step(ch, StreamingChunk{"s1", restated, "e1"});
    REQUIRE(ch.messages[0].execution->phases[0].streamed_content == restated);

    // Short content is never treated as a restatement.
    auto ch2 = make_channel();
    step(ch2, AgentStart{context_for("e2")});
    step(ch2, StreamingStart{"s2", "e2"});
    step(ch2, StreamingChunk{"s2", "ab", "e2"});
    step(ch2, StreamingChunk{"s2", "abc", "e2"});
    REQUIRE(ch2.messages[0].execution->phases[0].streamed_content == "ababc");
}

TEST_CASE("Reducer: node events track phases", "[reducer]") {
    auto ch = make_channel();
    step(ch, AgentStart{context_for("e1")});
    step(ch, NodeStart{context_for("e1"), "search_web", "search"});
    auto& exec = *ch.messages[0].execution;
    REQUIRE(exec.phases.size() == 1);
    REQUIRE(exec.current_phase == "Search Web");
    REQUIRE(exec.current_node == "search_web");

    step(ch, NodeStart{context_for("e1"), "summarize", ""});
    REQUIRE(exec.phases.size() == 2);
    REQUIRE(exec.phases[0].status == PhaseStatus::Completed);
    REQUIRE(exec.phases[1].status == PhaseStatus::Running);

    step(ch, NodeEnd{context_for("e1"), "summarize", "skipped", 12, "{\"k\":1}"});
    REQUIRE(exec.phases[1].status == PhaseStatus::Skipped);
    REQUIRE(exec.phases[1].duration_ms == 12);
    REQUIRE(exec.phases[1].output_summary == "{\"k\":1}");
}

TEST_CASE("Reducer: agent error fails the execution", "[reducer]") {
    auto ch = make_channel();
    step(ch, AgentStart{context_for("e1")});
    step(ch, NodeStart{context_for("e1"), "plan", ""});
    step(ch, AgentError{context_for("e1"), "ToolError", "boom", false, "plan"});
    const auto& exec = *ch.messages[0].execution;
    REQUIRE(exec.status == ExecutionStatus::Error);
    REQUIRE(exec.error->message == "boom");
    REQUIRE(exec.phases[0].status == PhaseStatus::Failed);
    REQUIRE_FALSE(ch.responding);
}

TEST_CASE("Reducer: subagents and progress attach to the parent execution", "[reducer]") {
    auto ch = make_channel();
    step(ch, AgentStart{context_for("e1")});

    AgentContext sub_ctx = context_for("e2");
    sub_ctx.parent_execution_id = "e1";
    sub_ctx.depth = 1;
    step(ch, SubagentStart{sub_ctx, "sub1", "Writer", "react"});
    auto& exec = *ch.messages[0].execution;
    REQUIRE(exec.subagents.size() == 1);
    REQUIRE(exec.subagents[0].depth == 1);

    step(ch, SubagentEnd{sub_ctx, "sub1", "completed", 50, ""});
    REQUIRE(exec.subagents[0].status == SubagentStatus::Completed);
    REQUIRE(exec.subagents[0].duration_ms == 50);

    step(ch, ProgressUpdate{context_for("e1"), 42.5, "halfway"});
    REQUIRE(exec.progress_percent == 42.5);
    REQUIRE(exec.progress_message == "halfway");
}

TEST_CASE("Reducer: duplicate agent_start is ignored", "[reducer]") {
    auto ch = make_channel();
    step(ch, AgentStart{context_for("e1")});
    step(ch, AgentStart{context_for("e1")});
    REQUIRE(ch.messages.size() == 1);
}

// ── Correlation ─────────────────────────────────────────────────

TEST_CASE("Reducer: ack binds the server id once", "[reducer]") {
    auto ch = make_channel();
    ch.messages.push_back(user_message("c-1", MessageStatus::Sending));
    step(ch, MessageAck{kUuid1, "c-1"});
    REQUIRE(ch.messages[0].id == kUuid1);
    REQUIRE(ch.messages[0].server_id == kUuid1);
    REQUIRE(ch.messages[0].status == MessageStatus::Completed);

    step(ch, MessageAck{kUuid2, "c-1"});
    REQUIRE(ch.messages[0].id == kUuid1);
}

TEST_CASE("Reducer: ack promotes a send marked failed", "[reducer]") {
    auto ch = make_channel();
    Message m = user_message("c-1", MessageStatus::Failed);
    m.error = MessageError{"network.send_failed", "network", "x", true, ""};
    ch.messages.push_back(m);
    step(ch, MessageAck{kUuid1, "c-1"});
    REQUIRE(ch.messages[0].status == MessageStatus::Completed);
    REQUIRE_FALSE(ch.messages[0].error);
}

TEST_CASE("Reducer: ack for an unknown client id is a no-op", "[reducer]") {
    auto ch = make_channel();
    ch.messages.push_back(user_message("c-1", MessageStatus::Sending));
    step(ch, MessageAck{kUuid1, "c-2"});
    step(ch, MessageAck{kUuid1, ""});
    REQUIRE(ch.messages[0].id == "c-1");
    REQUIRE(ch.messages[0].status == MessageStatus::Sending);
}

TEST_CASE("Reducer: echoed message merges into the optimistic copy", "[reducer]") {
    auto ch = make_channel();
    ch.messages.push_back(user_message("c-1", MessageStatus::Sending));

    MessageReceived ev;
    ev.message.id = kUuid1;
    ev.message.role = Role::User;
    ev.message.content = "hello";
    ev.message.status = MessageStatus::Completed;
    ev.client_id = "c-1";
    step(ch, ev);

    REQUIRE(ch.messages.size() == 1);
    REQUIRE(ch.messages[0].id == kUuid1);
    REQUIRE(ch.messages[0].client_id == "c-1");
    REQUIRE(ch.messages[0].status == MessageStatus::Completed);
}

TEST_CASE("Reducer: message events append once", "[reducer]") {
    auto ch = make_channel();
    MessageReceived ev;
    ev.message.id = kUuid1;
    ev.message.server_id = kUuid1;
    ev.message.role = Role::Assistant;
    ev.message.content = "from elsewhere";
    step(ch, ev);
    step(ch, ev);
    REQUIRE(ch.messages.size() == 1);
    REQUIRE(ch.messages[0].content == "from elsewhere");
}

// ── Errors ──────────────────────────────────────────────────────

TEST_CASE("Reducer: error marks the streaming message failed", "[reducer]") {
    auto ch = make_channel();
    step(ch, StreamingChunk{"s1", "partial answer", ""});

    ErrorReport err;
    err.error = "Model overloaded";
    err.error_code = "provider.overloaded";
    err.recoverable = true;
    auto r = step(ch, err);

    REQUIRE(ch.messages.size() == 1);
    const Message& m = ch.messages[0];
    REQUIRE(m.status == MessageStatus::Failed);
    REQUIRE(m.content == "partial answer");
    REQUIRE(m.error->code == "provider.overloaded");
    REQUIRE(m.error->category == "provider");
    REQUIRE(m.error->recoverable);
    REQUIRE(r.notification);
    REQUIRE(r.notification->level == "error");
    REQUIRE(r.notification->message == "Model overloaded");
    REQUIRE_FALSE(ch.responding);
}

TEST_CASE("Reducer: error without a target inserts nothing", "[reducer]") {
    auto ch = make_channel();
    ch.messages.push_back(user_message("c-1", MessageStatus::Completed));
    auto r = step(ch, ErrorReport{});
    REQUIRE(ch.messages.size() == 1);
    REQUIRE(ch.messages[0].status == MessageStatus::Completed);
    REQUIRE(r.notification);
    REQUIRE(r.notification->code == kInternalErrorCode);
    REQUIRE(r.notification->message == "An error occurred");
}

TEST_CASE("Reducer: error fails a running agent", "[reducer]") {
    auto ch = make_channel();
    step(ch, AgentStart{context_for("e1")});
    step(ch, NodeStart{context_for("e1"), "plan", ""});
    // Leave the pending state so the lookup falls through to the running agent.
    ch.messages[0].status = MessageStatus::Completed;

    ErrorReport err;
    err.error = "tool crashed";
    step(ch, err);
    REQUIRE(ch.messages[0].status == MessageStatus::Failed);
    REQUIRE(ch.messages[0].execution->status == ExecutionStatus::Error);
}

TEST_CASE("Reducer: insufficient balance fails the placeholder", "[reducer]") {
    auto ch = make_channel();
    step(ch, Loading{});
    auto r = step(ch, InsufficientBalance{"", "", "recharge", ""});
    REQUIRE(ch.messages[0].status == MessageStatus::Failed);
    REQUIRE(ch.messages[0].error->code == "billing.insufficient_balance");
    REQUIRE(r.notification->level == "warning");
    REQUIRE_FALSE(ch.responding);
}

TEST_CASE("Reducer: parallel chat limit message", "[reducer]") {
    auto ch = make_channel();
    step(ch, Loading{});
    auto r = step(ch, ParallelChatLimit{"", int64_t{3}, std::nullopt});
    REQUIRE(r.notification->title == "Parallel chat limit");
    REQUIRE(r.notification->message.rfind("Parallel chat limit reached (3/?)", 0) == 0);
    REQUIRE(ch.messages[0].status == MessageStatus::Failed);
    REQUIRE(ch.messages[0].error->recoverable);
}

// ── Abort and topic ─────────────────────────────────────────────

TEST_CASE("Reducer: stream_aborted finalizes and acknowledges", "[reducer]") {
    auto ch = make_channel();
    ch.aborting = true;
    ch.messages.push_back(user_message("c-1", MessageStatus::Sending));
    step(ch, StreamingChunk{"s1", "half", ""});

    auto r = step(ch, StreamAborted{"user", 4, 2});
    REQUIRE(r.abort_acknowledged);
    REQUIRE_FALSE(ch.aborting);
    REQUIRE(ch.messages[0].status == MessageStatus::Failed);
    REQUIRE(ch.messages[1].status == MessageStatus::Cancelled);
    REQUIRE(ch.messages[1].content == "half");
    REQUIRE_FALSE(ch.responding);
}

TEST_CASE("Reducer: topic_updated renames only the matching topic", "[reducer]") {
    auto ch = make_channel();
    auto r = step(ch, TopicUpdated{"topic-1", "Trip plan", ""});
    REQUIRE(ch.title == "Trip plan");
    REQUIRE(r.rename);
    REQUIRE(r.rename->name == "Trip plan");

    auto other = step(ch, TopicUpdated{"topic-2", "Other", ""});
    REQUIRE(ch.title == "Trip plan");
    REQUIRE_FALSE(other.rename);
}

// ── Tool calls ──────────────────────────────────────────────────

static ToolCall make_call(const std::string& id, ToolCallStatus status) {
    ToolCall tc;
    tc.id = id;
    tc.name = "search";
    tc.status = status;
    return tc;
}

TEST_CASE("Reducer: standalone tool call completes its message", "[reducer]") {
    auto ch = make_channel();
    step(ch, ToolCallRequest{make_call("tc1", ToolCallStatus::WaitingConfirmation), ""});
    REQUIRE(ch.messages.size() == 1);
    REQUIRE(ch.messages[0].id == "tool-call-tc1");
    REQUIRE(ch.responding);

    step(ch, ToolCallRequest{make_call("tc1", ToolCallStatus::Pending), ""});
    REQUIRE(ch.messages.size() == 1);

    step(ch, ToolCallResponse{"tc1", ToolCallStatus::Completed, "{\"hits\":2}", ""});
    REQUIRE(ch.messages[0].tool_calls[0].status == ToolCallStatus::Completed);
    REQUIRE(ch.messages[0].tool_calls[0].result == "{\"hits\":2}");
    REQUIRE(ch.messages[0].status == MessageStatus::Completed);
    REQUIRE_FALSE(ch.responding);
}

TEST_CASE("Reducer: tool call inside an agent phase", "[reducer]") {
    auto ch = make_channel();
    step(ch, AgentStart{context_for("e1")});
    step(ch, NodeStart{context_for("e1"), "search_web", ""});
    step(ch, ToolCallRequest{make_call("tc1", ToolCallStatus::Executing), ""});

    REQUIRE(ch.messages.size() == 1);
    REQUIRE(ch.messages[0].execution->phases[0].tool_calls.size() == 1);

    step(ch, ToolCallResponse{"tc1", ToolCallStatus::Failed, "", "timeout"});
    ToolCall* tc = find_tool_call(ch, "tc1");
    REQUIRE(tc);
    REQUIRE(tc->status == ToolCallStatus::Failed);
    REQUIRE(tc->error == "timeout");
    REQUIRE(ch.responding);
}

// ── Attachments and usage ───────────────────────────────────────

TEST_CASE("Reducer: citations and generated files", "[reducer]") {
    auto ch = make_channel();
    step(ch, StreamingChunk{"s1", "see sources", ""});

    Citation c;
    c.url = "https://example.com";
    step(ch, SearchCitations{{c}});
    REQUIRE(ch.messages[0].citations.size() == 1);

    Attachment a;
    a.id = "f1";
    step(ch, GeneratedFiles{{a}});
    step(ch, GeneratedFiles{{a}});
    REQUIRE(ch.messages[0].attachments.size() == 1);
}

TEST_CASE("Reducer: token usage", "[reducer]") {
    auto ch = make_channel();
    step(ch, TokenUsage{10, 20, 30});
    REQUIRE(ch.token_usage == 30);
}
