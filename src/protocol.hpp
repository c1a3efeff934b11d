#pragma once
#include "model.hpp"
#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <nlohmann/json.hpp>

namespace chansync {

// Inbound protocol events, one struct per server frame "type".
// Agent lifecycle events share the execution context block.

struct AgentContext {
    std::string agent_id;
    std::string agent_name;
    std::string agent_type;
    std::string execution_id;
    std::string parent_execution_id;
    int depth = 0;
    std::vector<std::string> execution_path;
    int64_t started_at = 0;
    std::string stream_id;
};

struct Loading {            // "processing" | "loading"
    std::string stream_id;
};

struct StreamingStart {
    std::string stream_id;
    std::string execution_id;
};

struct StreamingChunk {
    std::string stream_id;
    std::string content;
    std::string execution_id;
};

struct StreamingEnd {
    std::string stream_id;
    std::string created_at;
    std::string execution_id;
};

struct ThinkingStart {
    std::string stream_id;
};

struct ThinkingChunk {
    std::string stream_id;
    std::string content;
};

struct ThinkingEnd {
    std::string stream_id;
};

struct MessageReceived {    // "message"
    Message message;
    std::string client_id;  // echo of the optimistic correlation id, if any
};

struct MessageAck {
    std::string message_id;
    std::string client_id;
};

struct MessageSaved {
    std::string stream_id;
    std::string db_id;
    std::string created_at;
};

struct ToolCallRequest {
    ToolCall call;
    std::string stream_id;
};

struct ToolCallResponse {
    std::string tool_call_id;
    ToolCallStatus status = ToolCallStatus::Completed;
    std::string result;     // serialized JSON, empty if absent
    std::string error;
};

struct ErrorReport {        // "error"
    std::string error;
    std::string error_code;
    std::string error_category;
    bool recoverable = false;
    std::string detail;
    std::string stream_id;
};

struct InsufficientBalance {
    std::string error_code;
    std::string message;
    std::string action_required;
    std::string stream_id;
};

struct ParallelChatLimit {
    std::string error_code;
    std::optional<int64_t> current;
    std::optional<int64_t> limit;
};

struct StreamAborted {
    std::string reason;
    int64_t partial_content_length = 0;
    int64_t tokens_consumed = 0;
};

struct TopicUpdated {
    std::string id;
    std::string name;
    std::string updated_at;
};

struct AgentStart {
    AgentContext context;
};

struct AgentEnd {
    AgentContext context;
    std::string status;
    std::optional<int64_t> duration_ms;
};

struct AgentError {
    AgentContext context;
    std::string error_type;
    std::string error_message;
    bool recoverable = false;
    std::string node_id;
};

struct NodeStart {
    AgentContext context;
    std::string node_id;
    std::string component_key;
};

struct NodeEnd {
    AgentContext context;
    std::string node_id;
    std::string status;
    int64_t duration_ms = 0;
    std::string output_summary;
};

struct SubagentStart {
    AgentContext context;
    std::string subagent_id;
    std::string subagent_name;
    std::string subagent_type;
};

struct SubagentEnd {
    AgentContext context;
    std::string subagent_id;
    std::string status;
    int64_t duration_ms = 0;
    std::string output_summary;
};

struct ProgressUpdate {
    AgentContext context;
    double progress_percent = 0;
    std::string message;
};

struct TokenUsage {
    uint64_t input_tokens = 0;
    uint64_t output_tokens = 0;
    uint64_t total_tokens = 0;
};

struct SearchCitations {
    std::vector<Citation> citations;
};

struct GeneratedFiles {
    std::vector<Attachment> files;
};

using ProtocolEvent = std::variant<
    Loading, StreamingStart, StreamingChunk, StreamingEnd,
    ThinkingStart, ThinkingChunk, ThinkingEnd,
    MessageReceived, MessageAck, MessageSaved,
    ToolCallRequest, ToolCallResponse,
    ErrorReport, InsufficientBalance, ParallelChatLimit, StreamAborted,
    TopicUpdated,
    AgentStart, AgentEnd, AgentError, NodeStart, NodeEnd,
    SubagentStart, SubagentEnd, ProgressUpdate,
    TokenUsage, SearchCitations, GeneratedFiles>;

// Parse a server frame {"type": ..., "data": {...}}.
// Returns nullopt for unknown types; throws std::invalid_argument when the
// frame is not an object with a string "type".
std::optional<ProtocolEvent> parse_event(const nlohmann::json& frame);

// Wire name of the event alternative (e.g. "streaming_chunk").
const char* event_type_name(const ProtocolEvent& event);

// True for streaming_chunk / thinking_chunk.
bool is_delta(const ProtocolEvent& event);

// ── Outbound payloads ───────────────────────────────────────────

struct ChatContext {
    std::string knowledge_set_id;
    std::string folder_id;
    std::string folder_name;
};

nlohmann::json make_chat_message(const std::string& text,
                                 const std::string& client_id,
                                 const std::vector<std::string>& file_ids = {},
                                 const std::optional<ChatContext>& context = std::nullopt);
nlohmann::json make_regenerate();
nlohmann::json make_tool_call_confirm(const std::string& tool_call_id);
nlohmann::json make_tool_call_cancel(const std::string& tool_call_id,
                                     const std::string& reason);
nlohmann::json make_abort();
nlohmann::json make_pong();

} // namespace chansync
