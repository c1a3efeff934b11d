#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace chansync {

enum class Role { User, Assistant, Tool, System };

enum class MessageStatus {
    Pending,
    Sending,
    Streaming,
    Thinking,
    Completed,
    Failed,
    Cancelled
};

enum class ExecutionStatus { Running, Completed, Error, Cancelled };

enum class PhaseStatus { Running, Completed, Skipped, Failed, Cancelled };

enum class SubagentStatus { Running, Completed, Failed };

enum class ToolCallStatus {
    Pending,
    WaitingConfirmation,
    Executing,
    Completed,
    Failed
};

const char* to_string(Role role);
const char* to_string(MessageStatus status);
const char* to_string(ExecutionStatus status);
const char* to_string(PhaseStatus status);
const char* to_string(SubagentStatus status);
const char* to_string(ToolCallStatus status);

// Lenient parsers: unknown values map to the listed fallback.
Role role_from_string(const std::string& s);                     // Assistant
MessageStatus message_status_from_string(const std::string& s);  // Completed
ToolCallStatus tool_call_status_from_string(const std::string& s); // Pending

// pending | sending | streaming | thinking
bool is_in_flight(MessageStatus status);
bool is_terminal(ToolCallStatus status);

struct ToolCall {
    std::string id;
    std::string name;
    std::string description;
    nlohmann::json arguments = nlohmann::json::object();
    ToolCallStatus status = ToolCallStatus::Pending;
    std::string result;   // serialized JSON
    std::string error;
    std::string timestamp;
};

struct Phase {
    std::string id;
    std::string name;
    std::string component_key;
    PhaseStatus status = PhaseStatus::Running;
    int64_t started_at = 0;
    int64_t ended_at = 0;
    int64_t duration_ms = 0;
    std::string streamed_content;
    std::string output_summary;
    std::vector<ToolCall> tool_calls;
};

struct Subagent {
    std::string id;
    std::string name;
    std::string type;
    SubagentStatus status = SubagentStatus::Running;
    int depth = 0;
    std::vector<std::string> execution_path;
    int64_t started_at = 0;
    int64_t ended_at = 0;
    int64_t duration_ms = 0;
    std::string output_summary;
};

struct ExecutionError {
    std::string type;
    std::string message;
    bool recoverable = false;
    std::string node_id;
};

struct AgentExecution {
    std::string agent_id;
    std::string agent_name;
    std::string agent_type;
    std::string execution_id;
    ExecutionStatus status = ExecutionStatus::Running;
    int64_t started_at = 0;
    int64_t ended_at = 0;
    std::optional<int64_t> duration_ms;
    std::vector<Phase> phases;
    std::vector<Subagent> subagents;
    std::string current_phase; // display name
    std::string current_node;  // phase id
    std::optional<double> progress_percent;
    std::string progress_message;
    std::optional<ExecutionError> error;

    Phase* find_phase(const std::string& phase_id);
    Phase* running_phase();
};

struct MessageError {
    std::string code;
    std::string category;
    std::string message;
    bool recoverable = false;
    std::string detail;
};

struct Citation {
    std::string url;
    std::string title;
    std::string cited_text;
    int64_t start_index = 0;
    int64_t end_index = 0;
    std::vector<std::string> search_queries;
};

struct Attachment {
    std::string id;
    std::string name;
    std::string type;
    int64_t size = 0;
    std::string category;
    std::string download_url;
    std::string thumbnail_url;
};

struct Message {
    std::string id;                       // current lookup identity
    std::string client_id;                // assigned at creation, never reused
    std::optional<std::string> server_id; // persisted id once confirmed/saved
    Role role = Role::Assistant;
    std::string content;
    MessageStatus status = MessageStatus::Completed;
    bool is_loading = false;
    bool is_streaming = false;
    bool is_thinking = false;
    std::optional<std::string> stream_id;
    std::string thinking_content;
    std::optional<AgentExecution> execution;
    std::vector<ToolCall> tool_calls;
    std::optional<MessageError> error;
    std::vector<Citation> citations;
    std::vector<Attachment> attachments;
    std::string created_at;

    bool has_runtime_flags() const { return is_loading || is_streaming || is_thinking; }
    bool has_running_execution() const {
        return execution && execution->status == ExecutionStatus::Running;
    }
};

struct KnowledgeContext {
    std::string folder_id;
    std::string folder_name;
};

struct Channel {
    std::string id;          // topic id
    std::string session_id;
    std::string title;
    std::string agent_id;
    std::vector<Message> messages;
    bool connected = false;
    bool responding = false;
    bool aborting = false;
    std::optional<std::string> error;
    std::string provider_id;
    std::string model;
    std::string model_tier;
    std::optional<std::string> knowledge_set_id;
    std::optional<KnowledgeContext> knowledge_context;
    uint64_t token_usage = 0;

    Message* find_message(const std::string& message_id);
    const Message* find_message(const std::string& message_id) const;
};

// ── Sessions and topics (REST shapes) ───────────────────────────

struct TopicInfo {
    std::string id;
    std::string session_id;
    std::string name;
    std::string updated_at;
};

struct SessionInfo {
    std::string id;
    std::string name;
    std::string agent_id;
    std::string provider_id;
    std::string model;
    std::string model_tier;
    std::optional<std::string> knowledge_set_id;
    std::vector<TopicInfo> topics;
};

struct TokenStats {
    uint64_t input_tokens = 0;
    uint64_t output_tokens = 0;
    uint64_t total_tokens = 0;
};

// ── JSON conversion ─────────────────────────────────────────────

ToolCall tool_call_from_json(const nlohmann::json& j);
Citation citation_from_json(const nlohmann::json& j);
Attachment attachment_from_json(const nlohmann::json& j);

// Parses a persisted or wire message. id doubles as server_id when it is a UUID.
Message message_from_json(const nlohmann::json& j);

TopicInfo topic_from_json(const nlohmann::json& j);
SessionInfo session_from_json(const nlohmann::json& j);
TokenStats token_stats_from_json(const nlohmann::json& j);

} // namespace chansync
