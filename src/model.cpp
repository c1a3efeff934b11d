#include "model.hpp"
#include "util.hpp"

namespace chansync {

const char* to_string(Role role) {
    switch (role) {
        case Role::User:      return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool:      return "tool";
        case Role::System:    return "system";
    }
    return "assistant";
}

const char* to_string(MessageStatus status) {
    switch (status) {
        case MessageStatus::Pending:   return "pending";
        case MessageStatus::Sending:   return "sending";
        case MessageStatus::Streaming: return "streaming";
        case MessageStatus::Thinking:  return "thinking";
        case MessageStatus::Completed: return "completed";
        case MessageStatus::Failed:    return "failed";
        case MessageStatus::Cancelled: return "cancelled";
    }
    return "completed";
}

const char* to_string(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Running:   return "running";
        case ExecutionStatus::Completed: return "completed";
        case ExecutionStatus::Error:     return "error";
        case ExecutionStatus::Cancelled: return "cancelled";
    }
    return "running";
}

const char* to_string(PhaseStatus status) {
    switch (status) {
        case PhaseStatus::Running:   return "running";
        case PhaseStatus::Completed: return "completed";
        case PhaseStatus::Skipped:   return "skipped";
        case PhaseStatus::Failed:    return "failed";
        case PhaseStatus::Cancelled: return "cancelled";
    }
    return "running";
}

const char* to_string(SubagentStatus status) {
    switch (status) {
        case SubagentStatus::Running:   return "running";
        case SubagentStatus::Completed: return "completed";
        case SubagentStatus::Failed:    return "failed";
    }
    return "running";
}

const char* to_string(ToolCallStatus status) {
    switch (status) {
        case ToolCallStatus::Pending:             return "pending";
        case ToolCallStatus::WaitingConfirmation: return "waiting_confirmation";
        case ToolCallStatus::Executing:           return "executing";
        case ToolCallStatus::Completed:           return "completed";
        case ToolCallStatus::Failed:              return "failed";
    }
    return "pending";
}

Role role_from_string(const std::string& s) {
    if (s == "user") return Role::User;
    if (s == "tool") return Role::Tool;
    if (s == "system") return Role::System;
    return Role::Assistant;
}

MessageStatus message_status_from_string(const std::string& s) {
    if (s == "pending") return MessageStatus::Pending;
    if (s == "sending") return MessageStatus::Sending;
    if (s == "streaming") return MessageStatus::Streaming;
    if (s == "thinking") return MessageStatus::Thinking;
    if (s == "failed") return MessageStatus::Failed;
    if (s == "cancelled") return MessageStatus::Cancelled;
    return MessageStatus::Completed;
}

ToolCallStatus tool_call_status_from_string(const std::string& s) {
    if (s == "waiting_confirmation") return ToolCallStatus::WaitingConfirmation;
    if (s == "executing") return ToolCallStatus::Executing;
    if (s == "completed") return ToolCallStatus::Completed;
    if (s == "failed") return ToolCallStatus::Failed;
    return ToolCallStatus::Pending;
}

bool is_in_flight(MessageStatus status) {
    return status == MessageStatus::Pending || status == MessageStatus::Sending ||
           status == MessageStatus::Streaming || status == MessageStatus::Thinking;
}

bool is_terminal(ToolCallStatus status) {
    return status == ToolCallStatus::Completed || status == ToolCallStatus::Failed;
}

Phase* AgentExecution::find_phase(const std::string& phase_id) {
    for (auto& phase : phases) {
        if (phase.id == phase_id) return &phase;
    }
    return nullptr;
}

Phase* AgentExecution::running_phase() {
    for (auto& phase : phases) {
        if (phase.status == PhaseStatus::Running) return &phase;
    }
    return nullptr;
}

Message* Channel::find_message(const std::string& message_id) {
    for (auto& m : messages) {
        if (m.id == message_id) return &m;
    }
    return nullptr;
}

const Message* Channel::find_message(const std::string& message_id) const {
    for (const auto& m : messages) {
        if (m.id == message_id) return &m;
    }
    return nullptr;
}

// ── JSON conversion ─────────────────────────────────────────────

static std::string string_field(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return {};
}

static int64_t int_field(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_number()) return j[key].get<int64_t>();
    return 0;
}

static uint64_t count_field(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_number_unsigned()) return j[key].get<uint64_t>();
    return 0;
}

ToolCall tool_call_from_json(const nlohmann::json& j) {
    ToolCall call;
    call.id = string_field(j, "id");
    call.name = string_field(j, "name");
    call.description = string_field(j, "description");
    if (j.contains("arguments") && !j["arguments"].is_null())
        call.arguments = j["arguments"];
    call.status = tool_call_status_from_string(string_field(j, "status"));
    if (j.contains("result") && !j["result"].is_null()) {
        call.result = j["result"].is_string() ? j["result"].get<std::string>()
                                              : j["result"].dump();
    }
    call.error = string_field(j, "error");
    call.timestamp = string_field(j, "timestamp");
    return call;
}

Citation citation_from_json(const nlohmann::json& j) {
    Citation c;
    c.url = string_field(j, "url");
    c.title = string_field(j, "title");
    c.cited_text = string_field(j, "cited_text");
    c.start_index = int_field(j, "start_index");
    c.end_index = int_field(j, "end_index");
    if (j.contains("search_queries") && j["search_queries"].is_array()) {
        for (const auto& q : j["search_queries"]) {
            if (q.is_string()) c.search_queries.push_back(q.get<std::string>());
        }
    }
    return c;
}

Attachment attachment_from_json(const nlohmann::json& j) {
    Attachment a;
    a.id = string_field(j, "id");
    a.name = string_field(j, "name");
    a.type = string_field(j, "type");
    a.size = int_field(j, "size");
    a.category = string_field(j, "category");
    a.download_url = string_field(j, "download_url");
    a.thumbnail_url = string_field(j, "thumbnail_url");
    return a;
}

Message message_from_json(const nlohmann::json& j) {
    Message m;
    m.id = string_field(j, "id");
    if (is_uuid(m.id)) m.server_id = m.id;
    m.client_id = string_field(j, "client_id");
    if (m.client_id.empty()) m.client_id = generate_client_id();
    m.role = role_from_string(string_field(j, "role"));
    m.content = string_field(j, "content");
    m.status = message_status_from_string(string_field(j, "status"));
    m.created_at = string_field(j, "created_at");
    m.thinking_content = string_field(j, "thinking_content");

    const char* tool_key = j.contains("tool_calls") ? "tool_calls" : "toolCalls";
    if (j.contains(tool_key) && j[tool_key].is_array()) {
        for (const auto& tc : j[tool_key]) {
            if (tc.is_object()) m.tool_calls.push_back(tool_call_from_json(tc));
        }
    }
    if (j.contains("citations") && j["citations"].is_array()) {
        for (const auto& c : j["citations"]) {
            if (c.is_object()) m.citations.push_back(citation_from_json(c));
        }
    }
    if (j.contains("attachments") && j["attachments"].is_array()) {
        for (const auto& a : j["attachments"]) {
            if (a.is_object()) m.attachments.push_back(attachment_from_json(a));
        }
    }
    return m;
}

TopicInfo topic_from_json(const nlohmann::json& j) {
    TopicInfo t;
    t.id = string_field(j, "id");
    t.session_id = string_field(j, "session_id");
    t.name = string_field(j, "name");
    t.updated_at = string_field(j, "updated_at");
    return t;
}

SessionInfo session_from_json(const nlohmann::json& j) {
    SessionInfo s;
    s.id = string_field(j, "id");
    s.name = string_field(j, "name");
    s.agent_id = string_field(j, "agent_id");
    s.provider_id = string_field(j, "provider_id");
    s.model = string_field(j, "model");
    s.model_tier = string_field(j, "model_tier");
    std::string ks = string_field(j, "knowledge_set_id");
    if (!ks.empty()) s.knowledge_set_id = ks;
    if (j.contains("topics") && j["topics"].is_array()) {
        for (const auto& t : j["topics"]) {
            if (!t.is_object()) continue;
            TopicInfo topic = topic_from_json(t);
            if (topic.session_id.empty()) topic.session_id = s.id;
            s.topics.push_back(std::move(topic));
        }
    }
    return s;
}

TokenStats token_stats_from_json(const nlohmann::json& j) {
    TokenStats stats;
    stats.input_tokens = count_field(j, "input_tokens");
    stats.output_tokens = count_field(j, "output_tokens");
    stats.total_tokens = count_field(j, "total_tokens");
    return stats;
}

} // namespace chansync
