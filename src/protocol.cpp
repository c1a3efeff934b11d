#include "protocol.hpp"

#include <iterator>
#include <stdexcept>

namespace chansync {

static std::string str(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return {};
}

static int64_t int64(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_number()) return j[key].get<int64_t>();
    return 0;
}

static std::optional<int64_t> opt_int64(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_number()) return j[key].get<int64_t>();
    return std::nullopt;
}

static bool boolean(const nlohmann::json& j, const char* key) {
    return j.contains(key) && j[key].is_boolean() && j[key].get<bool>();
}

static std::string summary(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return {};
    return j[key].is_string() ? j[key].get<std::string>() : j[key].dump();
}

static AgentContext parse_context(const nlohmann::json& data) {
    AgentContext ctx;
    if (!data.contains("context") || !data["context"].is_object()) return ctx;
    const auto& c = data["context"];
    ctx.agent_id = str(c, "agent_id");
    ctx.agent_name = str(c, "agent_name");
    ctx.agent_type = str(c, "agent_type");
    ctx.execution_id = str(c, "execution_id");
    ctx.parent_execution_id = str(c, "parent_execution_id");
    ctx.depth = static_cast<int>(int64(c, "depth"));
    if (c.contains("execution_path") && c["execution_path"].is_array()) {
        for (const auto& p : c["execution_path"]) {
            if (p.is_string()) ctx.execution_path.push_back(p.get<std::string>());
        }
    }
    ctx.started_at = int64(c, "started_at");
    ctx.stream_id = str(c, "stream_id");
    return ctx;
}

std::optional<ProtocolEvent> parse_event(const nlohmann::json& frame) {
    if (!frame.is_object() || !frame.contains("type") || !frame["type"].is_string())
        throw std::invalid_argument("protocol: frame has no type");

    const std::string type = frame["type"].get<std::string>();
    static const nlohmann::json empty = nlohmann::json::object();
    const nlohmann::json& d = (frame.contains("data") && frame["data"].is_object())
        ? frame["data"] : empty;

    if (type == "processing" || type == "loading")
        return Loading{str(d, "stream_id")};
    if (type == "streaming_start")
        return StreamingStart{str(d, "stream_id"), str(d, "execution_id")};
    if (type == "streaming_chunk")
        return StreamingChunk{str(d, "stream_id"), str(d, "content"), str(d, "execution_id")};
    if (type == "streaming_end")
        return StreamingEnd{str(d, "stream_id"), str(d, "created_at"), str(d, "execution_id")};
    if (type == "thinking_start")
        return ThinkingStart{str(d, "stream_id")};
    if (type == "thinking_chunk")
        return ThinkingChunk{str(d, "stream_id"), str(d, "content")};
    if (type == "thinking_end")
        return ThinkingEnd{str(d, "stream_id")};

    if (type == "message") {
        MessageReceived ev;
        ev.message = message_from_json(d);
        ev.client_id = str(d, "client_id");
        if (!d.contains("status")) ev.message.status = MessageStatus::Completed;
        return ev;
    }
    if (type == "message_ack")
        return MessageAck{str(d, "message_id"), str(d, "client_id")};
    if (type == "message_saved")
        return MessageSaved{str(d, "stream_id"), str(d, "db_id"), str(d, "created_at")};

    if (type == "tool_call_request") {
        ToolCallRequest ev;
        ev.call = tool_call_from_json(d);
        if (d.contains("timestamp") && d["timestamp"].is_number())
            ev.call.timestamp = std::to_string(d["timestamp"].get<int64_t>());
        ev.stream_id = str(d, "stream_id");
        return ev;
    }
    if (type == "tool_call_response") {
        ToolCallResponse ev;
        ev.tool_call_id = str(d, "toolCallId");
        if (ev.tool_call_id.empty()) ev.tool_call_id = str(d, "tool_call_id");
        ev.status = tool_call_status_from_string(str(d, "status"));
        ev.result = summary(d, "result");
        ev.error = str(d, "error");
        return ev;
    }

    if (type == "error") {
        ErrorReport ev;
        ev.error = str(d, "error");
        ev.error_code = str(d, "error_code");
        ev.error_category = str(d, "error_category");
        ev.recoverable = boolean(d, "recoverable");
        ev.detail = str(d, "detail");
        ev.stream_id = str(d, "stream_id");
        return ev;
    }
    if (type == "insufficient_balance")
        return InsufficientBalance{str(d, "error_code"), str(d, "message"),
                                   str(d, "action_required"), str(d, "stream_id")};
    if (type == "parallel_chat_limit")
        return ParallelChatLimit{str(d, "error_code"), opt_int64(d, "current"),
                                 opt_int64(d, "limit")};
    if (type == "stream_aborted")
        return StreamAborted{str(d, "reason"), int64(d, "partial_content_length"),
                             int64(d, "tokens_consumed")};
    if (type == "topic_updated")
        return TopicUpdated{str(d, "id"), str(d, "name"), str(d, "updated_at")};

    if (type == "agent_start")
        return AgentStart{parse_context(d)};
    if (type == "agent_end")
        return AgentEnd{parse_context(d), str(d, "status"), opt_int64(d, "duration_ms")};
    if (type == "agent_error")
        return AgentError{parse_context(d), str(d, "error_type"), str(d, "error_message"),
                          boolean(d, "recoverable"), str(d, "node_id")};
    if (type == "node_start")
        return NodeStart{parse_context(d), str(d, "node_id"), str(d, "component_key")};
    if (type == "node_end")
        return NodeEnd{parse_context(d), str(d, "node_id"), str(d, "status"),
                       int64(d, "duration_ms"), summary(d, "output_summary")};
    if (type == "subagent_start")
        return SubagentStart{parse_context(d), str(d, "subagent_id"),
                             str(d, "subagent_name"), str(d, "subagent_type")};
    if (type == "subagent_end")
        return SubagentEnd{parse_context(d), str(d, "subagent_id"), str(d, "status"),
                           int64(d, "duration_ms"), summary(d, "output_summary")};
    if (type == "progress_update") {
        ProgressUpdate ev;
        ev.context = parse_context(d);
        if (d.contains("progress_percent") && d["progress_percent"].is_number())
            ev.progress_percent = d["progress_percent"].get<double>();
        ev.message = str(d, "message");
        return ev;
    }

    if (type == "token_usage") {
        TokenUsage ev;
        ev.input_tokens = static_cast<uint64_t>(int64(d, "input_tokens"));
        ev.output_tokens = static_cast<uint64_t>(int64(d, "output_tokens"));
        ev.total_tokens = static_cast<uint64_t>(int64(d, "total_tokens"));
        return ev;
    }
    if (type == "search_citations") {
        SearchCitations ev;
        if (d.contains("citations") && d["citations"].is_array()) {
            for (const auto& c : d["citations"]) {
                if (c.is_object()) ev.citations.push_back(citation_from_json(c));
            }
        }
        return ev;
    }
    if (type == "generated_files") {
        GeneratedFiles ev;
        if (d.contains("files") && d["files"].is_array()) {
            for (const auto& f : d["files"]) {
                if (f.is_object()) ev.files.push_back(attachment_from_json(f));
            }
        }
        return ev;
    }

    return std::nullopt;
}

const char* event_type_name(const ProtocolEvent& event) {
    static const char* const names[] = {
        "loading", "streaming_start", "streaming_chunk", "streaming_end",
        "thinking_start", "thinking_chunk", "thinking_end",
        "message", "message_ack", "message_saved",
        "tool_call_request", "tool_call_response",
        "error", "insufficient_balance", "parallel_chat_limit", "stream_aborted",
        "topic_updated",
        "agent_start", "agent_end", "agent_error", "node_start", "node_end",
        "subagent_start", "subagent_end", "progress_update",
        "token_usage", "search_citations", "generated_files"
    };
    static_assert(std::size(names) == std::variant_size_v<ProtocolEvent>,
                  "event name table out of sync with ProtocolEvent");
    return names[event.index()];
}

bool is_delta(const ProtocolEvent& event) {
    return std::holds_alternative<StreamingChunk>(event) ||
           std::holds_alternative<ThinkingChunk>(event);
}

// ── Outbound payloads ───────────────────────────────────────────

nlohmann::json make_chat_message(const std::string& text,
                                 const std::string& client_id,
                                 const std::vector<std::string>& file_ids,
                                 const std::optional<ChatContext>& context) {
    nlohmann::json payload = {{"message", text}, {"client_id", client_id}};
    if (!file_ids.empty()) payload["file_ids"] = file_ids;
    if (context) {
        nlohmann::json ctx = nlohmann::json::object();
        if (!context->knowledge_set_id.empty())
            ctx["knowledge_set_id"] = context->knowledge_set_id;
        if (!context->folder_id.empty()) ctx["folder_id"] = context->folder_id;
        if (!context->folder_name.empty()) ctx["folder_name"] = context->folder_name;
        payload["context"] = std::move(ctx);
    }
    return payload;
}

nlohmann::json make_regenerate() {
    return {{"type", "regenerate"}};
}

nlohmann::json make_tool_call_confirm(const std::string& tool_call_id) {
    return {{"type", "tool_call_confirm"}, {"data", {{"toolCallId", tool_call_id}}}};
}

nlohmann::json make_tool_call_cancel(const std::string& tool_call_id,
                                     const std::string& reason) {
    return {{"type", "tool_call_cancel"},
            {"data", {{"toolCallId", tool_call_id}, {"reason", reason}}}};
}

nlohmann::json make_abort() {
    return {{"type", "abort"}};
}

nlohmann::json make_pong() {
    return {{"type", "pong"}};
}

} // namespace chansync
