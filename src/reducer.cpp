#include "reducer.hpp"
#include "channel_state.hpp"
#include "util.hpp"

#include <iostream>

namespace chansync {

namespace {

constexpr size_t kRestatePrefix = 100;

Message make_assistant(const std::string& id, MessageStatus status) {
    Message m;
    m.id = id;
    m.client_id = generate_client_id();
    m.role = Role::Assistant;
    m.status = status;
    m.created_at = timestamp_now();
    return m;
}

std::string category_of(const std::string& code) {
    auto dot = code.find('.');
    return dot == std::string::npos ? code : code.substr(0, dot);
}

std::string last_non_empty_phase_content(const AgentExecution& exec) {
    for (auto it = exec.phases.rbegin(); it != exec.phases.rend(); ++it) {
        if (!it->streamed_content.empty()) return it->streamed_content;
    }
    return {};
}

Phase* streaming_target_phase(AgentExecution& exec) {
    Phase* phase = exec.current_node.empty() ? nullptr : exec.find_phase(exec.current_node);
    if (!phase) phase = exec.running_phase();
    if (!phase && !exec.phases.empty()) phase = &exec.phases.back();
    return phase;
}

// Marks a message failed without touching its content.
void mark_failed(Message& m, MessageError error) {
    m.status = MessageStatus::Failed;
    m.error = std::move(error);
    finalize_message_execution(m, Outcome::Failed, std::nullopt, /*only_if_running=*/true);
}

struct Reducer {
    Channel& ch;
    ReduceResult& out;

    std::vector<Message>& msgs() { return ch.messages; }

    void operator()(const Loading& ev) {
        if (find_message_index_by_stream(ch, ev.stream_id)) return;
        if (find_loading_index(ch)) return;
        std::string id = ev.stream_id.empty()
            ? "loading-" + std::to_string(epoch_ms()) : ev.stream_id;
        Message m = make_assistant(id, MessageStatus::Pending);
        if (!ev.stream_id.empty()) m.stream_id = ev.stream_id;
        m.is_loading = true;
        msgs().push_back(std::move(m));
    }

    void operator()(const StreamingStart& ev) {
        auto idx = find_message_index_by_stream(ch, ev.stream_id, ev.execution_id);
        if (!idx) idx = find_loading_index(ch);
        if (!idx) {
            Message m = make_assistant(ev.stream_id, MessageStatus::Streaming);
            m.stream_id = ev.stream_id;
            m.is_streaming = true;
            msgs().push_back(std::move(m));
            return;
        }
        Message& m = msgs()[*idx];
        m.id = ev.stream_id;
        m.stream_id = ev.stream_id;
        m.is_loading = false;
        m.is_thinking = false;
        m.status = MessageStatus::Streaming;
        m.is_streaming = true;
        ensure_fallback_response_phase(m);
    }

    void operator()(const StreamingChunk& ev) {
        auto idx = find_message_index_by_stream(ch, ev.stream_id, ev.execution_id);
        if (!idx) {
            Message m = make_assistant(ev.stream_id, MessageStatus::Streaming);
            m.stream_id = ev.stream_id;
            m.content = ev.content;
            m.is_streaming = true;
            msgs().push_back(std::move(m));
            return;
        }

        Message& m = msgs()[*idx];
        m.stream_id = ev.stream_id;
        m.status = MessageStatus::Streaming;
        m.is_streaming = true;
        m.is_thinking = false;
        m.is_loading = false;

        if (!m.execution) {
            m.content += ev.content;
            return;
        }

        ensure_fallback_response_phase(m);
        Phase* phase = streaming_target_phase(*m.execution);
        if (!phase) return;
        const std::string& existing = phase->streamed_content;
        bool restated = existing.size() > kRestatePrefix &&
                        ev.content.size() > existing.size() &&
                        ev.content.compare(0, kRestatePrefix, existing, 0, kRestatePrefix) == 0;
        if (restated) {
            phase->streamed_content = ev.content;
        } else {
            phase->streamed_content += ev.content;
        }
    }

    void operator()(const StreamingEnd& ev) {
        auto idx = find_message_index_by_stream(ch, ev.stream_id, ev.execution_id);
        if (!idx) {
            std::optional<size_t> sole;
            for (size_t i = 0; i < msgs().size(); ++i) {
                const auto& m = msgs()[i];
                if (m.status != MessageStatus::Streaming && !m.is_streaming) continue;
                if (sole) { sole.reset(); break; }
                sole = i;
            }
            idx = sole;
        }
        if (!idx) {
            std::cerr << "[reducer] streaming_end: no message for stream "
                      << ev.stream_id << "\n";
            return;
        }

        Message& m = msgs()[*idx];
        if (m.content.empty() && m.execution) {
            m.content = last_non_empty_phase_content(*m.execution);
        }
        if (m.has_running_execution()) {
            m.is_streaming = false;
        } else {
            finalize_message_execution(m, Outcome::Completed, std::nullopt, true);
        }
        m.created_at = ev.created_at.empty() ? timestamp_now() : ev.created_at;
    }

    void operator()(const ThinkingStart& ev) {
        if (auto idx = find_loading_index(ch)) {
            Message& m = msgs()[*idx];
            m.id = ev.stream_id;
            m.is_loading = false;
            m.status = MessageStatus::Thinking;
            m.is_thinking = true;
            m.thinking_content.clear();
            return;
        }
        if (auto idx = find_running_agent_index(ch)) {
            Message& m = msgs()[*idx];
            m.status = MessageStatus::Thinking;
            m.is_thinking = true;
            m.thinking_content.clear();
            return;
        }
        Message m = make_assistant(ev.stream_id, MessageStatus::Thinking);
        m.is_thinking = true;
        msgs().push_back(std::move(m));
    }

    std::optional<size_t> thinking_target(const std::string& stream_id) {
        for (size_t i = 0; i < msgs().size(); ++i) {
            if (msgs()[i].id == stream_id) return i;
        }
        for (size_t i = msgs().size(); i-- > 0;) {
            if (msgs()[i].is_thinking && msgs()[i].has_running_execution()) return i;
        }
        return std::nullopt;
    }

    void operator()(const ThinkingChunk& ev) {
        if (auto idx = thinking_target(ev.stream_id)) {
            msgs()[*idx].thinking_content += ev.content;
        }
    }

    void operator()(const ThinkingEnd& ev) {
        auto idx = thinking_target(ev.stream_id);
        if (!idx) return;
        Message& m = msgs()[*idx];
        m.is_thinking = false;
        // Without a stream yet the answer is still to come; stay in flight
        // until streaming_start or streaming_end.
        if (m.status == MessageStatus::Thinking && m.is_streaming)
            m.status = MessageStatus::Streaming;
    }

    void operator()(const MessageReceived& ev) {
        if (!ev.client_id.empty()) {
            for (auto& m : msgs()) {
                if (m.client_id != ev.client_id) continue;
                if (!m.server_id && !ev.message.id.empty()) {
                    m.server_id = ev.message.id;
                    m.id = ev.message.id;
                }
                if (!ev.message.content.empty()) m.content = ev.message.content;
                if (!ev.message.created_at.empty()) m.created_at = ev.message.created_at;
                m.status = ev.message.status;
                if (m.status != MessageStatus::Failed) m.error.reset();
                return;
            }
        }
        for (const auto& m : msgs()) {
            if (m.id == ev.message.id) return;
            if (m.server_id && *m.server_id == ev.message.id) return;
        }
        msgs().push_back(ev.message);
    }

    void operator()(const MessageAck& ev) {
        if (ev.client_id.empty()) return;
        for (auto& m : msgs()) {
            if (m.client_id != ev.client_id) continue;
            if (m.server_id) return;
            m.server_id = ev.message_id;
            m.id = ev.message_id;
            if (m.status == MessageStatus::Sending || m.status == MessageStatus::Failed) {
                m.status = MessageStatus::Completed;
                m.error.reset();
            }
            return;
        }
    }

    void operator()(const MessageSaved& ev) {
        auto idx = find_message_index_by_stream(ch, ev.stream_id);
        if (!idx) {
            for (size_t i = msgs().size(); i-- > 0;) {
                const auto& m = msgs()[i];
                if (m.role == Role::Assistant && m.error && !is_uuid(m.id)) {
                    idx = i;
                    break;
                }
            }
        }
        if (!idx) return;
        Message& m = msgs()[*idx];
        m.server_id = ev.db_id;
        m.id = ev.db_id;
        if (!ev.created_at.empty()) m.created_at = ev.created_at;
        finalize_message_execution(m, Outcome::Completed, std::nullopt, true);
    }

    void operator()(const ToolCallRequest& ev) {
        if (find_tool_call(ch, ev.call.id)) return;

        if (auto idx = find_running_agent_index(ch)) {
            AgentExecution& exec = *msgs()[*idx].execution;
            Phase* phase = exec.current_node.empty() ? nullptr
                                                     : exec.find_phase(exec.current_node);
            if (!phase) phase = exec.running_phase();
            if (phase) {
                phase->tool_calls.push_back(ev.call);
                return;
            }
        }

        Message m = make_assistant("tool-call-" + ev.call.id, MessageStatus::Streaming);
        m.tool_calls.push_back(ev.call);
        msgs().push_back(std::move(m));
    }

    void operator()(const ToolCallResponse& ev) {
        auto apply = [&ev](ToolCall& tc) {
            tc.status = ev.status;
            if (!ev.result.empty()) tc.result = ev.result;
            if (!ev.error.empty()) tc.error = ev.error;
        };

        for (auto& m : msgs()) {
            if (m.execution) {
                for (auto& phase : m.execution->phases) {
                    for (auto& tc : phase.tool_calls) {
                        if (tc.id == ev.tool_call_id) apply(tc);
                    }
                }
            }
            bool touched = false;
            for (auto& tc : m.tool_calls) {
                if (tc.id == ev.tool_call_id) {
                    apply(tc);
                    touched = true;
                }
            }
            if (!touched || m.execution || !is_in_flight(m.status)) continue;
            bool all_terminal = true;
            for (const auto& tc : m.tool_calls) {
                if (!is_terminal(tc.status)) all_terminal = false;
            }
            if (all_terminal) clear_transient_state(m);
        }
    }

    // Target of a backend-reported failure: by stream, then loading
    // placeholder, then last streaming assistant, then last running agent.
    std::optional<size_t> error_target(const std::string& stream_id) {
        std::optional<size_t> idx;
        if (!stream_id.empty()) idx = find_message_index_by_stream(ch, stream_id);
        if (!idx) idx = find_loading_index(ch);
        if (!idx) {
            for (size_t i = msgs().size(); i-- > 0;) {
                const auto& m = msgs()[i];
                if (m.role == Role::Assistant &&
                    (m.status == MessageStatus::Streaming || m.is_streaming)) {
                    idx = i;
                    break;
                }
            }
        }
        if (!idx) {
            for (size_t i = msgs().size(); i-- > 0;) {
                const auto& m = msgs()[i];
                if (m.role == Role::Assistant && m.has_running_execution()) {
                    idx = i;
                    break;
                }
            }
        }
        return idx;
    }

    void operator()(const ErrorReport& ev) {
        MessageError error;
        if (!ev.error_code.empty()) {
            error.code = ev.error_code;
            error.category = ev.error_category.empty() ? category_of(ev.error_code)
                                                       : ev.error_category;
            error.message = ev.error;
            error.recoverable = ev.recoverable;
            error.detail = ev.detail;
        } else {
            error.code = kInternalErrorCode;
            error.category = "system";
            error.message = ev.error.empty() ? "An error occurred" : ev.error;
        }

        std::cerr << "[reducer] backend error " << error.code << ": " << error.message << "\n";
        out.notification = Notification{"error", "Error", error.message, error.code};

        if (auto idx = error_target(ev.stream_id)) mark_failed(msgs()[*idx], std::move(error));
    }

    void operator()(const InsufficientBalance& ev) {
        MessageError error;
        error.code = "billing.insufficient_balance";
        error.category = "billing";
        error.message = ev.message.empty()
            ? "Insufficient balance. Please recharge to continue." : ev.message;

        out.notification = Notification{"warning", "Insufficient balance",
                                        error.message, error.code};

        std::optional<size_t> idx;
        if (!ev.stream_id.empty()) idx = find_message_index_by_stream(ch, ev.stream_id);
        if (!idx) idx = find_loading_index(ch);
        if (idx) mark_failed(msgs()[*idx], std::move(error));
    }

    void operator()(const ParallelChatLimit& ev) {
        auto fmt = [](const std::optional<int64_t>& v) {
            return v ? std::to_string(*v) : std::string("?");
        };
        std::string text = "Parallel chat limit reached (" + fmt(ev.current) + "/" +
                           fmt(ev.limit) + "). Wait for another chat to finish and retry.";

        MessageError error;
        error.code = "chat.parallel_limit";
        error.category = "chat";
        error.message = text;
        error.recoverable = true;

        out.notification = Notification{"warning", "Parallel chat limit", text, error.code};
        if (auto idx = find_loading_index(ch)) mark_failed(msgs()[*idx], std::move(error));
    }

    void operator()(const StreamAborted& ev) {
        std::cerr << "[reducer] stream aborted: " << ev.reason << " ("
                  << ev.partial_content_length << " chars, "
                  << ev.tokens_consumed << " tokens)\n";
        finalize_aborted(ch);
        out.abort_acknowledged = true;
    }

    void operator()(const TopicUpdated& ev) {
        if (!ev.id.empty() && ev.id != ch.id) return;
        ch.title = ev.name;
        out.rename = ev;
    }

    void operator()(const AgentStart& ev) {
        const AgentContext& ctx = ev.context;
        if (find_execution_index(ch, ctx.execution_id)) return;

        AgentExecution exec;
        exec.agent_id = ctx.agent_id;
        exec.agent_name = ctx.agent_name;
        exec.agent_type = ctx.agent_type;
        exec.execution_id = ctx.execution_id;
        exec.status = ExecutionStatus::Running;
        exec.started_at = ctx.started_at ? ctx.started_at : epoch_ms();

        std::optional<size_t> idx;
        if (!ctx.stream_id.empty()) idx = find_message_index_by_stream(ch, ctx.stream_id);
        if (!idx) idx = find_loading_index(ch);

        if (idx) {
            Message& m = msgs()[*idx];
            m.id = "agent-" + ctx.execution_id;
            m.is_loading = false;
            m.status = MessageStatus::Pending;
            m.execution = std::move(exec);
            return;
        }

        Message m = make_assistant("agent-" + ctx.execution_id, MessageStatus::Pending);
        if (!ctx.stream_id.empty()) m.stream_id = ctx.stream_id;
        m.execution = std::move(exec);
        msgs().push_back(std::move(m));
    }

    void operator()(const AgentEnd& ev) {
        auto idx = find_execution_index(ch, ev.context.execution_id);
        if (!idx) return;
        Outcome outcome = Outcome::Failed;
        if (ev.status == "completed") outcome = Outcome::Completed;
        else if (ev.status == "cancelled") outcome = Outcome::Cancelled;
        finalize_message_execution(msgs()[*idx], outcome, ev.duration_ms);
    }

    void operator()(const AgentError& ev) {
        auto idx = find_execution_index(ch, ev.context.execution_id);
        if (!idx) return;
        Message& m = msgs()[*idx];
        m.execution->error = ExecutionError{ev.error_type, ev.error_message,
                                            ev.recoverable, ev.node_id};
        finalize_message_execution(m, Outcome::Failed);
    }

    void operator()(const NodeStart& ev) {
        auto idx = find_execution_index(ch, ev.context.execution_id);
        if (!idx) return;
        AgentExecution& exec = *msgs()[*idx].execution;
        int64_t now = epoch_ms();

        if (Phase* running = exec.running_phase()) {
            running->status = PhaseStatus::Completed;
            running->ended_at = now;
            if (running->started_at) running->duration_ms = now - running->started_at;
        }

        std::string name = node_display_name(ev.node_id);
        if (Phase* existing = exec.find_phase(ev.node_id)) {
            existing->status = PhaseStatus::Running;
            existing->name = name;
            existing->component_key = ev.component_key;
            existing->started_at = now;
            existing->streamed_content.clear();
        } else {
            Phase phase;
            phase.id = ev.node_id;
            phase.name = name;
            phase.component_key = ev.component_key;
            phase.status = PhaseStatus::Running;
            phase.started_at = now;
            exec.phases.push_back(std::move(phase));
        }
        exec.current_phase = name;
        exec.current_node = ev.node_id;
    }

    void operator()(const NodeEnd& ev) {
        auto idx = find_execution_index(ch, ev.context.execution_id);
        if (!idx) return;
        Phase* phase = msgs()[*idx].execution->find_phase(ev.node_id);
        if (!phase) return;
        if (ev.status == "completed") phase->status = PhaseStatus::Completed;
        else if (ev.status == "skipped") phase->status = PhaseStatus::Skipped;
        else phase->status = PhaseStatus::Failed;
        phase->ended_at = epoch_ms();
        phase->duration_ms = ev.duration_ms;
        phase->output_summary = ev.output_summary;
    }

    void operator()(const SubagentStart& ev) {
        const AgentContext& ctx = ev.context;
        for (auto& m : msgs()) {
            if (!m.execution) continue;
            const std::string& id = m.execution->execution_id;
            if (id != ctx.parent_execution_id && id != ctx.execution_id) continue;
            Subagent sub;
            sub.id = ev.subagent_id;
            sub.name = ev.subagent_name;
            sub.type = ev.subagent_type;
            sub.depth = ctx.depth;
            sub.execution_path = ctx.execution_path;
            sub.started_at = ctx.started_at;
            m.execution->subagents.push_back(std::move(sub));
            return;
        }
    }

    void operator()(const SubagentEnd& ev) {
        for (auto& m : msgs()) {
            if (!m.execution) continue;
            for (auto& sub : m.execution->subagents) {
                if (sub.id != ev.subagent_id) continue;
                sub.status = ev.status == "completed" ? SubagentStatus::Completed
                                                      : SubagentStatus::Failed;
                sub.ended_at = epoch_ms();
                sub.duration_ms = ev.duration_ms;
                sub.output_summary = ev.output_summary;
                return;
            }
        }
    }

    void operator()(const ProgressUpdate& ev) {
        auto idx = find_execution_index(ch, ev.context.execution_id);
        if (!idx) return;
        AgentExecution& exec = *msgs()[*idx].execution;
        exec.progress_percent = ev.progress_percent;
        exec.progress_message = ev.message;
    }

    void operator()(const TokenUsage& ev) {
        ch.token_usage = ev.total_tokens;
    }

    void operator()(const SearchCitations& ev) {
        for (size_t i = msgs().size(); i-- > 0;) {
            Message& m = msgs()[i];
            if (m.role != Role::Assistant) continue;
            if (!m.is_streaming && !m.citations.empty()) continue;
            m.citations = ev.citations;
            return;
        }
        std::cerr << "[reducer] search_citations: no assistant message to attach to\n";
    }

    void operator()(const GeneratedFiles& ev) {
        for (size_t i = msgs().size(); i-- > 0;) {
            Message& m = msgs()[i];
            if (m.role != Role::Assistant) continue;
            if (!m.is_streaming && !m.attachments.empty()) continue;
            for (const auto& file : ev.files) {
                bool seen = false;
                for (const auto& a : m.attachments) {
                    if (a.id == file.id) { seen = true; break; }
                }
                if (!seen) m.attachments.push_back(file);
            }
            return;
        }
    }
};

} // namespace

ReduceResult reduce(Channel& channel, const ProtocolEvent& event) {
    ReduceResult result;
    std::visit(Reducer{channel, result}, event);
    sync_responding(channel);
    return result;
}

} // namespace chansync
