#include "channel_state.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>

namespace chansync {

static ExecutionStatus execution_status_for(Outcome outcome) {
    switch (outcome) {
        case Outcome::Completed: return ExecutionStatus::Completed;
        case Outcome::Failed:    return ExecutionStatus::Error;
        case Outcome::Cancelled: return ExecutionStatus::Cancelled;
    }
    return ExecutionStatus::Completed;
}

static PhaseStatus phase_status_for(Outcome outcome) {
    switch (outcome) {
        case Outcome::Completed: return PhaseStatus::Completed;
        case Outcome::Failed:    return PhaseStatus::Failed;
        case Outcome::Cancelled: return PhaseStatus::Cancelled;
    }
    return PhaseStatus::Completed;
}

bool derive_responding(const Channel& channel) {
    return std::any_of(channel.messages.begin(), channel.messages.end(),
                       [](const Message& m) {
                           return is_in_flight(m.status) || m.has_running_execution();
                       });
}

void sync_responding(Channel& channel) {
    channel.responding = derive_responding(channel);
}

bool has_stale_runtime_state(const Message& m) {
    return m.status == MessageStatus::Pending ||
           m.status == MessageStatus::Streaming ||
           m.status == MessageStatus::Thinking ||
           m.has_runtime_flags() ||
           m.has_running_execution();
}

bool has_stale_runtime_state(const Channel& channel) {
    for (const auto& m : channel.messages) {
        if (has_stale_runtime_state(m)) return true;
    }
    return false;
}

std::optional<size_t> find_message_index_by_stream(const Channel& channel,
                                                   const std::string& stream_id,
                                                   const std::string& execution_id) {
    const auto& msgs = channel.messages;

    if (!stream_id.empty()) {
        for (size_t i = msgs.size(); i-- > 0;) {
            if (msgs[i].id == stream_id ||
                (msgs[i].stream_id && *msgs[i].stream_id == stream_id))
                return i;
        }
    }

    if (!execution_id.empty()) {
        for (size_t i = msgs.size(); i-- > 0;) {
            if (msgs[i].execution && msgs[i].execution->execution_id == execution_id)
                return i;
        }
    }

    for (size_t i = msgs.size(); i-- > 0;) {
        if (msgs[i].role == Role::Assistant && msgs[i].status == MessageStatus::Pending)
            return i;
    }

    std::optional<size_t> running;
    for (size_t i = 0; i < msgs.size(); ++i) {
        if (!msgs[i].has_running_execution()) continue;
        if (running) return std::nullopt; // ambiguous
        running = i;
    }
    return running;
}

std::optional<size_t> find_loading_index(const Channel& channel) {
    for (size_t i = 0; i < channel.messages.size(); ++i) {
        const auto& m = channel.messages[i];
        if (m.status == MessageStatus::Pending || m.is_loading) return i;
    }
    return std::nullopt;
}

std::optional<size_t> find_running_agent_index(const Channel& channel) {
    for (size_t i = channel.messages.size(); i-- > 0;) {
        if (channel.messages[i].has_running_execution()) return i;
    }
    return std::nullopt;
}

std::optional<size_t> find_execution_index(const Channel& channel,
                                           const std::string& execution_id) {
    for (size_t i = 0; i < channel.messages.size(); ++i) {
        const auto& exec = channel.messages[i].execution;
        if (exec && exec->execution_id == execution_id) return i;
    }
    return std::nullopt;
}

ToolCall* find_tool_call(Channel& channel, const std::string& tool_call_id) {
    for (auto& m : channel.messages) {
        if (!m.execution) continue;
        for (auto& phase : m.execution->phases) {
            for (auto& tc : phase.tool_calls) {
                if (tc.id == tool_call_id) return &tc;
            }
        }
    }
    for (auto& m : channel.messages) {
        for (auto& tc : m.tool_calls) {
            if (tc.id == tool_call_id) return &tc;
        }
    }
    return nullptr;
}

void clear_transient_state(Message& message) {
    message.is_loading = false;
    message.is_streaming = false;
    message.is_thinking = false;
    if (message.status != MessageStatus::Failed &&
        message.status != MessageStatus::Cancelled) {
        message.status = MessageStatus::Completed;
    }
}

void finalize_execution_phases(Message& message, Outcome outcome, int64_t ended_at) {
    if (!message.execution) return;
    for (auto& phase : message.execution->phases) {
        if (phase.status != PhaseStatus::Running) continue;
        phase.status = phase_status_for(outcome);
        phase.ended_at = ended_at;
        if (phase.started_at) phase.duration_ms = ended_at - phase.started_at;
    }
}

void finalize_message_execution(Message& message, Outcome outcome,
                                std::optional<int64_t> duration_ms,
                                bool only_if_running) {
    int64_t ended_at = epoch_ms();
    if (message.execution) {
        auto& exec = *message.execution;
        if (!only_if_running || exec.status == ExecutionStatus::Running) {
            exec.status = execution_status_for(outcome);
            exec.ended_at = ended_at;
            if (duration_ms) exec.duration_ms = duration_ms;
            finalize_execution_phases(message, outcome, ended_at);
        }
    }
    clear_transient_state(message);
}

void ensure_fallback_response_phase(Message& message) {
    if (!message.execution || !message.execution->phases.empty()) return;
    Phase phase;
    phase.id = "response";
    phase.name = "Response";
    phase.status = PhaseStatus::Running;
    phase.started_at = epoch_ms();
    message.execution->phases.push_back(std::move(phase));
    message.execution->current_node = "response";
}

std::string node_display_name(const std::string& node_id) {
    std::string out = node_id;
    bool at_word_start = true;
    for (auto& c : out) {
        if (c == '_') c = ' ';
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            if (at_word_start) c = static_cast<char>(std::toupper(uc));
            at_word_start = false;
        } else {
            at_word_start = true;
        }
    }
    return out;
}

void finalize_aborted(Channel& channel) {
    int64_t now = epoch_ms();
    int placeholder_seq = 0;
    channel.aborting = false;

    for (auto& m : channel.messages) {
        if (m.role == Role::User) {
            if (m.status == MessageStatus::Sending) m.status = MessageStatus::Failed;
            continue;
        }

        if (m.has_running_execution()) {
            m.execution->status = ExecutionStatus::Cancelled;
            m.execution->ended_at = now;
            finalize_execution_phases(m, Outcome::Cancelled, now);
        }

        bool placeholder = (m.status == MessageStatus::Pending || m.is_loading) &&
                           !m.execution;
        if (placeholder) {
            std::string id = "aborted-" + std::to_string(now);
            if (placeholder_seq++ > 0) id += "-" + std::to_string(placeholder_seq);
            m.id = id;
            AgentExecution exec;
            exec.agent_type = "react";
            exec.execution_id = id;
            exec.status = ExecutionStatus::Cancelled;
            exec.started_at = now;
            exec.ended_at = now;
            m.execution = std::move(exec);
        }

        if (is_in_flight(m.status)) m.status = MessageStatus::Cancelled;
        m.is_loading = false;
        m.is_streaming = false;
        m.is_thinking = false;
    }

    sync_responding(channel);
}

void settle_stale(Channel& channel) {
    for (auto& m : channel.messages) {
        if (m.role == Role::User) {
            if (m.status == MessageStatus::Sending) m.status = MessageStatus::Failed;
            continue;
        }
        if (m.has_running_execution()) {
            finalize_message_execution(m, Outcome::Cancelled);
        } else if (has_stale_runtime_state(m)) {
            bool empty_placeholder = m.content.empty() && m.thinking_content.empty() &&
                                     (m.status == MessageStatus::Pending || m.is_loading);
            if (empty_placeholder) m.status = MessageStatus::Cancelled;
            clear_transient_state(m);
        }
    }
    sync_responding(channel);
}

} // namespace chansync
