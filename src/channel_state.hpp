#pragma once
#include "model.hpp"
#include <optional>
#include <string>

namespace chansync {

// Shared lookup and lifecycle helpers over a single Channel. Used by the
// reducer, reconciliation, submission and abort paths.

enum class Outcome { Completed, Failed, Cancelled };

// True iff some message is in flight or carries a running execution.
bool derive_responding(const Channel& channel);

// Recompute channel.responding from its messages.
void sync_responding(Channel& channel);

// Runtime state that a reconnect or cold activation should repair:
// pending/streaming/thinking status, a transient flag, or a running execution.
bool has_stale_runtime_state(const Channel& channel);
bool has_stale_runtime_state(const Message& message);

// Lookup priority: stream_id/id, execution id, last pending assistant,
// sole running execution.
std::optional<size_t> find_message_index_by_stream(const Channel& channel,
                                                   const std::string& stream_id,
                                                   const std::string& execution_id = "");

// First message that is pending or flagged as loading.
std::optional<size_t> find_loading_index(const Channel& channel);

// Last message whose execution is running.
std::optional<size_t> find_running_agent_index(const Channel& channel);

// Message carrying the execution with this id (first match).
std::optional<size_t> find_execution_index(const Channel& channel,
                                           const std::string& execution_id);

// Tool call with this id, searched in execution phases first, then standalone
// calls. nullptr when absent.
ToolCall* find_tool_call(Channel& channel, const std::string& tool_call_id);

// Clears loading/streaming/thinking flags. Failed and cancelled are kept,
// everything else becomes completed.
void clear_transient_state(Message& message);

// Marks running phases terminal.
void finalize_execution_phases(Message& message, Outcome outcome, int64_t ended_at);

// Finalizes the execution (optionally only when still running) and clears
// transient state.
void finalize_message_execution(Message& message, Outcome outcome,
                                std::optional<int64_t> duration_ms = std::nullopt,
                                bool only_if_running = false);

// Agents without explicit node events stream into a synthetic "response" phase.
void ensure_fallback_response_phase(Message& message);

// "clarify_with_user" -> "Clarify With User"
std::string node_display_name(const std::string& node_id);

// Terminal reset after an abort: placeholders and streams become cancelled,
// running executions are cancelled, unacknowledged sends fail.
void finalize_aborted(Channel& channel);

// Terminal reset for a channel whose stream went silent. Leaves nothing in
// flight so reconciliation may run.
void settle_stale(Channel& channel);

} // namespace chansync
