#pragma once
#include "model.hpp"
#include "protocol.hpp"
#include <optional>
#include <string>

namespace chansync {

// Notice produced by backend-reported failures. level is "warning" or "error".
struct Notification {
    std::string level;
    std::string title;
    std::string message;
    std::string code;
};

// Side effects the owner of the channel applies after a reduce.
struct ReduceResult {
    std::optional<Notification> notification;
    bool abort_acknowledged = false;       // stream_aborted: clear the abort timer
    std::optional<TopicUpdated> rename;    // topic_updated: update the session list
};

// Applies one inbound event to the channel and recomputes `responding`.
// Never throws on unexpected state; unmatched events are no-ops.
ReduceResult reduce(Channel& channel, const ProtocolEvent& event);

// Default error code when the backend reports none.
constexpr const char* kInternalErrorCode = "system.internal_error";

} // namespace chansync
