#pragma once
#include "channel_store.hpp"
#include "config.hpp"
#include "connection_manager.hpp"
#include "event_bus.hpp"
#include "event_loop.hpp"
#include "protocol.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace chansync {

struct SendOptions {
    std::vector<std::string> file_ids;
    std::optional<ChatContext> context;
};

struct SendResult {
    bool ok = false;
    std::string client_id;  // set whenever a message was inserted
    std::string error;
};

// Optimistic user sends: insert as "sending", transmit, and fail in place if
// the transport refuses. The ack (or a matching "message") later confirms it.
class SubmissionPipeline {
public:
    SubmissionPipeline(EventLoop& loop, ChannelStore& store, ConnectionManager& connections,
                       EventBus& bus, SyncConfig config);

    SendResult send(const std::string& topic_id, const std::string& text,
                    const SendOptions& options = {});

    // Replaces a failed user message with a fresh send of the same content.
    SendResult retry(const std::string& topic_id, const std::string& message_id);

    // Asks the backend to answer the last user message again.
    bool regenerate(const std::string& topic_id);

    // Connects if needed and pumps the loop until connected, errored or
    // connect_timeout_ms elapsed.
    bool ensure_connected(const std::string& topic_id);

    void set_uploading(const std::string& topic_id, bool uploading);
    bool uploading(const std::string& topic_id) const { return uploading_.count(topic_id) > 0; }

private:
    void notify_connection_failed(const std::string& topic_id);

    EventLoop& loop_;
    ChannelStore& store_;
    ConnectionManager& connections_;
    EventBus& bus_;
    SyncConfig config_;
    std::set<std::string> uploading_;
};

} // namespace chansync
