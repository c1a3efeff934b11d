#pragma once
#include "channel_store.hpp"
#include "config.hpp"
#include "connection_manager.hpp"
#include "event_bus.hpp"

#include <string>

namespace chansync {

// User-initiated cancellation. The channel is flagged as aborting right away;
// stream_aborted from the backend finalizes it, and if that never arrives the
// fallback timer does the same locally.
class AbortController {
public:
    AbortController(ChannelStore& store, ConnectionManager& connections, EventBus& bus,
                    SyncConfig config);

    // False if the topic is unknown. A refused transmit still arms the timer.
    bool abort(const std::string& topic_id);

    // Fallback timer body.
    void on_timeout(const std::string& topic_id);

private:
    ChannelStore& store_;
    ConnectionManager& connections_;
    EventBus& bus_;
    SyncConfig config_;
};

} // namespace chansync
