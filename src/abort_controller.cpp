#include "abort_controller.hpp"
#include "channel_state.hpp"
#include "protocol.hpp"

#include <iostream>

namespace chansync {

AbortController::AbortController(ChannelStore& store, ConnectionManager& connections,
                                 EventBus& bus, SyncConfig config)
    : store_(store), connections_(connections), bus_(bus), config_(config) {}

bool AbortController::abort(const std::string& topic_id) {
    Channel* ch = store_.find(topic_id);
    if (!ch) return false;

    if (!connections_.send(topic_id, make_abort()))
        std::cerr << "[abort] could not transmit abort for " << topic_id
                  << ", finalizing after timeout\n";

    ch->aborting = true;
    connections_.arm_abort_timer(topic_id, config_.abort_timeout_ms,
                                 [this, topic_id] { on_timeout(topic_id); });
    publish_channel_updated(bus_, topic_id);
    return true;
}

void AbortController::on_timeout(const std::string& topic_id) {
    Channel* ch = store_.find(topic_id);
    if (!ch || !ch->aborting) return;
    std::cerr << "[abort] no stream_aborted for " << topic_id << " within "
              << config_.abort_timeout_ms << "ms, finalizing locally\n";
    finalize_aborted(*ch);
    publish_channel_updated(bus_, topic_id);
}

} // namespace chansync
