#pragma once
#include "api_client.hpp"
#include "channel_store.hpp"
#include "event_bus.hpp"
#include "model.hpp"

#include <string>
#include <vector>

namespace chansync {

enum class ReconcileOutcome { Skipped, Applied, NotFound, Failed };

const char* to_string(ReconcileOutcome outcome);

struct MergeStats {
    size_t preserved = 0;  // local messages kept outside the persisted set
    size_t folded = 0;     // of those, merged onto a persisted assistant message
    size_t appended = 0;   // of those, appended after the persisted history
};

// A local message that the persisted history cannot represent: absent from
// it and still carrying runtime state, or a failed or cancelled message the
// server never confirmed that has content or an error.
bool is_runtime_only(const Message& message);

// Replace channel.messages with the persisted history, keeping runtime state.
// Running it twice with the same history leaves the channel unchanged.
MergeStats merge_persisted(Channel& channel, std::vector<Message> persisted);

// Pulls authoritative history over REST and merges it into the store.
class Reconciler {
public:
    Reconciler(ChannelStore& store, ApiClient& api, EventBus& bus);

    // Never touches a responding channel. REST failures leave it as it was.
    ReconcileOutcome reconcile(const std::string& topic_id);

private:
    ChannelStore& store_;
    ApiClient& api_;
    EventBus& bus_;
};

} // namespace chansync
