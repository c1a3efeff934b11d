#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace chansync {

using EventHandler = std::function<void(const Event&)>;

// Synchronous publish/subscribe keyed by event tag. Handlers run on the
// publishing thread (the event loop) in subscription order.
class EventBus {
public:
    uint64_t subscribe(const std::string& tag, EventHandler handler);
    bool unsubscribe(uint64_t id);

    // Handlers are copied out under the lock and invoked without it, so a
    // handler may subscribe or unsubscribe.
    void publish(const Event& event);

    void clear();
    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Subscription>> by_tag_;
    uint64_t next_id_ = 1;
};

template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

// Shorthands for the events the engine emits.
void publish_channel_updated(EventBus& bus, const std::string& topic_id);
void publish_notification(EventBus& bus, const std::string& topic_id,
                          const std::string& level, const std::string& title,
                          const std::string& message, const std::string& code = "");

} // namespace chansync
