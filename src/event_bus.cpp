#include "event_bus.hpp"
#include <algorithm>

namespace chansync {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    by_tag_[tag].push_back(Subscription{id, std::move(handler)});
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : by_tag_) {
        auto& subs = entry.second;
        auto it = std::find_if(subs.begin(), subs.end(),
                               [id](const Subscription& s) { return s.id == id; });
        if (it != subs.end()) {
            subs.erase(it);
            return true;
        }
    }
    return false;
}

void EventBus::publish(const Event& event) {
    std::vector<EventHandler> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = by_tag_.find(event.type_tag);
        if (it == by_tag_.end()) return;
        for (const auto& sub : it->second) snapshot.push_back(sub.handler);
    }
    for (const auto& handler : snapshot) handler(event);
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    by_tag_.clear();
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_tag_.find(tag);
    return it == by_tag_.end() ? 0 : it->second.size();
}

void publish_channel_updated(EventBus& bus, const std::string& topic_id) {
    ChannelUpdatedEvent ev;
    ev.topic_id = topic_id;
    bus.publish(ev);
}

void publish_notification(EventBus& bus, const std::string& topic_id,
                          const std::string& level, const std::string& title,
                          const std::string& message, const std::string& code) {
    NotificationEvent ev;
    ev.topic_id = topic_id;
    ev.level = level;
    ev.title = title;
    ev.message = message;
    ev.code = code;
    bus.publish(ev);
}

} // namespace chansync
