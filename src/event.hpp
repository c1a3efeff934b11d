#pragma once
#include <string>
#include <cstddef>

namespace chansync {

// Side-channel events published by the sync engine for the UI layer.
// Dispatch is by tag; handlers static_cast to the concrete struct.

struct Event {
    const char* type_tag;
};

namespace event_tags {
    constexpr const char* Notification     = "Notification";
    constexpr const char* ChannelUpdated   = "ChannelUpdated";
    constexpr const char* ConnectionStatus = "ConnectionStatus";
    constexpr const char* TopicRenamed     = "TopicRenamed";
    constexpr const char* ChannelReconciled = "ChannelReconciled";
} // namespace event_tags

// User-facing notice. level is "info", "warning" or "error".
struct NotificationEvent : Event {
    static constexpr const char* TAG = event_tags::Notification;
    std::string topic_id;
    std::string level;
    std::string title;
    std::string message;
    std::string code;

    NotificationEvent() { type_tag = TAG; }
};

// Some part of the channel changed; re-read it from the store.
struct ChannelUpdatedEvent : Event {
    static constexpr const char* TAG = event_tags::ChannelUpdated;
    std::string topic_id;

    ChannelUpdatedEvent() { type_tag = TAG; }
};

struct ConnectionStatusEvent : Event {
    static constexpr const char* TAG = event_tags::ConnectionStatus;
    std::string topic_id;
    bool connected = false;
    std::string error;

    ConnectionStatusEvent() { type_tag = TAG; }
};

struct TopicRenamedEvent : Event {
    static constexpr const char* TAG = event_tags::TopicRenamed;
    std::string topic_id;
    std::string title;

    TopicRenamedEvent() { type_tag = TAG; }
};

struct ChannelReconciledEvent : Event {
    static constexpr const char* TAG = event_tags::ChannelReconciled;
    std::string topic_id;
    size_t preserved = 0;  // runtime-only messages kept
    size_t folded = 0;     // folded onto a persisted assistant message
    size_t appended = 0;   // appended after the persisted history

    ChannelReconciledEvent() { type_tag = TAG; }
};

} // namespace chansync
