#include "connection_manager.hpp"
#include "channel_state.hpp"

#include <iostream>
#include <stdexcept>

namespace chansync {

ConnectionManager::ConnectionManager(EventLoop& loop, ChannelStore& store, EventBus& bus,
                                     TransportFactory factory, SyncConfig config)
    : loop_(loop), store_(store), bus_(bus),
      factory_(std::move(factory)), config_(config) {}

ConnectionManager::~ConnectionManager() {
    disconnect();
}

TransportCallbacks ConnectionManager::callbacks_for(const std::string& topic_id) {
    TransportCallbacks cbs;
    cbs.on_message = [this, topic_id](const nlohmann::json& frame) {
        handle_frame(topic_id, frame);
    };
    cbs.on_status = [this, topic_id](const TransportStatus& status) {
        handle_status(topic_id, status);
    };
    cbs.on_reconnect = [this, topic_id] {
        const Channel* ch = store_.find(topic_id);
        if (ch && has_stale_runtime_state(*ch)) recover(topic_id, "reconnect");
    };
    return cbs;
}

void ConnectionManager::connect(const std::string& topic_id) {
    Channel* target = store_.find(topic_id);
    if (!target)
        throw std::invalid_argument("connection: unknown topic " + topic_id);

    demote_others(topic_id);

    auto existing = links_.find(topic_id);
    if (existing != links_.end()) {
        existing->second.primary = true;
        existing->second.transport->bind(callbacks_for(topic_id));
        target->connected = existing->second.transport->is_open();
        if (target->connected) target->error.reset();
        publish_channel_updated(bus_, topic_id);
        return;
    }

    target->error.reset();

    Link link;
    link.transport = factory_(target->session_id, topic_id);
    if (!link.transport)
        throw std::runtime_error("connection: transport factory returned null");
    link.primary = true;
    link.watchdog = std::make_unique<StaleWatchdog>(
        loop_, config_.stale_timeout_ms, config_.stale_check_interval_ms,
        [this, topic_id] {
            const Channel* ch = store_.find(topic_id);
            return ch && ch->responding;
        },
        [this, topic_id] { recover(topic_id, "stale"); });
    link.coalescer = std::make_unique<ChunkCoalescer>(
        loop_, config_.frame_interval_ms,
        [this, topic_id](std::vector<ProtocolEvent> batch) {
            apply_deltas(topic_id, std::move(batch));
        });

    Transport& transport = *link.transport;
    links_.emplace(topic_id, std::move(link));
    transport.open(callbacks_for(topic_id));
}

// Every other link becomes background; those whose channel is idle close.
void ConnectionManager::demote_others(const std::string& topic_id) {
    std::vector<std::string> idle;
    for (auto& [id, link] : links_) {
        if (id == topic_id) continue;
        link.primary = false;
        const Channel* ch = store_.find(id);
        if (!ch || !ch->responding) idle.push_back(id);
    }
    for (const auto& id : idle) close_link(id);

    for (const auto& id : store_.topic_ids()) {
        if (id != topic_id && links_.count(id) == 0) store_.find(id)->connected = false;
    }
}

void ConnectionManager::close_link(const std::string& topic_id) {
    auto it = links_.find(topic_id);
    if (it == links_.end()) return;
    Link link = std::move(it->second);
    links_.erase(it);
    link.transport->bind(TransportCallbacks{});
    link.transport->close();
    if (link.coalescer) link.coalescer->destroy();
}

void ConnectionManager::release_topic(const std::string& topic_id) {
    close_link(topic_id);
    clear_abort_timer(topic_id);
}

void ConnectionManager::disconnect() {
    std::vector<std::string> topics = open_topics();
    for (const auto& id : topics) close_link(id);
    for (auto& [id, timer] : abort_timers_) loop_.cancel(timer);
    abort_timers_.clear();
}

bool ConnectionManager::send(const std::string& topic_id, const nlohmann::json& payload) {
    auto it = links_.find(topic_id);
    if (it == links_.end()) return false;
    return it->second.transport->send(payload);
}

bool ConnectionManager::has_connection(const std::string& topic_id) const {
    return links_.count(topic_id) > 0;
}

bool ConnectionManager::is_primary(const std::string& topic_id) const {
    auto it = links_.find(topic_id);
    return it != links_.end() && it->second.primary;
}

std::string ConnectionManager::primary_topic() const {
    for (const auto& [id, link] : links_) {
        if (link.primary) return id;
    }
    return {};
}

size_t ConnectionManager::primary_count() const {
    size_t n = 0;
    for (const auto& [id, link] : links_) {
        if (link.primary) ++n;
    }
    return n;
}

std::vector<std::string> ConnectionManager::open_topics() const {
    std::vector<std::string> ids;
    for (const auto& [id, link] : links_) ids.push_back(id);
    return ids;
}

void ConnectionManager::arm_abort_timer(const std::string& topic_id, int64_t timeout_ms,
                                        std::function<void()> on_timeout) {
    clear_abort_timer(topic_id);
    abort_timers_[topic_id] = loop_.call_after(timeout_ms,
        [this, topic_id, fn = std::move(on_timeout)] {
            abort_timers_.erase(topic_id);
            fn();
        });
}

bool ConnectionManager::clear_abort_timer(const std::string& topic_id) {
    auto it = abort_timers_.find(topic_id);
    if (it == abort_timers_.end()) return false;
    loop_.cancel(it->second);
    abort_timers_.erase(it);
    return true;
}

bool ConnectionManager::has_abort_timer(const std::string& topic_id) const {
    return abort_timers_.count(topic_id) > 0;
}

bool ConnectionManager::has_watchdog(const std::string& topic_id) const {
    auto it = links_.find(topic_id);
    return it != links_.end() && it->second.watchdog != nullptr;
}

bool ConnectionManager::has_pending_chunks(const std::string& topic_id) const {
    auto it = links_.find(topic_id);
    return it != links_.end() && it->second.coalescer && it->second.coalescer->has_pending();
}

// ── Inbound ─────────────────────────────────────────────────────

void ConnectionManager::handle_frame(const std::string& topic_id, const nlohmann::json& frame) {
    auto it = links_.find(topic_id);
    if (it == links_.end()) return;
    Link& link = it->second;
    if (link.watchdog) link.watchdog->touch();

    std::optional<ProtocolEvent> event;
    try {
        event = parse_event(frame);
    } catch (const std::exception& e) {
        std::cerr << "[connection] dropping malformed frame: " << e.what() << "\n";
        return;
    }
    if (!event) {
        std::cerr << "[connection] ignoring unknown event type "
                  << frame["type"].get<std::string>() << "\n";
        return;
    }

    if (is_delta(*event)) {
        link.coalescer->push(std::move(*event));
        return;
    }
    link.coalescer->flush_sync();

    Channel* ch = store_.find(topic_id);
    if (!ch) return;
    ReduceResult result = reduce(*ch, *event);
    if (result.abort_acknowledged) clear_abort_timer(topic_id);
    bool primary = link.primary;

    publish_result(topic_id, result);
    publish_channel_updated(bus_, topic_id);

    if (!primary) {
        std::weak_ptr<bool> alive = alive_;
        loop_.post([this, alive, topic_id] {
            if (!alive.expired()) close_if_idle(topic_id);
        });
    }
}

void ConnectionManager::apply_deltas(const std::string& topic_id, std::vector<ProtocolEvent> batch) {
    Channel* ch = store_.find(topic_id);
    if (!ch) return;
    for (const auto& event : batch) reduce(*ch, event);
    publish_channel_updated(bus_, topic_id);
}

void ConnectionManager::publish_result(const std::string& topic_id, const ReduceResult& result) {
    if (result.notification) {
        const Notification& n = *result.notification;
        publish_notification(bus_, topic_id, n.level, n.title, n.message, n.code);
    }
    if (result.rename) {
        TopicRenamedEvent ev;
        ev.topic_id = topic_id;
        ev.title = result.rename->name;
        bus_.publish(ev);
    }
}

void ConnectionManager::close_if_idle(const std::string& topic_id) {
    auto it = links_.find(topic_id);
    if (it == links_.end() || it->second.primary) return;
    const Channel* ch = store_.find(topic_id);
    if (ch && ch->responding) return;
    std::cerr << "[connection] closing idle background connection " << topic_id << "\n";
    close_link(topic_id);
    if (Channel* c = store_.find(topic_id)) c->connected = false;
}

void ConnectionManager::handle_status(const std::string& topic_id, const TransportStatus& status) {
    Channel* ch = store_.find(topic_id);
    if (!ch) return;
    ch->connected = status.connected;
    if (status.connected || status.error.empty()) {
        ch->error.reset();
    } else {
        ch->error = status.error;
    }

    ConnectionStatusEvent ev;
    ev.topic_id = topic_id;
    ev.connected = status.connected;
    ev.error = status.error;
    bus_.publish(ev);
    publish_channel_updated(bus_, topic_id);
}

void ConnectionManager::recover(const std::string& topic_id, const char* why) {
    Channel* ch = store_.find(topic_id);
    if (!ch) return;
    std::cerr << "[connection] recovering " << topic_id << " after " << why << "\n";
    if (auto it = links_.find(topic_id); it != links_.end() && it->second.coalescer)
        it->second.coalescer->flush_sync();
    settle_stale(*ch);
    publish_channel_updated(bus_, topic_id);
    if (reconcile_) reconcile_(topic_id);
}

} // namespace chansync
