#pragma once
#include "channel_store.hpp"
#include "chunk_coalescer.hpp"
#include "config.hpp"
#include "event_bus.hpp"
#include "event_loop.hpp"
#include "reducer.hpp"
#include "stale_watchdog.hpp"
#include "transport.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace chansync {

// Owns one transport per open topic. At most one of them is primary; the
// others stay open only while their channel is still responding.
//
// Per topic it also owns the stale watchdog, the delta coalescer and the
// abort fallback timer, and releases all of them together.
class ConnectionManager {
public:
    using ReconcileHandler = std::function<void(const std::string& topic_id)>;

    ConnectionManager(EventLoop& loop, ChannelStore& store, EventBus& bus,
                      TransportFactory factory, SyncConfig config);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Promote an existing transport in place, or open a new primary one.
    // Throws std::invalid_argument if the store has no channel for the topic.
    void connect(const std::string& topic_id);

    void disconnect();
    void release_topic(const std::string& topic_id);

    // False when the topic has no transport or the transport refused the frame.
    bool send(const std::string& topic_id, const nlohmann::json& payload);

    bool has_connection(const std::string& topic_id) const;
    bool is_primary(const std::string& topic_id) const;
    std::string primary_topic() const;
    size_t primary_count() const;
    std::vector<std::string> open_topics() const;

    // Replaces any timer already armed for the topic.
    void arm_abort_timer(const std::string& topic_id, int64_t timeout_ms,
                         std::function<void()> on_timeout);
    bool clear_abort_timer(const std::string& topic_id);
    bool has_abort_timer(const std::string& topic_id) const;

    bool has_watchdog(const std::string& topic_id) const;
    bool has_pending_chunks(const std::string& topic_id) const;

    // Invoked after stale recovery and after a reconnect that found stale state.
    void set_reconcile_handler(ReconcileHandler handler) { reconcile_ = std::move(handler); }

private:
    struct Link {
        std::unique_ptr<Transport> transport;
        bool primary = false;
        std::unique_ptr<StaleWatchdog> watchdog;
        std::unique_ptr<ChunkCoalescer> coalescer;
    };

    TransportCallbacks callbacks_for(const std::string& topic_id);
    void demote_others(const std::string& topic_id);
    void close_link(const std::string& topic_id);
    void close_if_idle(const std::string& topic_id);

    void handle_frame(const std::string& topic_id, const nlohmann::json& frame);
    void apply_deltas(const std::string& topic_id, std::vector<ProtocolEvent> batch);
    void publish_result(const std::string& topic_id, const ReduceResult& result);
    void handle_status(const std::string& topic_id, const TransportStatus& status);
    void recover(const std::string& topic_id, const char* why);

    EventLoop& loop_;
    ChannelStore& store_;
    EventBus& bus_;
    TransportFactory factory_;
    SyncConfig config_;
    ReconcileHandler reconcile_;

    std::map<std::string, Link> links_;
    std::map<std::string, EventLoop::TimerId> abort_timers_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace chansync
