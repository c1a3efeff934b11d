#pragma once
#include "abort_controller.hpp"
#include "api_client.hpp"
#include "channel_store.hpp"
#include "config.hpp"
#include "connection_manager.hpp"
#include "event_bus.hpp"
#include "event_loop.hpp"
#include "reconciler.hpp"
#include "submission.hpp"

#include <set>
#include <string>
#include <vector>

namespace chansync {

struct CommandResult {
    bool ok = false;
    std::string error;
};

struct ActivateResult {
    bool ok = false;          // the topic is now active
    bool connected = false;
    std::string topic_id;
    std::string error;
};

// Keys of operations in flight ("activate:<topic>", "create:<agent>", ...).
// A second attempt while the first holds the key is refused.
class PendingOps {
public:
    class Guard {
    public:
        Guard() = default;
        Guard(PendingOps* ops, std::string key) : ops_(ops), key_(std::move(key)) {}
        Guard(Guard&& other) noexcept : ops_(other.ops_), key_(std::move(other.key_)) {
            other.ops_ = nullptr;
        }
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard& operator=(Guard&&) = delete;
        ~Guard() {
            if (ops_) ops_->keys_.erase(key_);
        }

        explicit operator bool() const { return ops_ != nullptr; }

    private:
        PendingOps* ops_ = nullptr;
        std::string key_;
    };

    // Empty guard if the key is already held.
    Guard try_acquire(const std::string& key);
    bool pending(const std::string& key) const { return keys_.count(key) > 0; }

private:
    std::set<std::string> keys_;
};

// Entry point for a UI: owns the channel store and wires the connection,
// reconciliation, submission and abort services together. Every method must
// be called on the event loop thread.
class ChatClient {
public:
    ChatClient(EventLoop& loop, HttpClient& http, TransportFactory transports, Config config);
    ~ChatClient();

    ChatClient(const ChatClient&) = delete;
    ChatClient& operator=(const ChatClient&) = delete;

    // ── Selectors ───────────────────────────────────────────────
    const Channel* channel(const std::string& topic_id) const { return store_.find(topic_id); }
    const Channel* active_channel() const { return store_.find(store_.active_topic()); }
    const std::string& active_topic() const { return store_.active_topic(); }
    bool connected(const std::string& topic_id) const;
    bool responding(const std::string& topic_id) const;
    bool aborting(const std::string& topic_id) const;
    std::optional<std::string> error(const std::string& topic_id) const;
    const std::vector<Message>& messages(const std::string& topic_id) const;
    const std::vector<SessionInfo>& sessions() const { return sessions_; }

    EventBus& bus() { return bus_; }
    ChannelStore& store() { return store_; }
    ConnectionManager& connections() { return connections_; }
    SubmissionPipeline& submission() { return submission_; }
    PendingOps& pending_ops() { return pending_; }

    // ── Commands ────────────────────────────────────────────────
    CommandResult fetch_history();

    ActivateResult activate(const std::string& topic_id);
    ActivateResult activate_for_agent(const std::string& agent_id);
    ActivateResult create_default_channel(const std::string& agent_id = "");

    SendResult send(const std::string& topic_id, const std::string& text,
                    const SendOptions& options = {});
    SendResult retry(const std::string& topic_id, const std::string& message_id);
    CommandResult delete_message(const std::string& topic_id, const std::string& message_id);
    CommandResult edit_message(const std::string& topic_id, const std::string& message_id,
                               const std::string& content, bool truncate_and_regenerate);
    CommandResult abort(const std::string& topic_id);

    CommandResult confirm_tool_call(const std::string& topic_id, const std::string& tool_call_id);
    CommandResult cancel_tool_call(const std::string& topic_id, const std::string& tool_call_id,
                                   const std::string& reason = kCancelledByUser);

    CommandResult rename_topic(const std::string& topic_id, const std::string& name);
    CommandResult delete_topic(const std::string& topic_id);
    CommandResult clear_session_topics(const std::string& session_id);
    CommandResult update_session_config(const std::string& session_id, const SessionUpdate& update);

    void disconnect();

    static constexpr const char* kCancelledByUser = "Cancelled by user";

private:
    const SessionInfo* find_session_for_topic(const std::string& topic_id,
                                              const TopicInfo** topic = nullptr) const;
    SessionInfo* find_session(const std::string& session_id);
    void remember_session(const SessionInfo& session);
    Channel& adopt_topic(const SessionInfo& session, const TopicInfo& topic);
    void release_channel(const std::string& topic_id);
    void notify_error(const std::string& topic_id, const std::string& title,
                      const std::string& message);

    Config config_;
    EventLoop& loop_;
    ChannelStore store_;
    EventBus bus_;
    ApiClient api_;
    ConnectionManager connections_;
    Reconciler reconciler_;
    SubmissionPipeline submission_;
    AbortController abort_;
    PendingOps pending_;
    std::vector<SessionInfo> sessions_;
    uint64_t rename_sub_ = 0;
};

// Applies session-level configuration (agent, provider, model, knowledge set)
// to a channel.
void apply_session(Channel& channel, const SessionInfo& session);

} // namespace chansync
