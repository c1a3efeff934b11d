#include "chat_client.hpp"
#include "channel_state.hpp"
#include "reducer.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>

namespace chansync {

PendingOps::Guard PendingOps::try_acquire(const std::string& key) {
    if (!keys_.insert(key).second) return Guard();
    return Guard(this, key);
}

void apply_session(Channel& channel, const SessionInfo& session) {
    channel.session_id = session.id;
    if (!session.agent_id.empty()) channel.agent_id = session.agent_id;
    channel.provider_id = session.provider_id;
    channel.model = session.model;
    channel.model_tier = session.model_tier;
    channel.knowledge_set_id = session.knowledge_set_id;
}

static CommandResult fail(std::string error) {
    CommandResult r;
    r.error = std::move(error);
    return r;
}

static CommandResult success() {
    CommandResult r;
    r.ok = true;
    return r;
}

ChatClient::ChatClient(EventLoop& loop, HttpClient& http, TransportFactory transports,
                       Config config)
    : config_(std::move(config)),
      loop_(loop),
      api_(http, config_.backend),
      connections_(loop_, store_, bus_, std::move(transports), config_.sync),
      reconciler_(store_, api_, bus_),
      submission_(loop_, store_, connections_, bus_, config_.sync),
      abort_(store_, connections_, bus_, config_.sync) {
    connections_.set_reconcile_handler([this](const std::string& topic_id) {
        reconciler_.reconcile(topic_id);
    });

    // Server-side renames also update the cached session list.
    rename_sub_ = subscribe<TopicRenamedEvent>(bus_, [this](const TopicRenamedEvent& ev) {
        for (auto& s : sessions_) {
            for (auto& t : s.topics) {
                if (t.id == ev.topic_id) t.name = ev.title;
            }
        }
    });
}

ChatClient::~ChatClient() {
    bus_.unsubscribe(rename_sub_);
    connections_.disconnect();
}

// ── Selectors ───────────────────────────────────────────────────

bool ChatClient::connected(const std::string& topic_id) const {
    const Channel* ch = store_.find(topic_id);
    return ch && ch->connected;
}

bool ChatClient::responding(const std::string& topic_id) const {
    const Channel* ch = store_.find(topic_id);
    return ch && ch->responding;
}

bool ChatClient::aborting(const std::string& topic_id) const {
    const Channel* ch = store_.find(topic_id);
    return ch && ch->aborting;
}

std::optional<std::string> ChatClient::error(const std::string& topic_id) const {
    const Channel* ch = store_.find(topic_id);
    if (!ch) return std::nullopt;
    return ch->error;
}

const std::vector<Message>& ChatClient::messages(const std::string& topic_id) const {
    static const std::vector<Message> empty;
    const Channel* ch = store_.find(topic_id);
    return ch ? ch->messages : empty;
}

// ── Sessions ────────────────────────────────────────────────────

const SessionInfo* ChatClient::find_session_for_topic(const std::string& topic_id,
                                                      const TopicInfo** topic) const {
    for (const auto& s : sessions_) {
        for (const auto& t : s.topics) {
            if (t.id == topic_id) {
                if (topic) *topic = &t;
                return &s;
            }
        }
    }
    return nullptr;
}

SessionInfo* ChatClient::find_session(const std::string& session_id) {
    for (auto& s : sessions_) {
        if (s.id == session_id) return &s;
    }
    return nullptr;
}

void ChatClient::remember_session(const SessionInfo& session) {
    if (SessionInfo* known = find_session(session.id)) {
        std::vector<TopicInfo> topics = known->topics;
        *known = session;
        for (auto& t : topics) {
            bool present = std::any_of(known->topics.begin(), known->topics.end(),
                                       [&](const TopicInfo& k) { return k.id == t.id; });
            if (!present) known->topics.push_back(std::move(t));
        }
        return;
    }
    sessions_.insert(sessions_.begin(), session);
}

Channel& ChatClient::adopt_topic(const SessionInfo& session, const TopicInfo& topic) {
    Channel& ch = store_.ensure(topic.id, session.id);
    if (!ch.responding) {
        ch.title = topic.name;
        apply_session(ch, session);
    }
    return ch;
}

CommandResult ChatClient::fetch_history() {
    std::vector<SessionInfo> sessions;
    try {
        sessions = api_.list_sessions();
    } catch (const ApiError& e) {
        std::cerr << "[client] failed to fetch history: " << e.what() << "\n";
        return fail(e.what());
    }
    sessions_ = std::move(sessions);

    for (const auto& s : sessions_) {
        for (const auto& t : s.topics) {
            Channel* ch = store_.find(t.id);
            if (!ch || ch->responding) continue;
            ch->title = t.name;
            apply_session(*ch, s);
            publish_channel_updated(bus_, t.id);
        }
    }
    return success();
}

// ── Activation ──────────────────────────────────────────────────

ActivateResult ChatClient::activate(const std::string& topic_id) {
    ActivateResult result;
    result.topic_id = topic_id;

    auto guard = pending_.try_acquire("activate:" + topic_id);
    if (!guard) {
        result.error = "activation already in progress";
        return result;
    }

    const Channel* existing = store_.find(topic_id);
    if (store_.active_topic() == topic_id && existing && existing->connected) {
        result.ok = true;
        result.connected = true;
        return result;
    }

    const TopicInfo* topic = nullptr;
    const SessionInfo* session = find_session_for_topic(topic_id, &topic);
    if (!session && !existing) {
        std::cerr << "[client] topic " << topic_id << " not in session list, refetching\n";
        fetch_history();
        session = find_session_for_topic(topic_id, &topic);
    }
    if (session) {
        adopt_topic(*session, *topic);
    } else if (!existing) {
        std::cerr << "[client] topic " << topic_id << " not found\n";
        result.error = "unknown topic";
        return result;
    }

    store_.set_active_topic(topic_id);
    result.ok = true;

    const Channel* ch = store_.find(topic_id);
    if (!connections_.has_connection(topic_id) &&
        (ch->messages.empty() || has_stale_runtime_state(*ch))) {
        reconciler_.reconcile(topic_id);
    }

    if (connections_.has_connection(topic_id) && !connections_.is_primary(topic_id))
        connections_.connect(topic_id);
    result.connected = submission_.ensure_connected(topic_id);
    if (!result.connected) {
        ch = store_.find(topic_id);
        result.error = (ch && ch->error) ? *ch->error : "connection failed";
        std::cerr << "[client] " << topic_id << " did not connect: " << result.error << "\n";
    }
    return result;
}

ActivateResult ChatClient::activate_for_agent(const std::string& agent_id) {
    ActivateResult result;
    auto guard = pending_.try_acquire("activate-agent:" + agent_id);
    if (!guard) {
        result.error = "activation already in progress";
        return result;
    }

    std::optional<SessionInfo> session;
    try {
        session = api_.session_by_agent(agent_id);
    } catch (const ApiError& e) {
        std::cerr << "[client] session lookup for agent " << agent_id
                  << " failed: " << e.what() << "\n";
        return create_default_channel(agent_id);
    }
    if (!session) return create_default_channel(agent_id);

    // Topics come newest first.
    TopicInfo topic;
    if (!session->topics.empty()) {
        topic = session->topics.front();
    } else {
        try {
            topic = api_.create_topic(session->id);
        } catch (const ApiError& e) {
            notify_error("", "Could not create chat", e.what());
            result.error = e.what();
            return result;
        }
        session->topics.push_back(topic);
    }

    remember_session(*session);
    adopt_topic(*session, topic);
    return activate(topic.id);
}

ActivateResult ChatClient::create_default_channel(const std::string& agent_id) {
    ActivateResult result;
    auto guard = pending_.try_acquire("create:" + (agent_id.empty() ? std::string("default")
                                                                    : agent_id));
    if (!guard) {
        result.error = "creation already in progress";
        return result;
    }

    SessionInfo session;
    TopicInfo topic;
    try {
        session = api_.create_session("New Session", agent_id);
        if (!session.topics.empty()) {
            topic = session.topics.front();
        } else {
            topic = api_.create_topic(session.id);
            session.topics.push_back(topic);
        }
    } catch (const ApiError& e) {
        std::cerr << "[client] failed to create channel: " << e.what() << "\n";
        notify_error("", "Could not create chat", e.what());
        result.error = e.what();
        return result;
    }

    remember_session(session);
    adopt_topic(session, topic);
    return activate(topic.id);
}

// ── Messages ────────────────────────────────────────────────────

SendResult ChatClient::send(const std::string& topic_id, const std::string& text,
                            const SendOptions& options) {
    SendOptions opts = options;
    const Channel* ch = store_.find(topic_id);
    if (ch && !opts.context && (ch->knowledge_set_id || ch->knowledge_context)) {
        ChatContext ctx;
        if (ch->knowledge_set_id) ctx.knowledge_set_id = *ch->knowledge_set_id;
        if (ch->knowledge_context) {
            ctx.folder_id = ch->knowledge_context->folder_id;
            ctx.folder_name = ch->knowledge_context->folder_name;
        }
        opts.context = ctx;
    }
    return submission_.send(topic_id, text, opts);
}

SendResult ChatClient::retry(const std::string& topic_id, const std::string& message_id) {
    return submission_.retry(topic_id, message_id);
}

CommandResult ChatClient::delete_message(const std::string& topic_id,
                                         const std::string& message_id) {
    Channel* ch = store_.find(topic_id);
    if (!ch) return fail("unknown topic");
    const Message* m = ch->find_message(message_id);

    if (!is_uuid(message_id)) {
        std::string reason = (m && m->is_streaming) ? "The message is still streaming."
                                                    : "The message has not been saved yet.";
        publish_notification(bus_, topic_id, "warning", "Cannot delete message", reason);
        return fail(reason);
    }
    if (!m) return fail("message not found");

    try {
        api_.delete_message(message_id);
    } catch (const ApiError& e) {
        std::cerr << "[client] delete message failed: " << e.what() << "\n";
        notify_error(topic_id, "Error", "Failed to delete message");
        return fail(e.what());
    }

    ch = store_.find(topic_id);
    if (ch) {
        auto& msgs = ch->messages;
        msgs.erase(std::remove_if(msgs.begin(), msgs.end(),
                                  [&](const Message& x) { return x.id == message_id; }),
                   msgs.end());
        sync_responding(*ch);
        publish_channel_updated(bus_, topic_id);
    }
    return success();
}

CommandResult ChatClient::edit_message(const std::string& topic_id, const std::string& message_id,
                                       const std::string& content, bool truncate_and_regenerate) {
    Channel* ch = store_.find(topic_id);
    if (!ch) return fail("unknown topic");
    if (!ch->find_message(message_id)) {
        std::cerr << "[client] edit: message " << message_id << " not in " << topic_id << "\n";
        return fail("message not found");
    }

    EditResult edited;
    try {
        edited = api_.edit_message(message_id, content, truncate_and_regenerate);
    } catch (const ApiError& e) {
        std::cerr << "[client] edit message failed: " << e.what() << "\n";
        notify_error(topic_id, "Error", "Failed to edit message");
        return fail(e.what());
    }

    ch = store_.find(topic_id);
    if (!ch) return fail("unknown topic");
    auto& msgs = ch->messages;
    auto it = std::find_if(msgs.begin(), msgs.end(),
                           [&](const Message& m) { return m.id == message_id; });
    if (it == msgs.end()) return fail("message not found");

    it->content = edited.message.content;
    if (!edited.message.created_at.empty()) it->created_at = edited.message.created_at;
    if (truncate_and_regenerate) msgs.erase(it + 1, msgs.end());
    sync_responding(*ch);
    publish_channel_updated(bus_, topic_id);

    if (edited.regenerate && !submission_.regenerate(topic_id))
        return fail("regenerate could not be sent");
    return success();
}

CommandResult ChatClient::abort(const std::string& topic_id) {
    if (!abort_.abort(topic_id)) return fail("unknown topic");
    return success();
}

// ── Tool calls ──────────────────────────────────────────────────

CommandResult ChatClient::confirm_tool_call(const std::string& topic_id,
                                            const std::string& tool_call_id) {
    Channel* ch = store_.find(topic_id);
    if (!ch) return fail("unknown topic");
    ToolCall* tc = find_tool_call(*ch, tool_call_id);
    if (!tc) return fail("tool call not found");
    if (tc->status != ToolCallStatus::WaitingConfirmation)
        return fail(std::string("tool call is ") + to_string(tc->status));

    if (!connections_.send(topic_id, make_tool_call_confirm(tool_call_id)))
        return fail("not connected");
    tc->status = ToolCallStatus::Executing;
    publish_channel_updated(bus_, topic_id);
    return success();
}

CommandResult ChatClient::cancel_tool_call(const std::string& topic_id,
                                           const std::string& tool_call_id,
                                           const std::string& reason) {
    Channel* ch = store_.find(topic_id);
    if (!ch) return fail("unknown topic");
    ToolCall* tc = find_tool_call(*ch, tool_call_id);
    if (!tc) return fail("tool call not found");
    if (is_terminal(tc->status))
        return fail(std::string("tool call is ") + to_string(tc->status));

    if (!connections_.send(topic_id, make_tool_call_cancel(tool_call_id, reason)))
        return fail("not connected");

    // Same transition the backend's failed response would cause.
    ToolCallResponse local;
    local.tool_call_id = tool_call_id;
    local.status = ToolCallStatus::Failed;
    local.error = reason;
    reduce(*ch, local);
    publish_channel_updated(bus_, topic_id);
    return success();
}

// ── Topics and sessions ─────────────────────────────────────────

void ChatClient::notify_error(const std::string& topic_id, const std::string& title,
                              const std::string& message) {
    publish_notification(bus_, topic_id, "error", title, message);
}

void ChatClient::release_channel(const std::string& topic_id) {
    connections_.release_topic(topic_id);
    submission_.set_uploading(topic_id, false);
    store_.erase(topic_id);
    if (store_.active_topic() == topic_id) store_.set_active_topic("");
}

CommandResult ChatClient::rename_topic(const std::string& topic_id, const std::string& name) {
    std::string title = trim(name);
    if (title.empty()) return fail("name must not be empty");

    TopicInfo updated;
    try {
        updated = api_.update_topic(topic_id, title);
    } catch (const ApiError& e) {
        std::cerr << "[client] rename topic failed: " << e.what() << "\n";
        notify_error(topic_id, "Error", "Failed to rename topic");
        return fail(e.what());
    }

    if (Channel* ch = store_.find(topic_id)) {
        ch->title = updated.name;
        publish_channel_updated(bus_, topic_id);
    }
    TopicRenamedEvent ev;
    ev.topic_id = topic_id;
    ev.title = updated.name;
    bus_.publish(ev);
    return success();
}

CommandResult ChatClient::delete_topic(const std::string& topic_id) {
    try {
        api_.delete_topic(topic_id);
    } catch (const ApiError& e) {
        std::cerr << "[client] delete topic failed: " << e.what() << "\n";
        notify_error(topic_id, "Error", "Failed to delete topic");
        return fail(e.what());
    }

    release_channel(topic_id);
    for (auto& s : sessions_) {
        s.topics.erase(std::remove_if(s.topics.begin(), s.topics.end(),
                                      [&](const TopicInfo& t) { return t.id == topic_id; }),
                       s.topics.end());
    }
    return success();
}

CommandResult ChatClient::clear_session_topics(const std::string& session_id) {
    try {
        api_.clear_session_topics(session_id);
    } catch (const ApiError& e) {
        std::cerr << "[client] clear session topics failed: " << e.what() << "\n";
        notify_error("", "Error", "Failed to clear topics");
        return fail(e.what());
    }

    std::vector<std::string> topics = store_.topics_for_session(session_id);
    if (SessionInfo* s = find_session(session_id)) {
        for (const auto& t : s->topics) {
            if (std::find(topics.begin(), topics.end(), t.id) == topics.end())
                topics.push_back(t.id);
        }
        s->topics.clear();
    }
    for (const auto& id : topics) release_channel(id);
    return success();
}

CommandResult ChatClient::update_session_config(const std::string& session_id,
                                                const SessionUpdate& update) {
    SessionInfo updated;
    try {
        updated = api_.update_session(session_id, update);
    } catch (const ApiError& e) {
        std::cerr << "[client] update session failed: " << e.what() << "\n";
        notify_error("", "Error", "Failed to update session");
        return fail(e.what());
    }

    SessionInfo* s = find_session(session_id);
    if (!s) {
        sessions_.push_back(updated);
        s = &sessions_.back();
    }
    if (update.provider_id) s->provider_id = *update.provider_id;
    if (update.model) s->model = *update.model;
    if (update.model_tier) s->model_tier = *update.model_tier;
    if (update.knowledge_set_id) {
        if (update.knowledge_set_id->empty()) {
            s->knowledge_set_id.reset();
        } else {
            s->knowledge_set_id = *update.knowledge_set_id;
        }
    }

    for (const auto& id : store_.topics_for_session(session_id)) {
        Channel* ch = store_.find(id);
        if (!ch) continue;
        if (update.provider_id) ch->provider_id = s->provider_id;
        if (update.model) ch->model = s->model;
        if (update.model_tier) ch->model_tier = s->model_tier;
        if (update.knowledge_set_id) ch->knowledge_set_id = s->knowledge_set_id;
        publish_channel_updated(bus_, id);
    }
    return success();
}

void ChatClient::disconnect() {
    connections_.disconnect();
    for (const auto& id : store_.topic_ids()) {
        if (Channel* ch = store_.find(id)) ch->connected = false;
    }
}

} // namespace chansync
