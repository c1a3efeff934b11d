#include "submission.hpp"
#include "channel_state.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>

namespace chansync {

SubmissionPipeline::SubmissionPipeline(EventLoop& loop, ChannelStore& store,
                                       ConnectionManager& connections, EventBus& bus,
                                       SyncConfig config)
    : loop_(loop), store_(store), connections_(connections), bus_(bus), config_(config) {}

void SubmissionPipeline::set_uploading(const std::string& topic_id, bool uploading) {
    if (uploading) {
        uploading_.insert(topic_id);
    } else {
        uploading_.erase(topic_id);
    }
}

bool SubmissionPipeline::ensure_connected(const std::string& topic_id) {
    Channel* ch = store_.find(topic_id);
    if (!ch) return false;
    if (ch->connected && connections_.has_connection(topic_id)) return true;

    try {
        connections_.connect(topic_id);
    } catch (const std::exception& e) {
        std::cerr << "[send] connect failed for " << topic_id << ": " << e.what() << "\n";
        return false;
    }

    loop_.run_until([this, &topic_id] {
        const Channel* c = store_.find(topic_id);
        return !c || c->connected || c->error.has_value();
    }, config_.connect_timeout_ms);

    ch = store_.find(topic_id);
    return ch && ch->connected;
}

void SubmissionPipeline::notify_connection_failed(const std::string& topic_id) {
    std::cerr << "[send] not connected to " << topic_id << "\n";
    publish_notification(bus_, topic_id, "error", "Connection failed",
                         "Could not reach the chat service. Please try again.");
}

SendResult SubmissionPipeline::send(const std::string& topic_id, const std::string& text,
                                    const SendOptions& options) {
    SendResult result;
    Channel* ch = store_.find(topic_id);
    if (!ch) {
        result.error = "unknown topic";
        return result;
    }
    if (uploading(topic_id)) {
        result.error = "attachments are still uploading";
        return result;
    }
    if (ch->responding) {
        result.error = "a response is still in progress";
        return result;
    }
    if (!ch->connected || !connections_.has_connection(topic_id)) {
        if (!ensure_connected(topic_id)) {
            notify_connection_failed(topic_id);
            result.error = "connection failed";
            return result;
        }
        ch = store_.find(topic_id);
        if (!ch) {
            result.error = "unknown topic";
            return result;
        }
    }

    Message m;
    m.client_id = generate_client_id();
    m.id = m.client_id;
    m.role = Role::User;
    m.content = text;
    m.status = MessageStatus::Sending;
    m.created_at = timestamp_now();
    for (const auto& file_id : options.file_ids) {
        Attachment a;
        a.id = file_id;
        m.attachments.push_back(std::move(a));
    }
    result.client_id = m.client_id;
    ch->messages.push_back(std::move(m));
    sync_responding(*ch);
    publish_channel_updated(bus_, topic_id);

    auto payload = make_chat_message(text, result.client_id, options.file_ids, options.context);
    if (!connections_.send(topic_id, payload)) {
        if (Message* sent = ch->find_message(result.client_id)) {
            sent->status = MessageStatus::Failed;
            MessageError err;
            err.code = "network.send_failed";
            err.category = "network";
            err.message = "Message could not be sent";
            err.recoverable = true;
            sent->error = err;
        }
        sync_responding(*ch);
        publish_channel_updated(bus_, topic_id);
        std::cerr << "[send] transmit failed for " << topic_id << "\n";
        result.error = "send failed";
        return result;
    }

    result.ok = true;
    return result;
}

SendResult SubmissionPipeline::retry(const std::string& topic_id, const std::string& message_id) {
    SendResult result;
    Channel* ch = store_.find(topic_id);
    if (!ch) {
        result.error = "unknown topic";
        return result;
    }
    const Message* failed = ch->find_message(message_id);
    if (!failed || failed->status != MessageStatus::Failed || failed->role != Role::User) {
        result.error = "only failed user messages can be retried";
        return result;
    }
    if (ch->responding) {
        result.error = "a response is still in progress";
        return result;
    }

    if (!ensure_connected(topic_id)) {
        notify_connection_failed(topic_id);
        result.error = "connection failed";
        return result;
    }

    ch = store_.find(topic_id);
    if (!ch) {
        result.error = "unknown topic";
        return result;
    }
    auto it = std::find_if(ch->messages.begin(), ch->messages.end(),
                           [&](const Message& m) { return m.id == message_id; });
    if (it == ch->messages.end()) {
        result.error = "message disappeared";
        return result;
    }

    std::string text = it->content;
    SendOptions options;
    for (const auto& a : it->attachments) options.file_ids.push_back(a.id);
    ch->messages.erase(it);
    sync_responding(*ch);

    return send(topic_id, text, options);
}

bool SubmissionPipeline::regenerate(const std::string& topic_id) {
    Channel* ch = store_.find(topic_id);
    if (!ch || ch->responding) return false;
    if (!connections_.send(topic_id, make_regenerate())) return false;

    // Placeholder keeps the channel responding until the first stream event.
    Message placeholder;
    placeholder.id = "loading-" + std::to_string(epoch_ms());
    placeholder.client_id = generate_client_id();
    placeholder.role = Role::Assistant;
    placeholder.status = MessageStatus::Pending;
    placeholder.is_loading = true;
    placeholder.created_at = timestamp_now();
    ch->messages.push_back(std::move(placeholder));
    sync_responding(*ch);
    publish_channel_updated(bus_, topic_id);
    return true;
}

} // namespace chansync
