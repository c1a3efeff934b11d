#include "reconciler.hpp"
#include "channel_state.hpp"

#include <iostream>
#include <optional>
#include <set>
#include <unordered_map>

namespace chansync {

const char* to_string(ReconcileOutcome outcome) {
    switch (outcome) {
        case ReconcileOutcome::Skipped:  return "skipped";
        case ReconcileOutcome::Applied:  return "applied";
        case ReconcileOutcome::NotFound: return "not_found";
        case ReconcileOutcome::Failed:   return "failed";
    }
    return "failed";
}

static bool carries_runtime_state(const Message& m) {
    return is_in_flight(m.status) || m.has_runtime_flags() || m.execution.has_value();
}

bool is_runtime_only(const Message& m) {
    if (carries_runtime_state(m)) return true;
    bool terminal_failure = m.status == MessageStatus::Failed ||
                            m.status == MessageStatus::Cancelled;
    if (!terminal_failure || m.server_id) return false;
    // A settled placeholder that never received anything has nothing to keep.
    return !m.content.empty() || !m.thinking_content.empty() || m.error.has_value() ||
           !m.tool_calls.empty();
}

static void transplant_runtime(Message& to, const Message& from) {
    to.stream_id = from.stream_id;
    to.status = from.status;
    to.is_loading = from.is_loading;
    to.is_streaming = from.is_streaming;
    to.is_thinking = from.is_thinking;
    to.execution = from.execution;
    to.thinking_content = from.thinking_content;
}

MergeStats merge_persisted(Channel& channel, std::vector<Message> persisted) {
    MergeStats stats;

    std::unordered_map<std::string, size_t> index_of;
    for (size_t i = 0; i < persisted.size(); ++i) index_of.emplace(persisted[i].id, i);

    auto persisted_index = [&](const Message& m) -> std::optional<size_t> {
        auto it = index_of.find(m.id);
        if (it != index_of.end()) return it->second;
        if (m.server_id) {
            it = index_of.find(*m.server_id);
            if (it != index_of.end()) return it->second;
        }
        return std::nullopt;
    };

    std::set<size_t> used;
    std::vector<const Message*> runtime_only;

    // Local copies already bound to a persisted id keep their runtime state.
    for (const auto& m : channel.messages) {
        auto idx = persisted_index(m);
        if (idx) {
            if (carries_runtime_state(m) && used.insert(*idx).second)
                transplant_runtime(persisted[*idx], m);
            continue;
        }
        if (is_runtime_only(m)) runtime_only.push_back(&m);
    }

    std::vector<Message> extra;
    for (const Message* m : runtime_only) {
        ++stats.preserved;
        std::optional<size_t> target;
        // Only live runtime state folds; a plain failed reply keeps its own
        // content and error.
        if (m->role == Role::Assistant && carries_runtime_state(*m)) {
            for (size_t i = persisted.size(); i-- > 0;) {
                if (persisted[i].role == Role::Assistant && used.count(i) == 0) {
                    target = i;
                    break;
                }
            }
        }
        if (target) {
            transplant_runtime(persisted[*target], *m);
            used.insert(*target);
            ++stats.folded;
        } else {
            extra.push_back(*m);
            ++stats.appended;
        }
    }

    for (auto& m : extra) persisted.push_back(std::move(m));
    channel.messages = std::move(persisted);
    sync_responding(channel);
    return stats;
}

Reconciler::Reconciler(ChannelStore& store, ApiClient& api, EventBus& bus)
    : store_(store), api_(api), bus_(bus) {}

ReconcileOutcome Reconciler::reconcile(const std::string& topic_id) {
    Channel* ch = store_.find(topic_id);
    if (!ch) return ReconcileOutcome::NotFound;
    if (ch->responding) {
        std::cerr << "[reconcile] skip " << topic_id << ": channel is responding\n";
        return ReconcileOutcome::Skipped;
    }

    std::vector<Message> persisted;
    try {
        persisted = api_.get_messages(topic_id);
    } catch (const ApiError& e) {
        std::cerr << "[reconcile] fetch failed for " << topic_id << ": " << e.what() << "\n";
        return ReconcileOutcome::Failed;
    }

    std::optional<TokenStats> stats;
    try {
        stats = api_.token_stats(topic_id);
    } catch (const ApiError& e) {
        std::cerr << "[reconcile] token stats unavailable for " << topic_id
                  << ": " << e.what() << "\n";
    }

    // The store may have changed while the request was in flight.
    ch = store_.find(topic_id);
    if (!ch) return ReconcileOutcome::NotFound;
    if (ch->responding) {
        std::cerr << "[reconcile] skip " << topic_id << ": channel started responding\n";
        return ReconcileOutcome::Skipped;
    }

    size_t before = ch->messages.size();
    MergeStats merged = merge_persisted(*ch, std::move(persisted));
    if (stats) ch->token_usage = stats->total_tokens;

    std::cerr << "[reconcile] " << topic_id << ": " << before << " -> "
              << ch->messages.size() << " messages (preserved=" << merged.preserved
              << " folded=" << merged.folded << " appended=" << merged.appended << ")\n";

    ChannelReconciledEvent ev;
    ev.topic_id = topic_id;
    ev.preserved = merged.preserved;
    ev.folded = merged.folded;
    ev.appended = merged.appended;
    bus_.publish(ev);
    publish_channel_updated(bus_, topic_id);
    return ReconcileOutcome::Applied;
}

} // namespace chansync
