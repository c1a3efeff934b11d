#include "channel_store.hpp"
#include <algorithm>

namespace chansync {

Channel& ChannelStore::ensure(const std::string& topic_id, const std::string& session_id) {
    auto it = channels_.find(topic_id);
    if (it != channels_.end()) return it->second;
    Channel& ch = channels_[topic_id];
    ch.id = topic_id;
    ch.session_id = session_id;
    return ch;
}

Channel* ChannelStore::find(const std::string& topic_id) {
    auto it = channels_.find(topic_id);
    return it == channels_.end() ? nullptr : &it->second;
}

const Channel* ChannelStore::find(const std::string& topic_id) const {
    auto it = channels_.find(topic_id);
    return it == channels_.end() ? nullptr : &it->second;
}

bool ChannelStore::contains(const std::string& topic_id) const {
    return channels_.count(topic_id) > 0;
}

bool ChannelStore::erase(const std::string& topic_id) {
    if (active_topic_ == topic_id) active_topic_.clear();
    return channels_.erase(topic_id) > 0;
}

std::vector<std::string> ChannelStore::topic_ids() const {
    std::vector<std::string> ids;
    ids.reserve(channels_.size());
    for (const auto& [id, ch] : channels_) ids.push_back(id);
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<std::string> ChannelStore::topics_for_session(const std::string& session_id) const {
    std::vector<std::string> ids;
    for (const auto& [id, ch] : channels_) {
        if (ch.session_id == session_id) ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace chansync
