#pragma once
#include "model.hpp"
#include <string>
#include <vector>
#include <unordered_map>

namespace chansync {

// Topic id -> Channel. References returned by ensure()/find() stay valid
// until the topic is erased.
class ChannelStore {
public:
    // Return the existing channel or create an empty one for the topic.
    Channel& ensure(const std::string& topic_id, const std::string& session_id);

    Channel* find(const std::string& topic_id);
    const Channel* find(const std::string& topic_id) const;

    bool contains(const std::string& topic_id) const;

    // Returns true if the topic existed.
    bool erase(const std::string& topic_id);

    std::vector<std::string> topic_ids() const;
    std::vector<std::string> topics_for_session(const std::string& session_id) const;
    size_t size() const { return channels_.size(); }

    const std::string& active_topic() const { return active_topic_; }
    void set_active_topic(const std::string& topic_id) { active_topic_ = topic_id; }

private:
    std::unordered_map<std::string, Channel> channels_;
    std::string active_topic_;
};

} // namespace chansync
