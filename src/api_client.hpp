#pragma once
#include "config.hpp"
#include "http.hpp"
#include "model.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace chansync {

// Non-2xx response, transport failure (status 0) or unparseable body.
class ApiError : public std::runtime_error {
public:
    ApiError(long status, const std::string& what)
        : std::runtime_error(what), status_(status) {}
    long status() const { return status_; }

private:
    long status_;
};

// Fields left unset are not sent.
struct SessionUpdate {
    std::optional<std::string> provider_id;
    std::optional<std::string> model;
    std::optional<std::string> model_tier;
    std::optional<std::string> knowledge_set_id;
};

struct EditResult {
    Message message;
    int deleted_count = 0;
    bool regenerate = false;
};

// Name given to topics the client creates on the user's behalf.
constexpr const char* kDefaultTopicName = "New Chat";

// Typed wrapper over the backend REST API. Every call blocks and throws
// ApiError on failure.
class ApiClient {
public:
    ApiClient(HttpClient& http, BackendConfig config);

    std::vector<SessionInfo> list_sessions();

    // nullopt when the backend answers 404.
    std::optional<SessionInfo> session_by_agent(const std::string& agent_id);

    SessionInfo create_session(const std::string& name, const std::string& agent_id = "");
    SessionInfo update_session(const std::string& session_id, const SessionUpdate& update);
    void clear_session_topics(const std::string& session_id);

    TopicInfo create_topic(const std::string& session_id,
                           const std::string& name = kDefaultTopicName);
    TopicInfo update_topic(const std::string& topic_id, const std::string& name);
    void delete_topic(const std::string& topic_id);

    std::vector<Message> get_messages(const std::string& topic_id);
    TokenStats token_stats(const std::string& topic_id);

    EditResult edit_message(const std::string& message_id, const std::string& content,
                            bool truncate_and_regenerate);
    void delete_message(const std::string& message_id);

    const BackendConfig& config() const { return config_; }

private:
    nlohmann::json call(const std::string& method, const std::string& path,
                        const std::string& body = "");
    HttpResponse send(const std::string& method, const std::string& path,
                      const std::string& body);
    std::vector<Header> headers() const;

    HttpClient& http_;
    BackendConfig config_;
};

} // namespace chansync
