#include "api_client.hpp"
#include "util.hpp"

#include <iostream>

namespace chansync {

static const char* const kApiPrefix = "/xyzen/api/v1";

ApiClient::ApiClient(HttpClient& http, BackendConfig config)
    : http_(http), config_(std::move(config)) {
    while (!config_.url.empty() && config_.url.back() == '/') config_.url.pop_back();
}

std::vector<Header> ApiClient::headers() const {
    std::vector<Header> h = {{"Content-Type", "application/json"},
                             {"Accept", "application/json"}};
    if (!config_.token.empty())
        h.emplace_back("Authorization", "Bearer " + config_.token);
    return h;
}

HttpResponse ApiClient::send(const std::string& method, const std::string& path,
                             const std::string& body) {
    std::string url = config_.url + kApiPrefix + path;
    HttpResponse resp = http_.request(method, url, body, headers(), config_.request_timeout);
    if (resp.status_code == 0)
        throw ApiError(0, method + " " + path + ": no response from backend");
    return resp;
}

nlohmann::json ApiClient::call(const std::string& method, const std::string& path,
                               const std::string& body) {
    HttpResponse resp = send(method, path, body);
    if (resp.status_code < 200 || resp.status_code >= 300) {
        throw ApiError(resp.status_code, method + " " + path + " failed (HTTP " +
                       std::to_string(resp.status_code) + "): " + resp.body);
    }
    if (resp.body.empty()) return nullptr;
    try {
        return nlohmann::json::parse(resp.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw ApiError(resp.status_code, method + " " + path +
                       ": invalid JSON response: " + e.what());
    }
}

// ── Sessions ────────────────────────────────────────────────────

std::vector<SessionInfo> ApiClient::list_sessions() {
    auto j = call("GET", "/sessions/");
    std::vector<SessionInfo> sessions;
    if (!j.is_array()) return sessions;
    for (const auto& s : j) {
        if (s.is_object()) sessions.push_back(session_from_json(s));
    }
    return sessions;
}

std::optional<SessionInfo> ApiClient::session_by_agent(const std::string& agent_id) {
    std::string path = "/sessions/by-agent/" + url_encode(agent_id);
    HttpResponse resp = send("GET", path, "");
    if (resp.status_code == 404) return std::nullopt;
    if (resp.status_code < 200 || resp.status_code >= 300) {
        throw ApiError(resp.status_code, "GET " + path + " failed (HTTP " +
                       std::to_string(resp.status_code) + ")");
    }
    try {
        auto j = nlohmann::json::parse(resp.body);
        if (!j.is_object()) return std::nullopt;
        return session_from_json(j);
    } catch (const nlohmann::json::parse_error& e) {
        throw ApiError(resp.status_code, "GET " + path + ": invalid JSON response: " + e.what());
    }
}

SessionInfo ApiClient::create_session(const std::string& name, const std::string& agent_id) {
    nlohmann::json body = {{"name", name}};
    if (!agent_id.empty()) body["agent_id"] = agent_id;
    auto j = call("POST", "/sessions/", body.dump());
    if (!j.is_object()) throw ApiError(200, "POST /sessions/: expected a session object");
    return session_from_json(j);
}

SessionInfo ApiClient::update_session(const std::string& session_id,
                                      const SessionUpdate& update) {
    nlohmann::json body = nlohmann::json::object();
    if (update.provider_id) body["provider_id"] = *update.provider_id;
    if (update.model) body["model"] = *update.model;
    if (update.model_tier) body["model_tier"] = *update.model_tier;
    if (update.knowledge_set_id) body["knowledge_set_id"] = *update.knowledge_set_id;
    auto j = call("PATCH", "/sessions/" + session_id, body.dump());
    if (!j.is_object()) {
        SessionInfo s;
        s.id = session_id;
        return s;
    }
    return session_from_json(j);
}

void ApiClient::clear_session_topics(const std::string& session_id) {
    call("DELETE", "/sessions/" + session_id + "/topics");
}

// ── Topics ──────────────────────────────────────────────────────

TopicInfo ApiClient::create_topic(const std::string& session_id, const std::string& name) {
    nlohmann::json body = {{"name", name}, {"session_id", session_id}};
    auto j = call("POST", "/topics/", body.dump());
    if (!j.is_object()) throw ApiError(200, "POST /topics/: expected a topic object");
    TopicInfo t = topic_from_json(j);
    if (t.session_id.empty()) t.session_id = session_id;
    return t;
}

TopicInfo ApiClient::update_topic(const std::string& topic_id, const std::string& name) {
    nlohmann::json body = {{"name", name}};
    auto j = call("PATCH", "/topics/" + topic_id, body.dump());
    TopicInfo t;
    if (j.is_object()) t = topic_from_json(j);
    if (t.id.empty()) t.id = topic_id;
    if (t.name.empty()) t.name = name;
    return t;
}

void ApiClient::delete_topic(const std::string& topic_id) {
    call("DELETE", "/topics/" + topic_id);
}

std::vector<Message> ApiClient::get_messages(const std::string& topic_id) {
    auto j = call("GET", "/topics/" + topic_id + "/messages");
    std::vector<Message> messages;
    if (!j.is_array()) {
        std::cerr << "[api] unexpected messages payload for topic " << topic_id << "\n";
        return messages;
    }
    messages.reserve(j.size());
    for (const auto& m : j) {
        if (m.is_object()) messages.push_back(message_from_json(m));
    }
    return messages;
}

TokenStats ApiClient::token_stats(const std::string& topic_id) {
    auto j = call("GET", "/topics/" + topic_id + "/token-stats");
    if (!j.is_object()) return {};
    return token_stats_from_json(j);
}

// ── Messages ────────────────────────────────────────────────────

EditResult ApiClient::edit_message(const std::string& message_id, const std::string& content,
                                   bool truncate_and_regenerate) {
    nlohmann::json body = {{"content", content},
                           {"truncate_and_regenerate", truncate_and_regenerate}};
    auto j = call("PATCH", "/messages/" + message_id, body.dump());
    if (!j.is_object() || !j.contains("message") || !j["message"].is_object())
        throw ApiError(200, "PATCH /messages/: expected {message, ...}");

    EditResult r;
    r.message = message_from_json(j["message"]);
    if (j.contains("deleted_count") && j["deleted_count"].is_number_integer())
        r.deleted_count = j["deleted_count"].get<int>();
    r.regenerate = j.contains("regenerate") && j["regenerate"].is_boolean() &&
                   j["regenerate"].get<bool>();
    return r;
}

void ApiClient::delete_message(const std::string& message_id) {
    call("DELETE", "/messages/" + message_id);
}

} // namespace chansync
