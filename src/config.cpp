#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace chansync {

nlohmann::json Config::defaults_json() {
    return {
        {"backend", {
            {"url", "http://localhost:48196"},
            {"ws_url", ""},
            {"token", ""},
            {"request_timeout", 30}
        }},
        {"sync", {
            {"stale_timeout_ms", 60000},
            {"stale_check_interval_ms", 15000},
            {"abort_timeout_ms", 10000},
            {"connect_timeout_ms", 5000},
            {"connect_poll_ms", 100},
            {"frame_interval_ms", 16}
        }},
        {"transport", {
            {"heartbeat_timeout_ms", 45000},
            {"max_retries", 5},
            {"retry_base_ms", 1000},
            {"retry_max_ms", 10000},
            {"connect_timeout_s", 10}
        }},
        {"default_agent", ""}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_u32(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (obj.contains(key) && obj[key].is_number_unsigned())
        out = obj[key].get<uint32_t>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("backend") && j["backend"].is_object()) {
        auto& b = j["backend"];
        if (b.contains("url") && b["url"].is_string())
            cfg.backend.url = b["url"].get<std::string>();
        if (b.contains("ws_url") && b["ws_url"].is_string())
            cfg.backend.ws_url = b["ws_url"].get<std::string>();
        if (b.contains("token") && b["token"].is_string())
            cfg.backend.token = b["token"].get<std::string>();
        if (b.contains("request_timeout") && b["request_timeout"].is_number_unsigned())
            cfg.backend.request_timeout = b["request_timeout"].get<long>();
    }

    if (j.contains("sync") && j["sync"].is_object()) {
        auto& s = j["sync"];
        read_u32(s, "stale_timeout_ms", cfg.sync.stale_timeout_ms);
        read_u32(s, "stale_check_interval_ms", cfg.sync.stale_check_interval_ms);
        read_u32(s, "abort_timeout_ms", cfg.sync.abort_timeout_ms);
        read_u32(s, "connect_timeout_ms", cfg.sync.connect_timeout_ms);
        read_u32(s, "connect_poll_ms", cfg.sync.connect_poll_ms);
        read_u32(s, "frame_interval_ms", cfg.sync.frame_interval_ms);
    }

    if (j.contains("transport") && j["transport"].is_object()) {
        auto& t = j["transport"];
        read_u32(t, "heartbeat_timeout_ms", cfg.transport.heartbeat_timeout_ms);
        read_u32(t, "max_retries", cfg.transport.max_retries);
        read_u32(t, "retry_base_ms", cfg.transport.retry_base_ms);
        read_u32(t, "retry_max_ms", cfg.transport.retry_max_ms);
        if (t.contains("connect_timeout_s") && t["connect_timeout_s"].is_number_unsigned())
            cfg.transport.connect_timeout_s = t["connect_timeout_s"].get<long>();
    }

    if (j.contains("default_agent") && j["default_agent"].is_string())
        cfg.default_agent = j["default_agent"].get<std::string>();

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.chansync/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n"))
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("CHANSYNC_BACKEND_URL"))
        cfg.backend.url = v;
    if (const char* v = std::getenv("CHANSYNC_WS_URL"))
        cfg.backend.ws_url = v;
    if (const char* v = std::getenv("CHANSYNC_TOKEN"))
        cfg.backend.token = v;

    return cfg;
}

std::string Config::ws_base() const {
    std::string base = backend.ws_url.empty() ? backend.url : backend.ws_url;
    if (base.rfind("https://", 0) == 0) base = "wss://" + base.substr(8);
    else if (base.rfind("http://", 0) == 0) base = "ws://" + base.substr(7);
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base;
}

} // namespace chansync
