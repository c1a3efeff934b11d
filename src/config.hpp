#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace chansync {

struct BackendConfig {
    std::string url = "http://localhost:48196";
    std::string ws_url;     // empty = derived from url (http -> ws)
    std::string token;
    long request_timeout = 30; // seconds
};

struct SyncConfig {
    uint32_t stale_timeout_ms = 60000;
    uint32_t stale_check_interval_ms = 15000;
    uint32_t abort_timeout_ms = 10000;
    uint32_t connect_timeout_ms = 5000;
    uint32_t connect_poll_ms = 100;
    uint32_t frame_interval_ms = 16;
};

struct TransportConfig {
    uint32_t heartbeat_timeout_ms = 45000;
    uint32_t max_retries = 5;
    uint32_t retry_base_ms = 1000;
    uint32_t retry_max_ms = 10000;
    long connect_timeout_s = 10;
};

struct Config {
    BackendConfig backend;
    SyncConfig sync;
    TransportConfig transport;
    std::string default_agent;

    // Load from ~/.chansync/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a (defaults-merged) JSON document into a Config
    static Config from_json(const nlohmann::json& j);

    // WebSocket base URL: ws_url if set, otherwise url with http(s) -> ws(s)
    std::string ws_base() const;
};

} // namespace chansync
