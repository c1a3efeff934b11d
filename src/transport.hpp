#pragma once
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace chansync {

struct TransportStatus {
    bool connected = false;
    std::string error;   // empty while retrying or on a clean close
};

// All callbacks run on the event loop thread.
struct TransportCallbacks {
    std::function<void(const nlohmann::json&)> on_message;
    std::function<void(const TransportStatus&)> on_status;
    std::function<void()> on_reconnect;   // a reconnect attempt succeeded
};

// One persistent bidirectional connection for a topic. Failures are reported
// through on_status and send() returning false, never thrown.
class Transport {
public:
    virtual ~Transport() = default;

    virtual void open(TransportCallbacks callbacks) = 0;

    // Replace the callback set without reopening.
    virtual void bind(TransportCallbacks callbacks) = 0;

    virtual bool send(const nlohmann::json& payload) = 0;

    // Idempotent. No callback fires after close() returns.
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>(
    const std::string& session_id, const std::string& topic_id)>;

} // namespace chansync
