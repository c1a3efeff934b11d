#pragma once
#include "config.hpp"
#include "event_loop.hpp"
#include "transport.hpp"
#include "websocket.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace chansync {

// Transport over a WebSocket to the chat backend. A worker thread owns the
// blocking reads and hands every frame to the event loop; all state below is
// touched only on the loop thread.
//
// Drops reconnect with backoff min(base * 2^n, max) up to max_retries. A
// connection that stays silent for heartbeat_timeout_ms is closed with code
// 4001 and takes the same path. Application-level {"type":"ping"} frames are
// answered with a pong and not forwarded.
class BackendConnection : public Transport {
public:
    BackendConnection(EventLoop& loop, std::string url, TransportConfig config);
    ~BackendConnection() override;

    void open(TransportCallbacks callbacks) override;
    void bind(TransportCallbacks callbacks) override;
    bool send(const nlohmann::json& payload) override;
    void close() override;
    bool is_open() const override { return state_ == State::Open; }

    static int64_t backoff_delay_ms(uint32_t attempt, uint32_t base_ms, uint32_t max_ms);

private:
    enum class State { Idle, Connecting, Open, Retrying, Closed };

    void start_attempt();
    void stop_worker();
    void post_from_worker(uint64_t generation, std::function<void()> fn);

    void on_opened();
    void on_frame(const std::string& text);
    void on_dropped(const std::string& close_reason, const std::string& detail);
    void schedule_retry(const std::string& close_reason);
    void check_heartbeat();
    void report(bool connected, const std::string& error);

    EventLoop& loop_;
    std::string url_;
    TransportConfig config_;
    TransportCallbacks callbacks_;

    State state_ = State::Idle;
    uint32_t retries_ = 0;
    bool was_disconnected_ = false;
    int64_t last_frame_ms_ = 0;
    EventLoop::TimerId heartbeat_timer_ = 0;
    EventLoop::TimerId retry_timer_ = 0;
    uint64_t generation_ = 0;

    std::thread worker_;
    std::mutex ws_mutex_;
    std::shared_ptr<WebSocketClient> ws_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

// {ws_base}/xyzen/ws/v1/chat/sessions/{session}/topics/{topic}?token={token}
std::string backend_ws_url(const Config& config, const std::string& session_id,
                           const std::string& topic_id);

TransportFactory make_backend_transport_factory(EventLoop& loop, const Config& config);

} // namespace chansync
