#include "backend_connection.hpp"
#include "protocol.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>

namespace chansync {

static constexpr uint16_t kHeartbeatCloseCode = 4001;
static constexpr const char* kGiveUpMessage = "Connection closed. Please refresh the page.";

BackendConnection::BackendConnection(EventLoop& loop, std::string url, TransportConfig config)
    : loop_(loop), url_(std::move(url)), config_(config) {}

BackendConnection::~BackendConnection() {
    close();
}

int64_t BackendConnection::backoff_delay_ms(uint32_t attempt, uint32_t base_ms, uint32_t max_ms) {
    int64_t delay = base_ms;
    for (uint32_t i = 0; i < attempt && delay < max_ms; ++i) delay *= 2;
    return std::min<int64_t>(delay, max_ms);
}

void BackendConnection::open(TransportCallbacks callbacks) {
    callbacks_ = std::move(callbacks);
    if (state_ != State::Idle) return;
    state_ = State::Connecting;
    start_attempt();
}

void BackendConnection::bind(TransportCallbacks callbacks) {
    callbacks_ = std::move(callbacks);
}

bool BackendConnection::send(const nlohmann::json& payload) {
    if (state_ != State::Open) return false;
    std::string text;
    try {
        text = payload.dump();
    } catch (const nlohmann::json::type_error& e) {
        std::cerr << "[connection] cannot serialize payload: " << e.what() << "\n";
        return false;
    }
    std::lock_guard<std::mutex> lock(ws_mutex_);
    return ws_ && ws_->send_text(text);
}

void BackendConnection::close() {
    if (state_ == State::Closed && !worker_.joinable()) return;
    state_ = State::Closed;
    callbacks_ = TransportCallbacks{};
    if (heartbeat_timer_) loop_.cancel(heartbeat_timer_);
    if (retry_timer_) loop_.cancel(retry_timer_);
    heartbeat_timer_ = retry_timer_ = 0;
    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        if (ws_) ws_->send_close(1000, "client closing");
    }
    stop_worker();
}

void BackendConnection::post_from_worker(uint64_t generation, std::function<void()> fn) {
    std::weak_ptr<bool> alive = alive_;
    loop_.post([this, alive, generation, fn = std::move(fn)] {
        if (alive.expired() || generation != generation_) return;
        fn();
    });
}

void BackendConnection::start_attempt() {
    retry_timer_ = 0;
    stop_worker();
    uint64_t generation = ++generation_;

    auto ws = std::make_shared<WebSocketClient>();
    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        ws_ = ws;
    }

    worker_ = std::thread([this, ws, generation] {
        std::string error;
        if (!ws->connect(url_, config_.connect_timeout_s, error)) {
            post_from_worker(generation, [this, error] { on_dropped("", error); });
            return;
        }
        post_from_worker(generation, [this] { on_opened(); });

        std::string text;
        for (;;) {
            auto result = ws->receive(text, 1000);
            if (result == WebSocketClient::ReadResult::Timeout) continue;
            if (result == WebSocketClient::ReadResult::Message) {
                post_from_worker(generation, [this, text] { on_frame(text); });
                continue;
            }
            std::string reason = ws->close_reason();
            std::string detail = result == WebSocketClient::ReadResult::Closed
                ? "closed with code " + std::to_string(ws->close_code())
                : ws->last_error();
            post_from_worker(generation, [this, reason, detail] { on_dropped(reason, detail); });
            return;
        }
    });
}

void BackendConnection::stop_worker() {
    std::shared_ptr<WebSocketClient> ws;
    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        ws.swap(ws_);
    }
    if (ws) ws->shutdown();
    if (worker_.joinable()) worker_.join();
    ++generation_;
}

void BackendConnection::report(bool connected, const std::string& error) {
    if (callbacks_.on_status) callbacks_.on_status(TransportStatus{connected, error});
}

void BackendConnection::on_opened() {
    state_ = State::Open;
    retries_ = 0;
    last_frame_ms_ = loop_.now();
    int64_t check_ms = std::max<int64_t>(1000, std::min<int64_t>(config_.heartbeat_timeout_ms / 3, 5000));
    heartbeat_timer_ = loop_.call_every(check_ms, [this] { check_heartbeat(); });

    report(true, "");
    if (was_disconnected_) {
        was_disconnected_ = false;
        std::cerr << "[connection] reconnected\n";
        if (callbacks_.on_reconnect) callbacks_.on_reconnect();
    }
}

void BackendConnection::on_frame(const std::string& text) {
    last_frame_ms_ = loop_.now();

    nlohmann::json frame;
    try {
        frame = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[connection] dropping malformed frame: " << e.what() << "\n";
        return;
    }

    if (frame.is_object() && frame.contains("type") && frame["type"] == "ping") {
        send(make_pong());
        return;
    }
    if (callbacks_.on_message) callbacks_.on_message(frame);
}

void BackendConnection::check_heartbeat() {
    if (state_ != State::Open) return;
    int64_t silent = loop_.now() - last_frame_ms_;
    if (silent <= static_cast<int64_t>(config_.heartbeat_timeout_ms)) return;

    std::cerr << "[connection] no frame for " << silent << " ms, closing\n";
    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        if (ws_) ws_->send_close(kHeartbeatCloseCode, "heartbeat timeout");
    }
    on_dropped("", "heartbeat timeout");
}

void BackendConnection::on_dropped(const std::string& close_reason, const std::string& detail) {
    if (state_ == State::Closed) return;
    if (heartbeat_timer_) loop_.cancel(heartbeat_timer_);
    heartbeat_timer_ = 0;
    stop_worker();

    bool was_open = state_ == State::Open;
    state_ = State::Retrying;
    std::cerr << "[connection] " << (was_open ? "lost" : "connect failed")
              << (detail.empty() ? "" : ": " + detail) << "\n";
    if (was_open) {
        was_disconnected_ = true;
        report(false, "");
    }
    schedule_retry(close_reason);
}

void BackendConnection::schedule_retry(const std::string& close_reason) {
    if (retries_ >= config_.max_retries) {
        state_ = State::Closed;
        std::cerr << "[connection] giving up after " << retries_ << " retries\n";
        report(false, close_reason.empty() ? kGiveUpMessage : close_reason);
        return;
    }
    int64_t delay = backoff_delay_ms(retries_, config_.retry_base_ms, config_.retry_max_ms);
    ++retries_;
    std::cerr << "[connection] reconnecting in " << delay << " ms (attempt "
              << retries_ << "/" << config_.max_retries << ")\n";
    retry_timer_ = loop_.call_after(delay, [this] { start_attempt(); });
}

std::string backend_ws_url(const Config& config, const std::string& session_id,
                           const std::string& topic_id) {
    return config.ws_base() + "/xyzen/ws/v1/chat/sessions/" + url_encode(session_id) +
           "/topics/" + url_encode(topic_id) + "?token=" + url_encode(config.backend.token);
}

TransportFactory make_backend_transport_factory(EventLoop& loop, const Config& config) {
    return [&loop, config](const std::string& session_id,
                           const std::string& topic_id) -> std::unique_ptr<Transport> {
        return std::make_unique<BackendConnection>(
            loop, backend_ws_url(config, session_id, topic_id), config.transport);
    };
}

} // namespace chansync
