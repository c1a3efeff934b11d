#pragma once
#include "net_socket.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>

namespace chansync {

// RFC 6455 client over SocketConnection.

class WebSocketError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class WsOpcode : uint8_t {
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA
};

struct WsFrame {
    bool fin = true;
    WsOpcode opcode = WsOpcode::Text;
    bool masked = false;
    std::string payload; // unmasked
};

// Serializes one frame. A null mask_key produces an unmasked (server-side)
// frame; clients always pass a key.
std::string encode_frame(WsOpcode opcode, const std::string& payload,
                         const uint8_t* mask_key = nullptr, bool fin = true);

// Decodes the frame at the front of buf. Returns the bytes consumed, or 0
// when buf does not yet hold a whole frame. Throws WebSocketError on
// protocol violations.
size_t decode_frame(const std::string& buf, WsFrame& out);

// base64(SHA-1(client_key + RFC 6455 GUID))
std::string websocket_accept_key(const std::string& client_key);

class WebSocketClient {
public:
    enum class ReadResult { Message, Timeout, Closed, Error };

    WebSocketClient() = default;
    ~WebSocketClient();
    WebSocketClient(const WebSocketClient&) = delete;
    WebSocketClient& operator=(const WebSocketClient&) = delete;

    // Opening handshake. On failure returns false and fills error.
    bool connect(const std::string& url, long timeout_secs, std::string& error);

    // Thread-safe against a concurrent receive().
    bool send_text(const std::string& text);
    bool send_close(uint16_t code, const std::string& reason);

    // Waits up to timeout_ms for one complete data message. Pings are
    // answered, pongs dropped, fragments reassembled.
    ReadResult receive(std::string& message, int timeout_ms);

    // Unblocks receive() from another thread and fails further I/O.
    void shutdown();

    uint16_t close_code() const { return close_code_; }
    const std::string& close_reason() const { return close_reason_; }
    const std::string& last_error() const { return last_error_; }

private:
    bool send_frame(WsOpcode opcode, const std::string& payload);
    ReadResult handle_frame(WsFrame& frame, std::string& message);

    SocketConnection conn_;
    std::mutex io_mutex_;
    std::atomic<bool> abort_{false};
    std::string buffer_;
    std::string fragments_;
    bool in_fragment_ = false;
    std::atomic<bool> close_sent_{false};
    uint16_t close_code_ = 0;
    std::string close_reason_;
    std::string last_error_;
};

} // namespace chansync
