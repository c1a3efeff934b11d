#include "websocket.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <chrono>

namespace chansync {

static constexpr char kWebSocketGuid[] = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
static constexpr uint64_t kMaxPayload = 64ull * 1024 * 1024;

static std::string base64(const unsigned char* data, size_t len) {
    std::string out(4 * ((len + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data,
                            static_cast<int>(len));
    out.resize(static_cast<size_t>(n));
    return out;
}

std::string websocket_accept_key(const std::string& client_key) {
    std::string merged = client_key + kWebSocketGuid;
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(merged.data(), merged.size(), digest, &digest_len, EVP_sha1(), nullptr) != 1)
        throw WebSocketError("websocket: SHA-1 digest failed");
    return base64(digest, digest_len);
}

// ── Framing ─────────────────────────────────────────────────────

std::string encode_frame(WsOpcode opcode, const std::string& payload,
                         const uint8_t* mask_key, bool fin) {
    std::string frame;
    frame.reserve(payload.size() + 14);
    frame.push_back(static_cast<char>((fin ? 0x80 : 0x00) | static_cast<uint8_t>(opcode)));

    uint8_t mask_bit = mask_key ? 0x80 : 0x00;
    uint64_t len = payload.size();
    if (len < 126) {
        frame.push_back(static_cast<char>(mask_bit | len));
    } else if (len <= 0xFFFF) {
        frame.push_back(static_cast<char>(mask_bit | 126));
        frame.push_back(static_cast<char>((len >> 8) & 0xFF));
        frame.push_back(static_cast<char>(len & 0xFF));
    } else {
        frame.push_back(static_cast<char>(mask_bit | 127));
        for (int shift = 56; shift >= 0; shift -= 8)
            frame.push_back(static_cast<char>((len >> shift) & 0xFF));
    }

    if (!mask_key) {
        frame += payload;
        return frame;
    }
    frame.append(reinterpret_cast<const char*>(mask_key), 4);
    for (size_t i = 0; i < payload.size(); ++i)
        frame.push_back(static_cast<char>(payload[i] ^ mask_key[i % 4]));
    return frame;
}

size_t decode_frame(const std::string& buf, WsFrame& out) {
    if (buf.size() < 2) return 0;
    auto byte = [&buf](size_t i) { return static_cast<uint8_t>(buf[i]); };

    uint8_t b0 = byte(0);
    uint8_t b1 = byte(1);
    if (b0 & 0x70) throw WebSocketError("websocket: reserved bits set");

    uint8_t op = b0 & 0x0F;
    bool control = (op & 0x08) != 0;
    if (op != 0x0 && op != 0x1 && op != 0x2 && op != 0x8 && op != 0x9 && op != 0xA)
        throw WebSocketError("websocket: unknown opcode " + std::to_string(op));

    size_t pos = 2;
    uint64_t len = b1 & 0x7F;
    if (len == 126) {
        if (buf.size() < pos + 2) return 0;
        len = (static_cast<uint64_t>(byte(2)) << 8) | byte(3);
        pos += 2;
    } else if (len == 127) {
        if (buf.size() < pos + 8) return 0;
        len = 0;
        for (size_t i = 0; i < 8; ++i) len = (len << 8) | byte(2 + i);
        pos += 8;
    }
    if (len > kMaxPayload) throw WebSocketError("websocket: frame too large");

    bool fin = (b0 & 0x80) != 0;
    if (control && (!fin || len > 125))
        throw WebSocketError("websocket: invalid control frame");

    bool masked = (b1 & 0x80) != 0;
    uint8_t mask[4] = {0, 0, 0, 0};
    if (masked) {
        if (buf.size() < pos + 4) return 0;
        for (size_t i = 0; i < 4; ++i) mask[i] = byte(pos + i);
        pos += 4;
    }
    if (buf.size() < pos + len) return 0;

    out.fin = fin;
    out.opcode = static_cast<WsOpcode>(op);
    out.masked = masked;
    out.payload.assign(buf, pos, static_cast<size_t>(len));
    if (masked) {
        for (size_t i = 0; i < out.payload.size(); ++i)
            out.payload[i] = static_cast<char>(out.payload[i] ^ mask[i % 4]);
    }
    return pos + static_cast<size_t>(len);
}

// ── Client ──────────────────────────────────────────────────────

WebSocketClient::~WebSocketClient() {
    shutdown();
}

bool WebSocketClient::connect(const std::string& url_str, long timeout_secs,
                              std::string& error) {
    ParsedUrl url;
    try {
        url = parse_url(url_str);
    } catch (const std::invalid_argument& e) {
        error = e.what();
        return false;
    }

    conn_.set_abort_flag(&abort_);
    if (!conn_.connect(url, timeout_secs)) {
        error = "could not connect to " + url.host + ":" + url.port;
        return false;
    }

    unsigned char nonce[16];
    if (RAND_bytes(nonce, sizeof(nonce)) != 1) {
        error = "websocket: RAND_bytes failed";
        return false;
    }
    std::string key = base64(nonce, sizeof(nonce));

    std::string request;
    request += "GET " + url.path + " HTTP/1.1\r\n";
    request += "Host: " + url.host + ":" + url.port + "\r\n";
    request += "Upgrade: websocket\r\n";
    request += "Connection: Upgrade\r\n";
    request += "Sec-WebSocket-Key: " + key + "\r\n";
    request += "Sec-WebSocket-Version: 13\r\n\r\n";
    if (!conn_.write_all(request.data(), request.size())) {
        error = "websocket: handshake write failed";
        return false;
    }

    ResponseHead head;
    if (!read_response_head(conn_, buffer_, head)) {
        error = "websocket: no handshake response";
        return false;
    }
    if (head.status != 101) {
        error = "websocket: handshake rejected with HTTP " + std::to_string(head.status);
        return false;
    }
    if (head.header("sec-websocket-accept") != websocket_accept_key(key)) {
        error = "websocket: bad Sec-WebSocket-Accept";
        return false;
    }
    // buffer_ may already hold the first frames sent right after the 101.
    return true;
}

bool WebSocketClient::send_frame(WsOpcode opcode, const std::string& payload) {
    uint8_t mask[4];
    if (RAND_bytes(mask, sizeof(mask)) != 1) return false;
    std::string frame = encode_frame(opcode, payload, mask);
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!conn_.is_open()) return false;
    return conn_.write_all(frame.data(), frame.size());
}

bool WebSocketClient::send_text(const std::string& text) {
    return send_frame(WsOpcode::Text, text);
}

bool WebSocketClient::send_close(uint16_t code, const std::string& reason) {
    if (close_sent_.exchange(true)) return true;
    std::string payload;
    payload.push_back(static_cast<char>((code >> 8) & 0xFF));
    payload.push_back(static_cast<char>(code & 0xFF));
    payload += reason.substr(0, 123);
    return send_frame(WsOpcode::Close, payload);
}

WebSocketClient::ReadResult WebSocketClient::handle_frame(WsFrame& frame, std::string& message) {
    switch (frame.opcode) {
        case WsOpcode::Ping:
            send_frame(WsOpcode::Pong, frame.payload);
            return ReadResult::Timeout;
        case WsOpcode::Pong:
            return ReadResult::Timeout;
        case WsOpcode::Close:
            if (frame.payload.size() >= 2) {
                close_code_ = static_cast<uint16_t>(
                    (static_cast<uint8_t>(frame.payload[0]) << 8) |
                    static_cast<uint8_t>(frame.payload[1]));
                close_reason_ = frame.payload.substr(2);
            } else {
                close_code_ = 1005;
            }
            send_close(close_code_ == 1005 ? 1000 : close_code_, "");
            return ReadResult::Closed;
        case WsOpcode::Continuation:
            if (!in_fragment_) throw WebSocketError("websocket: unexpected continuation");
            fragments_ += frame.payload;
            break;
        case WsOpcode::Text:
        case WsOpcode::Binary:
            if (in_fragment_) throw WebSocketError("websocket: interleaved data frame");
            fragments_ = std::move(frame.payload);
            in_fragment_ = true;
            break;
    }
    if (!frame.fin) return ReadResult::Timeout;
    message = std::move(fragments_);
    fragments_.clear();
    in_fragment_ = false;
    return ReadResult::Message;
}

WebSocketClient::ReadResult WebSocketClient::receive(std::string& message, int timeout_ms) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);

    for (;;) {
        try {
            WsFrame frame;
            size_t used = decode_frame(buffer_, frame);
            if (used > 0) {
                buffer_.erase(0, used);
                ReadResult r = handle_frame(frame, message);
                if (r != ReadResult::Timeout) return r;
                continue;
            }
        } catch (const WebSocketError& e) {
            last_error_ = e.what();
            send_close(1002, "protocol error");
            return ReadResult::Error;
        }

        if (abort_.load()) return ReadResult::Closed;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - clock::now()).count();
        if (left <= 0) return ReadResult::Timeout;

        int ready = conn_.wait_readable(static_cast<int>(left));
        if (ready == 0) return ReadResult::Timeout;
        if (ready < 0) {
            last_error_ = "websocket: poll failed";
            return ReadResult::Error;
        }

        // One attempt per lock: a partial TLS record must not stall send_text.
        char buf[8192];
        ssize_t n;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            n = conn_.read_once(buf, sizeof(buf));
        }
        if (n == SocketConnection::kReadWouldBlock) continue;
        if (n == 0) {
            last_error_ = "connection closed by peer";
            return ReadResult::Closed;
        }
        if (n < 0) {
            if (abort_.load()) return ReadResult::Closed;
            last_error_ = "websocket: read failed";
            return ReadResult::Error;
        }
        buffer_.append(buf, static_cast<size_t>(n));
    }
}

void WebSocketClient::shutdown() {
    abort_.store(true);
    conn_.shutdown();
}

} // namespace chansync
