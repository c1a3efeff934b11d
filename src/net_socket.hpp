#pragma once
#include "http.hpp"

#include <openssl/ssl.h>
#include <sys/types.h>

#include <atomic>
#include <string>
#include <vector>

namespace chansync {

struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

// Accepts http, https, ws and wss. Throws std::invalid_argument otherwise.
ParsedUrl parse_url(const std::string& url);

// ── RAII connection (TCP + optional TLS) ──────────────────────

class SocketConnection {
public:
    SocketConnection() = default;
    ~SocketConnection();
    SocketConnection(const SocketConnection&) = delete;
    SocketConnection& operator=(const SocketConnection&) = delete;

    // Checked between 1-second I/O slices; a raised flag fails the call.
    void set_abort_flag(const std::atomic<bool>* flag) { abort_ = flag; }

    bool connect(const ParsedUrl& url, long timeout_secs);

    // >0 on data, 0 on EOF, -1 on unrecoverable error or abort.
    ssize_t read_some(char* buf, size_t len);

    // One read attempt. Like read_some, but returns kReadWouldBlock instead of
    // retrying when no application data is ready yet (partial TLS record,
    // expired 1-second slice).
    static constexpr ssize_t kReadWouldBlock = -2;
    ssize_t read_once(char* buf, size_t len);
    bool write_all(const char* buf, size_t len);

    // 1 when data can be read without blocking, 0 on timeout, -1 on error.
    int wait_readable(int timeout_ms);

    // Unblocks a reader on another thread; the fd stays owned until destruction.
    void shutdown();

    bool is_open() const { return fd_ >= 0; }

private:
    bool aborted() const;
    void set_socket_timeout(long secs);

    int      fd_  = -1;
    SSL_CTX* ctx_ = nullptr;
    SSL*     ssl_ = nullptr;
    const std::atomic<bool>* abort_ = nullptr;
};

// ── HTTP/1.1 response head ────────────────────────────────────

struct ResponseHead {
    long status = 0;
    std::vector<Header> headers; // names lower-cased
    bool chunked = false;
    size_t content_length = 0;

    std::string header(const std::string& lower_name) const;
};

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
std::string read_line(SocketConnection& conn, std::string& leftover);

// Parse status line + headers. Returns false when no status line arrived.
bool read_response_head(SocketConnection& conn, std::string& leftover, ResponseHead& head);

} // namespace chansync
