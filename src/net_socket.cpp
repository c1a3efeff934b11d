#include "net_socket.hpp"

#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <sys/select.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cctype>
#include <cstdlib>
#include <cerrno>
#include <stdexcept>

namespace chansync {

#ifdef MSG_NOSIGNAL
static constexpr int kSendFlags = MSG_NOSIGNAL;
#else
static constexpr int kSendFlags = 0;
#endif

// ── URL parsing ────────────────────────────────────────────────

ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result;
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::invalid_argument("net: invalid URL: " + url);

    std::string scheme = url.substr(0, scheme_end);
    if (scheme == "https" || scheme == "wss") {
        result.tls = true;
    } else if (scheme != "http" && scheme != "ws") {
        throw std::invalid_argument("net: unsupported scheme: " + scheme);
    }

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find_first_of("/?", host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);
    if (host_port.empty())
        throw std::invalid_argument("net: URL has no host: " + url);

    if (path_start == std::string::npos) {
        result.path = "/";
    } else if (url[path_start] == '?') {
        result.path = "/" + url.substr(path_start);
    } else {
        result.path = url.substr(path_start);
    }

    size_t colon = host_port.rfind(':');
    if (colon != std::string::npos && host_port.find(']') == std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    return result;
}

// ── SocketConnection ───────────────────────────────────────────

SocketConnection::~SocketConnection() {
    if (ssl_) { SSL_shutdown(ssl_); SSL_free(ssl_); }
    if (ctx_) SSL_CTX_free(ctx_);
    if (fd_ >= 0) ::close(fd_);
}

bool SocketConnection::aborted() const {
    return abort_ && abort_->load(std::memory_order_relaxed);
}

void SocketConnection::set_socket_timeout(long secs) {
    struct timeval tv{secs, 0};
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

bool SocketConnection::connect(const ParsedUrl& url, long timeout_secs) {
    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res) != 0)
        return false;

    bool connected = false;
    for (auto* ai = res; ai && !connected && !aborted(); ai = ai->ai_next) {
        fd_ = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd_ < 0) continue;

        // Non-blocking connect, waited on in 1-second slices so an abort
        // request is noticed while the peer is unreachable.
        int flags = fcntl(fd_, F_GETFL, 0);
        fcntl(fd_, F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(fd_, ai->ai_addr, ai->ai_addrlen);
        if (rc == 0) {
            connected = true;
        } else if (errno == EINPROGRESS) {
            for (long waited = 0; waited < timeout_secs && !aborted(); ++waited) {
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd_, &wset);
                struct timeval tv{1, 0};
                rc = select(fd_ + 1, nullptr, &wset, nullptr, &tv);
                if (rc == 0) continue;
                if (rc > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &elen);
                    connected = (err == 0);
                }
                break;
            }
        }
        if (connected) {
            fcntl(fd_, F_SETFL, flags);
        } else {
            ::close(fd_);
            fd_ = -1;
        }
    }
    freeaddrinfo(res);
    if (!connected) return false;

    if (url.tls) {
        set_socket_timeout(timeout_secs);

        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) return false;
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx_);
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

        ssl_ = SSL_new(ctx_);
        if (!ssl_) return false;
        SSL_set_fd(ssl_, fd_);
        SSL_set_tlsext_host_name(ssl_, url.host.c_str()); // SNI

        if (SSL_connect(ssl_) != 1) {
            ERR_clear_error();
            return false;
        }
    }

    // 1-second slices for body I/O so the abort flag is polled.
    set_socket_timeout(1);
    return true;
}

ssize_t SocketConnection::read_once(char* buf, size_t len) {
    if (aborted()) return -1;

    ssize_t n;
    if (ssl_) {
        n = SSL_read(ssl_, buf, static_cast<int>(len));
        if (n > 0) return n;
        int err = SSL_get_error(ssl_, static_cast<int>(n));
        if (err == SSL_ERROR_ZERO_RETURN) return 0;
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
            return kReadWouldBlock;
        if (err == SSL_ERROR_SYSCALL &&
            (errno == EAGAIN || errno == EWOULDBLOCK))
            return kReadWouldBlock; // 1-second slice expired
        return n == 0 ? 0 : -1;
    }
    n = ::recv(fd_, buf, len, 0);
    if (n >= 0) return n;
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return kReadWouldBlock;
    return -1;
}

ssize_t SocketConnection::read_some(char* buf, size_t len) {
    while (true) {
        ssize_t n = read_once(buf, len);
        if (n != kReadWouldBlock) return n;
    }
}

bool SocketConnection::write_all(const char* buf, size_t len) {
    while (len > 0) {
        if (aborted()) return false;
        ssize_t n;
        if (ssl_) {
            n = SSL_write(ssl_, buf, static_cast<int>(len));
            if (n <= 0) {
                int err = SSL_get_error(ssl_, static_cast<int>(n));
                if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                    continue;
                return false;
            }
        } else {
            n = ::send(fd_, buf, len, kSendFlags);
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                return false;
            }
        }
        buf += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

int SocketConnection::wait_readable(int timeout_ms) {
    if (fd_ < 0) return -1;
    if (ssl_ && SSL_pending(ssl_) > 0) return 1;
    struct pollfd pfd{fd_, POLLIN, 0};
    int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc < 0) return errno == EINTR ? 0 : -1;
    if (rc == 0) return 0;
    if (pfd.revents & (POLLERR | POLLNVAL)) return -1;
    return 1;
}

void SocketConnection::shutdown() {
    if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
}

// ── Response head parsing ──────────────────────────────────────

std::string ResponseHead::header(const std::string& lower_name) const {
    for (const auto& h : headers) {
        if (h.first == lower_name) return h.second;
    }
    return {};
}

std::string read_line(SocketConnection& conn, std::string& leftover) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            std::string line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }
        char buf[4096];
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) return "";
        leftover.append(buf, static_cast<size_t>(n));
    }
}

static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool read_response_head(SocketConnection& conn, std::string& leftover, ResponseHead& head) {
    head = ResponseHead{};

    // "HTTP/1.1 200 OK": extract the three-digit code
    std::string status_line = read_line(conn, leftover);
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos || status_line.size() < sp1 + 4) return false;
    long status = 0;
    for (size_t i = sp1 + 1; i < sp1 + 4; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(status_line[i]))) return false;
        status = status * 10 + (status_line[i] - '0');
    }
    head.status = status;

    while (true) {
        std::string line = read_line(conn, leftover);
        if (line.empty()) break; // blank line: end of headers

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name = to_lower(line.substr(0, colon));
        std::string value = line.substr(colon + 1);
        while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
            value.erase(0, 1);

        if (name == "transfer-encoding") {
            head.chunked = to_lower(value).find("chunked") != std::string::npos;
        } else if (name == "content-length") {
            head.content_length = static_cast<size_t>(std::strtoull(value.c_str(), nullptr, 10));
        }
        head.headers.emplace_back(std::move(name), std::move(value));
    }
    return true;
}

} // namespace chansync
