// Linux HTTP/HTTPS client over SocketConnection (POSIX sockets + OpenSSL).
// http_init/cleanup are no-ops: OpenSSL 1.1+ initialises itself.
#ifdef __linux__

#include "http.hpp"
#include "net_socket.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace chansync {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void http_init() {}
void http_cleanup() {}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

static std::string build_request(const std::string& method,
                                 const ParsedUrl& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += method + " " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";

    bool has_content_length = false;
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
        if (h.first == "Content-Length") has_content_length = true;
    }
    if (!has_content_length && (!body.empty() || method == "POST" || method == "PATCH"))
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// Read exactly n bytes, consuming leftover first.
static bool read_exactly(SocketConnection& conn, std::string& leftover,
                         size_t n, std::string& out) {
    while (n > 0) {
        if (!leftover.empty()) {
            size_t take = std::min(n, leftover.size());
            out.append(leftover, 0, take);
            leftover.erase(0, take);
            n -= take;
            continue;
        }
        char buf[4096];
        ssize_t got = conn.read_some(buf, std::min(n, sizeof(buf)));
        if (got <= 0) return false;
        out.append(buf, static_cast<size_t>(got));
        n -= static_cast<size_t>(got);
    }
    return true;
}

// Accumulate full body (chunked, content-length, or read-to-close).
static std::string read_body(SocketConnection& conn, std::string& leftover,
                             const ResponseHead& head) {
    std::string body;
    if (head.chunked) {
        for (;;) {
            std::string size_line = read_line(conn, leftover);
            if (size_line.empty()) break;
            // Chunk size is hex, may have extensions after ';'
            size_t chunk_size = std::strtoul(size_line.c_str(), nullptr, 16);
            if (chunk_size == 0) break;
            if (!read_exactly(conn, leftover, chunk_size, body)) break;
            std::string crlf;
            if (!read_exactly(conn, leftover, 2, crlf)) break;
        }
    } else if (head.content_length > 0) {
        read_exactly(conn, leftover, head.content_length, body);
    } else {
        body += leftover;
        leftover.clear();
        char buf[4096];
        for (;;) {
            ssize_t n = conn.read_some(buf, sizeof(buf));
            if (n <= 0) break;
            body.append(buf, static_cast<size_t>(n));
        }
    }
    return body;
}

HttpResponse http_request(const std::string& method,
                          const std::string& url_str,
                          const std::string& body,
                          const std::vector<Header>& headers,
                          long timeout_seconds) {
    ParsedUrl url;
    try {
        url = parse_url(url_str);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[http] " << e.what() << "\n";
        return {};
    }

    SocketConnection conn;
    conn.set_abort_flag(g_socket_abort_flag);
    if (!conn.connect(url, timeout_seconds)) return {};

    std::string request = build_request(method, url, body, headers);
    if (!conn.write_all(request.c_str(), request.size())) return {};

    std::string leftover;
    ResponseHead head;
    if (!read_response_head(conn, leftover, head)) return {};

    HttpResponse resp;
    resp.status_code = head.status;
    if (method != "HEAD" && head.status != 204 && head.status != 304)
        resp.body = read_body(conn, leftover, head);
    return resp;
}

HttpResponse SocketHttpClient::request(const std::string& method,
                                       const std::string& url,
                                       const std::string& body,
                                       const std::vector<Header>& headers,
                                       long timeout_seconds) {
    return http_request(method, url, body, headers, timeout_seconds);
}

} // namespace chansync

#endif // __linux__
