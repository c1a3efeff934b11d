#pragma once
#include <string>
#include <vector>
#include <utility>
#include <atomic>

namespace chansync {

// Initialize HTTP subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

// Global abort flag checked by in-flight transfers (~1s granularity).
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

// status_code 0 means the request never got an HTTP response.
struct HttpResponse {
    long status_code = 0;
    std::string body;
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse request(const std::string& method,
                                 const std::string& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers,
                                 long timeout_seconds = 30) = 0;
};

// Only one concrete client is compiled per platform (CMakeLists.txt gates the
// source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketHttpClient : public HttpClient {
public:
    HttpResponse request(const std::string& method,
                         const std::string& url,
                         const std::string& body,
                         const std::vector<Header>& headers,
                         long timeout_seconds = 30) override;
};
using PlatformHttpClient = SocketHttpClient;

#else

class CurlHttpClient : public HttpClient {
public:
    HttpResponse request(const std::string& method,
                         const std::string& url,
                         const std::string& body,
                         const std::vector<Header>& headers,
                         long timeout_seconds = 30) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

// One-shot request through the platform implementation.
HttpResponse http_request(const std::string& method,
                          const std::string& url,
                          const std::string& body,
                          const std::vector<Header>& headers,
                          long timeout_seconds = 30);

} // namespace chansync
