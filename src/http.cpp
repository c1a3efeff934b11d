// libcurl HTTP client for non-Linux builds.
#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace chansync {

static const std::atomic<bool>* g_http_abort_flag = nullptr;

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_http_abort_flag = flag;
}

// Called by curl ~once per second; return non-zero to abort the transfer.
static int abort_progress_cb(void* /*clientp*/,
                             curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                             curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    if (g_http_abort_flag && g_http_abort_flag->load(std::memory_order_relaxed))
        return 1;
    return 0;
}

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

// ── RAII curl handle ──────────────────────────────────────────

struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;

    CurlRequest() = default;
    ~CurlRequest() {
        curl_slist_free_all(hlist);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    explicit operator bool() const { return curl != nullptr; }
};

HttpResponse http_request(const std::string& method,
                          const std::string& url,
                          const std::string& body,
                          const std::vector<Header>& headers,
                          long timeout_seconds) {
    CurlRequest req;
    if (!req) return {};

    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        req.hlist = curl_slist_append(req.hlist, entry.c_str());
    }
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, timeout_seconds);
    if (g_http_abort_flag) {
        curl_easy_setopt(req.curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(req.curl, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
    }

    if (method == "GET") {
        curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(req.curl, CURLOPT_CUSTOMREQUEST, method.c_str());
        if (!body.empty()) {
            curl_easy_setopt(req.curl, CURLOPT_POSTFIELDS, body.c_str());
            curl_easy_setopt(req.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        }
    }

    HttpResponse response;
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response.body);
    if (curl_easy_perform(req.curl) == CURLE_OK)
        curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

HttpResponse CurlHttpClient::request(const std::string& method,
                                     const std::string& url,
                                     const std::string& body,
                                     const std::vector<Header>& headers,
                                     long timeout_seconds) {
    return http_request(method, url, body, headers, timeout_seconds);
}

} // namespace chansync
