#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace chanview {

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
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, total);
    return total;
}

static curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    return list;
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

// ── Public API ────────────────────────────────────────────────

HttpResponse CurlHttpClient::get(const std::string& url,
                                 const std::vector<Header>& headers,
                                 long timeout_seconds) {
    return http_get(url, headers, timeout_seconds, connect_timeout_, max_redirects_);
}

HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds,
                      long connect_timeout_seconds,
                      long max_redirects) {
    HttpResponse response;
    CurlRequest req;
    if (!req) {
        response.error = "curl_easy_init failed";
        return response;
    }

    req.hlist = build_headers(headers);
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_CONNECTTIMEOUT, connect_timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_FOLLOWLOCATION, max_redirects > 0 ? 1L : 0L);
    curl_easy_setopt(req.curl, CURLOPT_MAXREDIRS, max_redirects);
    // Workers run on plain threads; signals must not be used for timeouts
    curl_easy_setopt(req.curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(req.curl, CURLOPT_USERAGENT, "chanview/1.0");
    if (g_http_abort_flag) {
        curl_easy_setopt(req.curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(req.curl, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
    }
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response.body);

    CURLcode res = curl_easy_perform(req.curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    } else {
        response.body.clear();
        response.error = curl_easy_strerror(res);
    }
    return response;
}

} // namespace chanview
