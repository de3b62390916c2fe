#pragma once
#include <string>
#include <vector>
#include <utility>
#include <atomic>

namespace chanview {

// Initialize HTTP subsystem (call once at startup, before any worker runs).
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight HTTP requests abort promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;   // 0 when the transfer itself failed
    std::string body;
    std::string error;      // transport error text when status_code == 0

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

// Abstract HTTP client interface (injectable for testing).
// Implementations must be safe to call from several worker threads at once.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 30) = 0;
};

// libcurl, one easy handle per request.
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(long connect_timeout_seconds = 15, long max_redirects = 5)
        : connect_timeout_(connect_timeout_seconds), max_redirects_(max_redirects) {}

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) override;

private:
    long connect_timeout_;
    long max_redirects_;
};

// HTTP GET following up to max_redirects redirects
HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30,
                      long connect_timeout_seconds = 15,
                      long max_redirects = 5);

} // namespace chanview
