#pragma once
#include "http.hpp"
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace chanview {

// Canned responses. Routes are matched by URL substring in insertion order;
// otherwise the queue, then next_response. Safe to call from workers.
class MockHttpClient : public HttpClient {
public:
    HttpResponse next_response;
    std::vector<HttpResponse> response_queue;
    std::vector<std::pair<std::string, HttpResponse>> routes;
    std::string last_url;
    std::vector<Header> last_headers;
    long last_timeout = 0;
    std::vector<std::string> urls;
    int call_count = 0;

    void route(const std::string& url_part, long status, const std::string& body) {
        std::lock_guard<std::mutex> lock(mutex_);
        routes.emplace_back(url_part, HttpResponse{status, body, ""});
    }

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        call_count++;
        last_url = url;
        last_headers = headers;
        last_timeout = timeout_seconds;
        urls.push_back(url);
        for (const auto& r : routes) {
            if (url.find(r.first) != std::string::npos) return r.second;
        }
        if (!response_queue.empty()) {
            auto resp = response_queue.front();
            response_queue.erase(response_queue.begin());
            return resp;
        }
        return next_response;
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return call_count;
    }

private:
    mutable std::mutex mutex_;
};

inline HttpResponse json_response(const std::string& body, long status = 200) {
    return HttpResponse{status, body, ""};
}

inline HttpResponse transport_error(const std::string& error) {
    return HttpResponse{0, "", error};
}

} // namespace chanview
