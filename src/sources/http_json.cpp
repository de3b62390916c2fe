#include "http_json.hpp"
#include "../util.hpp"
#include <stdexcept>

namespace chanview {

std::string describe_transport_error(const std::string& curl_error) {
    std::string lower = to_lower(curl_error);
    if (lower.find("certificate") != std::string::npos ||
        lower.find("ssl") != std::string::npos) {
        return "Network proxy blocking connection. Try using a VPN.";
    }
    if (lower.find("connect") != std::string::npos ||
        lower.find("timeout") != std::string::npos ||
        lower.find("timed out") != std::string::npos ||
        lower.find("resolve") != std::string::npos) {
        return "Unable to connect. Check your internet connection.";
    }
    return "Connection error: " + curl_error;
}

bool is_html_body(const std::string& body) {
    return body.find("<!DOCTYPE") != std::string::npos ||
           body.find("<html") != std::string::npos;
}

std::string describe_status_error(long status_code, const std::string& body) {
    if (is_html_body(body)) {
        return "API blocked by network. Try using a VPN.";
    }
    return "API error: " + std::to_string(status_code);
}

void ensure_success(const HttpResponse& response) {
    if (response.status_code == 0) {
        throw std::runtime_error(describe_transport_error(response.error));
    }
    if (!response.ok()) {
        throw std::runtime_error(describe_status_error(response.status_code, response.body));
    }
}

nlohmann::json parse_json_body(const std::string& body) {
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse response: ") + e.what());
    }
}

std::string json_string(const nlohmann::json& obj, const char* key,
                        const std::string& fallback) {
    auto v = json_optional_string(obj, key);
    return v ? *v : fallback;
}

std::optional<std::string> json_optional_string(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return std::nullopt;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::optional<double> json_optional_number(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return std::nullopt;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return std::nullopt;
    return it->get<double>();
}

int64_t json_int(const nlohmann::json& obj, const char* key, int64_t fallback) {
    if (!obj.is_object()) return fallback;
    auto it = obj.find(key);
    if (it == obj.end()) return fallback;
    if (it->is_number_integer()) return it->get<int64_t>();
    if (it->is_number()) return double_to_int64(it->get<double>()).value_or(fallback);
    if (it->is_string()) return parse_int64(it->get<std::string>()).value_or(fallback);
    return fallback;
}

nlohmann::json get_json(HttpClient& http, const std::string& url,
                        long timeout_seconds) {
    auto response = http.get(url, {{"Accept", "application/json"}}, timeout_seconds);
    ensure_success(response);
    return parse_json_body(response.body);
}

} // namespace chanview
