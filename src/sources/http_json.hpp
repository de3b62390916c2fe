#pragma once
#include "../http.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace chanview {

// Human-readable text for a failed transfer (status_code == 0).
std::string describe_transport_error(const std::string& curl_error);

// Human-readable text for a non-2xx response.
std::string describe_status_error(long status_code, const std::string& body);

// GET and decode a JSON document. Throws std::runtime_error with the
// messages above, or "Failed to parse response: ..." on bad JSON.
nlohmann::json get_json(HttpClient& http, const std::string& url,
                        long timeout_seconds);

// Throws unless the response is 2xx.
void ensure_success(const HttpResponse& response);

nlohmann::json parse_json_body(const std::string& body);

// ── Lenient field access (missing, null or mistyped -> fallback) ──

std::string json_string(const nlohmann::json& obj, const char* key,
                        const std::string& fallback = "");
std::optional<std::string> json_optional_string(const nlohmann::json& obj, const char* key);
std::optional<double> json_optional_number(const nlohmann::json& obj, const char* key);
int64_t json_int(const nlohmann::json& obj, const char* key, int64_t fallback = 0);

// Looks like an HTML error page (captive portal, proxy block page)
bool is_html_body(const std::string& body);

} // namespace chanview
