#include "xtream.hpp"
#include "http_json.hpp"
#include "../cache/retrying_fetcher.hpp"
#include "../util.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <initializer_list>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace chanview {

bool XtreamCredentials::empty() const {
    return base_url().empty();
}

std::string XtreamCredentials::base_url() const {
    std::string url = trim(server_url);
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

// ── Listing decoding ─────────────────────────────────────────────

// "YYYY-MM-DD HH:MM:SS" read as UTC
static std::optional<int64_t> parse_datetime_utc(const std::string& s) {
    std::tm tm{};
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0;
    if (std::sscanf(s.c_str(), "%d-%d-%d %d:%d:%d", &y, &mo, &d, &h, &mi, &sec) != 6) {
        return std::nullopt;
    }
    tm.tm_year = y - 1900;
    tm.tm_mon = mo - 1;
    tm.tm_mday = d;
    tm.tm_hour = h;
    tm.tm_min = mi;
    tm.tm_sec = sec;
    return static_cast<int64_t>(timegm(&tm));
}

// Field as unix seconds: a JSON number or a numeric string
static std::optional<int64_t> numeric_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    if (it->is_number_integer()) return it->get<int64_t>();
    if (it->is_number()) return double_to_int64(it->get<double>());
    if (it->is_string()) return parse_int64(it->get<std::string>());
    return std::nullopt;
}

static int64_t timestamp_field(const json& obj, const char* numeric_key,
                               std::initializer_list<const char*> fallback_keys) {
    if (auto ts = numeric_field(obj, numeric_key)) return *ts;
    for (const char* key : fallback_keys) {
        if (auto ts = numeric_field(obj, key)) return *ts;
        if (auto text = json_optional_string(obj, key)) {
            if (auto ts = parse_datetime_utc(*text)) return *ts;
        }
    }
    return 0;
}

EpgProgram parse_epg_listing(const json& listing) {
    EpgProgram program;
    if (!listing.is_object()) return program;

    program.id = json_string(listing, "id");
    program.channel_id = json_string(listing, "channel_id", json_string(listing, "epg_id"));
    program.title = json_string(listing, "title");
    program.description = json_string(listing, "description");
    program.start = timestamp_field(listing, "start_timestamp", {"start"});
    program.end = timestamp_field(listing, "stop_timestamp", {"end", "stop"});
    program.has_archive = json_int(listing, "has_archive") != 0;
    return program;
}

std::vector<EpgProgram> parse_epg_listings(const json& response) {
    std::vector<EpgProgram> programs;
    if (!response.is_object() || !response.contains("epg_listings") ||
        !response["epg_listings"].is_array()) {
        return programs;
    }
    for (const auto& listing : response["epg_listings"]) {
        if (listing.is_object()) programs.push_back(parse_epg_listing(listing));
    }
    return programs;
}

// ── Fetcher ──────────────────────────────────────────────────────

XtreamEpgFetcher::XtreamEpgFetcher(std::shared_ptr<HttpClient> http,
                                   XtreamCredentials credentials,
                                   long timeout_seconds)
    : http_(std::move(http)), credentials_(std::move(credentials)),
      timeout_seconds_(timeout_seconds) {
    if (!http_) throw std::invalid_argument("XtreamEpgFetcher requires an HTTP client");
}

std::string XtreamEpgFetcher::short_epg_url(const std::string& stream_id) const {
    return credentials_.base_url() +
           "/player_api.php?username=" + url_encode(trim(credentials_.username)) +
           "&password=" + url_encode(trim(credentials_.password)) +
           "&action=get_short_epg&stream_id=" + url_encode(stream_id) +
           "&limit=" + std::to_string(kShortEpgLimit);
}

std::vector<EpgProgram> XtreamEpgFetcher::fetch(const std::string& stream_id) {
    auto response = http_->get(short_epg_url(stream_id), {}, timeout_seconds_);
    if (response.status_code == 0) {
        throw std::runtime_error(describe_transport_error(response.error));
    }
    if (!response.ok()) {
        throw std::runtime_error("EPG API returned status: " +
                                 std::to_string(response.status_code));
    }

    auto programs = parse_epg_listings(parse_json_body(response.body));
    if (!programs.empty()) {
        std::cerr << "[epg] Loaded " << programs.size()
                  << " programs for stream " << stream_id << "\n";
    }
    return programs;
}

std::optional<std::string> XtreamEpgFetcher::unavailable_reason() const {
    if (credentials_.empty()) return std::string("No server credentials configured");
    return std::nullopt;
}

std::shared_ptr<Fetcher<std::string, std::vector<EpgProgram>>>
make_epg_fetcher(std::shared_ptr<HttpClient> http, XtreamCredentials credentials,
                 long timeout_seconds) {
    auto inner = std::make_shared<XtreamEpgFetcher>(std::move(http), std::move(credentials),
                                                    timeout_seconds);
    return std::make_shared<RetryingFetcher<std::string, std::vector<EpgProgram>>>(
        inner, 2, std::chrono::milliseconds(500),
        [](const std::string& stream_id, const std::string& error) {
            if (error.find("503") != std::string::npos) return;
            std::cerr << "[epg] Error loading stream " << stream_id << ": " << error << "\n";
        });
}

} // namespace chanview
