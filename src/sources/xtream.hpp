#pragma once
#include "../cache/fetcher.hpp"
#include "../epg.hpp"
#include "../http.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace chanview {

struct XtreamCredentials {
    std::string server_url;
    std::string username;
    std::string password;

    bool empty() const;
    // Server URL without surrounding whitespace or trailing slashes
    std::string base_url() const;
};

// Decode one entry of an epg_listings array.
EpgProgram parse_epg_listing(const nlohmann::json& listing);

// Decode a get_short_epg response. A missing epg_listings array is an
// empty guide, not an error.
std::vector<EpgProgram> parse_epg_listings(const nlohmann::json& response);

// Short EPG for one live stream, keyed by stream id.
class XtreamEpgFetcher : public Fetcher<std::string, std::vector<EpgProgram>> {
public:
    static constexpr int kShortEpgLimit = 4;

    XtreamEpgFetcher(std::shared_ptr<HttpClient> http, XtreamCredentials credentials,
                     long timeout_seconds = 120);

    std::vector<EpgProgram> fetch(const std::string& stream_id) override;
    std::optional<std::string> unavailable_reason() const override;
    std::string source_name() const override { return "epg"; }

    std::string short_epg_url(const std::string& stream_id) const;

private:
    std::shared_ptr<HttpClient> http_;
    XtreamCredentials credentials_;
    long timeout_seconds_;
};

// Production EPG fetcher: two attempts 500 ms apart, final failures logged
// (except 503, which some panels return routinely under load).
std::shared_ptr<Fetcher<std::string, std::vector<EpgProgram>>>
make_epg_fetcher(std::shared_ptr<HttpClient> http, XtreamCredentials credentials,
                 long timeout_seconds = 120);

} // namespace chanview
