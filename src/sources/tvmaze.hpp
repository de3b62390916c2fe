#pragma once
#include "../cache/fetcher.hpp"
#include "../http.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace chanview {

enum class DiscoverCategory {
    AiringToday,
    Popular,
    TopRated,
    SciFi,
    Drama,
    Comedy,
    Action,
};

const std::vector<DiscoverCategory>& all_discover_categories();
std::string discover_category_name(DiscoverCategory category);
// Command-line form: "airing-today", "sci-fi", ...
std::string discover_category_slug(DiscoverCategory category);
std::optional<DiscoverCategory> parse_discover_category(const std::string& slug);
// TVmaze genre searched for a genre category, empty otherwise
std::string discover_genre(DiscoverCategory category);

struct DiscoverItem {
    int64_t id = 0;
    std::string title;
    std::string overview;                  // HTML stripped
    std::optional<std::string> poster_url;
    std::optional<double> rating;
    std::optional<std::string> year;
};

// Build an item from a TVmaze show object.
DiscoverItem discover_item_from_show(const nlohmann::json& show);

// TV-show discovery against the public TVmaze API (no key needed).
class TvMazeClient {
public:
    static constexpr const char* kDefaultBaseUrl = "https://api.tvmaze.com";
    static constexpr size_t kMaxItems = 20;

    explicit TvMazeClient(std::shared_ptr<HttpClient> http,
                          std::string base_url = kDefaultBaseUrl,
                          long timeout_seconds = 15);

    std::vector<DiscoverItem> airing_today();
    std::vector<DiscoverItem> popular();
    std::vector<DiscoverItem> top_rated();
    std::vector<DiscoverItem> by_genre(const std::string& genre);
    std::vector<DiscoverItem> by_category(DiscoverCategory category);
    std::vector<DiscoverItem> search(const std::string& query);

private:
    nlohmann::json get(const std::string& endpoint);
    std::vector<nlohmann::json> search_shows(const std::string& query);

    std::shared_ptr<HttpClient> http_;
    std::string base_url_;
    long timeout_seconds_;
};

class TvMazeDiscoverFetcher : public Fetcher<DiscoverCategory, std::vector<DiscoverItem>> {
public:
    explicit TvMazeDiscoverFetcher(TvMazeClient client) : client_(std::move(client)) {}

    std::vector<DiscoverItem> fetch(const DiscoverCategory& category) override {
        return client_.by_category(category);
    }
    std::string source_name() const override { return "discover"; }

private:
    TvMazeClient client_;
};

class TvMazeSearchFetcher : public Fetcher<std::string, std::vector<DiscoverItem>> {
public:
    explicit TvMazeSearchFetcher(TvMazeClient client) : client_(std::move(client)) {}

    std::vector<DiscoverItem> fetch(const std::string& query) override {
        return client_.search(query);
    }
    std::string source_name() const override { return "search"; }

private:
    TvMazeClient client_;
};

} // namespace chanview
