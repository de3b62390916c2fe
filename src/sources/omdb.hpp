#pragma once
#include "../cache/fetcher.hpp"
#include "../http.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace chanview {

// Discover rows backed by OMDb title search
enum class OmdbCategory {
    NewMovies2026,
    Movies2025,
    Series2025,
    ActionMovies,
    ComedyMovies,
    HorrorMovies,
    SciFiMovies,
    DramaSeries,
    CrimeSeries,
    MarvelContent,
    StarWarsContent,
};

const std::vector<OmdbCategory>& all_omdb_categories();
std::string omdb_category_name(OmdbCategory category);
std::string omdb_category_slug(OmdbCategory category);
std::optional<OmdbCategory> parse_omdb_category(const std::string& slug);

// Empty type or year: no filter
struct OmdbSearchParams {
    std::string query;
    std::string type;
    std::string year;
};

OmdbSearchParams omdb_search_params(OmdbCategory category);

enum class OmdbContentType { Movie, Series };

struct OmdbItem {
    std::string imdb_id;
    std::string title;
    std::optional<std::string> year;
    std::optional<std::string> poster_url;
    OmdbContentType content_type = OmdbContentType::Movie;

    std::string content_type_name() const;
};

// One "Search" entry. "N/A" year and poster become nullopt.
OmdbItem omdb_item_from_json(const nlohmann::json& obj);

class OmdbClient {
public:
    static constexpr const char* kDefaultBaseUrl = "https://www.omdbapi.com/";
    static constexpr int kCategoryPages = 2;

    OmdbClient(std::shared_ptr<HttpClient> http, std::string api_key,
               std::string base_url = kDefaultBaseUrl,
               long timeout_seconds = 15);

    bool has_api_key() const { return !api_key_.empty(); }

    std::vector<OmdbItem> search(const std::string& query, const std::string& type,
                                 const std::string& year, int page = 1);

    // First two result pages merged, first occurrence of each imdb id kept.
    // Only a first-page failure is an error.
    std::vector<OmdbItem> by_category(OmdbCategory category);

private:
    std::shared_ptr<HttpClient> http_;
    std::string api_key_;
    std::string base_url_;
    long timeout_seconds_;
};

class OmdbFetcher : public Fetcher<OmdbCategory, std::vector<OmdbItem>> {
public:
    explicit OmdbFetcher(OmdbClient client) : client_(std::move(client)) {}

    std::vector<OmdbItem> fetch(const OmdbCategory& category) override {
        return client_.by_category(category);
    }
    std::optional<std::string> unavailable_reason() const override;
    std::string source_name() const override { return "omdb"; }

private:
    OmdbClient client_;
};

} // namespace chanview
