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

enum class TmdbCategory {
    TrendingAll,
    TrendingMovies,
    TrendingTv,
    PopularMovies,
    PopularTv,
    TopRatedMovies,
    TopRatedTv,
    NowPlayingMovies,
    AiringTodayTv,
};

const std::vector<TmdbCategory>& all_tmdb_categories();
std::string tmdb_category_name(TmdbCategory category);
std::string tmdb_category_slug(TmdbCategory category);
std::optional<TmdbCategory> parse_tmdb_category(const std::string& slug);
// v3 endpoint path without query string, e.g. "movie/popular"
std::string tmdb_category_endpoint(TmdbCategory category);

enum class TmdbMediaType { Movie, TvShow };

struct TmdbItem {
    int64_t id = 0;
    std::string title;
    std::string overview;
    std::optional<std::string> poster_url;
    std::optional<std::string> backdrop_url;
    std::string release_date;   // first_air_date for TV
    double vote_average = 0.0;
    TmdbMediaType media_type = TmdbMediaType::Movie;

    // First four characters of release_date, if that long
    std::optional<std::string> year() const;
    std::string media_type_name() const;
};

// Convert one result object. Returns nullopt for anything but movie/tv.
std::optional<TmdbItem> tmdb_item_from_json(const nlohmann::json& obj, TmdbMediaType type);

class TmdbClient {
public:
    static constexpr const char* kDefaultBaseUrl = "https://api.themoviedb.org/3";
    static constexpr const char* kImageBaseUrl = "https://image.tmdb.org/t/p";
    static constexpr size_t kMaxItems = 20;

    TmdbClient(std::shared_ptr<HttpClient> http, std::string api_key,
               std::string base_url = kDefaultBaseUrl,
               long timeout_seconds = 10);

    bool has_api_key() const { return !api_key_.empty(); }

    std::vector<TmdbItem> by_category(TmdbCategory category, int page = 1);
    std::vector<TmdbItem> search_multi(const std::string& query, int page = 1);

private:
    nlohmann::json get(const std::string& endpoint);

    std::shared_ptr<HttpClient> http_;
    std::string api_key_;
    std::string base_url_;
    long timeout_seconds_;
};

class TmdbFetcher : public Fetcher<TmdbCategory, std::vector<TmdbItem>> {
public:
    explicit TmdbFetcher(TmdbClient client) : client_(std::move(client)) {}

    std::vector<TmdbItem> fetch(const TmdbCategory& category) override {
        return client_.by_category(category);
    }
    std::optional<std::string> unavailable_reason() const override;
    std::string source_name() const override { return "tmdb"; }

private:
    TmdbClient client_;
};

class TmdbSearchFetcher : public Fetcher<std::string, std::vector<TmdbItem>> {
public:
    explicit TmdbSearchFetcher(TmdbClient client) : client_(std::move(client)) {}

    std::vector<TmdbItem> fetch(const std::string& query) override {
        return client_.search_multi(query);
    }
    std::optional<std::string> unavailable_reason() const override;
    std::string source_name() const override { return "tmdb-search"; }

private:
    TmdbClient client_;
};

} // namespace chanview
