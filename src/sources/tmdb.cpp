#include "tmdb.hpp"
#include "http_json.hpp"
#include "../util.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace chanview {

static const char* kMissingKey = "TMDB API key not configured. Set TMDB_API_KEY.";

// ── Categories ───────────────────────────────────────────────────

const std::vector<TmdbCategory>& all_tmdb_categories() {
    static const std::vector<TmdbCategory> all = {
        TmdbCategory::TrendingAll,    TmdbCategory::TrendingMovies,
        TmdbCategory::TrendingTv,     TmdbCategory::PopularMovies,
        TmdbCategory::PopularTv,      TmdbCategory::TopRatedMovies,
        TmdbCategory::TopRatedTv,     TmdbCategory::NowPlayingMovies,
        TmdbCategory::AiringTodayTv,
    };
    return all;
}

std::string tmdb_category_name(TmdbCategory category) {
    switch (category) {
        case TmdbCategory::TrendingAll:      return "Trending";
        case TmdbCategory::TrendingMovies:   return "Trending Movies";
        case TmdbCategory::TrendingTv:       return "Trending TV";
        case TmdbCategory::PopularMovies:    return "Popular Movies";
        case TmdbCategory::PopularTv:        return "Popular TV";
        case TmdbCategory::TopRatedMovies:   return "Top Rated Movies";
        case TmdbCategory::TopRatedTv:       return "Top Rated TV";
        case TmdbCategory::NowPlayingMovies: return "Now Playing";
        case TmdbCategory::AiringTodayTv:    return "Airing Today";
    }
    return "";
}

std::string tmdb_category_slug(TmdbCategory category) {
    switch (category) {
        case TmdbCategory::TrendingAll:      return "trending";
        case TmdbCategory::TrendingMovies:   return "trending-movies";
        case TmdbCategory::TrendingTv:       return "trending-tv";
        case TmdbCategory::PopularMovies:    return "popular-movies";
        case TmdbCategory::PopularTv:        return "popular-tv";
        case TmdbCategory::TopRatedMovies:   return "top-rated-movies";
        case TmdbCategory::TopRatedTv:       return "top-rated-tv";
        case TmdbCategory::NowPlayingMovies: return "now-playing";
        case TmdbCategory::AiringTodayTv:    return "airing-today";
    }
    return "";
}

std::optional<TmdbCategory> parse_tmdb_category(const std::string& slug) {
    std::string wanted = to_lower(trim(slug));
    for (auto category : all_tmdb_categories()) {
        if (tmdb_category_slug(category) == wanted) return category;
    }
    return std::nullopt;
}

std::string tmdb_category_endpoint(TmdbCategory category) {
    switch (category) {
        case TmdbCategory::TrendingAll:      return "trending/all/day";
        case TmdbCategory::TrendingMovies:   return "trending/movie/day";
        case TmdbCategory::TrendingTv:       return "trending/tv/day";
        case TmdbCategory::PopularMovies:    return "movie/popular";
        case TmdbCategory::PopularTv:        return "tv/popular";
        case TmdbCategory::TopRatedMovies:   return "movie/top_rated";
        case TmdbCategory::TopRatedTv:       return "tv/top_rated";
        case TmdbCategory::NowPlayingMovies: return "movie/now_playing";
        case TmdbCategory::AiringTodayTv:    return "tv/airing_today";
    }
    return "";
}

// Mixed endpoints tag each result with media_type; the rest are uniform.
static std::optional<TmdbMediaType> fixed_media_type(TmdbCategory category) {
    switch (category) {
        case TmdbCategory::TrendingAll:
            return std::nullopt;
        case TmdbCategory::TrendingMovies:
        case TmdbCategory::PopularMovies:
        case TmdbCategory::TopRatedMovies:
        case TmdbCategory::NowPlayingMovies:
            return TmdbMediaType::Movie;
        default:
            return TmdbMediaType::TvShow;
    }
}

// ── Items ────────────────────────────────────────────────────────

std::optional<std::string> TmdbItem::year() const {
    if (release_date.size() < 4) return std::nullopt;
    return release_date.substr(0, 4);
}

std::string TmdbItem::media_type_name() const {
    return media_type == TmdbMediaType::Movie ? "Movie" : "TV Show";
}

static std::optional<std::string> image_url(const json& obj, const char* key,
                                            const char* size) {
    auto path = json_optional_string(obj, key);
    if (!path || path->empty()) return std::nullopt;
    return std::string(TmdbClient::kImageBaseUrl) + "/" + size + *path;
}

std::optional<TmdbItem> tmdb_item_from_json(const json& obj, TmdbMediaType type) {
    if (!obj.is_object()) return std::nullopt;

    TmdbItem item;
    item.media_type = type;
    item.id = json_int(obj, "id");
    item.overview = json_string(obj, "overview");
    item.poster_url = image_url(obj, "poster_path", "w342");
    item.backdrop_url = image_url(obj, "backdrop_path", "w780");
    item.vote_average = json_optional_number(obj, "vote_average").value_or(0.0);

    if (type == TmdbMediaType::Movie) {
        item.title = json_string(obj, "title");
        item.release_date = json_string(obj, "release_date");
    } else {
        item.title = json_string(obj, "name");
        item.release_date = json_string(obj, "first_air_date");
    }
    return item;
}

static std::optional<TmdbMediaType> media_type_of(const json& obj) {
    std::string type = json_string(obj, "media_type");
    if (type == "movie") return TmdbMediaType::Movie;
    if (type == "tv") return TmdbMediaType::TvShow;
    return std::nullopt;
}

static const json& results_of(const json& response) {
    if (!response.is_object() || !response.contains("results") ||
        !response["results"].is_array()) {
        throw std::runtime_error("Invalid response format");
    }
    return response["results"];
}

// ── Client ───────────────────────────────────────────────────────

TmdbClient::TmdbClient(std::shared_ptr<HttpClient> http, std::string api_key,
                       std::string base_url, long timeout_seconds)
    : http_(std::move(http)), api_key_(trim(api_key)), base_url_(std::move(base_url)),
      timeout_seconds_(timeout_seconds) {
    if (!http_) throw std::invalid_argument("TmdbClient requires an HTTP client");
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

json TmdbClient::get(const std::string& endpoint) {
    if (api_key_.empty()) throw std::runtime_error(kMissingKey);

    std::string url = base_url_ + "/" + endpoint;
    url += (endpoint.find('?') == std::string::npos) ? '?' : '&';
    url += "api_key=" + url_encode(api_key_);

    auto response = http_->get(url, {{"Accept", "application/json"}}, timeout_seconds_);
    if (response.status_code == 0) {
        throw std::runtime_error(describe_transport_error(response.error));
    }
    if (!response.ok()) {
        if (!is_html_body(response.body)) {
            auto body = json::parse(response.body, nullptr, false);
            if (auto message = json_optional_string(body, "status_message")) {
                throw std::runtime_error("TMDB: " + *message);
            }
        }
        throw std::runtime_error(describe_status_error(response.status_code, response.body));
    }
    return parse_json_body(response.body);
}

std::vector<TmdbItem> TmdbClient::by_category(TmdbCategory category, int page) {
    json response = get(tmdb_category_endpoint(category) + "?page=" + std::to_string(page));
    auto fixed = fixed_media_type(category);

    std::vector<TmdbItem> items;
    size_t seen = 0;
    for (const auto& obj : results_of(response)) {
        if (seen++ >= kMaxItems) break;
        auto type = fixed ? fixed : media_type_of(obj);
        if (!type) continue;
        if (auto item = tmdb_item_from_json(obj, *type)) items.push_back(std::move(*item));
    }
    return items;
}

std::vector<TmdbItem> TmdbClient::search_multi(const std::string& query, int page) {
    json response = get("search/multi?query=" + url_encode(query) +
                        "&page=" + std::to_string(page));

    std::vector<TmdbItem> items;
    for (const auto& obj : results_of(response)) {
        auto type = media_type_of(obj);
        if (!type) continue;
        if (auto item = tmdb_item_from_json(obj, *type)) items.push_back(std::move(*item));
    }
    return items;
}

// ── Fetchers ─────────────────────────────────────────────────────

std::optional<std::string> TmdbFetcher::unavailable_reason() const {
    if (!client_.has_api_key()) return std::string(kMissingKey);
    return std::nullopt;
}

std::optional<std::string> TmdbSearchFetcher::unavailable_reason() const {
    if (!client_.has_api_key()) return std::string(kMissingKey);
    return std::nullopt;
}

} // namespace chanview
