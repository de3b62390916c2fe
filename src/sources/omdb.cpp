#include "omdb.hpp"
#include "http_json.hpp"
#include "../util.hpp"
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <unordered_set>

using json = nlohmann::json;

namespace chanview {

static const char* kMissingKey = "OMDb API key not configured. Set OMDB_API_KEY.";

// ── Categories ───────────────────────────────────────────────────

const std::vector<OmdbCategory>& all_omdb_categories() {
    static const std::vector<OmdbCategory> all = {
        OmdbCategory::NewMovies2026, OmdbCategory::Movies2025,
        OmdbCategory::Series2025,    OmdbCategory::ActionMovies,
        OmdbCategory::ComedyMovies,  OmdbCategory::HorrorMovies,
        OmdbCategory::SciFiMovies,   OmdbCategory::DramaSeries,
        OmdbCategory::CrimeSeries,   OmdbCategory::MarvelContent,
        OmdbCategory::StarWarsContent,
    };
    return all;
}

std::string omdb_category_name(OmdbCategory category) {
    switch (category) {
        case OmdbCategory::NewMovies2026:   return "New Movies 2026";
        case OmdbCategory::Movies2025:      return "Movies 2025";
        case OmdbCategory::Series2025:      return "Series 2025";
        case OmdbCategory::ActionMovies:    return "Action Movies";
        case OmdbCategory::ComedyMovies:    return "Comedy Movies";
        case OmdbCategory::HorrorMovies:    return "Horror Movies";
        case OmdbCategory::SciFiMovies:     return "Sci-Fi Movies";
        case OmdbCategory::DramaSeries:     return "Drama Series";
        case OmdbCategory::CrimeSeries:     return "Crime Series";
        case OmdbCategory::MarvelContent:   return "Marvel";
        case OmdbCategory::StarWarsContent: return "Star Wars";
    }
    return "";
}

std::string omdb_category_slug(OmdbCategory category) {
    switch (category) {
        case OmdbCategory::NewMovies2026:   return "new-movies-2026";
        case OmdbCategory::Movies2025:      return "movies-2025";
        case OmdbCategory::Series2025:      return "series-2025";
        case OmdbCategory::ActionMovies:    return "action";
        case OmdbCategory::ComedyMovies:    return "comedy";
        case OmdbCategory::HorrorMovies:    return "horror";
        case OmdbCategory::SciFiMovies:     return "sci-fi";
        case OmdbCategory::DramaSeries:     return "drama";
        case OmdbCategory::CrimeSeries:     return "crime";
        case OmdbCategory::MarvelContent:   return "marvel";
        case OmdbCategory::StarWarsContent: return "star-wars";
    }
    return "";
}

std::optional<OmdbCategory> parse_omdb_category(const std::string& slug) {
    std::string wanted = to_lower(trim(slug));
    for (auto category : all_omdb_categories()) {
        if (omdb_category_slug(category) == wanted) return category;
    }
    return std::nullopt;
}

OmdbSearchParams omdb_search_params(OmdbCategory category) {
    switch (category) {
        case OmdbCategory::NewMovies2026:   return {"2026", "movie", "2026"};
        case OmdbCategory::Movies2025:      return {"2025", "movie", "2025"};
        case OmdbCategory::Series2025:      return {"2025", "series", "2025"};
        case OmdbCategory::ActionMovies:    return {"action", "movie", ""};
        case OmdbCategory::ComedyMovies:    return {"comedy", "movie", ""};
        case OmdbCategory::HorrorMovies:    return {"horror", "movie", ""};
        case OmdbCategory::SciFiMovies:     return {"sci-fi", "movie", ""};
        case OmdbCategory::DramaSeries:     return {"drama", "series", ""};
        case OmdbCategory::CrimeSeries:     return {"crime", "series", ""};
        case OmdbCategory::MarvelContent:   return {"marvel", "movie", ""};
        case OmdbCategory::StarWarsContent: return {"star wars", "", ""};
    }
    return {};
}

// ── Items ────────────────────────────────────────────────────────

std::string OmdbItem::content_type_name() const {
    return content_type == OmdbContentType::Series ? "Series" : "Movie";
}

static std::optional<std::string> known_string(const json& obj, const char* key) {
    auto v = json_optional_string(obj, key);
    if (!v || v->empty() || *v == "N/A") return std::nullopt;
    return v;
}

OmdbItem omdb_item_from_json(const json& obj) {
    OmdbItem item;
    item.imdb_id = json_string(obj, "imdbID");
    item.title = json_string(obj, "Title");
    item.year = known_string(obj, "Year");
    item.poster_url = known_string(obj, "Poster");
    item.content_type = json_string(obj, "Type") == "series" ? OmdbContentType::Series
                                                              : OmdbContentType::Movie;
    return item;
}

// ── Client ───────────────────────────────────────────────────────

OmdbClient::OmdbClient(std::shared_ptr<HttpClient> http, std::string api_key,
                       std::string base_url, long timeout_seconds)
    : http_(std::move(http)), api_key_(trim(api_key)), base_url_(std::move(base_url)),
      timeout_seconds_(timeout_seconds) {
    if (!http_) throw std::invalid_argument("OmdbClient requires an HTTP client");
}

std::vector<OmdbItem> OmdbClient::search(const std::string& query, const std::string& type,
                                         const std::string& year, int page) {
    if (api_key_.empty()) throw std::runtime_error(kMissingKey);

    std::string url = base_url_ + "?apikey=" + url_encode(api_key_) +
                      "&s=" + url_encode(query) + "&page=" + std::to_string(page);
    if (!type.empty()) url += "&type=" + url_encode(type);
    if (!year.empty()) url += "&y=" + url_encode(year);

    auto response = http_->get(url, {{"Accept", "application/json"}}, timeout_seconds_);
    if (response.status_code == 0) {
        throw std::runtime_error(describe_transport_error(response.error));
    }
    if (!response.ok()) {
        throw std::runtime_error(describe_status_error(response.status_code, response.body));
    }
    // Proxies answer 200 with a block page
    if (is_html_body(response.body)) {
        throw std::runtime_error("API blocked by network. Try using a VPN.");
    }

    json body = parse_json_body(response.body);
    if (json_string(body, "Response") == "False") {
        throw std::runtime_error(json_string(body, "Error", "No results found"));
    }

    std::vector<OmdbItem> items;
    if (body.is_object() && body.contains("Search") && body["Search"].is_array()) {
        for (const auto& obj : body["Search"]) {
            if (!obj.is_object()) continue;
            items.push_back(omdb_item_from_json(obj));
        }
    }
    return items;
}

std::vector<OmdbItem> OmdbClient::by_category(OmdbCategory category) {
    OmdbSearchParams params = omdb_search_params(category);

    std::vector<OmdbItem> merged = search(params.query, params.type, params.year, 1);
    for (int page = 2; page <= kCategoryPages; page++) {
        try {
            auto more = search(params.query, params.type, params.year, page);
            merged.insert(merged.end(), std::make_move_iterator(more.begin()),
                          std::make_move_iterator(more.end()));
        } catch (const std::exception& e) {
            std::cerr << "[omdb] Keeping page 1 of " << omdb_category_slug(category)
                      << ", page " << page << " failed: " << e.what() << "\n";
        }
    }

    std::unordered_set<std::string> seen;
    std::vector<OmdbItem> items;
    for (auto& item : merged) {
        if (seen.insert(item.imdb_id).second) items.push_back(std::move(item));
    }
    return items;
}

// ── Fetcher ──────────────────────────────────────────────────────

std::optional<std::string> OmdbFetcher::unavailable_reason() const {
    if (!client_.has_api_key()) return std::string(kMissingKey);
    return std::nullopt;
}

} // namespace chanview
