#include "tvmaze.hpp"
#include "http_json.hpp"
#include "../util.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

using json = nlohmann::json;

namespace chanview {

// ── Categories ───────────────────────────────────────────────────

const std::vector<DiscoverCategory>& all_discover_categories() {
    static const std::vector<DiscoverCategory> all = {
        DiscoverCategory::AiringToday, DiscoverCategory::Popular,
        DiscoverCategory::TopRated,    DiscoverCategory::SciFi,
        DiscoverCategory::Drama,       DiscoverCategory::Comedy,
        DiscoverCategory::Action,
    };
    return all;
}

std::string discover_category_name(DiscoverCategory category) {
    switch (category) {
        case DiscoverCategory::AiringToday: return "Airing Today";
        case DiscoverCategory::Popular:     return "Popular Shows";
        case DiscoverCategory::TopRated:    return "Top Rated";
        case DiscoverCategory::SciFi:       return "Sci-Fi";
        case DiscoverCategory::Drama:       return "Drama";
        case DiscoverCategory::Comedy:      return "Comedy";
        case DiscoverCategory::Action:      return "Action";
    }
    return "";
}

std::string discover_category_slug(DiscoverCategory category) {
    switch (category) {
        case DiscoverCategory::AiringToday: return "airing-today";
        case DiscoverCategory::Popular:     return "popular";
        case DiscoverCategory::TopRated:    return "top-rated";
        case DiscoverCategory::SciFi:       return "sci-fi";
        case DiscoverCategory::Drama:       return "drama";
        case DiscoverCategory::Comedy:      return "comedy";
        case DiscoverCategory::Action:      return "action";
    }
    return "";
}

std::optional<DiscoverCategory> parse_discover_category(const std::string& slug) {
    std::string wanted = to_lower(trim(slug));
    for (auto category : all_discover_categories()) {
        if (discover_category_slug(category) == wanted) return category;
    }
    return std::nullopt;
}

std::string discover_genre(DiscoverCategory category) {
    switch (category) {
        case DiscoverCategory::SciFi:  return "science-fiction";
        case DiscoverCategory::Drama:  return "drama";
        case DiscoverCategory::Comedy: return "comedy";
        case DiscoverCategory::Action: return "action";
        default: return "";
    }
}

// ── Items ────────────────────────────────────────────────────────

DiscoverItem discover_item_from_show(const json& show) {
    DiscoverItem item;
    item.id = json_int(show, "id");
    item.title = json_string(show, "name");
    if (auto summary = json_optional_string(show, "summary")) {
        item.overview = strip_html(*summary);
    }
    if (show.contains("image") && show["image"].is_object()) {
        item.poster_url = json_optional_string(show["image"], "medium");
    }
    if (show.contains("rating") && show["rating"].is_object()) {
        item.rating = json_optional_number(show["rating"], "average");
    }
    if (auto premiered = json_optional_string(show, "premiered")) {
        auto dash = premiered->find('-');
        std::string year = premiered->substr(0, dash);
        if (!year.empty()) item.year = year;
    }
    return item;
}

static void sort_by_rating(std::vector<DiscoverItem>& items) {
    std::stable_sort(items.begin(), items.end(),
        [](const DiscoverItem& a, const DiscoverItem& b) {
            return a.rating.value_or(0.0) > b.rating.value_or(0.0);
        });
}

static bool has_genre(const json& show, const std::string& genre) {
    if (!show.contains("genres") || !show["genres"].is_array()) return false;
    std::string wanted = to_lower(genre);
    for (const auto& g : show["genres"]) {
        if (g.is_string() && to_lower(g.get<std::string>()).find(wanted) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// ── Client ───────────────────────────────────────────────────────

TvMazeClient::TvMazeClient(std::shared_ptr<HttpClient> http, std::string base_url,
                           long timeout_seconds)
    : http_(std::move(http)), base_url_(std::move(base_url)),
      timeout_seconds_(timeout_seconds) {
    if (!http_) throw std::invalid_argument("TvMazeClient requires an HTTP client");
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

json TvMazeClient::get(const std::string& endpoint) {
    return get_json(*http_, base_url_ + "/" + endpoint, timeout_seconds_);
}

// Shows from /search/shows, in result order
std::vector<json> TvMazeClient::search_shows(const std::string& query) {
    json results = get("search/shows?q=" + url_encode(query));
    std::vector<json> shows;
    if (!results.is_array()) return shows;
    for (const auto& r : results) {
        if (r.is_object() && r.contains("show") && r["show"].is_object()) {
            shows.push_back(r["show"]);
        }
    }
    return shows;
}

std::vector<DiscoverItem> TvMazeClient::airing_today() {
    json entries = get("schedule");
    std::vector<DiscoverItem> items;
    if (!entries.is_array()) return items;

    std::unordered_set<int64_t> seen;
    for (const auto& entry : entries) {
        if (items.size() >= kMaxItems) break;
        if (!entry.is_object() || !entry.contains("show") || !entry["show"].is_object()) continue;
        const auto& show = entry["show"];
        if (!seen.insert(json_int(show, "id")).second) continue;
        items.push_back(discover_item_from_show(show));
    }
    return items;
}

std::vector<DiscoverItem> TvMazeClient::popular() {
    std::vector<DiscoverItem> items;
    for (const auto& show : search_shows("the")) {
        if (items.size() >= kMaxItems) break;
        items.push_back(discover_item_from_show(show));
    }
    sort_by_rating(items);
    return items;
}

std::vector<DiscoverItem> TvMazeClient::top_rated() {
    std::vector<DiscoverItem> items;
    for (const auto& show : search_shows("best")) {
        auto item = discover_item_from_show(show);
        if (item.rating.value_or(0.0) >= 7.0) items.push_back(std::move(item));
    }
    sort_by_rating(items);
    if (items.size() > kMaxItems) items.resize(kMaxItems);
    return items;
}

std::vector<DiscoverItem> TvMazeClient::by_genre(const std::string& genre) {
    auto shows = search_shows(genre);

    std::vector<DiscoverItem> items;
    for (const auto& show : shows) {
        if (items.size() >= kMaxItems) break;
        if (has_genre(show, genre)) items.push_back(discover_item_from_show(show));
    }

    // Too few genre matches: fall back to the plain search results
    if (items.size() < 10) {
        items.clear();
        for (const auto& show : shows) {
            if (items.size() >= kMaxItems) break;
            items.push_back(discover_item_from_show(show));
        }
    }

    sort_by_rating(items);
    return items;
}

std::vector<DiscoverItem> TvMazeClient::by_category(DiscoverCategory category) {
    switch (category) {
        case DiscoverCategory::AiringToday: return airing_today();
        case DiscoverCategory::Popular:     return popular();
        case DiscoverCategory::TopRated:    return top_rated();
        default:                            return by_genre(discover_genre(category));
    }
}

std::vector<DiscoverItem> TvMazeClient::search(const std::string& query) {
    std::vector<DiscoverItem> items;
    for (const auto& show : search_shows(query)) {
        if (items.size() >= kMaxItems) break;
        items.push_back(discover_item_from_show(show));
    }
    return items;
}

} // namespace chanview
