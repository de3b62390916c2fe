#include "media_library.hpp"
#include "util.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace chanview {

CoordinatorOptions coordinator_options(const Config& config, const std::string& source) {
    CacheTuning tuning = config.tuning_for(source);
    CoordinatorOptions options;
    options.name = source;
    options.ttl = std::chrono::seconds(tuning.ttl_seconds);
    options.cooldown = std::chrono::seconds(tuning.cooldown_seconds);
    options.drop_stale_after_clear = config.drop_stale_after_clear;
    return options;
}

// ── Report publishing ────────────────────────────────────────────

namespace {

std::string key_text(DiscoverCategory c) { return discover_category_slug(c); }
std::string key_text(TmdbCategory c) { return tmdb_category_slug(c); }
std::string key_text(OmdbCategory c) { return omdb_category_slug(c); }
std::string key_text(FootballCategory c) { return football_category_slug(c); }
std::string key_text(const std::string& s) { return s; }

template<typename Cache>
size_t drain(Cache& cache, EventBus* bus) {
    auto report = cache.process_pending();
    if (bus && bus->has_subscribers(ContentLoadedEvent::TAG)) {
        for (const auto& key : report.loaded) {
            ContentLoadedEvent ev;
            ev.source = cache.name();
            ev.key = key_text(key);
            bus->publish(ev);
        }
    }
    if (bus && bus->has_subscribers(ContentFailedEvent::TAG)) {
        for (const auto& [key, error] : report.failed) {
            ContentFailedEvent ev;
            ev.source = cache.name();
            ev.key = key_text(key);
            ev.error = error;
            bus->publish(ev);
        }
    }
    return report.delivered();
}

} // namespace

// ── MediaLibrary ─────────────────────────────────────────────────

MediaLibrary::MediaLibrary(const Config& config, MediaSources sources, EventBus* bus)
    : config_(config), sources_(std::move(sources)), bus_(bus) {
    if (!sources_.http) throw std::invalid_argument("MediaLibrary requires an HTTP client");
    if (!sources_.clock) throw std::invalid_argument("MediaLibrary requires a clock");
    if (!sources_.spawner) throw std::invalid_argument("MediaLibrary requires a spawner");

    credentials_ = XtreamCredentials{config_.xtream.server_url,
                                     config_.xtream.username,
                                     config_.xtream.password};

    TvMazeClient tvmaze(sources_.http, sources_.tvmaze_base_url);
    discover_ = std::make_unique<DiscoverCache>(
        coordinator_options(config_, "discover"),
        std::make_shared<TvMazeDiscoverFetcher>(tvmaze),
        sources_.clock, sources_.spawner);
    show_search_ = std::make_unique<ShowSearchCache>(
        coordinator_options(config_, "search"),
        std::make_shared<TvMazeSearchFetcher>(tvmaze),
        sources_.clock, sources_.spawner);

    TmdbClient tmdb(sources_.http, config_.tmdb_api_key, sources_.tmdb_base_url);
    tmdb_ = std::make_unique<TmdbCache>(
        coordinator_options(config_, "tmdb"),
        std::make_shared<TmdbFetcher>(tmdb),
        sources_.clock, sources_.spawner);
    auto tmdb_search_options = coordinator_options(config_, "search");
    tmdb_search_options.name = "tmdb-search";
    tmdb_search_ = std::make_unique<TmdbSearchCache>(
        tmdb_search_options,
        std::make_shared<TmdbSearchFetcher>(tmdb),
        sources_.clock, sources_.spawner);

    OmdbClient omdb(sources_.http, config_.omdb_api_key, sources_.omdb_base_url);
    omdb_ = std::make_unique<OmdbCache>(
        coordinator_options(config_, "omdb"),
        std::make_shared<OmdbFetcher>(omdb),
        sources_.clock, sources_.spawner);

    posters_ = std::make_unique<PosterCache>(
        coordinator_options(config_, "posters"),
        std::make_shared<PosterFetcher>(sources_.http),
        sources_.clock, sources_.spawner);

    rebuild_fixtures();
    rebuild_epg();
}

void MediaLibrary::rebuild_epg() {
    epg_ = std::make_unique<EpgCache>(
        coordinator_options(config_, "epg"),
        make_epg_fetcher(sources_.http, credentials_),
        sources_.clock, sources_.spawner);
}

void MediaLibrary::rebuild_fixtures() {
    auto repository = sources_.fixtures;
    if (!repository) {
        if (auto path = find_fixtures_database(config_.fixtures_db)) {
            std::cerr << "[fixtures] Using database " << *path << "\n";
            repository = std::make_shared<SqliteFixturesRepository>(*path);
        }
    }

    fixtures_ = std::make_unique<FixturesCache>(
        coordinator_options(config_, "fixtures"),
        std::make_shared<FootballFetcher>(repository, sources_.today),
        sources_.clock, sources_.spawner);
    auto stats_options = coordinator_options(config_, "fixtures");
    stats_options.name = "fixtures-stats";
    fixture_stats_ = std::make_unique<FixtureStatsCache>(
        stats_options,
        std::make_shared<FootballStatsFetcher>(repository),
        sources_.clock, sources_.spawner);
}

size_t MediaLibrary::process_pending() {
    size_t changes = 0;
    changes += drain(*discover_, bus_);
    changes += drain(*show_search_, bus_);
    changes += drain(*tmdb_, bus_);
    changes += drain(*tmdb_search_, bus_);
    changes += drain(*omdb_, bus_);
    changes += drain(*fixtures_, bus_);
    changes += drain(*fixture_stats_, bus_);
    changes += drain(*epg_, bus_);
    changes += drain(*posters_, bus_);

    if (changes > 0 && bus_) {
        RepaintRequestedEvent ev;
        ev.changes = changes;
        bus_->publish(ev);
    }
    return changes;
}

void MediaLibrary::request_poster(const std::string& url) {
    if (trim(url).empty()) return;
    posters_->request(url);
}

void MediaLibrary::search_shows(const std::string& query) {
    std::string q = trim(query);
    if (q.empty()) return;
    show_search_->request(q);
}

void MediaLibrary::search_tmdb(const std::string& query) {
    std::string q = trim(query);
    if (q.empty()) return;
    tmdb_search_->request(q);
}

void MediaLibrary::request_epg(const std::string& stream_id) {
    std::string id = trim(stream_id);
    if (id.empty()) return;
    epg_->request(id);
}

void MediaLibrary::request_fixture_stats() {
    fixture_stats_->request(sources_.today());
}

std::optional<EpgTimeline> MediaLibrary::timeline(const std::string& stream_id) const {
    const auto* programs = epg_->peek(trim(stream_id));
    if (!programs) return std::nullopt;
    return EpgTimeline(*programs);
}

std::optional<EpgProgram> MediaLibrary::current_program(const std::string& stream_id,
                                                        int64_t now) const {
    auto t = timeline(stream_id);
    if (!t) return std::nullopt;
    return t->current_program(now);
}

std::optional<EpgProgram> MediaLibrary::next_program(const std::string& stream_id,
                                                     int64_t now) const {
    auto t = timeline(stream_id);
    if (!t) return std::nullopt;
    return t->next_program(now);
}

void MediaLibrary::set_xtream_credentials(XtreamCredentials credentials) {
    credentials_ = std::move(credentials);
    rebuild_epg();
    publish_cleared("epg");
}

void MediaLibrary::disconnect() {
    epg_->clear();
    publish_cleared("epg");
}

void MediaLibrary::reload_fixtures() {
    rebuild_fixtures();
    publish_cleared("fixtures");
}

void MediaLibrary::clear_all() {
    discover_->clear();
    show_search_->clear();
    tmdb_->clear();
    tmdb_search_->clear();
    omdb_->clear();
    fixtures_->clear();
    fixture_stats_->clear();
    epg_->clear();
    posters_->clear();
    publish_cleared("all");
}

size_t MediaLibrary::pending_count() const {
    return discover_->pending_count() + show_search_->pending_count() +
           tmdb_->pending_count() + tmdb_search_->pending_count() +
           omdb_->pending_count() +
           fixtures_->pending_count() + fixture_stats_->pending_count() +
           epg_->pending_count() + posters_->pending_count();
}

void MediaLibrary::publish_cleared(const std::string& source) {
    if (!bus_) return;
    CacheClearedEvent ev;
    ev.source = source;
    bus_->publish(ev);
}

} // namespace chanview
