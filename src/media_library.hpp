#pragma once
#include "cache/clock.hpp"
#include "cache/request_coordinator.hpp"
#include "cache/spawner.hpp"
#include "config.hpp"
#include "epg.hpp"
#include "event_bus.hpp"
#include "http.hpp"
#include "sources/football.hpp"
#include "sources/omdb.hpp"
#include "sources/poster.hpp"
#include "sources/tmdb.hpp"
#include "sources/tvmaze.hpp"
#include "sources/xtream.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chanview {

using DiscoverCache     = RequestCoordinator<DiscoverCategory, std::vector<DiscoverItem>>;
using ShowSearchCache   = RequestCoordinator<std::string, std::vector<DiscoverItem>>;
using TmdbCache         = RequestCoordinator<TmdbCategory, std::vector<TmdbItem>>;
using TmdbSearchCache   = RequestCoordinator<std::string, std::vector<TmdbItem>>;
using OmdbCache         = RequestCoordinator<OmdbCategory, std::vector<OmdbItem>>;
using FixturesCache     = RequestCoordinator<FootballCategory, std::vector<FootballFixture>>;
using FixtureStatsCache = RequestCoordinator<std::string, FootballStats>;
using EpgCache          = RequestCoordinator<std::string, std::vector<EpgProgram>>;
using PosterCache       = RequestCoordinator<std::string, PosterImage>;

// Collaborators shared by every cache. Tests swap in mocks here.
struct MediaSources {
    std::shared_ptr<HttpClient> http;
    // Null: look for the scraper's database (Config::fixtures_db first)
    std::shared_ptr<FixturesRepository> fixtures;
    std::shared_ptr<Clock> clock = default_clock();
    Spawner spawner = detached_spawner();
    TodayFn today = local_today;
    std::string tvmaze_base_url = TvMazeClient::kDefaultBaseUrl;
    std::string tmdb_base_url = TmdbClient::kDefaultBaseUrl;
    std::string omdb_base_url = OmdbClient::kDefaultBaseUrl;
};

// Coordinator options for one source, from config tuning.
CoordinatorOptions coordinator_options(const Config& config, const std::string& source);

// Every background cache the browser reads from, driven by one render loop.
// Not thread-safe: construct, request and drain on the consumer thread.
class MediaLibrary {
public:
    MediaLibrary(const Config& config, MediaSources sources, EventBus* bus = nullptr);

    MediaLibrary(const MediaLibrary&) = delete;
    MediaLibrary& operator=(const MediaLibrary&) = delete;

    DiscoverCache& discover() { return *discover_; }
    ShowSearchCache& show_search() { return *show_search_; }
    TmdbCache& tmdb() { return *tmdb_; }
    TmdbSearchCache& tmdb_search() { return *tmdb_search_; }
    OmdbCache& omdb() { return *omdb_; }
    FixturesCache& fixtures() { return *fixtures_; }
    FixtureStatsCache& fixture_stats() { return *fixture_stats_; }
    EpgCache& epg() { return *epg_; }
    PosterCache& posters() { return *posters_; }

    // Drain every cache once. Publishes one ContentLoaded/ContentFailed per
    // delivered message, then a single RepaintRequested if anything changed.
    // Returns the number of delivered messages.
    size_t process_pending();

    // Convenience requests that skip empty keys
    void request_poster(const std::string& url);
    void search_shows(const std::string& query);
    void search_tmdb(const std::string& query);
    void request_epg(const std::string& stream_id);
    void request_fixture_stats();

    std::optional<EpgProgram> current_program(const std::string& stream_id, int64_t now) const;
    std::optional<EpgProgram> next_program(const std::string& stream_id, int64_t now) const;
    // nullopt until the stream's guide has been loaded
    std::optional<EpgTimeline> timeline(const std::string& stream_id) const;

    // New panel login: drops the guide cache and everything in flight for it.
    void set_xtream_credentials(XtreamCredentials credentials);
    const XtreamCredentials& xtream_credentials() const { return credentials_; }
    void disconnect();

    // Look for the fixtures database again (after the scraper ran).
    void reload_fixtures();

    void clear_all();

    // Workers in flight across every cache
    size_t pending_count() const;

private:
    void rebuild_epg();
    void rebuild_fixtures();
    void publish_cleared(const std::string& source);

    Config config_;
    MediaSources sources_;
    EventBus* bus_;
    XtreamCredentials credentials_;

    std::unique_ptr<DiscoverCache> discover_;
    std::unique_ptr<ShowSearchCache> show_search_;
    std::unique_ptr<TmdbCache> tmdb_;
    std::unique_ptr<TmdbSearchCache> tmdb_search_;
    std::unique_ptr<OmdbCache> omdb_;
    std::unique_ptr<FixturesCache> fixtures_;
    std::unique_ptr<FixtureStatsCache> fixture_stats_;
    std::unique_ptr<EpgCache> epg_;
    std::unique_ptr<PosterCache> posters_;
};

} // namespace chanview
