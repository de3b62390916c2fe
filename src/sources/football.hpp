#pragma once
#include "../cache/fetcher.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chanview {

enum class FootballCategory {
    Today,
    Tomorrow,
    ThisWeek,
    PremierLeague,
    LaLiga,
    SerieA,
    Bundesliga,
    Ligue1,
    ChampionsLeague,
};

const std::vector<FootballCategory>& all_football_categories();
std::string football_category_name(FootballCategory category);
std::string football_category_slug(FootballCategory category);
std::optional<FootballCategory> parse_football_category(const std::string& slug);
// Competition matched by a league category, empty for date categories
std::string football_competition(FootballCategory category);

struct Broadcaster {
    std::string country;
    std::string channel;
};

struct FootballFixture {
    int64_t id = 0;
    std::string home_team;
    std::string away_team;
    std::string competition;
    std::string fixture_date;                 // YYYY-MM-DD
    std::optional<std::string> fixture_time;
    std::optional<std::string> venue;
    std::vector<Broadcaster> broadcasters;

    std::string match_title() const;          // "Home vs Away"
    std::string display_time() const;         // "TBD" when unknown
    std::vector<std::string> all_channel_names() const;
    std::map<std::string, std::vector<std::string>> channels_by_country() const;
};

// Inclusive date range plus optional competition substring.
// Empty fields don't constrain.
struct FixtureFilter {
    std::string date_from;
    std::string date_to;
    std::string competition;
};

FixtureFilter filter_for(FootballCategory category, const std::string& today);

struct FootballStats {
    int64_t total_fixtures = 0;
    int64_t upcoming_fixtures = 0;
    int64_t total_broadcasters = 0;
    std::vector<std::string> competitions;    // upcoming only, sorted
    std::optional<std::string> min_date;
    std::optional<std::string> max_date;
};

// Read side of the fixtures datastore. query() and stats() may be called
// from several worker threads at once.
class FixturesRepository {
public:
    virtual ~FixturesRepository() = default;

    virtual bool available() const = 0;
    virtual std::vector<FootballFixture> query(const FixtureFilter& filter) = 0;
    virtual FootballStats stats(const std::string& today) = 0;
    virtual std::string describe() const = 0;
};

// SQLite database written by the fixtures scraper. Opens a read-only
// connection per call.
class SqliteFixturesRepository : public FixturesRepository {
public:
    explicit SqliteFixturesRepository(std::string path);

    bool available() const override;
    std::vector<FootballFixture> query(const FixtureFilter& filter) override;
    FootballStats stats(const std::string& today) override;
    std::string describe() const override { return path_; }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// First existing database among the configured path and the locations the
// scraper writes to. nullopt when none exists.
std::optional<std::string> find_fixtures_database(const std::string& configured_path);

using TodayFn = std::function<std::string()>;

// Local calendar date right now
std::string local_today();

class FootballFetcher : public Fetcher<FootballCategory, std::vector<FootballFixture>> {
public:
    static constexpr const char* kMissingDatabase =
        "Database not found. Run Soccer-Scraper to fetch fixtures.";

    explicit FootballFetcher(std::shared_ptr<FixturesRepository> repository,
                             TodayFn today = local_today);

    std::vector<FootballFixture> fetch(const FootballCategory& category) override;
    std::optional<std::string> unavailable_reason() const override;
    std::string source_name() const override { return "fixtures"; }

private:
    std::shared_ptr<FixturesRepository> repository_;
    TodayFn today_;
};

// Database summary as of the given day (key is "YYYY-MM-DD").
class FootballStatsFetcher : public Fetcher<std::string, FootballStats> {
public:
    explicit FootballStatsFetcher(std::shared_ptr<FixturesRepository> repository)
        : repository_(std::move(repository)) {}

    FootballStats fetch(const std::string& today) override;
    std::optional<std::string> unavailable_reason() const override;
    std::string source_name() const override { return "fixtures-stats"; }

private:
    std::shared_ptr<FixturesRepository> repository_;
};

} // namespace chanview
