#include "football.hpp"
#include "../util.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <stdexcept>

namespace chanview {

// ── Categories ───────────────────────────────────────────────────

const std::vector<FootballCategory>& all_football_categories() {
    static const std::vector<FootballCategory> all = {
        FootballCategory::Today,         FootballCategory::Tomorrow,
        FootballCategory::ThisWeek,      FootballCategory::PremierLeague,
        FootballCategory::LaLiga,        FootballCategory::SerieA,
        FootballCategory::Bundesliga,    FootballCategory::Ligue1,
        FootballCategory::ChampionsLeague,
    };
    return all;
}

std::string football_category_name(FootballCategory category) {
    switch (category) {
        case FootballCategory::Today:    return "Today's Matches";
        case FootballCategory::Tomorrow: return "Tomorrow";
        case FootballCategory::ThisWeek: return "This Week";
        default:                         return football_competition(category);
    }
}

std::string football_category_slug(FootballCategory category) {
    switch (category) {
        case FootballCategory::Today:           return "today";
        case FootballCategory::Tomorrow:        return "tomorrow";
        case FootballCategory::ThisWeek:        return "this-week";
        case FootballCategory::PremierLeague:   return "premier-league";
        case FootballCategory::LaLiga:          return "la-liga";
        case FootballCategory::SerieA:          return "serie-a";
        case FootballCategory::Bundesliga:      return "bundesliga";
        case FootballCategory::Ligue1:          return "ligue-1";
        case FootballCategory::ChampionsLeague: return "champions-league";
    }
    return "";
}

std::optional<FootballCategory> parse_football_category(const std::string& slug) {
    std::string wanted = to_lower(trim(slug));
    for (auto category : all_football_categories()) {
        if (football_category_slug(category) == wanted) return category;
    }
    return std::nullopt;
}

std::string football_competition(FootballCategory category) {
    switch (category) {
        case FootballCategory::PremierLeague:   return "Premier League";
        case FootballCategory::LaLiga:          return "La Liga";
        case FootballCategory::SerieA:          return "Serie A";
        case FootballCategory::Bundesliga:      return "Bundesliga";
        case FootballCategory::Ligue1:          return "Ligue 1";
        case FootballCategory::ChampionsLeague: return "Champions League";
        default:                                return "";
    }
}

FixtureFilter filter_for(FootballCategory category, const std::string& today) {
    FixtureFilter filter;
    switch (category) {
        case FootballCategory::Today:
            filter.date_from = today;
            filter.date_to = today;
            break;
        case FootballCategory::Tomorrow:
            filter.date_from = add_days(today, 1);
            filter.date_to = filter.date_from;
            break;
        case FootballCategory::ThisWeek:
            filter.date_from = today;
            filter.date_to = add_days(today, 7);
            break;
        default:
            filter.date_from = today;
            filter.competition = football_competition(category);
            break;
    }
    return filter;
}

// ── Fixture helpers ──────────────────────────────────────────────

std::string FootballFixture::match_title() const {
    return home_team + " vs " + away_team;
}

std::string FootballFixture::display_time() const {
    if (!fixture_time || fixture_time->empty()) return "TBD";
    return *fixture_time;
}

std::vector<std::string> FootballFixture::all_channel_names() const {
    std::vector<std::string> names;
    names.reserve(broadcasters.size());
    for (const auto& b : broadcasters) names.push_back(b.channel);
    return names;
}

std::map<std::string, std::vector<std::string>> FootballFixture::channels_by_country() const {
    std::map<std::string, std::vector<std::string>> grouped;
    for (const auto& b : broadcasters) grouped[b.country].push_back(b.channel);
    return grouped;
}

// ── SQLite repository ────────────────────────────────────────────

namespace {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

// RAII read-only connection
struct DbGuard {
    sqlite3* db = nullptr;

    explicit DbGuard(const std::string& path) {
        if (sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
            std::string err = db ? sqlite3_errmsg(db) : "unknown error";
            if (db) {
                sqlite3_close(db);
                db = nullptr;
            }
            throw std::runtime_error("Failed to open database: " + err);
        }
        sqlite3_busy_timeout(db, 2000);
    }
    ~DbGuard() { if (db) sqlite3_close(db); }

    DbGuard(const DbGuard&) = delete;
    DbGuard& operator=(const DbGuard&) = delete;
};

void prepare(sqlite3* db, const std::string& sql, StmtGuard& g) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("Failed to prepare query: ") + sqlite3_errmsg(db));
    }
}

// Throws unless a step loop ended cleanly
void check_done(sqlite3* db, int rc) {
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("Query failed: ") + sqlite3_errmsg(db));
    }
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    const auto* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return column_text(stmt, col);
}

int64_t count_query(sqlite3* db, const std::string& sql,
                    const std::vector<std::string>& params = {}) {
    StmtGuard g;
    prepare(db, sql, g);
    for (size_t i = 0; i < params.size(); i++) {
        sqlite3_bind_text(g.stmt, static_cast<int>(i + 1), params[i].c_str(), -1,
                          SQLITE_TRANSIENT);
    }
    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_ROW) return sqlite3_column_int64(g.stmt, 0);
    check_done(db, rc);
    return 0;
}

std::optional<std::string> text_query(sqlite3* db, const std::string& sql,
                                      const std::string& param) {
    StmtGuard g;
    prepare(db, sql, g);
    sqlite3_bind_text(g.stmt, 1, param.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_ROW) return column_optional_text(g.stmt, 0);
    check_done(db, rc);
    return std::nullopt;
}

} // namespace

SqliteFixturesRepository::SqliteFixturesRepository(std::string path)
    : path_(std::move(path)) {}

bool SqliteFixturesRepository::available() const {
    std::error_code ec;
    return !path_.empty() && std::filesystem::is_regular_file(path_, ec);
}

std::vector<FootballFixture> SqliteFixturesRepository::query(const FixtureFilter& filter) {
    DbGuard conn(path_);

    std::string sql =
        "SELECT id, home_team, away_team, competition, fixture_date, fixture_time, venue "
        "FROM fixtures";
    std::vector<std::string> params;
    std::string where;
    auto add_clause = [&](const std::string& clause, const std::string& value) {
        where += where.empty() ? " WHERE " : " AND ";
        where += clause;
        params.push_back(value);
    };
    if (!filter.date_from.empty()) add_clause("fixture_date >= ?", filter.date_from);
    if (!filter.date_to.empty()) add_clause("fixture_date <= ?", filter.date_to);
    if (!filter.competition.empty()) add_clause("competition LIKE ?", "%" + filter.competition + "%");
    sql += where + " ORDER BY fixture_date ASC, fixture_time ASC";

    std::vector<FootballFixture> fixtures;
    {
        StmtGuard g;
        prepare(conn.db, sql, g);
        for (size_t i = 0; i < params.size(); i++) {
            sqlite3_bind_text(g.stmt, static_cast<int>(i + 1), params[i].c_str(), -1,
                              SQLITE_TRANSIENT);
        }
        int rc;
        while ((rc = sqlite3_step(g.stmt)) == SQLITE_ROW) {
            FootballFixture f;
            f.id = sqlite3_column_int64(g.stmt, 0);
            f.home_team = column_text(g.stmt, 1);
            f.away_team = column_text(g.stmt, 2);
            f.competition = column_text(g.stmt, 3);
            f.fixture_date = column_text(g.stmt, 4);
            f.fixture_time = column_optional_text(g.stmt, 5);
            f.venue = column_optional_text(g.stmt, 6);
            fixtures.push_back(std::move(f));
        }
        check_done(conn.db, rc);
    }

    StmtGuard bg;
    prepare(conn.db,
            "SELECT country, channel FROM broadcasters WHERE fixture_id = ? "
            "ORDER BY country, channel",
            bg);
    for (auto& f : fixtures) {
        sqlite3_reset(bg.stmt);
        sqlite3_bind_int64(bg.stmt, 1, f.id);
        int rc;
        while ((rc = sqlite3_step(bg.stmt)) == SQLITE_ROW) {
            f.broadcasters.push_back({column_text(bg.stmt, 0), column_text(bg.stmt, 1)});
        }
        check_done(conn.db, rc);
    }
    return fixtures;
}

FootballStats SqliteFixturesRepository::stats(const std::string& today) {
    DbGuard conn(path_);

    FootballStats s;
    s.total_fixtures = count_query(conn.db, "SELECT COUNT(*) FROM fixtures");
    s.total_broadcasters = count_query(conn.db, "SELECT COUNT(*) FROM broadcasters");
    s.upcoming_fixtures = count_query(conn.db,
        "SELECT COUNT(*) FROM fixtures WHERE fixture_date >= ?", {today});

    StmtGuard g;
    prepare(conn.db,
            "SELECT DISTINCT competition FROM fixtures WHERE fixture_date >= ? "
            "ORDER BY competition",
            g);
    sqlite3_bind_text(g.stmt, 1, today.c_str(), -1, SQLITE_TRANSIENT);
    int rc;
    while ((rc = sqlite3_step(g.stmt)) == SQLITE_ROW) {
        s.competitions.push_back(column_text(g.stmt, 0));
    }
    check_done(conn.db, rc);

    s.min_date = text_query(conn.db,
        "SELECT MIN(fixture_date) FROM fixtures WHERE fixture_date >= ?", today);
    s.max_date = text_query(conn.db,
        "SELECT MAX(fixture_date) FROM fixtures WHERE fixture_date >= ?", today);
    return s;
}

std::optional<std::string> find_fixtures_database(const std::string& configured_path) {
    namespace fs = std::filesystem;
    std::error_code ec;

    if (!configured_path.empty()) {
        std::string path = expand_home(configured_path);
        if (fs::is_regular_file(path, ec)) return path;
        return std::nullopt;
    }

    std::vector<fs::path> candidates;
    auto exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) candidates.push_back(exe.parent_path() / "Soccer-Scraper-main/output/fixtures.db");
    candidates.emplace_back("Soccer-Scraper-main/output/fixtures.db");
    candidates.emplace_back("../Soccer-Scraper-main/output/fixtures.db");
    candidates.emplace_back("./output/fixtures.db");
    candidates.emplace_back(expand_home("~/.chanview/fixtures.db"));

    for (const auto& path : candidates) {
        if (fs::is_regular_file(path, ec)) return path.string();
    }
    return std::nullopt;
}

std::string local_today() {
    return local_date(static_cast<int64_t>(epoch_seconds()));
}

// ── Fetchers ─────────────────────────────────────────────────────

FootballFetcher::FootballFetcher(std::shared_ptr<FixturesRepository> repository,
                                 TodayFn today)
    : repository_(std::move(repository)), today_(std::move(today)) {
    if (!today_) throw std::invalid_argument("FootballFetcher requires a date source");
}

std::vector<FootballFixture> FootballFetcher::fetch(const FootballCategory& category) {
    if (!repository_) throw std::runtime_error(kMissingDatabase);
    return repository_->query(filter_for(category, today_()));
}

std::optional<std::string> FootballFetcher::unavailable_reason() const {
    if (!repository_ || !repository_->available()) return std::string(kMissingDatabase);
    return std::nullopt;
}

FootballStats FootballStatsFetcher::fetch(const std::string& today) {
    if (!repository_) throw std::runtime_error(FootballFetcher::kMissingDatabase);
    return repository_->stats(today);
}

std::optional<std::string> FootballStatsFetcher::unavailable_reason() const {
    if (!repository_ || !repository_->available()) {
        return std::string(FootballFetcher::kMissingDatabase);
    }
    return std::nullopt;
}

} // namespace chanview
