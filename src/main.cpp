#include "config.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "http.hpp"
#include "media_library.hpp"
#include "util.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <thread>
#include <vector>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: chanview [options]\n"
              << "\n"
              << "Options:\n"
              << "  --discover CAT       TV shows from TVmaze (airing-today, popular, top-rated,\n"
              << "                       sci-fi, drama, comedy, action)\n"
              << "  --tmdb CAT           Movies/TV from TMDB (trending, trending-movies, trending-tv,\n"
              << "                       popular-movies, popular-tv, top-rated-movies, top-rated-tv,\n"
              << "                       now-playing, airing-today)\n"
              << "  --omdb CAT           Movies/series from OMDb (new-movies-2026, movies-2025,\n"
              << "                       series-2025, action, comedy, horror, sci-fi, drama,\n"
              << "                       crime, marvel, star-wars)\n"
              << "  --fixtures CAT       Football fixtures (today, tomorrow, this-week, premier-league,\n"
              << "                       la-liga, serie-a, bundesliga, ligue-1, champions-league)\n"
              << "  --epg STREAM_ID      Now/next for a live stream (needs Xtream credentials)\n"
              << "  --poster URL         Download artwork\n"
              << "  --search QUERY       Search TVmaze (and TMDB when a key is set)\n"
              << "  --frames N           Stop after N frames (default: when everything resolved)\n"
              << "  --interval MS        Frame interval (default: frame_interval_ms, 500)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  TMDB_API_KEY         API key for TMDB\n"
              << "  OMDB_API_KEY         API key for OMDb\n"
              << "  XTREAM_SERVER_URL    Xtream panel URL\n"
              << "  XTREAM_USERNAME      Xtream username\n"
              << "  XTREAM_PASSWORD      Xtream password\n"
              << "  CHANVIEW_FIXTURES_DB Path to the fixtures database\n";
}

// One thing the user asked for, re-requested every frame until resolved.
struct Selection {
    std::string label;
    std::function<void()> request;
    std::function<bool()> ready;        // value cached
    std::function<void()> print;
    std::function<std::string()> error; // non-empty once given up
    bool done = false;
};

static void print_discover(const std::vector<chanview::DiscoverItem>& items) {
    for (const auto& item : items) {
        std::cout << "  " << item.title;
        if (item.year) std::cout << " (" << *item.year << ")";
        if (item.rating) std::cout << "  " << *item.rating;
        std::cout << "\n";
    }
}

static void print_omdb(const std::vector<chanview::OmdbItem>& items) {
    for (const auto& item : items) {
        std::cout << "  [" << item.content_type_name() << "] " << item.title;
        if (item.year) std::cout << " (" << *item.year << ")";
        std::cout << "  " << item.imdb_id << "\n";
    }
}

static void print_tmdb(const std::vector<chanview::TmdbItem>& items) {
    for (const auto& item : items) {
        std::cout << "  [" << item.media_type_name() << "] " << item.title;
        if (auto year = item.year()) std::cout << " (" << *year << ")";
        std::cout << "  " << item.vote_average << "\n";
    }
}

// Failures seen on the bus, by "source:key"
static std::map<std::string, std::string> g_failures;

// Why a key gave up: its reported failure, else the cache's last error
// (an unavailable source never spawns a worker). Empty while in flight.
template<typename Cache, typename Key>
static std::string key_error(const Cache& cache, const Key& key, const std::string& key_text) {
    if (cache.is_loading(key)) return "";
    auto it = g_failures.find(cache.name() + ":" + key_text);
    if (it != g_failures.end()) return it->second;
    return cache.last_error().value_or("");
}

int main(int argc, char* argv[]) try {
    std::vector<std::string> discover_args, tmdb_args, omdb_args, fixture_args, epg_args,
                             poster_args, search_args;
    long max_frames = 0;
    long interval_ms = -1;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--discover") == 0 && i + 1 < argc) {
            discover_args.push_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--tmdb") == 0 && i + 1 < argc) {
            tmdb_args.push_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--omdb") == 0 && i + 1 < argc) {
            omdb_args.push_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--fixtures") == 0 && i + 1 < argc) {
            fixture_args.push_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--epg") == 0 && i + 1 < argc) {
            epg_args.push_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--poster") == 0 && i + 1 < argc) {
            poster_args.push_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--search") == 0 && i + 1 < argc) {
            search_args.push_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--frames") == 0 && i + 1 < argc) {
            max_frames = chanview::parse_int64(argv[++i]).value_or(-1);
            if (max_frames < 0) {
                std::cerr << "Invalid --frames value\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "--interval") == 0 && i + 1 < argc) {
            interval_ms = chanview::parse_int64(argv[++i]).value_or(-1);
            if (interval_ms <= 0) {
                std::cerr << "Invalid --interval value\n";
                return 1;
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    chanview::http_init();
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    chanview::http_set_abort_flag(&g_shutdown);

    auto config = chanview::Config::load();
    if (interval_ms < 0) interval_ms = config.frame_interval_ms;

    chanview::EventBus bus;
    chanview::MediaSources sources;
    sources.http = std::make_shared<chanview::CurlHttpClient>();
    chanview::MediaLibrary library(config, sources, &bus);

    chanview::subscribe<chanview::ContentFailedEvent>(bus,
        [](const chanview::ContentFailedEvent& ev) {
            std::cerr << "[" << ev.source << "] " << ev.key << ": " << ev.error << "\n";
            g_failures[ev.source + ":" + ev.key] = ev.error;
        });

    std::vector<Selection> selections;

    for (const auto& arg : discover_args) {
        auto category = chanview::parse_discover_category(arg);
        if (!category) {
            std::cerr << "Unknown discover category: " << arg << "\n";
            return 1;
        }
        auto c = *category;
        auto& cache = library.discover();
        selections.push_back({"Discover: " + chanview::discover_category_name(c),
            [&cache, c] { cache.request(c); },
            [&cache, c] { return cache.peek(c) != nullptr; },
            [&cache, c] { print_discover(*cache.peek(c)); },
            [&cache, c] { return key_error(cache, c, chanview::discover_category_slug(c)); }});
    }

    for (const auto& arg : tmdb_args) {
        auto category = chanview::parse_tmdb_category(arg);
        if (!category) {
            std::cerr << "Unknown TMDB category: " << arg << "\n";
            return 1;
        }
        auto c = *category;
        auto& cache = library.tmdb();
        selections.push_back({"TMDB: " + chanview::tmdb_category_name(c),
            [&cache, c] { cache.request(c); },
            [&cache, c] { return cache.peek(c) != nullptr; },
            [&cache, c] { print_tmdb(*cache.peek(c)); },
            [&cache, c] { return key_error(cache, c, chanview::tmdb_category_slug(c)); }});
    }

    for (const auto& arg : omdb_args) {
        auto category = chanview::parse_omdb_category(arg);
        if (!category) {
            std::cerr << "Unknown OMDb category: " << arg << "\n";
            return 1;
        }
        auto c = *category;
        auto& cache = library.omdb();
        selections.push_back({"OMDb: " + chanview::omdb_category_name(c),
            [&cache, c] { cache.request(c); },
            [&cache, c] { return cache.peek(c) != nullptr; },
            [&cache, c] { print_omdb(*cache.peek(c)); },
            [&cache, c] { return key_error(cache, c, chanview::omdb_category_slug(c)); }});
    }

    for (const auto& arg : fixture_args) {
        auto category = chanview::parse_football_category(arg);
        if (!category) {
            std::cerr << "Unknown fixtures category: " << arg << "\n";
            return 1;
        }
        auto c = *category;
        auto& lib = library;
        selections.push_back({"Fixtures: " + chanview::football_category_name(c),
            [&lib, c] { lib.fixtures().request(c); },
            [&lib, c] { return lib.fixtures().peek(c) != nullptr; },
            [&lib, c] {
                for (const auto& f : *lib.fixtures().peek(c)) {
                    std::cout << "  " << f.fixture_date << " " << f.display_time() << "  "
                              << f.match_title() << "  [" << f.competition << "]\n";
                    for (const auto& [country, channels] : f.channels_by_country()) {
                        std::cout << "      " << country << ":";
                        for (const auto& ch : channels) std::cout << " " << ch;
                        std::cout << "\n";
                    }
                }
            },
            [&lib, c] {
                return key_error(lib.fixtures(), c, chanview::football_category_slug(c));
            }});
    }

    if (!epg_args.empty() && !config.has_xtream_credentials()) {
        std::cerr << "No Xtream credentials configured; skipping --epg "
                  << "(set XTREAM_SERVER_URL or xtream.server_url)\n";
        epg_args.clear();
    }

    for (const auto& arg : epg_args) {
        auto stream_id = chanview::trim(arg);
        auto& lib = library;
        selections.push_back({"EPG: stream " + stream_id,
            [&lib, stream_id] { lib.request_epg(stream_id); },
            [&lib, stream_id] { return lib.epg().peek(stream_id) != nullptr; },
            [&lib, stream_id] {
                auto now = static_cast<int64_t>(chanview::epoch_seconds());
                if (auto cur = lib.current_program(stream_id, now)) {
                    std::cout << "  Now:  " << cur->start_time_hhmm() << "-"
                              << cur->end_time_hhmm() << "  " << cur->title << "  "
                              << static_cast<int>(cur->progress(now) * 100) << "%\n";
                } else {
                    std::cout << "  Now:  (no guide data)\n";
                }
                if (auto next = lib.next_program(stream_id, now)) {
                    std::cout << "  Next: " << next->start_time_hhmm() << "-"
                              << next->end_time_hhmm() << "  " << next->title << "\n";
                }
            },
            [&lib, stream_id] { return key_error(lib.epg(), stream_id, stream_id); }});
    }

    for (const auto& url : poster_args) {
        auto& lib = library;
        selections.push_back({"Poster: " + url,
            [&lib, url] { lib.request_poster(url); },
            [&lib, url] { return lib.posters().peek(url) != nullptr; },
            [&lib, url] {
                const auto* image = lib.posters().peek(url);
                std::cout << "  " << image->mime_type << ", " << image->bytes.size()
                          << " bytes\n";
            },
            [&lib, url] { return key_error(lib.posters(), url, url); }});
    }

    for (const auto& query : search_args) {
        auto q = chanview::trim(query);
        auto& lib = library;
        selections.push_back({"Search TVmaze: " + q,
            [&lib, q] { lib.search_shows(q); },
            [&lib, q] { return lib.show_search().peek(q) != nullptr; },
            [&lib, q] { print_discover(*lib.show_search().peek(q)); },
            [&lib, q] { return key_error(lib.show_search(), q, q); }});
        if (!config.tmdb_api_key.empty()) {
            selections.push_back({"Search TMDB: " + q,
                [&lib, q] { lib.search_tmdb(q); },
                [&lib, q] { return lib.tmdb_search().peek(q) != nullptr; },
                [&lib, q] { print_tmdb(*lib.tmdb_search().peek(q)); },
                [&lib, q] { return key_error(lib.tmdb_search(), q, q); }});
        }
    }

    if (selections.empty()) {
        print_usage();
        chanview::http_cleanup();
        return 1;
    }

    // Render loop: request, drain, show whatever became available.
    long frame = 0;
    while (!g_shutdown.load()) {
        for (auto& s : selections) {
            if (!s.done) s.request();
        }

        library.process_pending();

        size_t remaining = 0;
        for (auto& s : selections) {
            if (s.done) continue;
            if (s.ready()) {
                std::cout << s.label << "\n";
                s.print();
                s.done = true;
                continue;
            }
            std::string err = s.error();
            if (!err.empty()) {
                std::cout << s.label << "\n  Error: " << err << "\n";
                s.done = true;
                continue;
            }
            remaining++;
        }

        ++frame;
        if (remaining == 0) break;
        if (max_frames > 0 && frame >= max_frames) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));
    }

    // Workers still running are abandoned; their sends become no-ops. curl
    // stays initialised for them.
    g_shutdown.store(true);
    if (library.pending_count() == 0) chanview::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
