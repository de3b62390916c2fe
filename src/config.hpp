#pragma once
#include <string>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace chanview {

// Per-source freshness and retry window, in seconds
struct CacheTuning {
    uint32_t ttl_seconds = 300;
    uint32_t cooldown_seconds = 30;
};

struct XtreamConfig {
    std::string server_url;
    std::string username;
    std::string password;
};

struct Config {
    XtreamConfig xtream;
    std::string tmdb_api_key;
    std::string omdb_api_key;
    std::string fixtures_db;            // empty = search the usual locations
    uint32_t frame_interval_ms = 500;   // consumer cadence when idle
    bool drop_stale_after_clear = false;

    // Keyed by source: discover, search, tmdb, fixtures, epg, posters, omdb
    std::unordered_map<std::string, CacheTuning> caches;

    // Load from ~/.chanview/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Tuning for a source; built-in defaults when absent
    CacheTuning tuning_for(const std::string& source) const;

    bool has_xtream_credentials() const;
};

// Built-in tuning for a known source name
CacheTuning default_tuning(const std::string& source);

} // namespace chanview
