#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace chanview {

CacheTuning default_tuning(const std::string& source) {
    if (source == "discover") return {600, 30};
    if (source == "search")   return {1800, 30};
    if (source == "tmdb")     return {300, 30};
    if (source == "fixtures") return {300, 30};
    if (source == "epg")      return {300, 30};
    if (source == "posters")  return {1800, 30};
    if (source == "omdb")     return {1800, 30};
    return {};
}

static nlohmann::json tuning_json(const std::string& source) {
    CacheTuning t = default_tuning(source);
    return {{"ttl_seconds", t.ttl_seconds}, {"cooldown_seconds", t.cooldown_seconds}};
}

nlohmann::json Config::defaults_json() {
    return {
        {"xtream", {
            {"server_url", ""},
            {"username", ""},
            {"password", ""}
        }},
        {"tmdb", {{"api_key", ""}}},
        {"omdb", {{"api_key", ""}}},
        {"fixtures", {{"db_path", ""}}},
        {"frame_interval_ms", 500},
        {"drop_stale_after_clear", false},
        {"caches", {
            {"discover", tuning_json("discover")},
            {"search", tuning_json("search")},
            {"tmdb", tuning_json("tmdb")},
            {"fixtures", tuning_json("fixtures")},
            {"epg", tuning_json("epg")},
            {"posters", tuning_json("posters")},
            {"omdb", tuning_json("omdb")}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_string(const nlohmann::json& obj, const char* field, std::string& out) {
    if (obj.contains(field) && obj[field].is_string())
        out = obj[field].get<std::string>();
}

Config Config::load() {
    Config cfg;

    std::string config_path = expand_home("~/.chanview/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n"))
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    if (j.contains("xtream") && j["xtream"].is_object()) {
        auto& x = j["xtream"];
        read_string(x, "server_url", cfg.xtream.server_url);
        read_string(x, "username", cfg.xtream.username);
        read_string(x, "password", cfg.xtream.password);
    }
    if (j.contains("tmdb") && j["tmdb"].is_object())
        read_string(j["tmdb"], "api_key", cfg.tmdb_api_key);
    if (j.contains("omdb") && j["omdb"].is_object())
        read_string(j["omdb"], "api_key", cfg.omdb_api_key);
    if (j.contains("fixtures") && j["fixtures"].is_object())
        read_string(j["fixtures"], "db_path", cfg.fixtures_db);

    if (j.contains("frame_interval_ms") && j["frame_interval_ms"].is_number_unsigned()) {
        uint32_t ms = j["frame_interval_ms"].get<uint32_t>();
        if (ms > 0)
            cfg.frame_interval_ms = ms;
        else
            std::cerr << "[config] Ignoring frame_interval_ms 0, keeping "
                      << cfg.frame_interval_ms << "\n";
    }
    if (j.contains("drop_stale_after_clear") && j["drop_stale_after_clear"].is_boolean())
        cfg.drop_stale_after_clear = j["drop_stale_after_clear"].get<bool>();

    if (j.contains("caches") && j["caches"].is_object()) {
        for (auto& [name, obj] : j["caches"].items()) {
            if (!obj.is_object()) continue;
            CacheTuning t = default_tuning(name);
            if (obj.contains("ttl_seconds") && obj["ttl_seconds"].is_number_unsigned())
                t.ttl_seconds = obj["ttl_seconds"].get<uint32_t>();
            if (obj.contains("cooldown_seconds") && obj["cooldown_seconds"].is_number_unsigned())
                t.cooldown_seconds = obj["cooldown_seconds"].get<uint32_t>();
            cfg.caches[name] = t;
        }
    }

    // Environment variables always override config file
    if (const char* v = std::getenv("TMDB_API_KEY"))
        cfg.tmdb_api_key = v;
    if (const char* v = std::getenv("OMDB_API_KEY"))
        cfg.omdb_api_key = v;
    if (const char* v = std::getenv("XTREAM_SERVER_URL"))
        cfg.xtream.server_url = v;
    if (const char* v = std::getenv("XTREAM_USERNAME"))
        cfg.xtream.username = v;
    if (const char* v = std::getenv("XTREAM_PASSWORD"))
        cfg.xtream.password = v;
    if (const char* v = std::getenv("CHANVIEW_FIXTURES_DB"))
        cfg.fixtures_db = v;

    return cfg;
}

CacheTuning Config::tuning_for(const std::string& source) const {
    auto it = caches.find(source);
    if (it != caches.end()) return it->second;
    return default_tuning(source);
}

bool Config::has_xtream_credentials() const {
    return !trim(xtream.server_url).empty();
}

} // namespace chanview
