#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace chanview {

uint64_t epoch_seconds() {
    return static_cast<uint64_t>(std::time(nullptr));
}

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::string replace_all(const std::string& str, const std::string& from, const std::string& to) {
    if (from.empty()) return str;
    std::string result = str;
    size_t pos = 0;
    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.size(), to);
        pos += to.size();
    }
    return result;
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

bool atomic_write_file(const std::string& path, const std::string& content) {
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) return false;
    }

    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) return false;
        out << content;
        if (!out.good()) return false;
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

std::string url_encode(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

std::string strip_html(const std::string& html) {
    std::string clean = html;
    clean = replace_all(clean, "<p>", "");
    clean = replace_all(clean, "</p>", "\n");
    clean = replace_all(clean, "<br>", "\n");
    clean = replace_all(clean, "<br/>", "\n");
    clean = replace_all(clean, "<br />", "\n");

    std::string out;
    out.reserve(clean.size());
    size_t i = 0;
    while (i < clean.size()) {
        if (clean[i] == '<') {
            size_t close = clean.find('>', i);
            if (close == std::string::npos) {
                // Unterminated tag: keep the rest verbatim
                out.append(clean, i, std::string::npos);
                break;
            }
            i = close + 1;
            continue;
        }
        out += clean[i++];
    }

    out = replace_all(out, "&quot;", "\"");
    out = replace_all(out, "&#39;", "'");
    out = replace_all(out, "&lt;", "<");
    out = replace_all(out, "&gt;", ">");
    out = replace_all(out, "&amp;", "&");
    return trim(out);
}

std::optional<int64_t> parse_int64(const std::string& s) {
    std::string t = trim(s);
    if (t.empty()) return std::nullopt;
    try {
        size_t used = 0;
        long long v = std::stoll(t, &used);
        if (used != t.size()) return std::nullopt;
        return static_cast<int64_t>(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<int64_t> double_to_int64(double v) {
    // 2^63 is exact as a double; the upper bound is exclusive
    if (!std::isfinite(v)) return std::nullopt;
    if (v < -9223372036854775808.0 || v >= 9223372036854775808.0) return std::nullopt;
    return static_cast<int64_t>(v);
}

std::string format_utc_hhmm(int64_t unix_seconds) {
    int64_t secs_in_day = unix_seconds % 86400;
    if (secs_in_day < 0) secs_in_day += 86400;
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d",
                  static_cast<int>(secs_in_day / 3600),
                  static_cast<int>((secs_in_day % 3600) / 60));
    return buf;
}

std::string local_date(int64_t unix_seconds) {
    std::time_t t = static_cast<std::time_t>(unix_seconds);
    std::tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm_buf);
    return buf;
}

std::string add_days(const std::string& ymd, int days) {
    int y = 0, m = 0, d = 0;
    if (std::sscanf(ymd.c_str(), "%d-%d-%d", &y, &m, &d) != 3) {
        throw std::invalid_argument("add_days: expected YYYY-MM-DD, got " + ymd);
    }
    // Noon UTC keeps the day stable through timegm's normalisation
    std::tm tm_buf{};
    tm_buf.tm_year = y - 1900;
    tm_buf.tm_mon  = m - 1;
    tm_buf.tm_mday = d + days;
    tm_buf.tm_hour = 12;
    std::time_t t = timegm(&tm_buf);
    std::tm out;
    gmtime_r(&t, &out);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &out);
    return buf;
}

} // namespace chanview
