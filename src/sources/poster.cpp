#include "poster.hpp"
#include "http_json.hpp"
#include <stdexcept>

namespace chanview {

static bool starts_with(const std::string& s, const char* prefix, size_t len) {
    return s.size() >= len && s.compare(0, len, prefix, len) == 0;
}

std::optional<std::string> detect_image_type(const std::string& bytes) {
    if (starts_with(bytes, "\x89PNG\r\n\x1a\n", 8)) return std::string("image/png");
    if (starts_with(bytes, "\xff\xd8\xff", 3)) return std::string("image/jpeg");
    if (starts_with(bytes, "GIF87a", 6) || starts_with(bytes, "GIF89a", 6)) {
        return std::string("image/gif");
    }
    if (bytes.size() >= 12 && starts_with(bytes, "RIFF", 4) &&
        bytes.compare(8, 4, "WEBP") == 0) {
        return std::string("image/webp");
    }
    return std::nullopt;
}

PosterFetcher::PosterFetcher(std::shared_ptr<HttpClient> http, long timeout_seconds)
    : http_(std::move(http)), timeout_seconds_(timeout_seconds) {
    if (!http_) throw std::invalid_argument("PosterFetcher requires an HTTP client");
}

PosterImage PosterFetcher::fetch(const std::string& url) {
    if (url.empty()) throw std::invalid_argument("Empty image URL");

    auto response = http_->get(url, {{"Accept", "image/*"}}, timeout_seconds_);
    ensure_success(response);

    auto mime = detect_image_type(response.body);
    if (!mime) throw std::runtime_error("Unsupported image format");
    return PosterImage{std::move(response.body), *mime};
}

} // namespace chanview
