#pragma once
#include "../cache/fetcher.hpp"
#include "../http.hpp"
#include <memory>
#include <optional>
#include <string>

namespace chanview {

struct PosterImage {
    std::string bytes;       // encoded image, as downloaded
    std::string mime_type;   // image/png, image/jpeg, image/gif, image/webp
};

// MIME type from the file signature, nullopt for anything unrecognised.
std::optional<std::string> detect_image_type(const std::string& bytes);

// Artwork downloads keyed by URL.
class PosterFetcher : public Fetcher<std::string, PosterImage> {
public:
    explicit PosterFetcher(std::shared_ptr<HttpClient> http, long timeout_seconds = 30);

    PosterImage fetch(const std::string& url) override;
    std::string source_name() const override { return "posters"; }

private:
    std::shared_ptr<HttpClient> http_;
    long timeout_seconds_;
};

} // namespace chanview
