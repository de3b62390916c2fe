#pragma once
#include <optional>
#include <string>

namespace chanview {

// One remote source. fetch() runs on a worker thread, may block on I/O and
// reports failure by throwing std::exception. Implementations must tolerate
// concurrent fetch() calls for different keys and must not touch coordinator
// state.
template<typename K, typename V>
class Fetcher {
public:
    virtual ~Fetcher() = default;

    virtual V fetch(const K& key) = 0;

    // Non-empty when the source can't be queried at all (no API key, no
    // database). The coordinator reports it instead of spawning a worker.
    virtual std::optional<std::string> unavailable_reason() const { return std::nullopt; }

    virtual std::string source_name() const = 0;
};

} // namespace chanview
