#pragma once
#include <string>
#include <cstddef>

namespace chanview {

// Tag-based event dispatch: no RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

namespace event_tags {
    constexpr const char* ContentLoaded    = "ContentLoaded";
    constexpr const char* ContentFailed    = "ContentFailed";
    constexpr const char* CacheCleared     = "CacheCleared";
    constexpr const char* RepaintRequested = "RepaintRequested";
} // namespace event_tags

// A worker's value landed in a cache during process_pending()
struct ContentLoadedEvent : Event {
    static constexpr const char* TAG = event_tags::ContentLoaded;
    std::string source;  // coordinator name, e.g. "tmdb"
    std::string key;     // printable key

    ContentLoadedEvent() { type_tag = TAG; }
};

struct ContentFailedEvent : Event {
    static constexpr const char* TAG = event_tags::ContentFailed;
    std::string source;
    std::string key;
    std::string error;

    ContentFailedEvent() { type_tag = TAG; }
};

struct CacheClearedEvent : Event {
    static constexpr const char* TAG = event_tags::CacheCleared;
    std::string source;

    CacheClearedEvent() { type_tag = TAG; }
};

// Published once per frame in which any cache changed
struct RepaintRequestedEvent : Event {
    static constexpr const char* TAG = event_tags::RepaintRequested;
    size_t changes = 0;

    RepaintRequestedEvent() { type_tag = TAG; }
};

} // namespace chanview
