#pragma once
#include "clock.hpp"
#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace chanview {

template<typename K, typename V>
struct CacheEntry {
    K key;
    V value;
    TimePoint fetched_at;
    bool invalidated = false; // forced stale by refresh_all()
};

// Key -> (value, fetched_at). Entries are replaced wholesale and never
// evicted for age: a stale value stays readable until overwritten.
template<typename K, typename V, typename Hash = std::hash<K>>
class CacheStore {
public:
    using Entry = CacheEntry<K, V>;

    explicit CacheStore(Duration ttl) : ttl_(ttl) {}

    void put(const K& key, V value, TimePoint now) {
        entries_.insert_or_assign(key, Entry{key, std::move(value), now, false});
    }

    const Entry* find(const K& key) const {
        auto it = entries_.find(key);
        return it == entries_.end() ? nullptr : &it->second;
    }

    bool contains(const K& key) const { return entries_.count(key) > 0; }

    bool is_fresh(const K& key, TimePoint now) const {
        auto it = entries_.find(key);
        if (it == entries_.end() || it->second.invalidated) return false;
        return now - it->second.fetched_at < ttl_;
    }

    void invalidate(const K& key) {
        auto it = entries_.find(key);
        if (it != entries_.end()) it->second.invalidated = true;
    }

    bool erase(const K& key) { return entries_.erase(key) > 0; }
    void clear() { entries_.clear(); }
    size_t size() const { return entries_.size(); }
    Duration ttl() const { return ttl_; }

    std::vector<K> keys() const {
        std::vector<K> out;
        out.reserve(entries_.size());
        for (const auto& [key, entry] : entries_) out.push_back(key);
        return out;
    }

private:
    Duration ttl_;
    std::unordered_map<K, Entry, Hash> entries_;
};

} // namespace chanview
