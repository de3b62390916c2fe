#pragma once
#include "clock.hpp"
#include <functional>
#include <unordered_map>

namespace chanview {

// Last failure time per key. A key is cooling while
// now - last_failure < cooldown.
template<typename K, typename Hash = std::hash<K>>
class CooldownMap {
public:
    explicit CooldownMap(Duration cooldown) : cooldown_(cooldown) {}

    void record_failure(const K& key, TimePoint now) { failures_[key] = now; }

    bool is_cooling(const K& key, TimePoint now) const {
        auto it = failures_.find(key);
        if (it == failures_.end()) return false;
        return now - it->second < cooldown_;
    }

    bool erase(const K& key) { return failures_.erase(key) > 0; }
    void clear() { failures_.clear(); }
    size_t size() const { return failures_.size(); }
    Duration cooldown() const { return cooldown_; }

private:
    Duration cooldown_;
    std::unordered_map<K, TimePoint, Hash> failures_;
};

} // namespace chanview
