#pragma once
#include <functional>
#include <unordered_set>

namespace chanview {

// Keys with a worker in flight.
template<typename K, typename Hash = std::hash<K>>
class PendingSet {
public:
    // Returns false if the key was already pending.
    bool insert(const K& key) { return keys_.insert(key).second; }

    bool contains(const K& key) const { return keys_.count(key) > 0; }
    bool erase(const K& key) { return keys_.erase(key) > 0; }
    void clear() { keys_.clear(); }
    size_t size() const { return keys_.size(); }
    bool empty() const { return keys_.empty(); }

private:
    std::unordered_set<K, Hash> keys_;
};

} // namespace chanview
