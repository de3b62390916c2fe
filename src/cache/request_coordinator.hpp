#pragma once
#include "cache_store.hpp"
#include "clock.hpp"
#include "cooldown_map.hpp"
#include "fetcher.hpp"
#include "pending_set.hpp"
#include "result_channel.hpp"
#include "spawner.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace chanview {

struct CoordinatorOptions {
    std::string name = "cache";
    Duration ttl = std::chrono::seconds(300);
    Duration cooldown = std::chrono::seconds(30);
    // Discard deliveries from workers spawned before the last clear().
    // Off by default: a late Loaded repopulates a cleared cache.
    bool drop_stale_after_clear = false;
};

// What one process_pending() call delivered.
template<typename K>
struct DrainReport {
    std::vector<K> loaded;
    std::vector<std::pair<K, std::string>> failed;
    size_t dropped = 0; // stale deliveries discarded after clear()

    size_t delivered() const { return loaded.size() + failed.size(); }
    bool empty() const { return delivered() == 0 && dropped == 0; }
};

// Background content cache with request coalescing.
//
// Owned and driven by a single consumer thread (the render loop): request(),
// get(), is_loading() and process_pending() never block and must all be
// called from that thread. Fetches run on spawned workers and come back
// through a ResultChannel, the only state shared across threads.
//
//   request(k)          fresh | cooling | pending -> no-op, else spawn one worker
//   process_pending()   drain results: Loaded -> store, Failed -> cooldown
//   get(k)              cached value regardless of freshness
template<typename K, typename V, typename Hash = std::hash<K>>
class RequestCoordinator {
public:
    using Message = ResultMessage<K, V>;
    using FetcherPtr = std::shared_ptr<Fetcher<K, V>>;

    RequestCoordinator(CoordinatorOptions options,
                       FetcherPtr fetcher,
                       std::shared_ptr<Clock> clock = default_clock(),
                       Spawner spawner = detached_spawner())
        : options_(std::move(options)),
          fetcher_(std::move(fetcher)),
          clock_(std::move(clock)),
          spawner_(std::move(spawner)),
          store_(options_.ttl),
          cooldowns_(options_.cooldown) {
        if (!fetcher_) throw std::invalid_argument("RequestCoordinator requires a fetcher");
        if (!clock_) throw std::invalid_argument("RequestCoordinator requires a clock");
        if (!spawner_) throw std::invalid_argument("RequestCoordinator requires a spawner");
    }

    RequestCoordinator(const RequestCoordinator&) = delete;
    RequestCoordinator& operator=(const RequestCoordinator&) = delete;

    void request(const K& key) {
        TimePoint now = clock_->now();
        if (store_.is_fresh(key, now)) return;
        if (cooldowns_.is_cooling(key, now)) return;
        if (pending_.contains(key)) return;

        if (auto reason = fetcher_->unavailable_reason()) {
            last_error_ = *reason;
            return;
        }

        pending_.insert(key);
        spawn_worker(key);
    }

    void request_batch(const std::vector<K>& keys) {
        for (const auto& key : keys) request(key);
    }

    bool is_loading(const K& key) const { return pending_.contains(key); }

    std::optional<V> get(const K& key) const {
        const auto* entry = store_.find(key);
        if (!entry) return std::nullopt;
        return entry->value;
    }

    // Non-copying get() for per-frame reads. Invalidated by process_pending()
    // and clear().
    const V* peek(const K& key) const {
        const auto* entry = store_.find(key);
        return entry ? &entry->value : nullptr;
    }

    bool is_fresh(const K& key) const { return store_.is_fresh(key, clock_->now()); }

    std::optional<Duration> entry_age(const K& key) const {
        const auto* entry = store_.find(key);
        if (!entry) return std::nullopt;
        return clock_->now() - entry->fetched_at;
    }

    DrainReport<K> process_pending() {
        DrainReport<K> report;
        auto messages = channel_.drain();
        if (messages.empty()) return report;

        TimePoint now = clock_->now();
        for (auto& msg : messages) {
            if (options_.drop_stale_after_clear && msg.generation != generation_) {
                report.dropped++;
                continue;
            }
            pending_.erase(msg.key);
            if (msg.ok()) {
                store_.put(msg.key, std::move(*msg.value), now);
                cooldowns_.erase(msg.key);
                last_error_.reset();
                report.loaded.push_back(std::move(msg.key));
            } else {
                cooldowns_.record_failure(msg.key, now);
                last_error_ = msg.error;
                report.failed.emplace_back(std::move(msg.key), std::move(msg.error));
            }
        }
        return report;
    }

    // Forget everything. Workers already running are not cancelled.
    void clear() {
        store_.clear();
        pending_.clear();
        cooldowns_.clear();
        last_error_.reset();
        ++generation_;
    }

    // Per-key retry: drop the cached value and any cooldown for one key.
    void forget(const K& key) {
        store_.erase(key);
        cooldowns_.erase(key);
    }

    // Re-request every cached key. Values stay readable until replaced.
    void refresh_all() {
        for (const auto& key : store_.keys()) {
            store_.invalidate(key);
            request(key);
        }
    }

    const std::optional<std::string>& last_error() const { return last_error_; }

    size_t size() const { return store_.size(); }
    size_t pending_count() const { return pending_.size(); }
    uint64_t generation() const { return generation_; }
    const std::string& name() const { return options_.name; }
    const CoordinatorOptions& options() const { return options_; }

private:
    void spawn_worker(const K& key) {
        auto sender = channel_.sender();
        FetcherPtr fetcher = fetcher_;
        uint64_t generation = generation_;

        Task task = [sender, fetcher, key, generation]() {
            try {
                V value = fetcher->fetch(key);
                sender.send(Message::loaded(key, std::move(value), generation));
            } catch (const std::exception& e) {
                sender.send(Message::failed(key, e.what(), generation));
            } catch (...) {
                sender.send(Message::failed(key, "unknown error", generation));
            }
        };

        try {
            spawner_(std::move(task));
        } catch (const std::exception& e) {
            // Thread creation failed: treat like a failed fetch.
            pending_.erase(key);
            cooldowns_.record_failure(key, clock_->now());
            last_error_ = std::string("Failed to start worker: ") + e.what();
            std::cerr << "[coordinator:" << options_.name << "] "
                      << *last_error_ << '\n';
        }
    }

    CoordinatorOptions options_;
    FetcherPtr fetcher_;
    std::shared_ptr<Clock> clock_;
    Spawner spawner_;

    CacheStore<K, V, Hash> store_;
    PendingSet<K, Hash> pending_;
    CooldownMap<K, Hash> cooldowns_;
    ResultChannel<Message> channel_;

    std::optional<std::string> last_error_;
    uint64_t generation_ = 0;
};

} // namespace chanview
