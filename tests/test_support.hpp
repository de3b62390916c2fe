#pragma once
#include "cache/clock.hpp"
#include "cache/fetcher.hpp"
#include "cache/spawner.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace chanview {

// Time only moves when a test says so.
class ManualClock : public Clock {
public:
    TimePoint now() const override { return now_; }
    void advance(Duration d) { now_ += d; }
    void advance_seconds(long s) { now_ += std::chrono::seconds(s); }

private:
    TimePoint now_ = TimePoint() + std::chrono::hours(1);
};

// Runs each task immediately on the calling thread.
inline Spawner inline_spawner(int* spawned = nullptr) {
    return [spawned](Task task) {
        if (spawned) ++*spawned;
        task();
    };
}

// Collects tasks; the test decides when (and whether) each one runs.
class DeferredSpawner {
public:
    Spawner spawner() {
        return [this](Task task) { tasks_.push_back(std::move(task)); };
    }

    size_t size() const { return tasks_.size(); }
    bool empty() const { return tasks_.empty(); }

    void run_next() {
        if (tasks_.empty()) throw std::logic_error("no task queued");
        Task t = std::move(tasks_.front());
        tasks_.pop_front();
        t();
    }

    void run_all() {
        while (!tasks_.empty()) run_next();
    }

private:
    std::deque<Task> tasks_;
};

// Returns scripted values per key; throws for keys scripted to fail.
class StubFetcher : public Fetcher<std::string, std::string> {
public:
    std::map<std::string, std::string> values;
    std::map<std::string, std::string> errors;
    std::optional<std::string> unavailable;
    std::atomic<int> fetch_count{0};

    std::string fetch(const std::string& key) override {
        ++fetch_count;
        auto err = errors.find(key);
        if (err != errors.end()) throw std::runtime_error(err->second);
        auto it = values.find(key);
        if (it != values.end()) return it->second;
        return "value:" + key;
    }

    std::optional<std::string> unavailable_reason() const override { return unavailable; }
    std::string source_name() const override { return "stub"; }
};

} // namespace chanview
