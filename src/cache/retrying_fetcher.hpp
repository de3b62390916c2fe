#pragma once
#include "fetcher.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace chanview {

// Wraps a fetcher with immediate retries. Only the final outcome leaves
// fetch(); the coordinator sees a single success or failure.
template<typename K, typename V>
class RetryingFetcher : public Fetcher<K, V> {
public:
    using GiveUpCallback = std::function<void(const K& key, const std::string& error)>;

    RetryingFetcher(std::shared_ptr<Fetcher<K, V>> inner,
                    uint32_t max_attempts,
                    std::chrono::milliseconds delay,
                    GiveUpCallback on_give_up = nullptr)
        : inner_(std::move(inner)), max_attempts_(max_attempts),
          delay_(delay), on_give_up_(std::move(on_give_up)) {
        if (!inner_) {
            throw std::invalid_argument("RetryingFetcher requires an inner fetcher");
        }
        if (max_attempts_ == 0) {
            throw std::invalid_argument("RetryingFetcher requires at least one attempt");
        }
    }

    V fetch(const K& key) override {
        std::string last_error;
        for (uint32_t attempt = 0; attempt < max_attempts_; ++attempt) {
            try {
                return inner_->fetch(key);
            } catch (const std::exception& e) {
                last_error = e.what();
            }
            if (attempt + 1 < max_attempts_ && delay_.count() > 0) {
                std::this_thread::sleep_for(delay_);
            }
        }
        if (on_give_up_) on_give_up_(key, last_error);
        throw std::runtime_error(last_error);
    }

    std::optional<std::string> unavailable_reason() const override {
        return inner_->unavailable_reason();
    }

    std::string source_name() const override { return inner_->source_name(); }

    uint32_t max_attempts() const { return max_attempts_; }

private:
    std::shared_ptr<Fetcher<K, V>> inner_;
    uint32_t max_attempts_;
    std::chrono::milliseconds delay_;
    GiveUpCallback on_give_up_;
};

} // namespace chanview
