#pragma once
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chanview {

// Outcome of one worker: exactly one message per completed fetch.
template<typename K, typename V>
struct ResultMessage {
    enum class Kind { Loaded, Failed };

    Kind kind = Kind::Failed;
    K key;
    std::optional<V> value;   // set when Loaded
    std::string error;        // set when Failed
    uint64_t generation = 0;  // coordinator generation at spawn time

    bool ok() const { return kind == Kind::Loaded; }

    static ResultMessage loaded(K key, V value, uint64_t generation) {
        ResultMessage msg{Kind::Loaded, std::move(key), std::nullopt, {}, generation};
        msg.value.emplace(std::move(value));
        return msg;
    }

    static ResultMessage failed(K key, std::string error, uint64_t generation) {
        return ResultMessage{Kind::Failed, std::move(key), std::nullopt,
                             std::move(error), generation};
    }
};

// Unbounded many-producer / single-consumer queue.
//
// Senders share ownership of the queue state, so a worker may outlive the
// channel. Once the channel (the receiving side) is destroyed, sends are
// silently dropped. Receiving never blocks.
template<typename Message>
class ResultChannel {
    struct State {
        std::mutex mutex;
        std::deque<Message> queue;
        bool closed = false;
    };

public:
    class Sender {
    public:
        // False (message dropped) once the receiving side is gone.
        bool send(Message msg) const {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->closed) return false;
            state_->queue.push_back(std::move(msg));
            return true;
        }

        bool is_closed() const {
            std::lock_guard<std::mutex> lock(state_->mutex);
            return state_->closed;
        }

    private:
        friend class ResultChannel;
        explicit Sender(std::shared_ptr<State> state) : state_(std::move(state)) {}

        std::shared_ptr<State> state_;
    };

    ResultChannel() : state_(std::make_shared<State>()) {}

    ~ResultChannel() {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->closed = true;
        state_->queue.clear();
    }

    ResultChannel(const ResultChannel&) = delete;
    ResultChannel& operator=(const ResultChannel&) = delete;

    Sender sender() const { return Sender(state_); }

    std::optional<Message> try_receive() {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->queue.empty()) return std::nullopt;
        Message msg = std::move(state_->queue.front());
        state_->queue.pop_front();
        return msg;
    }

    // Take everything queued right now, in send order. Messages sent while
    // draining land in the next call.
    std::vector<Message> drain() {
        std::deque<Message> taken;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            taken.swap(state_->queue);
        }
        std::vector<Message> out;
        out.reserve(taken.size());
        for (auto& msg : taken) out.push_back(std::move(msg));
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->queue.size();
    }

private:
    std::shared_ptr<State> state_;
};

} // namespace chanview
