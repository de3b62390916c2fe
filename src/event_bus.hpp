#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <memory>
#include <unordered_map>
#include <mutex>

namespace chanview {

using EventHandler = std::function<void(const Event&)>;

// Per-tag handler lists, replaced wholesale on subscribe. Subscriptions
// last as long as the bus; the library and the CLI wire them once at start.
class EventBus {
public:
    void subscribe(const std::string& tag, EventHandler handler);

    // Deliver synchronously, in subscription order, to the handlers that
    // were registered when publish() started. Handlers may subscribe or
    // publish themselves.
    void publish(const Event& event) const;

    // Lets publishers skip building events nobody listens to
    bool has_subscribers(const std::string& tag) const;

private:
    using HandlerList = std::vector<EventHandler>;

    std::shared_ptr<const HandlerList> handlers_for(const std::string& tag) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const HandlerList>> handlers_;
};

// Subscribe with the concrete event type instead of the Event base.
template<typename E>
void subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

} // namespace chanview
