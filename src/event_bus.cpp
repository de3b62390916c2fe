#include "event_bus.hpp"

namespace chanview {

void EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& current = handlers_[tag];
    auto next = current ? std::make_shared<HandlerList>(*current)
                        : std::make_shared<HandlerList>();
    next->push_back(std::move(handler));
    current = std::move(next);
}

std::shared_ptr<const EventBus::HandlerList>
EventBus::handlers_for(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(tag);
    return it == handlers_.end() ? nullptr : it->second;
}

void EventBus::publish(const Event& event) const {
    auto list = handlers_for(event.type_tag);
    if (!list) return;
    for (const auto& handler : *list) handler(event);
}

bool EventBus::has_subscribers(const std::string& tag) const {
    auto list = handlers_for(tag);
    return list && !list->empty();
}

} // namespace chanview
