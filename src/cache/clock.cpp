#include "clock.hpp"

namespace chanview {

TimePoint SteadyClock::now() const {
    return std::chrono::steady_clock::now();
}

std::shared_ptr<Clock> default_clock() {
    static std::shared_ptr<Clock> clock = std::make_shared<SteadyClock>();
    return clock;
}

} // namespace chanview
