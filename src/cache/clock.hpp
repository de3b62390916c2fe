#pragma once
#include <chrono>
#include <memory>

namespace chanview {

using TimePoint = std::chrono::steady_clock::time_point;
using Duration  = std::chrono::steady_clock::duration;

// Monotonic time source (injectable for testing)
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SteadyClock : public Clock {
public:
    TimePoint now() const override;
};

// Process-wide SteadyClock shared by coordinators that don't inject one.
std::shared_ptr<Clock> default_clock();

} // namespace chanview
