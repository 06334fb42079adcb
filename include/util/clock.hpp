#pragma once
#include <chrono>
#include <functional>
#include <mutex>

namespace util
{

using SteadyClock = std::chrono::steady_clock;
using TimePoint   = SteadyClock::time_point;
using Millis      = std::chrono::milliseconds;

// Time source injected into components that expire state; tests pass a manual one.
using Clock = std::function<TimePoint()>;

inline Clock steady_clock_source()
{
    return [] { return SteadyClock::now(); };
}

// Manually advanced clock for deterministic expiry tests.
class ManualClock
{
  public:
    explicit ManualClock(TimePoint start = TimePoint{} + std::chrono::hours(1)) : now_(start) {}

    TimePoint now() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return now_;
    }
    void advance(Millis d)
    {
        std::lock_guard<std::mutex> lk(mu_);
        now_ += d;
    }
    Clock source()
    {
        return [this] { return now(); };
    }

  private:
    mutable std::mutex mu_;
    TimePoint          now_;
};

}  // namespace util
