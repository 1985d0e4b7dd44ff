#pragma once

#include <chrono>
#include <optional>

namespace marquee {
namespace core {

using Clock = std::chrono::steady_clock;

// Bounds how often progress is redrawn, independent of how often the
// application calls update.
class RateLimiter {
public:
    RateLimiter(Clock::duration update_interval, Clock::duration print_holdoff);
    
    bool shouldPaint(Clock::time_point now,
                     const std::optional<Clock::time_point>& last_paint_time,
                     const std::optional<Clock::time_point>& last_text_time,
                     bool forced) const;
    
    Clock::duration updateInterval() const { return update_interval_; }
    Clock::duration printHoldoff() const { return print_holdoff_; }

private:
    Clock::duration update_interval_;
    Clock::duration print_holdoff_;
};

}}
