#include "marquee/core/rate_limiter.hpp"

namespace marquee {
namespace core {

RateLimiter::RateLimiter(Clock::duration update_interval, Clock::duration print_holdoff)
    : update_interval_(update_interval),
      print_holdoff_(print_holdoff) {}

bool RateLimiter::shouldPaint(Clock::time_point now,
                              const std::optional<Clock::time_point>& last_paint_time,
                              const std::optional<Clock::time_point>& last_text_time,
                              bool forced) const {
    if (forced) {
        return true;
    }
    
    if (last_text_time && now - *last_text_time < print_holdoff_) {
        return false;
    }
    
    if (!last_paint_time) {
        return true;
    }
    
    return now - *last_paint_time >= update_interval_;
}

}}
