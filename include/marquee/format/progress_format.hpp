#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace marquee {
namespace format {

// "33 sec" below two minutes, otherwise "12 min".
std::string durationBrief(std::chrono::steady_clock::duration duration);

// "50.0%", or "??%" when total is zero or done exceeds total.
std::string percentDone(size_t done, size_t total);

// Linear extrapolation of the time left. Empty when nothing is done yet,
// no time has passed, or the counts make no sense.
std::optional<std::string> estimateRemaining(std::chrono::steady_clock::time_point start,
                                             std::chrono::steady_clock::time_point now,
                                             size_t done, size_t total);

std::optional<std::string> estimateRemaining(std::chrono::steady_clock::time_point start,
                                             size_t done, size_t total);

}
}
