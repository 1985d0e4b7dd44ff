#include "marquee/format/progress_format.hpp"
#include "marquee/common/constants.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>

namespace marquee {
namespace format {

std::string durationBrief(std::chrono::steady_clock::duration duration) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(duration).count();
    if (secs < 0) {
        secs = 0;
    }
    if (secs >= 120) {
        return fmt::format("{} min", secs / 60);
    }
    return fmt::format("{} sec", secs);
}

std::string percentDone(size_t done, size_t total) {
    if (total == 0 || done > total) {
        return "??%";
    }
    return fmt::format("{:.1f}%", static_cast<double>(done) * 100.0 / static_cast<double>(total));
}

std::optional<std::string> estimateRemaining(std::chrono::steady_clock::time_point start,
                                             std::chrono::steady_clock::time_point now,
                                             size_t done, size_t total) {
    auto elapsed = now - start;
    if (total == 0 || done == 0 || elapsed <= std::chrono::steady_clock::duration::zero() || done > total) {
        return std::nullopt;
    }
    
    double elapsed_secs = std::chrono::duration<double>(elapsed).count();
    double remaining_secs = elapsed_secs * (static_cast<double>(total) / static_cast<double>(done) - 1.0);
    // Keep the conversion to integer clock ticks in range.
    remaining_secs = std::min(remaining_secs, constants::limits::MAX_ESTIMATE_SECS);
    
    auto remaining = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(remaining_secs));
    return durationBrief(remaining);
}

std::optional<std::string> estimateRemaining(std::chrono::steady_clock::time_point start,
                                             size_t done, size_t total) {
    return estimateRemaining(start, std::chrono::steady_clock::now(), done, total);
}

}
}
