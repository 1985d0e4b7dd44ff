#pragma once

#include "../common/config.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace marquee {
namespace core {

enum class Destination {
    STDOUT,
    STDERR,
    CAPTURE
};

std::optional<Destination> parseDestination(const std::string& name);
const char* destinationName(Destination destination);

// Settings fixed when a View is built. The defaults suit most programs:
// draw to stdout, at most every 100ms, and wait 100ms after printed text.
struct Options {
    Destination destination = Destination::STDOUT;
    std::chrono::milliseconds update_interval{100};
    std::chrono::milliseconds print_holdoff{100};
    bool enabled = true;
    bool fake_clock = false;
    
    Options withDestination(Destination value) const;
    // Zero repaints on every update.
    Options withUpdateInterval(std::chrono::milliseconds value) const;
    // Zero lets progress reappear right after printed text.
    Options withPrintHoldoff(std::chrono::milliseconds value) const;
    Options withEnabled(bool value) const;
    Options withFakeClock(bool value) const;
    
    static Options fromConfig(const common::ProgressConfig& config);
};

}}
