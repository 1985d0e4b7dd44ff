#include "marquee/core/options.hpp"
#include "marquee/common/logger.hpp"
#include <algorithm>

namespace marquee {
namespace core {

std::optional<Destination> parseDestination(const std::string& name) {
    if (name == "stdout") return Destination::STDOUT;
    if (name == "stderr") return Destination::STDERR;
    if (name == "capture") return Destination::CAPTURE;
    return std::nullopt;
}

const char* destinationName(Destination destination) {
    switch (destination) {
        case Destination::STDOUT: return "stdout";
        case Destination::STDERR: return "stderr";
        case Destination::CAPTURE: return "capture";
    }
    return "stdout";
}

Options Options::withDestination(Destination value) const {
    Options options = *this;
    options.destination = value;
    return options;
}

Options Options::withUpdateInterval(std::chrono::milliseconds value) const {
    Options options = *this;
    options.update_interval = value;
    return options;
}

Options Options::withPrintHoldoff(std::chrono::milliseconds value) const {
    Options options = *this;
    options.print_holdoff = value;
    return options;
}

Options Options::withEnabled(bool value) const {
    Options options = *this;
    options.enabled = value;
    return options;
}

Options Options::withFakeClock(bool value) const {
    Options options = *this;
    options.fake_clock = value;
    return options;
}

Options Options::fromConfig(const common::ProgressConfig& config) {
    Options options;
    
    auto destination = parseDestination(config.destination);
    if (destination) {
        options.destination = *destination;
    } else {
        common::Logger::instance().warn("[Options] Unknown destination, using stdout | value={}", 
                                        config.destination);
    }
    
    options.update_interval = std::chrono::milliseconds(std::max(0, config.update_interval_ms));
    options.print_holdoff = std::chrono::milliseconds(std::max(0, config.print_holdoff_ms));
    options.enabled = config.enabled;
    
    return options;
}

}}
