#pragma once

#include <string>
#include <array>
#include <algorithm>
#include <cstddef>

namespace marquee {
namespace constants {

namespace version {
    constexpr const char* LIBRARY_VERSION = "0.3.0";
    
    inline std::string getFullVersion() {
        return std::string("marquee v") + LIBRARY_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "marquee";
    constexpr const char* DEMO_NAME = "marquee-demo";
    constexpr const char* LOGGER_NAME = "marquee";
}

namespace terminal {
    constexpr size_t DEFAULT_WIDTH = 80;
    constexpr size_t CAPTURE_WIDTH = 80;
    constexpr size_t TAB_WIDTH = 8;
    constexpr const char* DUMB_TERM = "dumb";
}

namespace destinations {
    constexpr std::array<const char*, 3> SUPPORTED = {"stdout", "stderr", "capture"};
    
    inline bool isSupported(const std::string& name) {
        return std::find(SUPPORTED.begin(), SUPPORTED.end(), name) != SUPPORTED.end();
    }
}

namespace limits {
    constexpr int DEFAULT_UPDATE_INTERVAL_MS = 100;
    constexpr int DEFAULT_PRINT_HOLDOFF_MS = 100;
    
    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 3;
    
    constexpr double MAX_ESTIMATE_SECS = 1e9;
}

namespace config_defaults {
    constexpr int UPDATE_INTERVAL_MS = limits::DEFAULT_UPDATE_INTERVAL_MS;
    constexpr int PRINT_HOLDOFF_MS = limits::DEFAULT_PRINT_HOLDOFF_MS;
    constexpr bool PROGRESS_ENABLED = true;
    constexpr const char* DESTINATION = "stdout";
    
    constexpr size_t LOG_ROTATION_SIZE_MB = limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    constexpr size_t LOG_MAX_FILES = limits::DEFAULT_LOG_MAX_FILES;
}

}
}
