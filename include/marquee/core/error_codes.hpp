#pragma once

#include "../common/error_framework.hpp"
#include <functional>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace marquee {
namespace core {

enum class ViewErrorCode {
    TERMINAL_WRITE_FAILED = 100,
    TERMINAL_FLUSH_FAILED = 101,
    TERMINAL_WIDTH_UNAVAILABLE = 102,
    
    MODEL_OUTPUT_SANITIZED = 200,
    
    VIEW_FINISHED = 300,
    FAKE_CLOCK_DISABLED = 301
};

using ViewErrorCodeHelper = common::ErrorRegistry<ViewErrorCode>;

class ViewError : public std::runtime_error {
public:
    explicit ViewError(ViewErrorCode code);
    ViewError(ViewErrorCode code, const std::string& detail);
    
    ViewErrorCode code() const { return code_; }

private:
    ViewErrorCode code_;
};

// Called before the process aborts on an unrecoverable terminal error.
// A hook may throw to unwind instead; returning still aborts.
using FatalHook = std::function<void(ViewErrorCode, const std::string&)>;

FatalHook setFatalHook(FatalHook hook);

[[noreturn]] void fatalError(ViewErrorCode code, const common::ErrorContext& context);

}
}

namespace marquee {
namespace common {

template<>
inline const std::unordered_map<core::ViewErrorCode, ErrorInfo<core::ViewErrorCode>>& 
ErrorRegistry<core::ViewErrorCode>::getInfoMap() {
    static const std::unordered_map<core::ViewErrorCode, ErrorInfo<core::ViewErrorCode>> map = {
        {core::ViewErrorCode::TERMINAL_WRITE_FAILED, {
            core::ViewErrorCode::TERMINAL_WRITE_FAILED,
            "TERMINAL_WRITE_FAILED",
            "Writing to the terminal failed"
        }},
        {core::ViewErrorCode::TERMINAL_FLUSH_FAILED, {
            core::ViewErrorCode::TERMINAL_FLUSH_FAILED,
            "TERMINAL_FLUSH_FAILED",
            "Flushing the terminal failed"
        }},
        {core::ViewErrorCode::TERMINAL_WIDTH_UNAVAILABLE, {
            core::ViewErrorCode::TERMINAL_WIDTH_UNAVAILABLE,
            "TERMINAL_WIDTH_UNAVAILABLE",
            "Terminal width unavailable, using default"
        }},
        {core::ViewErrorCode::MODEL_OUTPUT_SANITIZED, {
            core::ViewErrorCode::MODEL_OUTPUT_SANITIZED,
            "MODEL_OUTPUT_SANITIZED",
            "Rendered model output contained control characters"
        }},
        {core::ViewErrorCode::VIEW_FINISHED, {
            core::ViewErrorCode::VIEW_FINISHED,
            "VIEW_FINISHED",
            "View has already been finished"
        }},
        {core::ViewErrorCode::FAKE_CLOCK_DISABLED, {
            core::ViewErrorCode::FAKE_CLOCK_DISABLED,
            "FAKE_CLOCK_DISABLED",
            "Fake clock is not enabled in the view options"
        }}
    };
    return map;
}

}
}
