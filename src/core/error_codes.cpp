#include "marquee/core/error_codes.hpp"
#include "marquee/common/constants.hpp"
#include "marquee/common/logger.hpp"
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace marquee {
namespace core {

namespace {

std::mutex& hookMutex() {
    static std::mutex mutex;
    return mutex;
}

FatalHook& currentHook() {
    static FatalHook hook;
    return hook;
}

}

ViewError::ViewError(ViewErrorCode code)
    : std::runtime_error(ViewErrorCodeHelper::getMessage(code)),
      code_(code) {}

ViewError::ViewError(ViewErrorCode code, const std::string& detail)
    : std::runtime_error(std::string(ViewErrorCodeHelper::getMessage(code)) + ": " + detail),
      code_(code) {}

FatalHook setFatalHook(FatalHook hook) {
    std::lock_guard<std::mutex> lock(hookMutex());
    FatalHook previous = std::move(currentHook());
    currentHook() = std::move(hook);
    return previous;
}

void fatalError(ViewErrorCode code, const common::ErrorContext& context) {
    std::string detail = common::formatContext(context);
    
    common::Logger::instance().error("[View] Fatal terminal error | code={} | {}",
                                     ViewErrorCodeHelper::toString(code), detail);
    common::Logger::instance().flush();
    
    FatalHook hook;
    {
        std::lock_guard<std::mutex> lock(hookMutex());
        hook = currentHook();
    }
    
    if (hook) {
        hook(code, detail);
    }
    
    std::cerr << "\n" << constants::system::APPLICATION_NAME << ": " << ViewErrorCodeHelper::getMessage(code);
    if (!detail.empty()) {
        std::cerr << " (" << detail << ")";
    }
    std::cerr << std::endl;
    std::abort();
}

}}
