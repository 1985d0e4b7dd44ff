#pragma once

#include "model.hpp"
#include "options.hpp"
#include "paint_engine.hpp"
#include "rate_limiter.hpp"
#include "terminal_writer.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace marquee {
namespace core {

enum class ViewState {
    DISABLED,
    IDLE,
    PAINTED,
    SUSPENDED,
    FINISHED
};

const char* viewStateName(ViewState state);

struct ViewStats {
    uint64_t updates = 0;
    uint64_t paints = 0;
    uint64_t erases = 0;
    uint64_t identical_suppressed = 0;
    uint64_t rate_limited = 0;
    uint64_t text_writes = 0;
    uint64_t bytes_written = 0;
};

// Split rendered model output into lines. Tabs become spaces up to the next
// tab stop and other control bytes except ESC are removed; `sanitized`
// reports whether any were removed.
std::vector<std::string> splitRenderedLines(const std::string& rendered, bool* sanitized = nullptr);

// The progress state machine. Not synchronized: View serializes every call.
class ViewCore {
public:
    explicit ViewCore(const Options& options);
    ViewCore(const Options& options, std::unique_ptr<TerminalWriter> writer);
    
    ViewCore(const ViewCore&) = delete;
    ViewCore& operator=(const ViewCore&) = delete;
    
    void afterUpdate(Model& model);
    void writeText(const std::string& bytes);
    void suspend();
    void resume(Model& model);
    void finish(Model& model);
    void abandon();
    
    // Erase without a final message. Safe to call more than once.
    void teardown();
    
    // Throws ViewError(VIEW_FINISHED) once the view is finished.
    void ensureActive() const;
    
    void setFakeClock(Clock::time_point now);
    
    ViewState state() const { return state_; }
    bool isEnabled() const { return enabled_; }
    const ViewStats& stats() const { return stats_; }
    std::shared_ptr<CaptureBuffer> capturedOutput() const { return capture_; }

private:
    const Options options_;
    std::unique_ptr<TerminalWriter> writer_;
    std::shared_ptr<CaptureBuffer> capture_;
    PaintEngine engine_;
    RateLimiter limiter_;
    
    ViewState state_;
    bool enabled_;
    bool incomplete_line_ = false;
    bool width_fallback_logged_ = false;
    
    std::optional<Clock::time_point> last_paint_time_;
    std::optional<Clock::time_point> last_text_time_;
    Clock::time_point fake_now_;
    
    ViewStats stats_;
    
    void paintIfDue(Model& model, bool forced);
    void eraseIfPainted();
    void emit(const std::string& bytes);
    size_t currentWidth();
    Clock::time_point now() const;
    
    static std::unique_ptr<TerminalWriter> writerFor(const Options& options);
};

}}
