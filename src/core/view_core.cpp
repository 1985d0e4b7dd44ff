#include "marquee/core/view_core.hpp"
#include "marquee/core/error_codes.hpp"
#include "marquee/common/constants.hpp"
#include "marquee/common/logger.hpp"
#include "marquee/format/text_width.hpp"

namespace marquee {
namespace core {

const char* viewStateName(ViewState state) {
    switch (state) {
        case ViewState::DISABLED: return "disabled";
        case ViewState::IDLE: return "idle";
        case ViewState::PAINTED: return "painted";
        case ViewState::SUSPENDED: return "suspended";
        case ViewState::FINISHED: return "finished";
    }
    return "unknown";
}

namespace {

// Control bytes other than newline, tab and ESC move the cursor or are
// invisible, so they never reach the terminal from a render.
bool isStrippedControl(unsigned char c) {
    return (c < 0x20 && c != '\n' && c != '\t' && c != '\033') || c == 0x7F;
}

}

std::vector<std::string> splitRenderedLines(const std::string& rendered, bool* sanitized) {
    std::vector<std::string> lines;
    bool found_control = false;
    
    std::string current;
    for (char c : rendered) {
        unsigned char byte = static_cast<unsigned char>(c);
        if (c == '\n') {
            lines.push_back(std::move(current));
            current.clear();
        } else if (c == '\t') {
            size_t column = format::displayWidth(current);
            size_t tab_width = constants::terminal::TAB_WIDTH;
            current.append(tab_width - column % tab_width, ' ');
        } else if (isStrippedControl(byte)) {
            found_control = true;
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        lines.push_back(std::move(current));
    }
    
    if (sanitized) {
        *sanitized = found_control;
    }
    return lines;
}

std::unique_ptr<TerminalWriter> ViewCore::writerFor(const Options& options) {
    switch (options.destination) {
        case Destination::STDERR:
            return StreamWriter::forStderr();
        case Destination::CAPTURE:
            return std::make_unique<CaptureWriter>(std::make_shared<CaptureBuffer>(),
                                                   constants::terminal::CAPTURE_WIDTH);
        case Destination::STDOUT:
        default:
            return StreamWriter::forStdout();
    }
}

ViewCore::ViewCore(const Options& options)
    : ViewCore(options, writerFor(options)) {}

ViewCore::ViewCore(const Options& options, std::unique_ptr<TerminalWriter> writer)
    : options_(options),
      writer_(std::move(writer)),
      limiter_(options.update_interval, options.print_holdoff),
      state_(ViewState::IDLE),
      enabled_(false),
      fake_now_(Clock::now()) {
    if (auto* capture_writer = dynamic_cast<CaptureWriter*>(writer_.get())) {
        capture_ = capture_writer->buffer();
    }
    
    bool interactive = writer_->isInteractive();
    enabled_ = options_.enabled && interactive;
    if (!enabled_) {
        state_ = ViewState::DISABLED;
    }
    
    common::Logger::instance().debug("[View] Created | destination={} | enabled={} | interactive={} | update_interval_ms={} | print_holdoff_ms={}",
                                     destinationName(options_.destination), enabled_, interactive,
                                     options_.update_interval.count(), options_.print_holdoff.count());
}

void ViewCore::ensureActive() const {
    if (state_ == ViewState::FINISHED) {
        throw ViewError(ViewErrorCode::VIEW_FINISHED);
    }
}

void ViewCore::afterUpdate(Model& model) {
    ++stats_.updates;
    
    if (state_ == ViewState::DISABLED || state_ == ViewState::FINISHED) {
        return;
    }
    
    bool forced = false;
    if (state_ == ViewState::SUSPENDED) {
        state_ = ViewState::IDLE;
        forced = true;
        common::Logger::instance().debug("[View] Resumed by update");
    }
    
    paintIfDue(model, forced);
}

void ViewCore::paintIfDue(Model& model, bool forced) {
    if (incomplete_line_) {
        return;
    }
    
    size_t width = currentWidth();
    if (engine_.isPainted() && engine_.state().last_width != width) {
        forced = true;
    }
    
    Clock::time_point paint_time = now();
    if (!limiter_.shouldPaint(paint_time, last_paint_time_, last_text_time_, forced)) {
        ++stats_.rate_limited;
        return;
    }
    
    bool sanitized = false;
    std::vector<std::string> lines = splitRenderedLines(model.render(width), &sanitized);
    if (sanitized) {
        common::Logger::instance().warn("[View] {} | lines={}",
                                        ViewErrorCodeHelper::getMessage(ViewErrorCode::MODEL_OUTPUT_SANITIZED),
                                        lines.size());
    }
    
    PaintPlan plan = engine_.repaint(lines, width);
    if (plan.empty()) {
        if (!lines.empty()) {
            ++stats_.identical_suppressed;
        }
        return;
    }
    
    emit(plan.bytes);
    engine_.commit(plan);
    last_paint_time_ = paint_time;
    
    if (engine_.isPainted()) {
        ++stats_.paints;
        state_ = ViewState::PAINTED;
    } else {
        ++stats_.erases;
        state_ = ViewState::IDLE;
    }
    
    common::Logger::instance().debug("[View] Painted | lines={} | width={} | bytes={} | forced={}",
                                     lines.size(), width, plan.bytes.size(), forced);
}

void ViewCore::eraseIfPainted() {
    if (!engine_.isPainted()) {
        return;
    }
    
    PaintPlan plan = engine_.erase();
    emit(plan.bytes);
    engine_.commit(plan);
    ++stats_.erases;
}

void ViewCore::writeText(const std::string& bytes) {
    ensureActive();
    
    if (bytes.empty()) {
        return;
    }
    
    std::string out;
    PaintPlan erase_plan = engine_.erase();
    bool erasing = engine_.isPainted();
    if (erasing) {
        out = erase_plan.bytes;
    }
    out += bytes;
    
    emit(out);
    
    if (erasing) {
        engine_.commit(erase_plan);
        ++stats_.erases;
    }
    ++stats_.text_writes;
    
    last_text_time_ = now();
    incomplete_line_ = bytes.back() != '\n';
    
    if (state_ == ViewState::PAINTED) {
        state_ = ViewState::IDLE;
    }
}

void ViewCore::suspend() {
    ensureActive();
    
    if (state_ == ViewState::DISABLED) {
        return;
    }
    
    eraseIfPainted();
    state_ = ViewState::SUSPENDED;
    common::Logger::instance().debug("[View] Suspended");
}

void ViewCore::resume(Model& model) {
    ensureActive();
    
    if (state_ == ViewState::DISABLED) {
        return;
    }
    
    bool was_suspended = state_ == ViewState::SUSPENDED;
    if (was_suspended) {
        state_ = ViewState::IDLE;
    }
    paintIfDue(model, was_suspended);
}

void ViewCore::finish(Model& model) {
    ensureActive();
    
    std::string out;
    PaintPlan erase_plan = engine_.erase();
    out = erase_plan.bytes;
    
    std::string final_message = model.finalMessage();
    if (!final_message.empty()) {
        out += final_message;
        out += "\n";
    }
    
    if (!out.empty()) {
        emit(out);
    }
    if (engine_.isPainted()) {
        ++stats_.erases;
    }
    engine_.commit(erase_plan);
    state_ = ViewState::FINISHED;
    
    common::Logger::instance().debug("[View] Finished | paints={} | text_writes={} | bytes={}",
                                     stats_.paints, stats_.text_writes, stats_.bytes_written);
}

void ViewCore::abandon() {
    ensureActive();
    
    // The cursor already sits below the bar, so it can simply stay there.
    engine_.forget();
    state_ = ViewState::FINISHED;
    
    common::Logger::instance().debug("[View] Abandoned | paints={}", stats_.paints);
}

void ViewCore::teardown() {
    if (state_ == ViewState::FINISHED) {
        return;
    }
    
    eraseIfPainted();
    state_ = ViewState::FINISHED;
}

void ViewCore::setFakeClock(Clock::time_point now) {
    if (!options_.fake_clock) {
        throw ViewError(ViewErrorCode::FAKE_CLOCK_DISABLED);
    }
    fake_now_ = now;
}

void ViewCore::emit(const std::string& bytes) {
    if (!writer_->write(bytes)) {
        fatalError(ViewErrorCode::TERMINAL_WRITE_FAILED,
                   common::ErrorContext{"View", {{"bytes", std::to_string(bytes.size())},
                                                 {"state", viewStateName(state_)}},
                                        std::chrono::system_clock::now()});
    }
    if (!writer_->flush()) {
        fatalError(ViewErrorCode::TERMINAL_FLUSH_FAILED,
                   common::ErrorContext{"View", {{"state", viewStateName(state_)}},
                                        std::chrono::system_clock::now()});
    }
    stats_.bytes_written += bytes.size();
}

size_t ViewCore::currentWidth() {
    auto width = writer_->width();
    if (width && *width > 0) {
        return *width;
    }
    
    if (!width_fallback_logged_) {
        common::Logger::instance().debug("[View] {} | default_width={}",
                                         ViewErrorCodeHelper::getMessage(ViewErrorCode::TERMINAL_WIDTH_UNAVAILABLE),
                                         constants::terminal::DEFAULT_WIDTH);
        width_fallback_logged_ = true;
    }
    return constants::terminal::DEFAULT_WIDTH;
}

Clock::time_point ViewCore::now() const {
    if (options_.fake_clock) {
        return fake_now_;
    }
    return Clock::now();
}

}}
