#include "marquee/core/paint_engine.hpp"
#include "marquee/core/ansi.hpp"
#include "marquee/format/text_width.hpp"

namespace marquee {
namespace core {

PaintPlan PaintEngine::repaint(const std::vector<std::string>& lines, size_t width) const {
    if (lines.empty()) {
        return erase();
    }
    
    PaintPlan plan;
    plan.next = state_;
    
    if (state_.last_rendered_lines && *state_.last_rendered_lines == lines &&
        state_.last_width == width) {
        return plan;
    }
    
    const size_t old_count = state_.line_count;
    const size_t new_count = lines.size();
    std::string& buf = plan.bytes;
    
    if (old_count > 0) {
        buf += ansi::CARRIAGE_RETURN;
        buf += ansi::upLines(old_count);
    }
    
    for (const auto& line : lines) {
        buf += ansi::CLEAR_TO_END_OF_LINE;
        buf += format::truncateToWidth(line, width);
        buf += ansi::NEWLINE;
    }
    
    if (new_count < old_count) {
        size_t stale = old_count - new_count;
        for (size_t i = 0; i < stale; ++i) {
            buf += ansi::CLEAR_TO_END_OF_LINE;
            buf += ansi::NEWLINE;
        }
        buf += ansi::upLines(stale);
    }
    
    plan.next.line_count = new_count;
    plan.next.last_rendered_lines = lines;
    plan.next.last_width = width;
    return plan;
}

PaintPlan PaintEngine::erase() const {
    PaintPlan plan;
    
    if (state_.line_count == 0) {
        return plan;
    }
    
    plan.bytes += ansi::CARRIAGE_RETURN;
    for (size_t i = 0; i < state_.line_count; ++i) {
        plan.bytes += ansi::upLines(1);
        plan.bytes += ansi::CLEAR_TO_END_OF_LINE;
    }
    
    return plan;
}

void PaintEngine::commit(const PaintPlan& plan) {
    state_ = plan.next;
}

void PaintEngine::forget() {
    state_ = PaintedState();
}

}}
