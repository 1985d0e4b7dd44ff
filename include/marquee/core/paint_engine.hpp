#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace marquee {
namespace core {

// What is on screen right now. line_count is zero when nothing is drawn.
struct PaintedState {
    size_t line_count = 0;
    std::optional<std::vector<std::string>> last_rendered_lines;
    size_t last_width = 0;
};

// Bytes to emit, and the state that holds once they are written.
struct PaintPlan {
    std::string bytes;
    PaintedState next;
    
    bool empty() const { return bytes.empty(); }
};

// Computes the escape sequences that replace the painted lines with new ones.
//
// After a paint the cursor sits at the start of the line just below the
// last painted line. After an erase it sits at the start of the first line
// that was painted, so interleaved text lands where the bar was.
class PaintEngine {
public:
    PaintPlan repaint(const std::vector<std::string>& lines, size_t width) const;
    PaintPlan erase() const;
    
    // Adopt the plan's state. Call only after its bytes were written.
    void commit(const PaintPlan& plan);
    
    // Drop the state without touching the screen; the lines stay visible.
    void forget();
    
    const PaintedState& state() const { return state_; }
    bool isPainted() const { return state_.line_count > 0; }

private:
    PaintedState state_;
};

}}
