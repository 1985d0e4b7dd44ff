#pragma once

#include <string>
#include <cstddef>

namespace marquee {
namespace format {

// Display columns of `text`, ignoring ANSI escape sequences.
size_t displayWidth(const std::string& text);

// Cut `text` to at most `max_width` display columns. Escape sequences are
// kept wherever they occur, and a multibyte character is never split.
std::string truncateToWidth(const std::string& text, size_t max_width);

// Length in bytes of the escape sequence starting at `pos`, or 0.
size_t escapeSequenceLength(const std::string& text, size_t pos);

std::string showControlCharacters(const std::string& text);

}
}
