#pragma once

#include <string>
#include <cstddef>

namespace marquee {
namespace core {
namespace ansi {

constexpr const char* CLEAR_TO_END_OF_LINE = "\x1b[0K";
constexpr const char* CARRIAGE_RETURN = "\r";
constexpr const char* NEWLINE = "\n";

// Empty when n is zero.
std::string upLines(size_t n);

}
}
}
