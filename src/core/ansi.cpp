#include "marquee/core/ansi.hpp"
#include <spdlog/fmt/fmt.h>

namespace marquee {
namespace core {
namespace ansi {

std::string upLines(size_t n) {
    if (n == 0) {
        return std::string();
    }
    return fmt::format("\x1b[{}A", n);
}

}
}
}
