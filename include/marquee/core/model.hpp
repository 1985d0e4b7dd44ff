#pragma once

#include <cstddef>
#include <string>

namespace marquee {
namespace core {

// Application state that knows how to draw itself as progress.
class Model {
public:
    virtual ~Model() = default;
    
    // Lines are separated by '\n'; one trailing newline is ignored. Lines
    // wider than `width` columns are cut when painted. ANSI styling is
    // allowed, cursor movement is not.
    virtual std::string render(size_t width) = 0;
    
    // Printed once by View::finish when non-empty. May span several lines
    // and should not end with a newline.
    virtual std::string finalMessage() { return std::string(); }
};

}}
