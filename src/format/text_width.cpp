#include "marquee/format/text_width.hpp"
#include "marquee/common/constants.hpp"
#include <cwchar>
#include <iomanip>
#include <sstream>
#include <wchar.h>

namespace marquee {
namespace format {

namespace {

struct Glyph {
    size_t bytes;
    size_t columns;
};

size_t tabAdvance(size_t column) {
    return constants::terminal::TAB_WIDTH - column % constants::terminal::TAB_WIDTH;
}

size_t utf8SequenceLength(const std::string& text, size_t pos) {
    unsigned char c = static_cast<unsigned char>(text[pos]);
    size_t utf8_len = 1;
    if ((c & 0xE0) == 0xC0) utf8_len = 2;
    else if ((c & 0xF0) == 0xE0) utf8_len = 3;
    else if ((c & 0xF8) == 0xF0) utf8_len = 4;
    
    if (pos + utf8_len > text.length()) {
        return 1;
    }
    for (size_t j = 1; j < utf8_len; ++j) {
        if ((static_cast<unsigned char>(text[pos + j]) & 0xC0) != 0x80) {
            return 1;
        }
    }
    return utf8_len;
}

Glyph nextGlyph(const std::string& text, size_t pos, std::mbstate_t& state) {
    const char* ptr = text.c_str() + pos;
    const char* end = text.c_str() + text.length();
    
    size_t utf8_len = utf8SequenceLength(text, pos);

    wchar_t wc;
    size_t len = std::mbrtowc(&wc, ptr, end - ptr, &state);

    if (len == 0 || len == static_cast<size_t>(-1) || len == static_cast<size_t>(-2) || len != utf8_len) {
        // Not decodable as UTF-8 in the current locale: keep whole sequences together.
        state = std::mbstate_t();
        return {utf8_len, 1};
    }
    
    int char_width = wcwidth(wc);
    return {len, char_width >= 0 ? static_cast<size_t>(char_width) : 1};
}

}

size_t escapeSequenceLength(const std::string& text, size_t pos) {
    if (pos >= text.length() || text[pos] != '\033') {
        return 0;
    }
    if (pos + 1 >= text.length()) {
        return 1;
    }
    
    char kind = text[pos + 1];
    size_t i = pos + 2;
    
    if (kind == '[') {
        while (i < text.length()) {
            unsigned char c = static_cast<unsigned char>(text[i]);
            ++i;
            if (c >= 0x40 && c <= 0x7E) {
                break;
            }
        }
        return i - pos;
    }
    
    if (kind == ']') {
        while (i < text.length()) {
            if (text[i] == '\a') {
                return i + 1 - pos;
            }
            if (text[i] == '\033' && i + 1 < text.length() && text[i + 1] == '\\') {
                return i + 2 - pos;
            }
            ++i;
        }
        return i - pos;
    }
    
    return 2;
}

size_t displayWidth(const std::string& text) {
    size_t width = 0;
    std::mbstate_t state = std::mbstate_t();
    size_t pos = 0;
    
    while (pos < text.length()) {
        size_t escape_len = escapeSequenceLength(text, pos);
        if (escape_len > 0) {
            pos += escape_len;
            continue;
        }
        
        if (text[pos] == '\t') {
            width += tabAdvance(width);
            ++pos;
            continue;
        }
        
        Glyph glyph = nextGlyph(text, pos, state);
        width += glyph.columns;
        pos += glyph.bytes;
    }
    
    return width;
}

std::string truncateToWidth(const std::string& text, size_t max_width) {
    std::string result;
    result.reserve(text.length());
    
    size_t accumulated_width = 0;
    bool full = false;
    std::mbstate_t state = std::mbstate_t();
    size_t pos = 0;
    
    while (pos < text.length()) {
        size_t escape_len = escapeSequenceLength(text, pos);
        if (escape_len > 0) {
            result.append(text, pos, escape_len);
            pos += escape_len;
            continue;
        }
        
        Glyph glyph = (text[pos] == '\t') ? Glyph{1, tabAdvance(accumulated_width)}
                                           : nextGlyph(text, pos, state);
        if (!full && accumulated_width + glyph.columns <= max_width) {
            result.append(text, pos, glyph.bytes);
            accumulated_width += glyph.columns;
        } else {
            full = true;
        }
        pos += glyph.bytes;
    }
    
    return result;
}

std::string showControlCharacters(const std::string& text) {
    std::ostringstream result;
    
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        
        if (c == '\n') {
            result << "\\n";
        } else if (c == '\r') {
            result << "\\r";
        } else if (c == '\033') {
            result << "\\e";
        } else if (c < 0x20 || c == 0x7F) {
            result << "<" << std::hex << std::uppercase << std::setw(2) << std::setfill('0') 
                   << static_cast<int>(c) << ">" << std::dec;
        } else {
            result << ch;
        }
    }
    
    return result.str();
}

}
}
