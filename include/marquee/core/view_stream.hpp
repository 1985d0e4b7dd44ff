#pragma once

#include "error_codes.hpp"
#include "view.hpp"
#include <ostream>
#include <streambuf>
#include <string>

namespace marquee {
namespace core {

// Stream buffer that hands complete lines to a View. A partial line is
// passed on when the stream is flushed.
template <typename M>
class ViewStreamBuf : public std::streambuf {
public:
    explicit ViewStreamBuf(View<M>& view) : view_(view) {}

protected:
    int_type overflow(int_type ch) override {
        if (traits_type::eq_int_type(ch, traits_type::eof())) {
            return traits_type::not_eof(ch);
        }
        pending_ += traits_type::to_char_type(ch);
        if (traits_type::to_char_type(ch) == '\n' && !sendCompleteLines()) {
            return traits_type::eof();
        }
        return ch;
    }
    
    std::streamsize xsputn(const char* s, std::streamsize n) override {
        pending_.append(s, static_cast<size_t>(n));
        if (!sendCompleteLines()) {
            return 0;
        }
        return n;
    }
    
    int sync() override {
        if (pending_.empty()) {
            return 0;
        }
        try {
            view_.message(pending_);
        } catch (const ViewError&) {
            return -1;
        }
        pending_.clear();
        return 0;
    }

private:
    View<M>& view_;
    std::string pending_;
    
    bool sendCompleteLines() {
        auto last_newline = pending_.rfind('\n');
        if (last_newline == std::string::npos) {
            return true;
        }
        try {
            view_.message(pending_.substr(0, last_newline + 1));
        } catch (const ViewError&) {
            return false;
        }
        pending_.erase(0, last_newline + 1);
        return true;
    }
};

// std::ostream over a View, so `stream << "done " << n << std::endl` prints
// underneath the progress.
template <typename M>
class ViewStream : public std::ostream {
public:
    explicit ViewStream(View<M>& view)
        : std::ostream(nullptr),
          buf_(view) {
        rdbuf(&buf_);
    }
    
    ~ViewStream() override {
        buf_.pubsync();
    }

private:
    ViewStreamBuf<M> buf_;
};

}}
