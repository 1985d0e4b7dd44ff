#include "marquee/core/terminal_writer.hpp"
#include "marquee/common/constants.hpp"
#include <cstdlib>
#include <iostream>
#include <strings.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace marquee {
namespace core {

bool isDumbTerminal() {
    const char* term = std::getenv("TERM");
    return term != nullptr && strcasecmp(term, constants::terminal::DUMB_TERM) == 0;
}

StreamWriter::StreamWriter(std::ostream& out, int fd)
    : out_(out), fd_(fd) {}

std::unique_ptr<StreamWriter> StreamWriter::forStdout() {
    return std::make_unique<StreamWriter>(std::cout, STDOUT_FILENO);
}

std::unique_ptr<StreamWriter> StreamWriter::forStderr() {
    return std::make_unique<StreamWriter>(std::cerr, STDERR_FILENO);
}

bool StreamWriter::write(const std::string& bytes) {
    out_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(out_);
}

bool StreamWriter::flush() {
    out_.flush();
    return static_cast<bool>(out_);
}

std::optional<size_t> StreamWriter::width() const {
    struct winsize w;
    if (ioctl(fd_, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return static_cast<size_t>(w.ws_col);
    }
    return std::nullopt;
}

bool StreamWriter::isInteractive() const {
    return isatty(fd_) && !isDumbTerminal();
}

void CaptureBuffer::append(const std::string& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_ += bytes;
}

std::string CaptureBuffer::contents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_;
}

size_t CaptureBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

CaptureWriter::CaptureWriter(std::shared_ptr<CaptureBuffer> buffer, size_t width)
    : buffer_(std::move(buffer)), width_(width) {}

bool CaptureWriter::write(const std::string& bytes) {
    buffer_->append(bytes);
    return true;
}

}}
