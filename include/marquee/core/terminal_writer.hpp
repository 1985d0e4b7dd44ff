#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace marquee {
namespace core {

// Where a View writes: a real terminal stream or an in-memory buffer.
class TerminalWriter {
public:
    virtual ~TerminalWriter() = default;
    
    virtual bool write(const std::string& bytes) = 0;
    virtual bool flush() = 0;
    
    // Empty if the width cannot be determined.
    virtual std::optional<size_t> width() const = 0;
    
    // True if progress may be drawn here at all.
    virtual bool isInteractive() const = 0;
};

bool isDumbTerminal();

class StreamWriter : public TerminalWriter {
public:
    StreamWriter(std::ostream& out, int fd);
    
    static std::unique_ptr<StreamWriter> forStdout();
    static std::unique_ptr<StreamWriter> forStderr();
    
    bool write(const std::string& bytes) override;
    bool flush() override;
    std::optional<size_t> width() const override;
    bool isInteractive() const override;

private:
    std::ostream& out_;
    int fd_;
};

// Thread-safe byte sink shared between a capturing View and its caller.
class CaptureBuffer {
public:
    void append(const std::string& bytes);
    std::string contents() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::string data_;
};

class CaptureWriter : public TerminalWriter {
public:
    explicit CaptureWriter(std::shared_ptr<CaptureBuffer> buffer, size_t width);
    
    bool write(const std::string& bytes) override;
    bool flush() override { return true; }
    std::optional<size_t> width() const override { return width_; }
    bool isInteractive() const override { return true; }
    
    std::shared_ptr<CaptureBuffer> buffer() const { return buffer_; }

private:
    std::shared_ptr<CaptureBuffer> buffer_;
    size_t width_;
};

}}
