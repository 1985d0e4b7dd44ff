#pragma once

#include "../core/model.hpp"
#include <spdlog/fmt/fmt.h>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>

namespace marquee {
namespace models {

// Renders a fixed prefix followed by a changing suffix.
class StringPair : public core::Model {
public:
    StringPair(std::string prefix, std::string suffix);
    
    void setPrefix(std::string prefix) { prefix_ = std::move(prefix); }
    void setSuffix(std::string suffix) { suffix_ = std::move(suffix); }
    
    std::string render(size_t width) override;

private:
    std::string prefix_;
    std::string suffix_;
};

// A value plus an inline render function, for when defining a Model
// subclass is not worth it.
template <typename T>
class BasicModel : public core::Model {
public:
    using RenderFn = std::function<std::string(const T&)>;
    
    BasicModel(T value, RenderFn render_fn)
        : value_(std::move(value)),
          render_fn_(std::move(render_fn)) {}
    
    T& value() { return value_; }
    const T& value() const { return value_; }
    
    std::string render(size_t) override {
        return render_fn_(value_);
    }

private:
    T value_;
    RenderFn render_fn_;
};

// Any value fmt can format, drawn without regard to the width.
template <typename T>
class DisplayModel : public core::Model {
public:
    explicit DisplayModel(T value) : value_(std::move(value)) {}
    
    T& value() { return value_; }
    const T& value() const { return value_; }
    
    std::string render(size_t) override {
        return fmt::format("{}", value_);
    }

private:
    T value_;
};

// Work with a known total: "Copying: 12/40, 30.0%, 8 sec remaining".
class LinearModel : public core::Model {
public:
    LinearModel(std::string message, size_t total);
    
    void increment(size_t n = 1) { done_ += n; }
    void setDone(size_t done) { done_ = done; }
    void setTotal(size_t total) { total_ = total; }
    void setMessage(std::string message) { message_ = std::move(message); }
    
    size_t done() const { return done_; }
    size_t total() const { return total_; }
    
    std::string render(size_t width) override;
    std::string finalMessage() override;

private:
    std::string message_;
    size_t done_;
    size_t total_;
    std::chrono::steady_clock::time_point start_;
};

// Work with no known total: "Scanning: 1520 in 12 sec".
class UnboundedModel : public core::Model {
public:
    explicit UnboundedModel(std::string message);
    
    void increment(size_t n = 1) { done_ += n; }
    void setMessage(std::string message) { message_ = std::move(message); }
    
    size_t done() const { return done_; }
    
    std::string render(size_t width) override;

private:
    std::string message_;
    size_t done_;
    std::chrono::steady_clock::time_point start_;
};

}}
