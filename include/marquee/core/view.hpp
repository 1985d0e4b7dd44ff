#pragma once

#include "model.hpp"
#include "options.hpp"
#include "terminal_writer.hpp"
#include "view_core.hpp"
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace marquee {
namespace core {

// Draws a model as progress on the terminal and coordinates it with text
// printed through message() or write().
//
// One View should own a terminal at a time, and while it is alive all output
// to that terminal should go through it. A View may be shared between
// threads (for example through std::shared_ptr); every call is serialized
// by one mutex, and the model is only touched while that mutex is held.
// Model::render runs under the lock and must not call back into the View.
//
// If the View is destroyed without finish() or abandon(), painted progress
// is erased and no final message is printed.
template <typename M>
class View {
    static_assert(std::is_base_of<Model, M>::value, "View models must derive from marquee::core::Model");

public:
    View(M model, const Options& options)
        : model_(std::move(model)),
          core_(options) {}
    
    // Draw to a caller-supplied writer. Progress is drawn only if the writer
    // reports itself interactive.
    View(M model, const Options& options, std::unique_ptr<TerminalWriter> writer)
        : model_(std::move(model)),
          core_(options, std::move(writer)) {}
    
    ~View() {
        std::lock_guard<std::mutex> lock(mutex_);
        core_.teardown();
    }
    
    View(const View&) = delete;
    View& operator=(const View&) = delete;
    
    // Apply `fn` to the model and repaint if the rate limit allows.
    // Returns whatever `fn` returns.
    template <typename F>
    auto update(F&& fn) -> decltype(fn(std::declval<M&>())) {
        using Result = decltype(fn(std::declval<M&>()));
        
        std::lock_guard<std::mutex> lock(mutex_);
        core_.ensureActive();
        
        if constexpr (std::is_void<Result>::value) {
            fn(*model_);
            core_.afterUpdate(*model_);
        } else {
            Result result = fn(*model_);
            core_.afterUpdate(*model_);
            return result;
        }
    }
    
    template <typename F>
    auto inspectModel(F&& fn) const -> decltype(fn(std::declval<const M&>())) {
        std::lock_guard<std::mutex> lock(mutex_);
        core_.ensureActive();
        return fn(static_cast<const M&>(*model_));
    }
    
    // Print text, hiding progress first. Without a final '\n' the line stays
    // open and progress is not drawn until a later message completes it.
    void message(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        core_.writeText(text);
    }
    
    template <typename... Args>
    void messagef(const std::string& format, Args&&... args) {
        message(fmt::format(fmt::runtime(format), std::forward<Args>(args)...));
    }
    
    void write(const char* data, size_t length) {
        if (length == 0) {
            return;
        }
        message(std::string(data, length));
    }
    
    // Erase progress. It comes back on the next update() or resume().
    void suspend() {
        std::lock_guard<std::mutex> lock(mutex_);
        core_.suspend();
    }
    
    void hide() {
        suspend();
    }
    
    void resume() {
        std::lock_guard<std::mutex> lock(mutex_);
        core_.ensureActive();
        core_.resume(*model_);
    }
    
    // Erase progress, print the model's final message, and hand back the model.
    M finish() {
        std::lock_guard<std::mutex> lock(mutex_);
        core_.ensureActive();
        core_.finish(*model_);
        return releaseModel();
    }
    
    // Leave the last painted progress on screen and hand back the model.
    M abandon() {
        std::lock_guard<std::mutex> lock(mutex_);
        core_.abandon();
        return releaseModel();
    }
    
    // Only valid with Options::fake_clock.
    void setFakeClock(Clock::time_point now) {
        std::lock_guard<std::mutex> lock(mutex_);
        core_.setFakeClock(now);
    }
    
    // Null unless drawing to Destination::CAPTURE or a CaptureWriter.
    std::shared_ptr<CaptureBuffer> capturedOutput() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return core_.capturedOutput();
    }
    
    ViewStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return core_.stats();
    }
    
    ViewState state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return core_.state();
    }
    
    bool isEnabled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return core_.isEnabled();
    }

private:
    mutable std::mutex mutex_;
    std::optional<M> model_;
    ViewCore core_;
    
    M releaseModel() {
        M model = std::move(*model_);
        model_.reset();
        return model;
    }
};

}}
