#pragma once

#include "error_codes.hpp"
#include "view.hpp"
#include "../common/logger.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace marquee {
namespace core {

// Process-wide View for programs that do not pass a handle around.
//
// install() builds the View once; get() hands out a shared handle from any
// thread. finish() uninstalls the View, finishes it and returns the model.
// Handles obtained earlier stay valid, and calls through them afterwards
// throw ViewError(VIEW_FINISHED). A View still installed at exit is torn
// down by static destruction, erasing progress.
template <typename M>
class GlobalView {
public:
    static std::shared_ptr<View<M>> install(M model, const Options& options) {
        auto& slot = storage();
        std::lock_guard<std::mutex> lock(slot.mutex);
        if (slot.view) {
            throw std::logic_error("global view is already installed");
        }
        slot.view = std::make_shared<View<M>>(std::move(model), options);
        return slot.view;
    }
    
    static std::shared_ptr<View<M>> get() {
        auto& slot = storage();
        std::lock_guard<std::mutex> lock(slot.mutex);
        if (!slot.view) {
            throw std::logic_error("global view is not installed");
        }
        return slot.view;
    }
    
    static bool installed() {
        auto& slot = storage();
        std::lock_guard<std::mutex> lock(slot.mutex);
        return slot.view != nullptr;
    }
    
    // Empty if nothing was installed.
    static std::optional<M> finish() {
        std::shared_ptr<View<M>> view;
        {
            auto& slot = storage();
            std::lock_guard<std::mutex> lock(slot.mutex);
            view = std::move(slot.view);
        }
        if (!view) {
            return std::nullopt;
        }
        return view->finish();
    }

private:
    struct Slot {
        std::mutex mutex;
        std::shared_ptr<View<M>> view;
    };
    
    static Slot& storage() {
        // The logger must outlive the slot, since teardown may log.
        common::Logger::instance();
        static Slot slot;
        return slot;
    }
};

}}
