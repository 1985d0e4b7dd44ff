#include "marquee/models/models.hpp"
#include "marquee/format/progress_format.hpp"

namespace marquee {
namespace models {

StringPair::StringPair(std::string prefix, std::string suffix)
    : prefix_(std::move(prefix)),
      suffix_(std::move(suffix)) {}

std::string StringPair::render(size_t) {
    return prefix_ + suffix_;
}

LinearModel::LinearModel(std::string message, size_t total)
    : message_(std::move(message)),
      done_(0),
      total_(total),
      start_(std::chrono::steady_clock::now()) {}

std::string LinearModel::render(size_t) {
    auto remaining = format::estimateRemaining(start_, done_, total_);
    return fmt::format("{}: {}/{}, {}, {} remaining",
                       message_, done_, total_,
                       format::percentDone(done_, total_),
                       remaining.value_or("??"));
}

std::string LinearModel::finalMessage() {
    return fmt::format("{}: {}/{} done in {}",
                       message_, done_, total_,
                       format::durationBrief(std::chrono::steady_clock::now() - start_));
}

UnboundedModel::UnboundedModel(std::string message)
    : message_(std::move(message)),
      done_(0),
      start_(std::chrono::steady_clock::now()) {}

std::string UnboundedModel::render(size_t) {
    return fmt::format("{}: {} in {}",
                       message_, done_,
                       format::durationBrief(std::chrono::steady_clock::now() - start_));
}

}}
