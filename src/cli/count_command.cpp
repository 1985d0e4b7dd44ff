#include "count_command.hpp"
#include "marquee/common/logger.hpp"
#include "marquee/core/view.hpp"
#include "marquee/core/view_stream.hpp"
#include "marquee/models/models.hpp"
#include <chrono>
#include <iostream>
#include <thread>

namespace marquee {
namespace cli {

CountCommand::CountCommand() : was_called_(false) {}

void CountCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    subcommand->add_option("-n,--total", total_, "Number of items to count")
              ->check(CLI::PositiveNumber);
    subcommand->add_option("--step-ms", step_ms_, "Milliseconds of simulated work per item")
              ->check(CLI::NonNegativeNumber);
    subcommand->add_option("--message-every", message_every_, 
                          "Print a text line every N items (0 disables)");
    subcommand->add_flag("--stderr", to_stderr_, "Draw progress on stderr");
    subcommand->add_flag("--no-progress", no_progress_, "Only print text lines");
    subcommand->add_flag("--abandon", abandon_, "Leave the last progress on screen");
    
    subcommand->callback([this]() { was_called_ = true; });
}

bool CountCommand::wasCalled() const {
    return was_called_;
}

bool CountCommand::validateArguments() const {
    return total_ > 0 && step_ms_ >= 0;
}

int CountCommand::execute() {
    if (!validateArguments()) {
        std::cerr << "Error: invalid count arguments\n";
        return 1;
    }
    
    core::Options options = configuredOptions();
    if (to_stderr_) {
        options = options.withDestination(core::Destination::STDERR);
    }
    if (no_progress_) {
        options = options.withEnabled(false);
    }
    
    common::Logger::instance().info("[Count] Starting | total={} | step_ms={} | destination={}",
                                    total_, step_ms_, core::destinationName(options.destination));
    
    core::View<models::LinearModel> view(models::LinearModel("Counting", total_), options);
    core::ViewStream<models::LinearModel> out(view);
    
    for (size_t i = 1; i <= total_; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(step_ms_));
        size_t done = view.update([](models::LinearModel& model) {
            model.increment();
            return model.done();
        });
        
        if (message_every_ > 0 && done % message_every_ == 0) {
            out << "reached " << done << std::endl;
        }
    }
    
    if (abandon_) {
        view.abandon();
    } else {
        view.finish();
    }
    auto stats = view.stats();
    
    common::Logger::instance().info("[Count] Done | updates={} | paints={} | rate_limited={}",
                                    stats.updates, stats.paints, stats.rate_limited);
    return 0;
}

}}
