#include "replay_command.hpp"
#include "marquee/common/logger.hpp"
#include "marquee/core/view.hpp"
#include "marquee/format/text_width.hpp"
#include "marquee/models/models.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <chrono>
#include <functional>
#include <iostream>
#include <map>
#include <vector>

namespace marquee {
namespace cli {

namespace {

struct ReplayResult {
    std::string captured;
    core::ViewStats stats;
};

using CounterModel = models::BasicModel<int>;
using Scenario = std::function<ReplayResult(const core::Options&)>;

CounterModel makeCounter(int total) {
    return CounterModel(0, [total](const int& i) { return fmt::format("{}/{}", i, total); });
}

ReplayResult runCounter(const core::Options& options) {
    core::View<CounterModel> view(makeCounter(10), options);
    auto captured = view.capturedOutput();
    for (int i = 1; i <= 10; ++i) {
        view.update([i](CounterModel& model) { model.value() = i; });
    }
    view.finish();
    return ReplayResult{captured->contents(), view.stats()};
}

ReplayResult runMultiline(const core::Options& options) {
    models::BasicModel<int> model(0, [](const int& n) {
        std::string out;
        for (int i = 0; i < n; ++i) {
            out += fmt::format("line {} of {}\n", i + 1, n);
        }
        return out;
    });
    core::View<models::BasicModel<int>> view(std::move(model), options);
    auto captured = view.capturedOutput();
    for (int n : {1, 3, 5, 2, 4, 1}) {
        view.update([n](models::BasicModel<int>& m) { m.value() = n; });
    }
    view.finish();
    return ReplayResult{captured->contents(), view.stats()};
}

ReplayResult runInterleave(const core::Options& options) {
    core::View<models::StringPair> view(models::StringPair("progress: ", "A"), options);
    auto captured = view.capturedOutput();
    view.update([](models::StringPair&) {});
    view.message("B\n");
    view.update([](models::StringPair& m) { m.setSuffix("C"); });
    view.message("partial... ");
    view.update([](models::StringPair& m) { m.setSuffix("D"); });
    view.message("done\n");
    view.update([](models::StringPair& m) { m.setSuffix("E"); });
    view.finish();
    return ReplayResult{captured->contents(), view.stats()};
}

ReplayResult runSuspend(const core::Options& options) {
    core::View<CounterModel> view(makeCounter(5), options);
    auto captured = view.capturedOutput();
    for (int i = 1; i <= 5; ++i) {
        if (i == 3) {
            view.suspend();
        }
        view.update([i](CounterModel& model) { model.value() = i; });
    }
    view.abandon();
    return ReplayResult{captured->contents(), view.stats()};
}

const std::map<std::string, Scenario>& scenarios() {
    static const std::map<std::string, Scenario> table = {
        {"counter", runCounter},
        {"multiline", runMultiline},
        {"interleave", runInterleave},
        {"suspend", runSuspend}
    };
    return table;
}

nlohmann::json statsToJson(const core::ViewStats& stats) {
    nlohmann::json json;
    json["updates"] = stats.updates;
    json["paints"] = stats.paints;
    json["erases"] = stats.erases;
    json["identical_suppressed"] = stats.identical_suppressed;
    json["rate_limited"] = stats.rate_limited;
    json["text_writes"] = stats.text_writes;
    json["bytes_written"] = stats.bytes_written;
    return json;
}

}

ReplayCommand::ReplayCommand() : was_called_(false) {}

void ReplayCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    std::vector<std::string> names;
    for (const auto& [name, scenario] : scenarios()) {
        names.push_back(name);
    }
    
    subcommand->add_option("scenario", scenario_, "Scenario to replay")
              ->check(CLI::IsMember(names));
    subcommand->add_flag("--json", json_output_, "Print a JSON report");
    
    subcommand->callback([this]() { was_called_ = true; });
}

bool ReplayCommand::wasCalled() const {
    return was_called_;
}

int ReplayCommand::execute() {
    auto it = scenarios().find(scenario_);
    if (it == scenarios().end()) {
        std::cerr << "Error: unknown scenario: " << scenario_ << "\n";
        return 1;
    }
    
    core::Options options = core::Options()
        .withDestination(core::Destination::CAPTURE)
        .withUpdateInterval(std::chrono::milliseconds(0))
        .withPrintHoldoff(std::chrono::milliseconds(0));
    
    common::Logger::instance().debug("[Replay] Running | scenario={}", scenario_);
    ReplayResult result = it->second(options);
    
    if (json_output_) {
        nlohmann::json report;
        report["scenario"] = scenario_;
        report["captured"] = result.captured;
        report["visible"] = format::showControlCharacters(result.captured);
        report["stats"] = statsToJson(result.stats);
        std::cout << report.dump(2) << std::endl;
    } else {
        std::cout << format::showControlCharacters(result.captured) << std::endl;
        std::cout << fmt::format("paints={} erases={} suppressed={} text_writes={} bytes={}",
                                 result.stats.paints, result.stats.erases,
                                 result.stats.identical_suppressed, result.stats.text_writes,
                                 result.stats.bytes_written) << std::endl;
    }
    
    return 0;
}

}}
