#include "jobs_command.hpp"
#include "marquee/common/logger.hpp"
#include "marquee/core/view.hpp"
#include <spdlog/fmt/fmt.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <chrono>
#include <iostream>
#include <memory>
#include <random>
#include <thread>
#include <vector>

namespace marquee {
namespace cli {

namespace {

struct JobProgress {
    int step = 0;
    bool complete = false;
};

// One header line plus one bar per job.
class JobsModel : public core::Model {
public:
    JobsModel(int jobs, int steps) : jobs_(jobs), steps_(steps) {}
    
    void advance(int job, int step) { jobs_[job].step = step; }
    void complete(int job) { jobs_[job].complete = true; }
    
    int completed() const {
        int n = 0;
        for (const auto& job : jobs_) {
            if (job.complete) ++n;
        }
        return n;
    }
    
    std::string render(size_t) override {
        std::string out = fmt::format("{}/{} complete\n", completed(), jobs_.size());
        for (size_t i = 0; i < jobs_.size(); ++i) {
            int done = jobs_[i].step;
            out += fmt::format("{:3}: {}{}\n", i, std::string(done, '#'), std::string(steps_ - done, '_'));
        }
        return out;
    }
    
    std::string finalMessage() override {
        return fmt::format("{} jobs finished", jobs_.size());
    }

private:
    std::vector<JobProgress> jobs_;
    int steps_;
};

}

JobsCommand::JobsCommand() : was_called_(false) {}

void JobsCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    subcommand->add_option("-j,--jobs", jobs_, "Number of jobs")
              ->check(CLI::Range(1, 64));
    subcommand->add_option("-s,--steps", steps_, "Steps per job")
              ->check(CLI::Range(1, 200));
    subcommand->add_option("-t,--threads", threads_, "Worker threads")
              ->check(CLI::Range(1, 64));
    subcommand->add_option("--step-ms", step_ms_, "Upper bound of simulated work per step")
              ->check(CLI::Range(1, 10000));
    
    subcommand->callback([this]() { was_called_ = true; });
}

bool JobsCommand::wasCalled() const {
    return was_called_;
}

bool JobsCommand::validateArguments() const {
    return jobs_ > 0 && steps_ > 0 && threads_ > 0 && step_ms_ > 0;
}

int JobsCommand::execute() {
    if (!validateArguments()) {
        std::cerr << "Error: invalid jobs arguments\n";
        return 1;
    }
    
    auto view = std::make_shared<core::View<JobsModel>>(JobsModel(jobs_, steps_), configuredOptions());
    
    common::Logger::instance().info("[Jobs] Starting | jobs={} | steps={} | threads={}",
                                    jobs_, steps_, threads_);
    
    tbb::task_arena arena(threads_);
    arena.execute([&]() {
        tbb::parallel_for(0, jobs_, [&](int job) {
            std::mt19937 rng(static_cast<unsigned>(job) * 7919u + 17u);
            std::uniform_int_distribution<int> work_ms(1, step_ms_);
            
            view->messagef("job {} starting\n", job);
            for (int step = 1; step <= steps_; ++step) {
                std::this_thread::sleep_for(std::chrono::milliseconds(work_ms(rng)));
                view->update([job, step](JobsModel& model) { model.advance(job, step); });
            }
            int completed = view->update([job](JobsModel& model) {
                model.complete(job);
                return model.completed();
            });
            view->messagef("job {} done ({} of {})\n", job, completed, jobs_);
        });
    });
    
    view->finish();
    auto stats = view->stats();
    
    common::Logger::instance().info("[Jobs] Done | updates={} | paints={} | text_writes={}",
                                    stats.updates, stats.paints, stats.text_writes);
    return 0;
}

}}
