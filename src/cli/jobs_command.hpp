#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>

namespace marquee {
namespace cli {

class JobsCommand : public MainCommand {
public:
    JobsCommand();
    
    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();
    
    bool validateArguments() const override;

private:
    bool was_called_;
    int jobs_ = 8;
    int steps_ = 20;
    int threads_ = 4;
    int step_ms_ = 40;
};

}}
