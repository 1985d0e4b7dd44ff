#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <cstddef>

namespace marquee {
namespace cli {

class CountCommand : public MainCommand {
public:
    CountCommand();
    
    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();
    
    bool validateArguments() const override;

private:
    bool was_called_;
    size_t total_ = 100;
    int step_ms_ = 30;
    size_t message_every_ = 10;
    bool to_stderr_ = false;
    bool no_progress_ = false;
    bool abandon_ = false;
};

}}
