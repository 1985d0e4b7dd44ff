#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace marquee {
namespace cli {

// Runs a scripted scenario against a capturing view and shows exactly
// which bytes reached the "terminal".
class ReplayCommand : public MainCommand {
public:
    ReplayCommand();
    
    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

private:
    bool was_called_;
    std::string scenario_ = "counter";
    bool json_output_ = false;
};

}}
