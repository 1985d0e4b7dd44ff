#pragma once

#include "marquee/core/options.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace marquee {
namespace cli {

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();
    
    virtual bool validateArguments() const;

protected:
    CLI::App* subcommand_ = nullptr;
    
    // View options from the loaded configuration.
    core::Options configuredOptions() const;
};

}}
