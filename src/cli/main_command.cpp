#include "main_command.hpp"
#include "marquee/common/config.hpp"

namespace marquee {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

bool MainCommand::validateArguments() const {
    return true;
}

core::Options MainCommand::configuredOptions() const {
    return core::Options::fromConfig(common::Config::instance().global().progress);
}

}}
