#include <CLI/CLI.hpp>
#include <clocale>
#include <iostream>
#include <memory>
#include <string>

#include "marquee/common/config.hpp"
#include "marquee/common/constants.hpp"
#include "marquee/common/logger.hpp"
#include "cli/count_command.hpp"
#include "cli/jobs_command.hpp"
#include "cli/replay_command.hpp"

int main(int argc, char** argv) {
    // Multibyte-aware width measurement follows the user's locale.
    std::setlocale(LC_CTYPE, "");
    
    try {
        CLI::App app{"Terminal progress demos", marquee::constants::system::DEMO_NAME};
        app.set_version_flag("--version,-v", marquee::constants::version::getFullVersion());
        app.require_subcommand(0, 1);
        
        std::string config_file;
        std::string log_level;
        std::string log_file;
        
        app.add_option("-c,--config", config_file, "TOML configuration file")
           ->check(CLI::ExistingFile);
        app.add_option("--log-level", log_level, "Log level (ERROR, WARN, INFO, DEBUG)");
        app.add_option("--log-file", log_file, "Write logs to this file instead of stderr");
        
        auto count_cmd = std::make_unique<marquee::cli::CountCommand>();
        auto jobs_cmd = std::make_unique<marquee::cli::JobsCommand>();
        auto replay_cmd = std::make_unique<marquee::cli::ReplayCommand>();
        
        count_cmd->setup(app.add_subcommand("count", "Count items with a linear progress bar"));
        jobs_cmd->setup(app.add_subcommand("jobs", "Run parallel jobs under a multi-line bar"));
        replay_cmd->setup(app.add_subcommand("replay", "Show the bytes a scripted scenario emits"));
        
        CLI11_PARSE(app, argc, argv);
        
        auto& config = marquee::common::Config::instance();
        if (!config_file.empty() && !config.load(config_file)) {
            std::cerr << "Error: failed to load configuration: " << config_file << "\n";
            return 1;
        }
        
        if (!log_level.empty() && !config.setValue("global.log_level", log_level)) {
            std::cerr << "Error: invalid log level: " << log_level << "\n";
            return 1;
        }
        if (!log_file.empty()) {
            config.setValue("logging.log_file", log_file);
        }
        
        const auto& global = config.global();
        marquee::common::Logger::instance().initialize(
            global.logging.log_file.empty() ? marquee::common::LogMode::CONSOLE_ONLY
                                            : marquee::common::LogMode::FILE_ONLY,
            global.log_level,
            global.logging
        );
        
        int rc = 0;
        if (count_cmd->wasCalled()) {
            rc = count_cmd->execute();
        } else if (jobs_cmd->wasCalled()) {
            rc = jobs_cmd->execute();
        } else if (replay_cmd->wasCalled()) {
            rc = replay_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
        }
        
        marquee::common::Logger::instance().shutdown();
        return rc;
        
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
