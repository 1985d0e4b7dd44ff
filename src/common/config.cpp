#include "marquee/common/config.hpp"
#include "marquee/common/constants.hpp"
#include "marquee/common/logger.hpp"
#include <toml.hpp>
#include <filesystem>
#include <unistd.h>

namespace marquee {
namespace common {

std::optional<LogLevel> parseLogLevel(const std::string& value) {
    if (value == "DEBUG" || value == "debug") return LogLevel::DEBUG;
    if (value == "INFO" || value == "info") return LogLevel::INFO;
    if (value == "WARN" || value == "warn") return LogLevel::WARN;
    if (value == "ERROR" || value == "error") return LogLevel::ERROR;
    return std::nullopt;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "INFO";
}

static bool parseBool(const std::string& value) {
    return value == "true" || value == "1";
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;
    
    GlobalConfig config;
    
    config.log_level = LogLevel::WARN;
    
    config.logging.log_file = "";
    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;
    
    config.progress.destination = DESTINATION;
    config.progress.update_interval_ms = UPDATE_INTERVAL_MS;
    config.progress.print_holdoff_ms = PRINT_HOLDOFF_MS;
    config.progress.enabled = PROGRESS_ENABLED;
    
    return config;
}

void Config::reset() {
    global_ = createDefaultConfig();
    current_config_path_.clear();
}

bool Config::load(const std::string& config_file) {
    try {
        global_ = createDefaultConfig();
        current_config_path_ = config_file;
        
        if (config_file.empty()) {
            Logger::instance().debug("[Config] No config file given, using defaults");
            return true;
        }
        
        bool loaded = tryLoadTomlFile(config_file);
        
        Logger::instance().info("[Config] Loaded | path={} | found={} | destination={}", 
                               config_file, loaded, global_.progress.destination);
        
        return loaded;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | error={}", e.what());
        global_ = createDefaultConfig();
        return false;
    }
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().debug("[Config] Config not found | path={}", path);
        return false;
    }
    
    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().debug("[Config] Config not readable | path={}", path);
        return false;
    }
    
    auto data = toml::parse(path);
    
    if (data.contains("global")) {
        auto global_section = data.at("global");
        
        if (global_section.contains("log_level")) {
            std::string level = toml::find<std::string>(global_section, "log_level");
            auto parsed = parseLogLevel(level);
            if (parsed) {
                global_.log_level = *parsed;
            } else {
                Logger::instance().warn("[Config] Unknown log level | value={}", level);
            }
        }
    }
    
    if (data.contains("logging")) {
        auto logging_section = data.at("logging");
        
        if (logging_section.contains("log_file")) {
            global_.logging.log_file = toml::find<std::string>(logging_section, "log_file");
        }
        if (logging_section.contains("rotation_size_mb")) {
            global_.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
        }
        if (logging_section.contains("max_files")) {
            global_.logging.max_files = toml::find<size_t>(logging_section, "max_files");
        }
        if (logging_section.contains("format")) {
            std::string format = toml::find<std::string>(logging_section, "format");
            global_.logging.format = (format == "json") ? LogFormat::JSON : LogFormat::TEXT;
        }
    }
    
    if (data.contains("progress")) {
        auto progress_section = data.at("progress");
        
        if (progress_section.contains("destination")) {
            std::string destination = toml::find<std::string>(progress_section, "destination");
            if (constants::destinations::isSupported(destination)) {
                global_.progress.destination = destination;
            } else {
                Logger::instance().warn("[Config] Unknown destination | value={}", destination);
            }
        }
        if (progress_section.contains("update_interval_ms")) {
            global_.progress.update_interval_ms = toml::find<int>(progress_section, "update_interval_ms");
        }
        if (progress_section.contains("print_holdoff_ms")) {
            global_.progress.print_holdoff_ms = toml::find<int>(progress_section, "print_holdoff_ms");
        }
        if (progress_section.contains("enabled")) {
            global_.progress.enabled = toml::find<bool>(progress_section, "enabled");
        }
    }
    
    return true;
}

bool Config::setValue(const std::string& key, const std::string& value) {
    try {
        if (key == "global.log_level" || key == "log_level") {
            auto parsed = parseLogLevel(value);
            if (!parsed) return false;
            global_.log_level = *parsed;
        }
        else if (key == "logging.log_file") global_.logging.log_file = value;
        else if (key == "logging.rotation_size_mb") global_.logging.rotation_size_mb = std::stoull(value);
        else if (key == "logging.max_files") global_.logging.max_files = std::stoull(value);
        else if (key == "logging.format") {
            global_.logging.format = (value == "json") ? LogFormat::JSON : LogFormat::TEXT;
        }
        else if (key == "progress.destination") {
            if (!constants::destinations::isSupported(value)) return false;
            global_.progress.destination = value;
        }
        else if (key == "progress.update_interval_ms") global_.progress.update_interval_ms = std::stoi(value);
        else if (key == "progress.print_holdoff_ms") global_.progress.print_holdoff_ms = std::stoi(value);
        else if (key == "progress.enabled") global_.progress.enabled = parseBool(value);
        else return false;
    } catch (const std::exception& e) {
        Logger::instance().warn("[Config] Invalid value | key={} | value={} | error={}", key, value, e.what());
        return false;
    }
    
    return true;
}

std::optional<std::string> Config::getValue(const std::string& key) const {
    if (key == "global.log_level" || key == "log_level") return std::string(logLevelName(global_.log_level));
    else if (key == "logging.log_file") return global_.logging.log_file;
    else if (key == "logging.rotation_size_mb") return std::to_string(global_.logging.rotation_size_mb);
    else if (key == "logging.max_files") return std::to_string(global_.logging.max_files);
    else if (key == "logging.format") return std::string(global_.logging.format == LogFormat::JSON ? "json" : "text");
    else if (key == "progress.destination") return global_.progress.destination;
    else if (key == "progress.update_interval_ms") return std::to_string(global_.progress.update_interval_ms);
    else if (key == "progress.print_holdoff_ms") return std::to_string(global_.progress.print_holdoff_ms);
    else if (key == "progress.enabled") return std::string(global_.progress.enabled ? "true" : "false");
    
    return std::nullopt;
}

}}
