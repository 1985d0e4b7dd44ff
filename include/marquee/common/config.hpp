#pragma once

#include <string>
#include <map>
#include <optional>
#include <cstddef>

namespace marquee {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct LoggingConfig {
    std::string log_file;
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

struct ProgressConfig {
    std::string destination;
    int update_interval_ms;
    int print_holdoff_ms;
    bool enabled;
};

struct GlobalConfig {
    LogLevel log_level;
    LoggingConfig logging;
    ProgressConfig progress;
};

std::optional<LogLevel> parseLogLevel(const std::string& value);
const char* logLevelName(LogLevel level);

class Config {
public:
    static Config& instance();
    
    bool load(const std::string& config_file = "");
    void reset();
    
    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }
    
    bool setValue(const std::string& key, const std::string& value);
    std::optional<std::string> getValue(const std::string& key) const;
    
    std::string getConfigPath() const { return current_config_path_; }
    
    static GlobalConfig createDefaultConfig();

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;
    
    bool tryLoadTomlFile(const std::string& path);
};

}}
