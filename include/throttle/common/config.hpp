#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstddef>
#include <cstdint>

namespace throttle {
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
    LogLevel level;
    LogFormat format;
    std::string file;
    size_t rotation_size_mb;
    size_t max_files;
};

// Raw loader settings as read from the [loader] table. Validation happens
// when a loader is constructed from them.
struct LoaderDefaults {
    std::string unit;
    std::string description;
    int64_t bar_length;
    int refresh_interval_ms;
    int item_delay_ms;
    bool spinner;
    std::string style;
    std::string color;
    std::string fill_char;
    std::string empty_char;
};

struct GlobalConfig {
    LoaderDefaults loader;
    LoggingConfig logging;
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& config_file = "");
    void reset();

    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }

    std::optional<std::string> findBestConfig() const;
    std::vector<std::string> getConfigSearchPaths() const;
    const std::string& getConfigPath() const { return current_config_path_; }

    static GlobalConfig createDefaultConfig();
    static std::optional<LogLevel> parseLogLevel(const std::string& level);

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;

    bool tryLoadTomlFile(const std::string& path);
};

std::string to_string(LogLevel level);

}}
