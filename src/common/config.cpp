#include "throttle/common/config.hpp"
#include "throttle/common/constants.hpp"
#include "throttle/common/logger.hpp"
#include <toml.hpp>
#include <cstdlib>
#include <filesystem>
#include <unistd.h>

namespace throttle {
namespace common {

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::loader_defaults;

    GlobalConfig config;

    config.loader.unit = UNIT;
    config.loader.description = DESCRIPTION;
    config.loader.bar_length = BAR_LENGTH;
    config.loader.refresh_interval_ms = REFRESH_INTERVAL_MS;
    config.loader.item_delay_ms = ITEM_DELAY_MS;
    config.loader.spinner = SPINNER;
    config.loader.style = STYLE;
    config.loader.color = COLOR;
    config.loader.fill_char = FILL_CHAR;
    config.loader.empty_char = EMPTY_CHAR;

    config.logging.level = LogLevel::WARN;
    config.logging.format = LogFormat::TEXT;
    config.logging.file = "";
    config.logging.rotation_size_mb = constants::config_defaults::LOG_ROTATION_SIZE_MB;
    config.logging.max_files = constants::config_defaults::LOG_MAX_FILES;

    return config;
}

std::optional<LogLevel> Config::parseLogLevel(const std::string& level) {
    if (level == "DEBUG" || level == "debug") return LogLevel::DEBUG;
    if (level == "INFO" || level == "info") return LogLevel::INFO;
    if (level == "WARN" || level == "warn") return LogLevel::WARN;
    if (level == "ERROR" || level == "error") return LogLevel::ERROR;
    return std::nullopt;
}

void Config::reset() {
    global_ = createDefaultConfig();
    current_config_path_.clear();
}

std::vector<std::string> Config::getConfigSearchPaths() const {
    std::vector<std::string> paths;

    if (const char* env_path = std::getenv(constants::system::CONFIG_ENV)) {
        if (*env_path) {
            paths.emplace_back(env_path);
        }
    }

    std::filesystem::path relative = std::filesystem::path(constants::system::CONFIG_DIR_NAME)
                                     / constants::system::CONFIG_FILE_NAME;

    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        if (*xdg) {
            paths.push_back((std::filesystem::path(xdg) / relative).string());
        }
    }

    if (const char* home = std::getenv("HOME")) {
        if (*home) {
            paths.push_back((std::filesystem::path(home) / ".config" / relative).string());
        }
    }

    return paths;
}

std::optional<std::string> Config::findBestConfig() const {
    for (const auto& path : getConfigSearchPaths()) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }

    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    reset();

    std::string effective_config_file = config_file;
    if (effective_config_file.empty()) {
        auto best = findBestConfig();
        if (!best) {
            Logger::instance().debug("[Config] No config file found, using defaults");
            return true;
        }
        effective_config_file = *best;
    }

    current_config_path_ = effective_config_file;

    if (!tryLoadTomlFile(effective_config_file)) {
        global_ = createDefaultConfig();
        return false;
    }
    return true;
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().warn("[Config] File not found | path={}", path);
        return false;
    }

    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().warn("[Config] File not readable | path={}", path);
        return false;
    }

    try {
        auto data = toml::parse(path);

        if (data.contains("loader")) {
            auto loader_section = data.at("loader");

            if (loader_section.contains("unit")) {
                global_.loader.unit = toml::find<std::string>(loader_section, "unit");
            }
            if (loader_section.contains("description")) {
                global_.loader.description = toml::find<std::string>(loader_section, "description");
            }
            if (loader_section.contains("bar_length")) {
                global_.loader.bar_length = toml::find<int64_t>(loader_section, "bar_length");
            }
            if (loader_section.contains("refresh_interval_ms")) {
                global_.loader.refresh_interval_ms = toml::find<int>(loader_section, "refresh_interval_ms");
            }
            if (loader_section.contains("item_delay_ms")) {
                global_.loader.item_delay_ms = toml::find<int>(loader_section, "item_delay_ms");
            }
            if (loader_section.contains("spinner")) {
                global_.loader.spinner = toml::find<bool>(loader_section, "spinner");
            }
            if (loader_section.contains("style")) {
                global_.loader.style = toml::find<std::string>(loader_section, "style");
            }
            if (loader_section.contains("color")) {
                global_.loader.color = toml::find<std::string>(loader_section, "color");
            }
            if (loader_section.contains("fill_char")) {
                global_.loader.fill_char = toml::find<std::string>(loader_section, "fill_char");
            }
            if (loader_section.contains("empty_char")) {
                global_.loader.empty_char = toml::find<std::string>(loader_section, "empty_char");
            }
        }

        if (data.contains("logging")) {
            auto logging_section = data.at("logging");

            if (logging_section.contains("level")) {
                std::string level = toml::find<std::string>(logging_section, "level");
                if (auto parsed = parseLogLevel(level)) {
                    global_.logging.level = *parsed;
                } else {
                    Logger::instance().warn("[Config] Unknown log level | value={}", level);
                }
            }
            if (logging_section.contains("format")) {
                std::string format_str = toml::find<std::string>(logging_section, "format");
                if (format_str == "json") {
                    global_.logging.format = LogFormat::JSON;
                } else {
                    global_.logging.format = LogFormat::TEXT;
                }
            }
            if (logging_section.contains("file")) {
                global_.logging.file = toml::find<std::string>(logging_section, "file");
            }
            if (logging_section.contains("rotation_size_mb")) {
                global_.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
            }
            if (logging_section.contains("max_files")) {
                global_.logging.max_files = toml::find<size_t>(logging_section, "max_files");
            }
        }

        Logger::instance().info("[Config] Loaded | path={}", path);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | path={} | error={}", path, e.what());
        return false;
    }
}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "UNKNOWN";
}

}}
