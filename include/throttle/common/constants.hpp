#pragma once

#include <string>
#include <array>
#include <cstddef>
#include <cstdint>

namespace throttle {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "1.0.0";

    inline std::string getFullVersion() {
        return std::string("Throttle v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "Throttle: a terminal progress loader";
    constexpr const char* CONFIG_ENV = "THROTTLE_CONFIG";
    constexpr const char* CONFIG_DIR_NAME = "throttle";
    constexpr const char* CONFIG_FILE_NAME = "config.toml";
    constexpr const char* LOGGER_NAME = "throttle";
}

namespace styles {
    constexpr const char* BAR = "bar";
    constexpr const char* DOTS = "dots";
    constexpr const char* TIME_CLOCK = "time_clock";
    constexpr const char* SPINNER = "spinner";

    constexpr std::array<const char*, 3> SUPPORTED = {BAR, DOTS, TIME_CLOCK};
}

namespace colors {
    constexpr std::array<const char*, 3> SUPPORTED = {"blue", "green", "red"};

    constexpr const char* BLUE = "\033[94m";
    constexpr const char* GREEN = "\033[92m";
    constexpr const char* RED = "\033[91m";
    constexpr const char* RESET = "\033[0m";
}

namespace glyphs {
    constexpr std::array<const char*, 4> SPINNER = {"-", "\\", "|", "/"};

    constexpr std::array<const char*, 22> CLOCK = {
        "🕝", "🕞", "🕟", "🕠", "🕡", "🕢", "🕒", "🕓", "🕔", "🕕",
        "🕖", "🕗", "🕛", "🕧", "🕜", "🕣", "🕘", "🕤", "🕙", "🕥",
        "🕚", "🕦"
    };

    constexpr char DOT = '.';
}

namespace loader_defaults {
    constexpr const char* UNIT = "items";
    constexpr const char* DESCRIPTION = "Progress";
    constexpr size_t BAR_LENGTH = 20;
    constexpr int REFRESH_INTERVAL_MS = 100;
    constexpr int ITEM_DELAY_MS = 100;
    constexpr bool SPINNER = false;
    constexpr const char* STYLE = styles::BAR;
    constexpr const char* COLOR = "blue";
    constexpr const char* FILL_CHAR = "#";
    constexpr const char* EMPTY_CHAR = " ";
}

namespace config_defaults {
    constexpr size_t LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t LOG_MAX_FILES = 3;
}

namespace cli {
    constexpr uint64_t FRAME_TOTAL = 100;
    constexpr int DEMO_ITEMS = 10;
}

}}
