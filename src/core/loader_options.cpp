#include "throttle/core/loader_options.hpp"
#include "throttle/core/error_codes.hpp"
#include "throttle/common/constants.hpp"
#include <spdlog/fmt/fmt.h>

namespace throttle {
namespace core {

LoaderOptions LoaderOptions::fromDefaults(uint64_t total, const common::LoaderDefaults& defaults) {
    LoaderOptions options;
    options.total = total;
    options.unit = defaults.unit;
    options.description = defaults.description;
    options.bar_length = defaults.bar_length;
    options.refresh_interval = std::chrono::milliseconds(defaults.refresh_interval_ms);
    options.item_delay = std::chrono::milliseconds(defaults.item_delay_ms);
    options.spinner = defaults.spinner;
    options.style = defaults.style;
    options.color = defaults.color;
    options.fill_char = defaults.fill_char;
    options.empty_char = defaults.empty_char;
    return options;
}

Style parseStyle(const std::string& style) {
    if (style == constants::styles::BAR) return Style::BAR;
    if (style == constants::styles::DOTS) return Style::DOTS;
    if (style == constants::styles::TIME_CLOCK) return Style::TIME_CLOCK;

    throw InvalidStyleError(fmt::format("Invalid style: {}", style));
}

Color parseColor(const std::string& color) {
    if (color == "blue") return Color::BLUE;
    if (color == "green") return Color::GREEN;
    if (color == "red") return Color::RED;

    throw InvalidColorError(fmt::format("Invalid color: {}", color));
}

LoaderSettings validateOptions(const LoaderOptions& options) {
    LoaderSettings settings;

    settings.style = parseStyle(options.style);
    settings.color = parseColor(options.color);

    if (utf8Length(options.fill_char) != 1) {
        throw InvalidFillCharError(fmt::format("Invalid fill_char: '{}'", options.fill_char));
    }
    if (utf8Length(options.empty_char) != 1) {
        throw InvalidEmptyCharError(fmt::format("Invalid empty_char: '{}'", options.empty_char));
    }
    if (options.total == 0) {
        throw InvalidTotalError("Invalid total: 0");
    }
    if (options.bar_length <= 0) {
        throw InvalidBarLengthError(fmt::format("Invalid bar_length: {}", options.bar_length));
    }
    if (options.refresh_interval.count() <= 0) {
        throw InvalidRefreshIntervalError(fmt::format("Invalid refresh_interval: {}ms",
                                                      options.refresh_interval.count()));
    }
    if (options.item_delay.count() < 0) {
        throw InvalidItemDelayError(fmt::format("Invalid item_delay: {}ms", options.item_delay.count()));
    }

    settings.total = options.total;
    settings.unit = options.unit;
    settings.description = options.description;
    settings.bar_length = static_cast<size_t>(options.bar_length);
    settings.refresh_interval = options.refresh_interval;
    settings.item_delay = options.item_delay;
    settings.spinner = options.spinner;
    settings.fill_char = options.fill_char;
    settings.empty_char = options.empty_char;

    return settings;
}

const char* ansiColor(Color color) {
    switch (color) {
        case Color::BLUE: return constants::colors::BLUE;
        case Color::GREEN: return constants::colors::GREEN;
        case Color::RED: return constants::colors::RED;
    }
    return constants::colors::RESET;
}

size_t utf8Length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::string to_string(Style style) {
    switch (style) {
        case Style::BAR: return constants::styles::BAR;
        case Style::DOTS: return constants::styles::DOTS;
        case Style::TIME_CLOCK: return constants::styles::TIME_CLOCK;
    }
    return "unknown";
}

std::string to_string(Color color) {
    switch (color) {
        case Color::BLUE: return "blue";
        case Color::GREEN: return "green";
        case Color::RED: return "red";
    }
    return "unknown";
}

}}
