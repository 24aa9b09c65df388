#pragma once

#include "../common/config.hpp"
#include "../common/constants.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace throttle {
namespace core {

enum class Style {
    BAR,
    DOTS,
    TIME_CLOCK
};

enum class Color {
    BLUE,
    GREEN,
    RED
};

using RenderCallback = std::function<std::string(uint64_t completed,
                                                 uint64_t total,
                                                 const std::string& description,
                                                 const std::string& fill_char,
                                                 const std::string& empty_char)>;

using UpdateCallback = std::function<void(uint64_t completed)>;

// Unvalidated construction parameters. Style, color and the bar characters
// stay strings here so that bad values are reported by ProgressLoader's
// constructor, not by whoever filled the struct in.
struct LoaderOptions {
    uint64_t total = 0;
    std::string unit = constants::loader_defaults::UNIT;
    std::string description = constants::loader_defaults::DESCRIPTION;
    int64_t bar_length = constants::loader_defaults::BAR_LENGTH;
    std::chrono::milliseconds refresh_interval{constants::loader_defaults::REFRESH_INTERVAL_MS};
    std::chrono::milliseconds item_delay{constants::loader_defaults::ITEM_DELAY_MS};
    bool spinner = constants::loader_defaults::SPINNER;
    std::string style = constants::loader_defaults::STYLE;
    std::string color = constants::loader_defaults::COLOR;
    std::string fill_char = constants::loader_defaults::FILL_CHAR;
    std::string empty_char = constants::loader_defaults::EMPTY_CHAR;
    RenderCallback render_callback;
    UpdateCallback update_callback;

    static LoaderOptions fromDefaults(uint64_t total, const common::LoaderDefaults& defaults);
};

// Validated, immutable view of LoaderOptions.
struct LoaderSettings {
    uint64_t total;
    std::string unit;
    std::string description;
    size_t bar_length;
    std::chrono::milliseconds refresh_interval;
    std::chrono::milliseconds item_delay;
    bool spinner;
    Style style;
    Color color;
    std::string fill_char;
    std::string empty_char;
};

LoaderSettings validateOptions(const LoaderOptions& options);

Style parseStyle(const std::string& style);
Color parseColor(const std::string& color);

const char* ansiColor(Color color);

// Number of UTF-8 code points in text.
size_t utf8Length(const std::string& text);

std::string to_string(Style style);
std::string to_string(Color color);

}}
