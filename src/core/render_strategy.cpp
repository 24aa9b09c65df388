#include "throttle/core/render_strategy.hpp"
#include "throttle/common/constants.hpp"
#include <spdlog/fmt/fmt.h>
#include <limits>
#include <utility>

namespace throttle {
namespace core {

namespace {

std::string repeat(const std::string& unit, uint64_t count) {
    std::string result;
    result.reserve(unit.size() * count);
    for (uint64_t i = 0; i < count; ++i) {
        result += unit;
    }
    return result;
}

// floor(completed * scale / total), with the product taken in 128 bits so
// large totals do not wrap. Saturates when completed is far past total.
uint64_t scaledQuotient(uint64_t completed, uint64_t total, uint64_t scale) {
    __extension__ typedef unsigned __int128 uint128_t;
    uint128_t quotient = static_cast<uint128_t>(completed) * scale / total;
    if (quotient > std::numeric_limits<uint64_t>::max()) {
        return std::numeric_limits<uint64_t>::max();
    }
    return static_cast<uint64_t>(quotient);
}

}

uint64_t BarStrategy::filledCells(uint64_t completed, uint64_t total, size_t bar_length) {
    return scaledQuotient(completed, total, bar_length);
}

uint64_t BarStrategy::percentage(uint64_t completed, uint64_t total) {
    return scaledQuotient(completed, total, 100);
}

std::string BarStrategy::render(const RenderContext& ctx) const {
    uint64_t filled = filledCells(ctx.completed, ctx.total, ctx.bar_length);
    uint64_t empty = filled < ctx.bar_length ? ctx.bar_length - filled : 0;

    std::string bar = "[" + repeat(ctx.fill_char, filled) + repeat(ctx.empty_char, empty) + "]";

    return fmt::format("{}: {}{}{} {}% ({}/{} {})",
                       ctx.description,
                       ansiColor(ctx.color), bar, constants::colors::RESET,
                       percentage(ctx.completed, ctx.total),
                       ctx.completed, ctx.total, ctx.unit);
}

size_t SpinnerStrategy::frameCount() {
    return constants::glyphs::SPINNER.size();
}

std::string SpinnerStrategy::render(const RenderContext& ctx) const {
    return fmt::format("{}: {}", ctx.description,
                       constants::glyphs::SPINNER[ctx.spinner_frame % frameCount()]);
}

size_t DotsStrategy::dotCount(uint64_t completed) {
    return static_cast<size_t>(completed % 4);
}

std::string DotsStrategy::render(const RenderContext& ctx) const {
    return fmt::format("{}: {}", ctx.description,
                       std::string(dotCount(ctx.completed), constants::glyphs::DOT));
}

size_t ClockStrategy::glyphIndex(uint64_t completed, uint64_t total) {
    const uint64_t glyphs = constants::glyphs::CLOCK.size();
    return static_cast<size_t>(scaledQuotient(completed, total, glyphs) % glyphs);
}

std::string ClockStrategy::render(const RenderContext& ctx) const {
    return fmt::format("{}: {}", ctx.description,
                       constants::glyphs::CLOCK[glyphIndex(ctx.completed, ctx.total)]);
}

CallbackStrategy::CallbackStrategy(RenderCallback callback)
    : callback_(std::move(callback)) {}

std::string CallbackStrategy::render(const RenderContext& ctx) const {
    return callback_(ctx.completed, ctx.total, ctx.description, ctx.fill_char, ctx.empty_char);
}

std::unique_ptr<RenderStrategy> makeStrategy(const LoaderSettings& settings,
                                             const RenderCallback& render_callback) {
    if (render_callback) {
        return std::make_unique<CallbackStrategy>(render_callback);
    }

    if (settings.spinner) {
        return std::make_unique<SpinnerStrategy>();
    }

    switch (settings.style) {
        case Style::DOTS:
            return std::make_unique<DotsStrategy>();
        case Style::TIME_CLOCK:
            return std::make_unique<ClockStrategy>();
        case Style::BAR:
        default:
            return std::make_unique<BarStrategy>();
    }
}

}}
