#include "throttle/core/render_strategy.hpp"
#include "throttle/common/constants.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace throttle;
using namespace throttle::core;

namespace {

RenderContext makeContext(uint64_t completed, uint64_t total, size_t bar_length = 20) {
    RenderContext ctx;
    ctx.completed = completed;
    ctx.total = total;
    ctx.unit = "items";
    ctx.description = "Progress";
    ctx.bar_length = bar_length;
    ctx.color = Color::BLUE;
    ctx.fill_char = "#";
    ctx.empty_char = " ";
    return ctx;
}

size_t countOccurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

std::string bracketed(const std::string& line) {
    auto open = line.find("m[") + 2;
    auto close = line.find(']', open);
    return line.substr(open, close - open);
}

LoaderSettings makeSettings(Style style, bool spinner) {
    LoaderSettings settings;
    settings.total = 10;
    settings.unit = "items";
    settings.description = "Progress";
    settings.bar_length = 20;
    settings.refresh_interval = std::chrono::milliseconds(10);
    settings.item_delay = std::chrono::milliseconds(0);
    settings.spinner = spinner;
    settings.style = style;
    settings.color = Color::GREEN;
    settings.fill_char = "#";
    settings.empty_char = " ";
    return settings;
}

}

TEST(BarStrategyTest, RendersHalfwayBar) {
    BarStrategy strategy;
    std::string line = strategy.render(makeContext(5, 10));

    EXPECT_EQ(line, "Progress: \033[94m[##########          ]\033[0m 50% (5/10 items)");
}

TEST(BarStrategyTest, FilledAndEmptyCellsSumToBarLength) {
    BarStrategy strategy;
    const size_t bar_length = 17;
    const uint64_t total = 13;

    for (uint64_t completed = 0; completed <= total; ++completed) {
        std::string inner = bracketed(strategy.render(makeContext(completed, total, bar_length)));
        size_t filled = countOccurrences(inner, "#");
        size_t empty = countOccurrences(inner, " ");

        EXPECT_EQ(filled, completed * bar_length / total) << "completed=" << completed;
        EXPECT_EQ(filled + empty, bar_length) << "completed=" << completed;
    }
}

TEST(BarStrategyTest, PercentageIsFloored) {
    EXPECT_EQ(BarStrategy::percentage(1, 3), 33u);
    EXPECT_EQ(BarStrategy::percentage(2, 3), 66u);
    EXPECT_EQ(BarStrategy::percentage(29, 100), 29u);
    EXPECT_EQ(BarStrategy::percentage(10, 10), 100u);
}

TEST(BarStrategyTest, AppliesConfiguredColorAroundBarOnly) {
    BarStrategy strategy;
    auto ctx = makeContext(0, 4);

    ctx.color = Color::RED;
    std::string red = strategy.render(ctx);
    EXPECT_EQ(red.find("Progress: \033[91m["), 0u);
    EXPECT_NE(red.find("]\033[0m 0% (0/4 items)"), std::string::npos);

    ctx.color = Color::GREEN;
    EXPECT_NE(strategy.render(ctx).find("\033[92m["), std::string::npos);
}

TEST(BarStrategyTest, OverflowsPastTotalWithoutEmptyCells) {
    BarStrategy strategy;
    std::string line = strategy.render(makeContext(15, 10, 10));

    EXPECT_EQ(BarStrategy::filledCells(15, 10, 10), 15u);
    EXPECT_EQ(bracketed(line), std::string(15, '#'));
    EXPECT_NE(line.find("150% (15/10 items)"), std::string::npos);
}

TEST(BarStrategyTest, HandlesTotalsNearIntegerLimit) {
    const uint64_t total = uint64_t{1} << 62;
    const uint64_t completed = uint64_t{1} << 61;

    EXPECT_EQ(BarStrategy::filledCells(completed, total, 20), 10u);
    EXPECT_EQ(BarStrategy::percentage(completed, total), 50u);
    EXPECT_EQ(BarStrategy::filledCells(total - 1, total, 20), 19u);
    EXPECT_EQ(BarStrategy::percentage(total, total), 100u);

    BarStrategy strategy;
    std::string line = strategy.render(makeContext(completed, total));
    EXPECT_EQ(bracketed(line), std::string(10, '#') + std::string(10, ' '));
    EXPECT_NE(line.find(" 50% ("), std::string::npos);
}

TEST(BarStrategyTest, SupportsMultiByteFillCharacters) {
    BarStrategy strategy;
    auto ctx = makeContext(2, 4, 4);
    ctx.fill_char = "█";
    ctx.empty_char = "░";

    EXPECT_NE(strategy.render(ctx).find("[██░░]"), std::string::npos);
}

TEST(SpinnerStrategyTest, CyclesThroughFourSymbols) {
    SpinnerStrategy strategy;
    auto ctx = makeContext(3, 10);

    const char* expected[] = {"-", "\\", "|", "/", "-"};
    for (size_t frame = 0; frame < 5; ++frame) {
        ctx.spinner_frame = frame;
        EXPECT_EQ(strategy.render(ctx), std::string("Progress: ") + expected[frame]);
    }
}

TEST(SpinnerStrategyTest, IgnoresProgress) {
    SpinnerStrategy strategy;
    auto a = makeContext(0, 10);
    auto b = makeContext(9, 10);
    a.spinner_frame = b.spinner_frame = 2;

    EXPECT_EQ(strategy.render(a), strategy.render(b));
}

TEST(DotsStrategyTest, DotCountIsCompletedModFour) {
    DotsStrategy strategy;

    for (uint64_t completed = 0; completed < 12; ++completed) {
        for (uint64_t total : {1u, 7u, 100u}) {
            std::string line = strategy.render(makeContext(completed, total));
            EXPECT_EQ(line, "Progress: " + std::string(completed % 4, '.'));
        }
    }
}

TEST(ClockStrategyTest, IndexStaysInRangeAndNeverDecreases) {
    const uint64_t total = 97;
    size_t previous = 0;

    for (uint64_t completed = 0; completed < total; ++completed) {
        size_t index = ClockStrategy::glyphIndex(completed, total);
        EXPECT_LT(index, constants::glyphs::CLOCK.size());
        EXPECT_GE(index, previous);
        previous = index;
    }
}

TEST(ClockStrategyTest, IndexNeverDecreasesForLargeTotals) {
    const uint64_t total = uint64_t{1} << 62;
    size_t previous = 0;

    for (uint64_t step = 0; step < 64; ++step) {
        size_t index = ClockStrategy::glyphIndex(total / 64 * step, total);
        EXPECT_GE(index, previous) << "step=" << step;
        previous = index;
    }
    EXPECT_EQ(ClockStrategy::glyphIndex(total / 2, total), 11u);
}

TEST(ClockStrategyTest, WrapsToFirstGlyphWhenComplete) {
    EXPECT_EQ(ClockStrategy::glyphIndex(10, 10), 0u);
    EXPECT_EQ(ClockStrategy::glyphIndex(5, 10), 11u);

    ClockStrategy strategy;
    EXPECT_EQ(strategy.render(makeContext(0, 10)),
              std::string("Progress: ") + constants::glyphs::CLOCK[0]);
}

TEST(CallbackStrategyTest, ForwardsStateToCallback) {
    CallbackStrategy strategy([](uint64_t completed, uint64_t total, const std::string& description,
                                 const std::string& fill, const std::string& empty) {
        return description + " " + std::to_string(completed) + "/" + std::to_string(total) + fill + empty;
    });

    EXPECT_EQ(strategy.render(makeContext(3, 8)), "Progress 3/8# ");
}

TEST(MakeStrategyTest, SelectsByCallbackThenSpinnerThenStyle) {
    RenderCallback callback = [](uint64_t, uint64_t, const std::string&, const std::string&,
                                 const std::string&) { return std::string("custom"); };

    EXPECT_STREQ(makeStrategy(makeSettings(Style::DOTS, true), callback)->name(), "custom");
    EXPECT_STREQ(makeStrategy(makeSettings(Style::DOTS, true), nullptr)->name(), "spinner");
    EXPECT_STREQ(makeStrategy(makeSettings(Style::BAR, false), nullptr)->name(), "bar");
    EXPECT_STREQ(makeStrategy(makeSettings(Style::DOTS, false), nullptr)->name(), "dots");
    EXPECT_STREQ(makeStrategy(makeSettings(Style::TIME_CLOCK, false), nullptr)->name(), "time_clock");
}
