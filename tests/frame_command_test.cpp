#include "cli/frame_command.hpp"
#include "throttle/common/config.hpp"
#include "throttle/common/constants.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <string>

using throttle::cli::FrameCommand;

namespace {

throttle::common::LoaderDefaults defaults() {
    return throttle::common::Config::createDefaultConfig().loader;
}

size_t countChar(const std::string& text, char c) {
    size_t count = 0;
    for (char ch : text) {
        if (ch == c) ++count;
    }
    return count;
}

}

TEST(FrameCommandTest, BarAtFiftyPercent) {
    auto settings = defaults();
    std::string frame = FrameCommand::renderFrame("bar", 50, settings);

    EXPECT_NE(frame.find(" 50% (50/100 items)"), std::string::npos);
    EXPECT_EQ(countChar(frame, '#'), static_cast<size_t>(settings.bar_length / 2));
    EXPECT_EQ(frame.find('\r'), std::string::npos);
    EXPECT_EQ(frame.find('\n'), std::string::npos);
}

TEST(FrameCommandTest, SpinnerLoaderMapsToSpinnerFlag) {
    std::string frame = FrameCommand::renderFrame("spinner", 75, defaults());

    EXPECT_EQ(frame, "Progress: -");
}

TEST(FrameCommandTest, DotsUsePercentageModFour) {
    EXPECT_EQ(FrameCommand::renderFrame("dots", 7, defaults()), "Progress: ...");
    EXPECT_EQ(FrameCommand::renderFrame("dots", 8, defaults()), "Progress: ");
}

TEST(FrameCommandTest, TimeClockPicksGlyphFromPercentage) {
    std::string frame = FrameCommand::renderFrame("time_clock", 50, defaults());

    EXPECT_EQ(frame, std::string("Progress: ") + throttle::constants::glyphs::CLOCK[11]);
}

TEST(FrameCommandTest, ExplicitLoaderOverridesConfiguredSpinner) {
    auto settings = defaults();
    settings.spinner = true;

    std::string frame = FrameCommand::renderFrame("bar", 100, settings);
    EXPECT_NE(frame.find("100% (100/100 items)"), std::string::npos);
}

TEST(FrameCommandTest, RequiresBothOptions) {
    CLI::App app{"test"};
    FrameCommand command;
    command.setup(&app);

    const char* only_loader[] = {"throttle", "--loader", "bar"};
    app.parse(3, only_loader);
    EXPECT_FALSE(command.wasRequested());
}

TEST(FrameCommandTest, PrintsHelpAndSucceedsWhenAnOptionIsMissing) {
    const char* only_loader[] = {"throttle", "--loader", "bar"};
    const char* only_percentage[] = {"throttle", "--percentage", "40"};
    const char* neither[] = {"throttle"};

    struct Case {
        int argc;
        const char** argv;
    };
    const Case cases[] = {{3, only_loader}, {3, only_percentage}, {1, neither}};

    for (const auto& c : cases) {
        CLI::App app{"test"};
        FrameCommand command;
        command.setup(&app);
        app.parse(c.argc, c.argv);

        std::ostringstream out;
        EXPECT_EQ(command.execute(out), 0);
        EXPECT_NE(out.str().find("--loader"), std::string::npos);
        EXPECT_NE(out.str().find("--percentage"), std::string::npos);
        EXPECT_EQ(out.str().find("Progress:"), std::string::npos);
    }
}

TEST(FrameCommandTest, ExecutePrintsSingleFrameWhenBothOptionsGiven) {
    CLI::App app{"test"};
    FrameCommand command;
    command.setup(&app);

    const char* argv[] = {"throttle", "--loader", "dots", "--percentage", "42"};
    app.parse(5, argv);

    std::ostringstream out;
    EXPECT_EQ(command.execute(out), 0);
    const std::string text = out.str();
    ASSERT_GE(text.size(), 4u);
    EXPECT_EQ(text.substr(text.size() - 4), ": ..\n");
    EXPECT_EQ(text.find("Usage"), std::string::npos);
}

TEST(FrameCommandTest, ParsesBothOptions) {
    CLI::App app{"test"};
    FrameCommand command;
    command.setup(&app);

    const char* argv[] = {"throttle", "--loader", "dots", "--percentage", "42"};
    app.parse(5, argv);
    EXPECT_TRUE(command.wasRequested());
}

TEST(FrameCommandTest, RejectsOutOfRangePercentageAndUnknownLoader) {
    {
        CLI::App app{"test"};
        FrameCommand command;
        command.setup(&app);
        const char* argv[] = {"throttle", "--loader", "bar", "--percentage", "150"};
        EXPECT_THROW(app.parse(5, argv), CLI::ValidationError);
    }
    {
        CLI::App app{"test"};
        FrameCommand command;
        command.setup(&app);
        const char* argv[] = {"throttle", "--loader", "pie", "--percentage", "10"};
        EXPECT_THROW(app.parse(5, argv), CLI::ValidationError);
    }
}
