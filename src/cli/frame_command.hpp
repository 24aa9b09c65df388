#pragma once

#include "main_command.hpp"
#include "throttle/common/config.hpp"
#include <CLI/CLI.hpp>
#include <iostream>
#include <ostream>
#include <string>

namespace throttle {
namespace cli {

// Top-level "--loader X --percentage N": prints a single frame, no thread.
class FrameCommand : public MainCommand {
public:
    FrameCommand();

    void setup(CLI::App* app);
    bool wasRequested() const;
    // Prints usage help and returns 0 when either option is missing.
    int execute(std::ostream& out = std::cout);

    static std::string renderFrame(const std::string& loader, int percentage,
                                   const common::LoaderDefaults& defaults);

private:
    std::string loader_;
    int percentage_ = 0;
    CLI::Option* loader_option_ = nullptr;
    CLI::Option* percentage_option_ = nullptr;
};

}}
