#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace throttle {
namespace cli {

class DemoCommand : public MainCommand {
public:
    DemoCommand();

    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    bool validateArguments() const override;
    int execute();

private:
    bool was_called_;
    std::string loader_;
    std::string description_;
    std::string color_;
    int items_;
    int fail_at_ = 0;
};

}}
