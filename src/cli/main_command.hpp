#pragma once

#include <CLI/CLI.hpp>
#include <set>
#include <string>

namespace throttle {
namespace cli {

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();

    virtual bool validateArguments() const;

protected:
    CLI::App* subcommand_ = nullptr;

    // Values accepted by --loader: the three styles plus "spinner".
    static std::set<std::string> loaderChoices();
};

}}
