#include "demo_command.hpp"
#include "throttle/common/config.hpp"
#include "throttle/common/constants.hpp"
#include "throttle/common/logger.hpp"
#include "throttle/core/progress_loader.hpp"
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace throttle {
namespace cli {

DemoCommand::DemoCommand()
    : was_called_(false),
      items_(constants::cli::DEMO_ITEMS) {}

void DemoCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    subcommand->add_option("-l,--loader", loader_, "Loader type: spinner, bar, dots, time_clock")
               ->check(CLI::IsMember(loaderChoices()));
    subcommand->add_option("-n,--items", items_, "Number of items to process (default: 10)")
               ->check(CLI::PositiveNumber);
    subcommand->add_option("-d,--description", description_, "Text shown before the indicator");
    subcommand->add_option("-c,--color", color_, "Bar color: blue, green, red");
    subcommand->add_option("--fail-at", fail_at_, "Fail while processing this item (1-based)");

    subcommand->callback([this]() { was_called_ = true; });
}

bool DemoCommand::wasCalled() const {
    return was_called_;
}

bool DemoCommand::validateArguments() const {
    return items_ > 0 && fail_at_ >= 0;
}

int DemoCommand::execute() {
    if (!validateArguments()) {
        std::cerr << "Error: invalid demo arguments\n";
        return 1;
    }

    auto options = core::LoaderOptions::fromDefaults(static_cast<uint64_t>(items_),
                                                     common::Config::instance().global().loader);

    if (loader_ == constants::styles::SPINNER) {
        options.spinner = true;
    } else if (!loader_.empty()) {
        options.spinner = false;
        options.style = loader_;
    }
    if (!description_.empty()) {
        options.description = description_;
    }
    if (!color_.empty()) {
        options.color = color_;
    }

    std::vector<int> items(static_cast<size_t>(items_));
    std::iota(items.begin(), items.end(), 1);

    const int fail_at = fail_at_;

    try {
        core::ProgressLoader loader(options);
        core::LoaderGuard guard(loader);

        loader.runOverItems([fail_at](int item, core::ProgressLoader&) {
            common::Logger::instance().debug("[Demo] Processing | item={}", item);
            if (item == fail_at) {
                throw std::runtime_error("Failed to process item " + std::to_string(item));
            }
        }, items);

    } catch (const core::LoaderError& e) {
        std::cerr << "Error: " << e.what() << " [" << e.codeString() << "]\n";
        return 1;
    } catch (const std::exception& e) {
        common::Logger::instance().warn("[Demo] Aborted | error={}", e.what());
        return 1;
    }

    return 0;
}

}}
