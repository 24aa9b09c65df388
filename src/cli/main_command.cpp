#include "main_command.hpp"
#include "throttle/common/constants.hpp"

namespace throttle {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

bool MainCommand::validateArguments() const {
    return true;
}

std::set<std::string> MainCommand::loaderChoices() {
    std::set<std::string> choices(constants::styles::SUPPORTED.begin(),
                                  constants::styles::SUPPORTED.end());
    choices.insert(constants::styles::SPINNER);
    return choices;
}

}}
