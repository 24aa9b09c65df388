#include "frame_command.hpp"
#include "throttle/common/constants.hpp"
#include "throttle/common/logger.hpp"
#include "throttle/core/progress_loader.hpp"

namespace throttle {
namespace cli {

FrameCommand::FrameCommand() = default;

void FrameCommand::setup(CLI::App* app) {
    subcommand_ = app;

    loader_option_ = app->add_option("--loader", loader_,
                                     "Type of loader to display:\n"
                                     "  spinner    - A rotating spinner\n"
                                     "  bar        - A progress bar\n"
                                     "  dots       - Dots indicating progress\n"
                                     "  time_clock - A clock emoji indicating progress")
                        ->check(CLI::IsMember(loaderChoices()));

    percentage_option_ = app->add_option("--percentage", percentage_,
                                         "Progress percentage (0-100)")
                            ->check(CLI::Range(0, 100));
}

bool FrameCommand::wasRequested() const {
    return loader_option_ && percentage_option_ &&
           loader_option_->count() > 0 && percentage_option_->count() > 0;
}

int FrameCommand::execute(std::ostream& out) {
    if (!wasRequested()) {
        out << subcommand_->help() << std::endl;
        return 0;
    }

    const auto& defaults = common::Config::instance().global().loader;
    out << renderFrame(loader_, percentage_, defaults) << std::endl;
    return 0;
}

std::string FrameCommand::renderFrame(const std::string& loader, int percentage,
                                      const common::LoaderDefaults& defaults) {
    auto options = core::LoaderOptions::fromDefaults(constants::cli::FRAME_TOTAL, defaults);

    if (loader == constants::styles::SPINNER) {
        options.spinner = true;
    } else {
        options.spinner = false;
        options.style = loader;
    }

    core::ProgressLoader progress(options);
    progress.setCompleted(static_cast<uint64_t>(percentage));

    common::Logger::instance().debug("[Frame] Rendering | loader={} | percentage={}", loader, percentage);
    return progress.render();
}

}}
