#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "throttle/common/config.hpp"
#include "throttle/common/constants.hpp"
#include "throttle/common/logger.hpp"
#include "cli/demo_command.hpp"
#include "cli/frame_command.hpp"

int main(int argc, char** argv) {
    try {
        CLI::App app{throttle::constants::system::APPLICATION_NAME, "throttle"};
        app.set_version_flag("--version,-v", throttle::constants::version::getFullVersion());
        app.require_subcommand(0, 1);
        app.footer("Example usage:\n"
                   "  throttle --loader bar --percentage 50\n"
                   "  throttle --loader spinner --percentage 75\n"
                   "  throttle demo --loader time_clock --items 20");

        std::string config_file;
        std::string log_level;
        app.add_option("--config", config_file, "Configuration file path");
        app.add_option("--log-level", log_level, "Log level: ERROR, WARN, INFO, DEBUG");

        auto frame_cmd = std::make_unique<throttle::cli::FrameCommand>();
        auto demo_cmd = std::make_unique<throttle::cli::DemoCommand>();

        frame_cmd->setup(&app);
        demo_cmd->setup(app.add_subcommand("demo", "Run a paced demonstration loader"));

        CLI11_PARSE(app, argc, argv);

        auto& config = throttle::common::Config::instance();
        bool config_ok = config.load(config_file);

        if (!log_level.empty()) {
            if (auto level = throttle::common::Config::parseLogLevel(log_level)) {
                config.global().logging.level = *level;
            } else {
                std::cerr << "Warning: unknown log level '" << log_level << "', using "
                          << throttle::common::to_string(config.global().logging.level) << "\n";
            }
        }

        const auto& logging = config.global().logging;
        throttle::common::Logger::instance().initialize(
            logging.file.empty() ? throttle::common::LogMode::CONSOLE_ONLY
                                 : throttle::common::LogMode::FILE_ONLY,
            logging);

        if (!config_ok) {
            throttle::common::Logger::instance().warn("[Config] Using defaults | path={}",
                                                      config.getConfigPath());
        }

        int result = 0;
        if (demo_cmd->wasCalled()) {
            result = demo_cmd->execute();
        } else {
            result = frame_cmd->execute();
        }

        throttle::common::Logger::instance().shutdown();
        return result;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
