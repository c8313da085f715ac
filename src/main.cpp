#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>

#include "threat_guard/common/config.hpp"
#include "threat_guard/common/constants.hpp"
#include "threat_guard/common/logger.hpp"
#include "cli/classify_command.hpp"
#include "cli/scan_command.hpp"
#include "cli/validate_command.hpp"

int main(int argc, char** argv) {
    using namespace threat_guard;

    try {
        CLI::App app{"Upload and request threat detection", constants::system::APPLICATION_NAME};
        app.set_version_flag("--version,-v", constants::version::getFullVersion());
        app.require_subcommand(0, 1);

        std::string config_file;
        std::string log_level_text;
        app.add_option("-c,--config", config_file, "Configuration file path");
        app.add_option("--log-level", log_level_text, "Log level (ERROR, WARN, INFO, DEBUG)");

        auto classify_cmd = std::make_unique<cli::ClassifyCommand>();
        auto scan_cmd = std::make_unique<cli::ScanCommand>();
        auto validate_cmd = std::make_unique<cli::ValidateCommand>();

        classify_cmd->setup(app.add_subcommand("classify", "Classify IP addresses or URL hosts"));
        scan_cmd->setup(app.add_subcommand("scan", "Analyze files for embedded threats"));
        validate_cmd->setup(app.add_subcommand("validate", "Run the upload validation pipeline on a file"));

        CLI11_PARSE(app, argc, argv);

        auto& config = common::Config::instance();
        bool config_ok = config.load(config_file);

        auto& global = config.global();
        if (!log_level_text.empty()) {
            auto level = common::parseLogLevel(log_level_text);
            if (!level) {
                std::cerr << "Error: Unknown log level: " << log_level_text << std::endl;
                return 2;
            }
            global.log_level = *level;
        }

        common::Logger::instance().initialize(
            global.log_file.empty() ? common::LogMode::CONSOLE_ONLY : common::LogMode::FILE_ONLY,
            global.log_file,
            global.log_level,
            global.logging
        );

        if (!config_ok) {
            common::Logger::instance().warn("[Config] Using defaults | path={}", config.getConfigPath());
        }

        int exit_code = 0;
        if (classify_cmd->wasCalled()) {
            exit_code = classify_cmd->execute();
        } else if (scan_cmd->wasCalled()) {
            exit_code = scan_cmd->execute();
        } else if (validate_cmd->wasCalled()) {
            exit_code = validate_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
        }

        common::Logger::instance().shutdown();
        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
