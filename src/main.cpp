#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "essay_anonymizer/common/config.hpp"
#include "essay_anonymizer/common/constants.hpp"
#include "essay_anonymizer/common/logger.hpp"
#include "essay_anonymizer/core/error_codes.hpp"
#include "cli/patterns_command.hpp"
#include "cli/redact_command.hpp"

std::string find_config_argument(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind("--config=", 0) == 0) {
            return arg.substr(9);
        }
    }
    return "";
}

int main(int argc, char** argv) {
    using essay_anonymizer::core::RedactError;
    namespace common = essay_anonymizer::common;
    namespace constants = essay_anonymizer::constants;

    try {
        CLI::App app{constants::system::APPLICATION_NAME, constants::system::BINARY_NAME};
        app.set_version_flag("--version,-v", constants::version::getFullVersion());
        app.require_subcommand(0, 1);

        std::string config_file;
        app.add_option("-c,--config", config_file, "Configuration file path");

        auto& config = common::Config::instance();
        std::string explicit_config = find_config_argument(argc, argv);
        if (!config.load(explicit_config)) {
            std::string path = explicit_config.empty() ? config.findBestConfig().value_or("") : explicit_config;
            std::cerr << "Error: " << essay_anonymizer::core::RedactErrorCodeHelper::getMessage(
                             essay_anonymizer::core::RedactErrorCode::CONFIG_PARSE_FAILED)
                      << ": " << path << std::endl;
            return 1;
        }

        common::Logger::instance().initialize(
            config.global().log_file.empty() ? common::LogMode::CONSOLE_ONLY : common::LogMode::CONSOLE_AND_FILE,
            config.global().log_file,
            config.global().log_level,
            config.global().logging
        );
        if (!config.getConfigPath().empty()) {
            common::Logger::instance().debug("[Config] Using config | path={}", config.getConfigPath());
        }

        auto redact_cmd = std::make_unique<essay_anonymizer::cli::RedactCommand>();
        auto patterns_cmd = std::make_unique<essay_anonymizer::cli::PatternsCommand>();

        redact_cmd->setup(app.add_subcommand("redact", "Redact PII from a file or directory"));
        patterns_cmd->setup(app.add_subcommand("patterns", "List active detector labels"));

        CLI11_PARSE(app, argc, argv);

        int rc = 0;
        if (redact_cmd->wasCalled()) {
            rc = redact_cmd->execute();
        } else if (patterns_cmd->wasCalled()) {
            rc = patterns_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
        }

        common::Logger::instance().shutdown();
        return rc;

    } catch (const RedactError& e) {
        common::Logger::instance().debug("[Main] Fatal | code={} | {}", e.codeString(),
                                         common::formatContext(e.context()));
        std::cerr << "Error: " << e.what() << std::endl;
        common::Logger::instance().shutdown();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        common::Logger::instance().shutdown();
        return 1;
    }
}
