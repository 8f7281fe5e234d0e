#include "essay_anonymizer/common/config.hpp"
#include "essay_anonymizer/common/constants.hpp"
#include "essay_anonymizer/common/paths.hpp"
#include "essay_anonymizer/common/logger.hpp"
#include <toml.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unistd.h>

namespace essay_anonymizer {
namespace common {

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;

    GlobalConfig config;

    config.log_level = LogLevel::INFO;
    config.log_file = "";

    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;

    config.redact.extensions = EXTENSIONS;
    config.redact.output_dir = OUTPUT_DIR;
    config.redact.mask = MASK;
    config.redact.mask_template = "";
    config.redact.hash = HASH;
    config.redact.salt = "";
    config.redact.hash_length = HASH_LENGTH;
    config.redact.threads = THREADS;
    config.redact.skip_clean = SKIP_CLEAN;

    config.report.json_name = REPORT_JSON_NAME;

    return config;
}

void Config::applyDefaults() {
    global_ = createDefaultConfig();
    current_config_path_.clear();
}

LogLevel Config::parseLogLevel(const std::string& level, LogLevel fallback) {
    std::string upper = level;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return fallback;
}

std::optional<std::string> Config::findBestConfig() const {
    for (const auto& path : PathManager::instance().getConfigSearchPaths()) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }
    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    applyDefaults();

    if (!config_file.empty()) {
        if (tryLoadTomlFile(config_file)) {
            current_config_path_ = config_file;
            return true;
        }
        return false;
    }

    auto best = findBestConfig();
    if (!best) {
        Logger::instance().debug("[Config] No config file found, using defaults");
        return true;
    }

    if (tryLoadTomlFile(*best)) {
        current_config_path_ = *best;
        return true;
    }
    return false;
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().debug("[Config] Config not found | path={}", path);
        return false;
    }

    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().debug("[Config] Config not readable | path={}", path);
        return false;
    }

    try {
        auto data = toml::parse(path);

        if (data.contains("global")) {
            auto global_section = data.at("global");

            if (global_section.contains("log_file")) {
                global_.log_file = toml::find<std::string>(global_section, "log_file");
            }
            if (global_section.contains("log_level")) {
                std::string level = toml::find<std::string>(global_section, "log_level");
                global_.log_level = parseLogLevel(level, global_.log_level);
            }
        }

        if (data.contains("logging")) {
            auto logging_section = data.at("logging");

            if (logging_section.contains("rotation_size_mb")) {
                global_.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
            }
            if (logging_section.contains("max_files")) {
                global_.logging.max_files = toml::find<size_t>(logging_section, "max_files");
            }
            if (logging_section.contains("format")) {
                std::string format_str = toml::find<std::string>(logging_section, "format");
                global_.logging.format = (format_str == "json") ? LogFormat::JSON : LogFormat::TEXT;
            }
        }

        if (data.contains("redact")) {
            auto redact_section = data.at("redact");

            if (redact_section.contains("extensions")) {
                global_.redact.extensions = toml::find<std::string>(redact_section, "extensions");
            }
            if (redact_section.contains("output_dir")) {
                global_.redact.output_dir = toml::find<std::string>(redact_section, "output_dir");
            }
            if (redact_section.contains("mask")) {
                global_.redact.mask = toml::find<std::string>(redact_section, "mask");
            }
            if (redact_section.contains("mask_template")) {
                global_.redact.mask_template = toml::find<std::string>(redact_section, "mask_template");
            }
            if (redact_section.contains("hash")) {
                global_.redact.hash = toml::find<bool>(redact_section, "hash");
            }
            if (redact_section.contains("salt")) {
                global_.redact.salt = toml::find<std::string>(redact_section, "salt");
            }
            if (redact_section.contains("hash_length")) {
                global_.redact.hash_length = toml::find<int>(redact_section, "hash_length");
            }
            if (redact_section.contains("threads")) {
                global_.redact.threads = toml::find<int>(redact_section, "threads");
            }
            if (redact_section.contains("skip_clean")) {
                global_.redact.skip_clean = toml::find<bool>(redact_section, "skip_clean");
            }
            if (redact_section.contains("disable")) {
                global_.redact.disable = toml::find<std::vector<std::string>>(redact_section, "disable");
            }
            if (redact_section.contains("exclude_dirs")) {
                global_.redact.exclude_dirs = toml::find<std::vector<std::string>>(redact_section, "exclude_dirs");
            }
            if (redact_section.contains("exclude_paths")) {
                global_.redact.exclude_paths = toml::find<std::vector<std::string>>(redact_section, "exclude_paths");
            }
        }

        if (data.contains("report")) {
            auto report_section = data.at("report");

            if (report_section.contains("json_name")) {
                global_.report.json_name = toml::find<std::string>(report_section, "json_name");
            }
        }

        Logger::instance().info("[Config] Config loaded | path={}", path);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().warn("[Config] Config parse failed | path={} | error={}", path, e.what());
        return false;
    }
}

}}
