#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace essay_anonymizer {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct LoggingConfig {
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

struct RedactConfig {
    std::string extensions;
    std::string output_dir;
    std::string mask;
    std::string mask_template;
    bool hash;
    std::string salt;
    int hash_length;
    int threads;
    bool skip_clean;
    std::vector<std::string> disable;
    std::vector<std::string> exclude_dirs;
    std::vector<std::string> exclude_paths;
};

struct ReportConfig {
    std::string json_name;
};

struct GlobalConfig {
    std::string log_file;
    LogLevel log_level;
    LoggingConfig logging;
    RedactConfig redact;
    ReportConfig report;
};

class Config {
public:
    static Config& instance();

    // Resets to defaults, then overlays the given file (or the best file on
    // the search path when empty). A missing file is not an error.
    bool load(const std::string& config_file = "");
    void applyDefaults();

    std::optional<std::string> findBestConfig() const;

    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }

    std::string getConfigPath() const { return current_config_path_; }

    static LogLevel parseLogLevel(const std::string& level, LogLevel fallback);

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;

    static GlobalConfig createDefaultConfig();
    bool tryLoadTomlFile(const std::string& path);
};

}}
