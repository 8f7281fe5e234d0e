#pragma once

#include <string>
#include <cstddef>

namespace essay_anonymizer {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "1.2.0";

    inline std::string getFullVersion() {
        return std::string("Essay Anonymizer v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "EssayAnonymizer";
    constexpr const char* BINARY_NAME = "essay-anonymizer";
    constexpr const char* LOGGER_NAME = "essay-anonymizer";
    constexpr const char* CONFIG_ENV = "ESSAY_ANONYMIZER_CONFIG";
    constexpr const char* CONFIG_DIR_NAME = "essay-anonymizer";
    constexpr const char* CONFIG_FILE_NAME = "config.toml";
    constexpr const char* SYSTEM_CONFIG_FILE = "/etc/essay-anonymizer/config.toml";
}

namespace labels {
    constexpr const char* EMAIL = "email";
    constexpr const char* PHONE = "phone";
    constexpr const char* SSN = "ssn";
    constexpr const char* DOB = "dob";
    constexpr const char* STREET_ADDRESS = "street_address";
    constexpr const char* URL = "url";
    constexpr const char* IP_ADDRESS = "ip_address";
    constexpr const char* CREDIT_CARD = "credit_card";

    constexpr const char* CUSTOM_PREFIX = "custom:";
    constexpr const char* NAME_PREFIX = "name:";
}

namespace mask {
    constexpr const char* DEFAULT_LITERAL = "[REDACTED]";
    constexpr const char* DEFAULT_HASH_TEMPLATE = "[REDACTED:{label}:{hash}]";
    constexpr const char* LABEL_PLACEHOLDER = "{label}";
    constexpr const char* INDEX_PLACEHOLDER = "{n}";
    constexpr const char* HASH_PLACEHOLDER = "{hash}";
    constexpr int DEFAULT_HASH_LENGTH = 8;
    constexpr int MAX_HASH_LENGTH = 64;
}

namespace luhn {
    constexpr size_t MIN_DIGITS = 13;
    constexpr size_t MAX_DIGITS = 19;
}

namespace report {
    constexpr const char* DEFAULT_JSON_NAME = "redaction-report.json";
    constexpr const char* DRY_RUN_OUTPUT_LABEL = "(dry-run)";
}

namespace runlog {
    constexpr const char* SCHEMA = "groupscholar_essay_anonymizer";
    constexpr const char* TABLE = "run_log";
    constexpr const char* DEFAULT_PORT = "5432";
    constexpr const char* DEFAULT_DATABASE = "postgres";
    constexpr const char* DEFAULT_SSLMODE = "disable";
    constexpr int CONNECT_TIMEOUT_SECONDS = 5;
}

namespace limits {
    constexpr int DEFAULT_THREADS = 4;
    constexpr int MAX_THREADS = 64;
    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 3;
}

namespace config_defaults {
    constexpr const char* EXTENSIONS = ".txt,.md,.csv";
    constexpr const char* OUTPUT_DIR = "./redacted";
    constexpr const char* MASK = mask::DEFAULT_LITERAL;
    constexpr bool HASH = false;
    constexpr int HASH_LENGTH = mask::DEFAULT_HASH_LENGTH;
    constexpr bool SKIP_CLEAN = false;
    constexpr int THREADS = limits::DEFAULT_THREADS;

    constexpr size_t LOG_ROTATION_SIZE_MB = limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    constexpr size_t LOG_MAX_FILES = limits::DEFAULT_LOG_MAX_FILES;

    constexpr const char* REPORT_JSON_NAME = report::DEFAULT_JSON_NAME;
}

}
}
