#pragma once

#include "../common/error_framework.hpp"
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace essay_anonymizer {
namespace core {

enum class RedactErrorCode {
    INVALID_PATTERN = 100,
    NO_PATTERNS = 101,

    CONFIGURATION_ERROR = 200,
    CONFIG_PARSE_FAILED = 201,

    INPUT_NOT_FOUND = 300,
    NO_FILES = 301,
    COLLECTION_FAILED = 302,

    DOCUMENT_READ_FAILED = 400,
    DOCUMENT_WRITE_FAILED = 401,
    DOCUMENT_REDACT_FAILED = 402,

    REPORT_WRITE_FAILED = 500,

    RUNLOG_CONFIG_MISSING = 600,
    RUNLOG_FAILED = 601
};

using RedactErrorCodeHelper = common::ErrorRegistry<RedactErrorCode>;

// Fatal, construction-time failure. Carries the registered code and the
// key/value context that produced it.
class RedactError : public std::runtime_error {
public:
    RedactError(RedactErrorCode code, const std::string& message,
                common::ErrorContext context = {});

    RedactErrorCode code() const { return code_; }
    const common::ErrorContext& context() const { return context_; }
    const char* codeString() const { return RedactErrorCodeHelper::toString(code_); }

private:
    RedactErrorCode code_;
    common::ErrorContext context_;
};

}
}

namespace essay_anonymizer {
namespace common {

template<>
inline const std::unordered_map<core::RedactErrorCode, ErrorInfo<core::RedactErrorCode>>&
ErrorRegistry<core::RedactErrorCode>::getInfoMap() {
    static const std::unordered_map<core::RedactErrorCode, ErrorInfo<core::RedactErrorCode>> map = {
        {core::RedactErrorCode::INVALID_PATTERN, {
            core::RedactErrorCode::INVALID_PATTERN,
            "INVALID_PATTERN",
            "Pattern failed to compile"
        }},
        {core::RedactErrorCode::NO_PATTERNS, {
            core::RedactErrorCode::NO_PATTERNS,
            "NO_PATTERNS",
            "No patterns configured"
        }},
        {core::RedactErrorCode::CONFIGURATION_ERROR, {
            core::RedactErrorCode::CONFIGURATION_ERROR,
            "CONFIGURATION_ERROR",
            "Invalid mask configuration"
        }},
        {core::RedactErrorCode::CONFIG_PARSE_FAILED, {
            core::RedactErrorCode::CONFIG_PARSE_FAILED,
            "CONFIG_PARSE_FAILED",
            "Configuration file could not be parsed"
        }},
        {core::RedactErrorCode::INPUT_NOT_FOUND, {
            core::RedactErrorCode::INPUT_NOT_FOUND,
            "INPUT_NOT_FOUND",
            "Input path not found"
        }},
        {core::RedactErrorCode::NO_FILES, {
            core::RedactErrorCode::NO_FILES,
            "NO_FILES",
            "No files to process"
        }},
        {core::RedactErrorCode::COLLECTION_FAILED, {
            core::RedactErrorCode::COLLECTION_FAILED,
            "COLLECTION_FAILED",
            "Failed to collect files"
        }},
        {core::RedactErrorCode::DOCUMENT_READ_FAILED, {
            core::RedactErrorCode::DOCUMENT_READ_FAILED,
            "DOCUMENT_READ_FAILED",
            "Document could not be read"
        }},
        {core::RedactErrorCode::DOCUMENT_WRITE_FAILED, {
            core::RedactErrorCode::DOCUMENT_WRITE_FAILED,
            "DOCUMENT_WRITE_FAILED",
            "Redacted document could not be written"
        }},
        {core::RedactErrorCode::DOCUMENT_REDACT_FAILED, {
            core::RedactErrorCode::DOCUMENT_REDACT_FAILED,
            "DOCUMENT_REDACT_FAILED",
            "Document could not be redacted"
        }},
        {core::RedactErrorCode::REPORT_WRITE_FAILED, {
            core::RedactErrorCode::REPORT_WRITE_FAILED,
            "REPORT_WRITE_FAILED",
            "Report could not be written"
        }},
        {core::RedactErrorCode::RUNLOG_CONFIG_MISSING, {
            core::RedactErrorCode::RUNLOG_CONFIG_MISSING,
            "RUNLOG_CONFIG_MISSING",
            "Missing GS_PG_HOST, GS_PG_USER, or GS_PG_PASSWORD"
        }},
        {core::RedactErrorCode::RUNLOG_FAILED, {
            core::RedactErrorCode::RUNLOG_FAILED,
            "RUNLOG_FAILED",
            "Run log could not be persisted"
        }}
    };
    return map;
}

}
}
