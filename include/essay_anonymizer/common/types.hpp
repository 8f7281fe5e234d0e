#pragma once

#include "error_framework.hpp"
#include <string>
#include <map>
#include <optional>

namespace essay_anonymizer {

namespace core {
enum class RedactErrorCode;
}

namespace common {

enum class DocumentStatus {
    REDACTED,
    CLEAN,
    SKIPPED,
    FAILED
};

// Per-document result. total is always the sum of counts.
struct RedactionOutcome {
    std::string source;
    std::optional<std::string> target;
    std::map<std::string, int> counts;
    int total = 0;
    bool skipped = false;
    std::optional<core::RedactErrorCode> error_code;
    std::optional<std::string> error_message;
    std::optional<ErrorContext> error_context;

    bool failed() const { return error_code.has_value(); }
};

DocumentStatus statusOf(const RedactionOutcome& outcome);

std::string to_string(DocumentStatus status);

}}
