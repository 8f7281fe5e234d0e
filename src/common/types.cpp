#include "essay_anonymizer/common/types.hpp"

namespace essay_anonymizer {
namespace common {

DocumentStatus statusOf(const RedactionOutcome& outcome) {
    if (outcome.failed()) return DocumentStatus::FAILED;
    if (outcome.skipped) return DocumentStatus::SKIPPED;
    if (outcome.total > 0) return DocumentStatus::REDACTED;
    return DocumentStatus::CLEAN;
}

std::string to_string(DocumentStatus status) {
    switch (status) {
        case DocumentStatus::REDACTED: return "REDACTED";
        case DocumentStatus::CLEAN: return "CLEAN";
        case DocumentStatus::SKIPPED: return "SKIPPED";
        case DocumentStatus::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

}}
