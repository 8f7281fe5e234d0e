#pragma once

#include "detector.hpp"
#include <string>
#include <vector>

namespace essay_anonymizer {
namespace redact {

// A resolved disable request: "phone" is EXACT, "name:*" is PREFIX("name:").
struct DisableRule {
    enum class Kind {
        EXACT,
        PREFIX
    };

    Kind kind;
    std::string value;

    bool matches(const std::string& label) const;
};

std::vector<DisableRule> parseDisableRules(const std::vector<std::string>& requests);

DetectorSet filterDetectors(const DetectorSet& detectors, const std::vector<DisableRule>& rules);
DetectorSet filterDetectors(const DetectorSet& detectors, const std::vector<std::string>& requests);

}}
