#include "essay_anonymizer/redact/pattern_filter.hpp"
#include "essay_anonymizer/common/logger.hpp"
#include <algorithm>

namespace essay_anonymizer {
namespace redact {

bool DisableRule::matches(const std::string& label) const {
    switch (kind) {
        case Kind::EXACT:
            return label == value;
        case Kind::PREFIX:
            return label.compare(0, value.size(), value) == 0;
        default:
            return false;
    }
}

std::vector<DisableRule> parseDisableRules(const std::vector<std::string>& requests) {
    std::vector<DisableRule> rules;
    for (const auto& raw : requests) {
        auto begin = raw.find_first_not_of(" \t");
        if (begin == std::string::npos) {
            continue;
        }
        auto end = raw.find_last_not_of(" \t");
        std::string request = raw.substr(begin, end - begin + 1);

        if (request.back() == '*') {
            rules.push_back({DisableRule::Kind::PREFIX, request.substr(0, request.size() - 1)});
        } else {
            rules.push_back({DisableRule::Kind::EXACT, request});
        }
    }
    return rules;
}

DetectorSet filterDetectors(const DetectorSet& detectors, const std::vector<DisableRule>& rules) {
    DetectorSet kept;
    kept.reserve(detectors.size());

    for (const auto& detector : detectors) {
        bool disabled = std::any_of(rules.begin(), rules.end(),
                                    [&](const DisableRule& rule) { return rule.matches(detector.label); });
        if (disabled) {
            common::Logger::instance().debug("[Filter] Detector disabled | label={}", detector.label);
            continue;
        }
        kept.push_back(detector);
    }
    return kept;
}

DetectorSet filterDetectors(const DetectorSet& detectors, const std::vector<std::string>& requests) {
    return filterDetectors(detectors, parseDisableRules(requests));
}

}}
