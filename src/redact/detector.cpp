#include "essay_anonymizer/redact/detector.hpp"
#include "essay_anonymizer/common/constants.hpp"
#include "essay_anonymizer/common/logger.hpp"
#include "essay_anonymizer/core/error_codes.hpp"
#include <fstream>
#include <utility>

namespace essay_anonymizer {
namespace redact {

namespace {

using core::RedactError;
using core::RedactErrorCode;

Detector compile(std::string label, std::string source,
                 std::regex::flag_type flags = std::regex::ECMAScript) {
    try {
        std::regex pattern(source, flags);
        return Detector{std::move(label), std::move(source), std::move(pattern)};
    } catch (const std::regex_error& e) {
        throw RedactError(RedactErrorCode::INVALID_PATTERN,
                          "invalid pattern \"" + source + "\": " + e.what(),
                          common::makeContext("Detector").with("label", label).with("pattern", source));
    }
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

}

DetectorSet builtinDetectors() {
    namespace labels = constants::labels;

    // Every run is bounded: std::regex recurses once per consumed character.
    DetectorSet set;
    set.reserve(8);
    set.push_back(compile(labels::EMAIL,
        R"([A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,253}\.[A-Za-z]{2,24})"));
    set.push_back(compile(labels::PHONE,
        R"((?:\+?1[\s.-]?)?(?:\(\s{0,3}\d{3}\s{0,3}\)|\d{3})[\s.-]?\d{3}[\s.-]?\d{4})"));
    set.push_back(compile(labels::SSN,
        R"(\b\d{3}-\d{2}-\d{4}\b)"));
    set.push_back(compile(labels::DOB,
        R"(\b(?:0?[1-9]|1[0-2])[/-](?:0?[1-9]|[12]\d|3[01])[/-](?:19|20)\d{2}\b)"));
    set.push_back(compile(labels::STREET_ADDRESS,
        R"(\b\d{1,6}\s{1,4}[A-Za-z0-9.\-\s]{1,80}\s{1,4}(?:Street|St|Avenue|Ave|Road|Rd|Boulevard|Blvd|Drive|Dr|Lane|Ln|Way|Court|Ct)\b)"));
    set.push_back(compile(labels::URL,
        R"(\bhttps?://[^\s]{1,2048})"));
    set.push_back(compile(labels::IP_ADDRESS,
        R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)"));
    set.push_back(compile(labels::CREDIT_CARD,
        R"(\b(?:\d[ -]{0,2}?){13,19}\b)"));
    return set;
}

DetectorSet buildCustomDetectors(const std::vector<std::string>& custom_patterns) {
    DetectorSet set;
    set.reserve(custom_patterns.size());
    for (const auto& raw : custom_patterns) {
        if (trim(raw).empty()) {
            throw RedactError(RedactErrorCode::INVALID_PATTERN,
                              "custom regex must not be blank",
                              common::makeContext("Detector"));
        }
        set.push_back(compile(constants::labels::CUSTOM_PREFIX + raw, raw));
    }
    return set;
}

DetectorSet buildNameDetectors(const std::vector<std::string>& names) {
    DetectorSet set;
    set.reserve(names.size());
    for (const auto& name : names) {
        set.push_back(compile(constants::labels::NAME_PREFIX + name,
                              "\\b" + escapeRegex(name) + "\\b",
                              std::regex::ECMAScript | std::regex::icase));
    }
    return set;
}

DetectorSet buildDetectorSet(const std::vector<std::string>& custom_patterns,
                             const std::vector<std::string>& names) {
    DetectorSet set = builtinDetectors();

    for (auto& detector : buildCustomDetectors(custom_patterns)) {
        set.push_back(std::move(detector));
    }
    for (auto& detector : buildNameDetectors(names)) {
        set.push_back(std::move(detector));
    }

    common::Logger::instance().debug("[Detector] Detector set built | builtin=8 | custom={} | names={}",
                                     custom_patterns.size(), names.size());
    return set;
}

std::string escapeRegex(const std::string& literal) {
    static const std::string special = R"(\^$.|?*+()[]{})";

    std::string escaped;
    escaped.reserve(literal.size() * 2);
    for (char c : literal) {
        if (special.find(c) != std::string::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

std::vector<std::string> parseNames(std::istream& input) {
    std::vector<std::string> names;
    std::string line;
    while (std::getline(input, line)) {
        std::string name = trim(line);
        if (!name.empty()) {
            names.push_back(std::move(name));
        }
    }
    return names;
}

std::vector<std::string> loadNames(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw RedactError(RedactErrorCode::CONFIGURATION_ERROR,
                          "failed to read names file: " + path,
                          common::makeContext("Detector").with("path", path));
    }
    auto names = parseNames(file);
    common::Logger::instance().info("[Detector] Names loaded | path={} | count={}", path, names.size());
    return names;
}

}}
