#pragma once

#include <istream>
#include <regex>
#include <string>
#include <vector>

namespace essay_anonymizer {
namespace redact {

// A labelled matcher. Labels are not unique: counts for detectors sharing a
// label are summed.
struct Detector {
    std::string label;
    std::string source;
    std::regex pattern;
};

using DetectorSet = std::vector<Detector>;

// email, phone, ssn, dob, street_address, url, ip_address, credit_card
DetectorSet builtinDetectors();

// Built-ins, then one "custom:<raw>" detector per custom pattern, then one
// "name:<name>" detector per name. Throws RedactError(INVALID_PATTERN).
DetectorSet buildDetectorSet(const std::vector<std::string>& custom_patterns,
                             const std::vector<std::string>& names);

DetectorSet buildCustomDetectors(const std::vector<std::string>& custom_patterns);
DetectorSet buildNameDetectors(const std::vector<std::string>& names);

std::string escapeRegex(const std::string& literal);

std::vector<std::string> parseNames(std::istream& input);
std::vector<std::string> loadNames(const std::string& path);

}}
