#pragma once

#include "../redact/aggregator.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace essay_anonymizer {
namespace report {

nlohmann::json toJson(const common::RedactionOutcome& outcome);
nlohmann::json toJson(const redact::RunAggregate& aggregate);

// Both writers create missing parent directories and throw
// RedactError(REPORT_WRITE_FAILED) on failure.
void writeJsonReport(const std::string& path, const redact::RunAggregate& aggregate);
void writeCsvReport(const std::string& path, const redact::RunAggregate& aggregate);

void writeCsv(std::ostream& out, const redact::RunAggregate& aggregate);

std::string csvEscape(const std::string& field);

}}
