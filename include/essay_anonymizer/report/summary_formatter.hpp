#pragma once

#include "../redact/aggregator.hpp"
#include <ostream>
#include <string>

namespace essay_anonymizer {
namespace report {

enum class OutputFormat {
    TEXT,
    JSON
};

class SummaryFormatter {
public:
    explicit SummaryFormatter(OutputFormat format = OutputFormat::TEXT);

    void formatDocument(const common::RedactionOutcome& outcome, std::ostream& out);
    void formatSummary(const redact::RunAggregate& aggregate, const std::string& report_path, std::ostream& out);

    void setColorsEnabled(bool enabled) { colors_enabled_ = enabled; }
    void setVerbose(bool verbose) { verbose_ = verbose; }

private:
    OutputFormat format_;
    bool colors_enabled_ = true;
    bool verbose_ = false;

    void formatTextSummary(const redact::RunAggregate& aggregate, const std::string& report_path, std::ostream& out);
    void formatJsonSummary(const redact::RunAggregate& aggregate, const std::string& report_path, std::ostream& out);

    std::string colorize(const std::string& text, const std::string& color);
};

}}
