#include "essay_anonymizer/report/summary_formatter.hpp"
#include "essay_anonymizer/report/report_writer.hpp"
#include <nlohmann/json.hpp>

namespace essay_anonymizer {
namespace report {

SummaryFormatter::SummaryFormatter(OutputFormat format) : format_(format) {}

void SummaryFormatter::formatDocument(const common::RedactionOutcome& outcome, std::ostream& out) {
    if (format_ == OutputFormat::JSON) {
        out << toJson(outcome).dump(verbose_ ? 2 : -1) << "\n";
        return;
    }

    auto status = common::statusOf(outcome);
    std::string color;
    switch (status) {
        case common::DocumentStatus::REDACTED: color = "\033[33m"; break;
        case common::DocumentStatus::CLEAN: color = "\033[32m"; break;
        case common::DocumentStatus::SKIPPED: color = "\033[36m"; break;
        case common::DocumentStatus::FAILED: color = "\033[31m"; break;
    }

    out << colorize(common::to_string(status), color) << ": " << outcome.source;

    if (outcome.total > 0) {
        out << " (" << outcome.total << " redaction" << (outcome.total == 1 ? "" : "s") << ")";
    }
    if (verbose_ && outcome.target) {
        out << " -> " << *outcome.target;
    }
    if (outcome.error_message) {
        out << " - " << *outcome.error_message;
    }

    out << "\n";
}

void SummaryFormatter::formatSummary(const redact::RunAggregate& aggregate,
                                     const std::string& report_path, std::ostream& out) {
    if (format_ == OutputFormat::JSON) {
        formatJsonSummary(aggregate, report_path, out);
    } else {
        formatTextSummary(aggregate, report_path, out);
    }
}

void SummaryFormatter::formatTextSummary(const redact::RunAggregate& aggregate,
                                         const std::string& report_path, std::ostream& out) {
    out << "Redacted " << aggregate.file_count << " files. Total redactions: "
        << aggregate.total_redactions << "\n";

    for (const auto& [label, count] : aggregate.by_label) {
        out << "  " << label << ": " << count << "\n";
    }

    if (aggregate.skipped_files > 0) {
        out << colorize("Skipped (no matches): ", "\033[36m") << aggregate.skipped_files << "\n";
    }
    if (aggregate.failed_files > 0) {
        out << colorize("Failed: ", "\033[31m") << aggregate.failed_files << "\n";
    }

    out << "Report: " << report_path << "\n";
}

void SummaryFormatter::formatJsonSummary(const redact::RunAggregate& aggregate,
                                         const std::string& report_path, std::ostream& out) {
    nlohmann::json json = toJson(aggregate);
    json["report_path"] = report_path;
    out << json.dump(2) << "\n";
}

std::string SummaryFormatter::colorize(const std::string& text, const std::string& color) {
    if (colors_enabled_) {
        return color + text + "\033[0m";
    }
    return text;
}

}}
