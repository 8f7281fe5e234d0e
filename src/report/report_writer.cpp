#include "essay_anonymizer/report/report_writer.hpp"
#include "essay_anonymizer/common/logger.hpp"
#include "essay_anonymizer/core/error_codes.hpp"
#include <filesystem>
#include <fstream>

namespace essay_anonymizer {
namespace report {

namespace {

using core::RedactError;
using core::RedactErrorCode;

std::ofstream openReport(const std::string& path) {
    std::filesystem::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            throw RedactError(RedactErrorCode::REPORT_WRITE_FAILED,
                              "failed to create report directory: " + ec.message(),
                              common::makeContext("Report").with("path", path));
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw RedactError(RedactErrorCode::REPORT_WRITE_FAILED,
                          "failed to open report: " + path,
                          common::makeContext("Report").with("path", path));
    }
    return out;
}

void checkWritten(const std::ofstream& out, const std::string& path) {
    if (!out) {
        throw RedactError(RedactErrorCode::REPORT_WRITE_FAILED,
                          "failed to write report: " + path,
                          common::makeContext("Report").with("path", path));
    }
}

void writeRow(std::ostream& out, const std::vector<std::string>& fields) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        out << csvEscape(fields[i]);
    }
    out << '\n';
}

}

nlohmann::json toJson(const common::RedactionOutcome& outcome) {
    nlohmann::json json;

    json["source"] = outcome.source;
    if (outcome.target) {
        json["target"] = *outcome.target;
    } else {
        json["target"] = nullptr;
    }
    json["redactions"] = outcome.counts;
    json["total"] = outcome.total;
    json["skipped"] = outcome.skipped;

    if (outcome.error_code) {
        nlohmann::json error;
        error["code"] = core::RedactErrorCodeHelper::toString(*outcome.error_code);
        error["message"] = outcome.error_message.value_or("");
        json["error"] = error;
    }

    return json;
}

nlohmann::json toJson(const redact::RunAggregate& aggregate) {
    nlohmann::json json;

    json["generated_at"] = aggregate.generated_at;
    json["input_path"] = aggregate.input_path;
    json["output_path"] = aggregate.output_path;
    json["dry_run"] = aggregate.dry_run;
    json["files"] = aggregate.file_count;
    json["skipped_files"] = aggregate.skipped_files;
    json["failed_files"] = aggregate.failed_files;
    json["total_redactions"] = aggregate.total_redactions;
    json["by_pattern"] = aggregate.by_label;

    json["details"] = nlohmann::json::array();
    for (const auto& outcome : aggregate.per_file) {
        json["details"].push_back(toJson(outcome));
    }

    return json;
}

void writeJsonReport(const std::string& path, const redact::RunAggregate& aggregate) {
    auto out = openReport(path);
    out << toJson(aggregate).dump(2) << "\n";
    out.flush();
    checkWritten(out, path);

    common::Logger::instance().info("[Report] JSON report written | path={} | files={}",
                                    path, aggregate.file_count);
}

void writeCsvReport(const std::string& path, const redact::RunAggregate& aggregate) {
    auto out = openReport(path);
    writeCsv(out, aggregate);
    out.flush();
    checkWritten(out, path);

    common::Logger::instance().info("[Report] CSV report written | path={} | columns={}",
                                    path, aggregate.by_label.size() + 3);
}

void writeCsv(std::ostream& out, const redact::RunAggregate& aggregate) {
    std::vector<std::string> header = {"source", "target", "total_redactions"};
    for (const auto& [label, count] : aggregate.by_label) {
        header.push_back(label);
    }
    writeRow(out, header);

    for (const auto& outcome : aggregate.per_file) {
        std::vector<std::string> row = {
            outcome.source,
            outcome.target.value_or(""),
            std::to_string(outcome.total)
        };
        for (const auto& [label, count] : aggregate.by_label) {
            auto it = outcome.counts.find(label);
            row.push_back(std::to_string(it != outcome.counts.end() ? it->second : 0));
        }
        writeRow(out, row);
    }
}

std::string csvEscape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos &&
        (field.empty() || field.front() != ' ')) {
        return field;
    }

    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

}}
