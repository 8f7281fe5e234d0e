#include "redact_command.hpp"
#include "essay_anonymizer/common/config.hpp"
#include "essay_anonymizer/common/constants.hpp"
#include "essay_anonymizer/common/logger.hpp"
#include "essay_anonymizer/core/error_codes.hpp"
#include "essay_anonymizer/redact/mask_resolver.hpp"
#include "essay_anonymizer/report/report_writer.hpp"
#include "essay_anonymizer/report/summary_formatter.hpp"
#include "essay_anonymizer/runlog/run_log_sink.hpp"
#include "essay_anonymizer/scan/document_processor.hpp"
#include "essay_anonymizer/scan/file_collector.hpp"
#include <chrono>
#include <iostream>
#include <unistd.h>

namespace essay_anonymizer {
namespace cli {

using core::RedactError;
using core::RedactErrorCode;

RedactCommand::RedactCommand() : was_called_(false) {}

void RedactCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    subcommand->add_option("input", input_path_, "File or directory to redact")
               ->required();

    subcommand->add_option("-o,--output", output_path_,
                          "Output directory for redacted files (default: from config)");
    subcommand->add_option("-e,--extensions", extensions_,
                          "Comma-separated extensions to include for directory input");
    subcommand->add_option("--mask", mask_,
                          "Text to replace redactions with");
    subcommand->add_option("--mask-template", mask_template_,
                          "Template using {label}, {n} and {hash} placeholders");
    subcommand->add_flag("--hash", hash_,
                        "Append a salted SHA-256 fragment of each match");
    subcommand->add_option("--salt", salt_,
                          "Salt prepended to matches before hashing");
    subcommand->add_option("--hash-length", hash_length_,
                          "Hex characters of the hash to keep")
                          ->check(CLI::Range(1, constants::mask::MAX_HASH_LENGTH));

    addPatternOptions(subcommand);

    subcommand->add_option("--exclude-dir", exclude_dirs_,
                          "Directory name to skip (repeatable)")
                          ->multi_option_policy(CLI::MultiOptionPolicy::TakeAll);
    subcommand->add_option("--exclude-path", exclude_paths_,
                          "Path relative to the input directory to skip (repeatable)")
                          ->multi_option_policy(CLI::MultiOptionPolicy::TakeAll);
    subcommand->add_option("--report", report_path_,
                          "JSON report path (default: <output>/redaction-report.json)");
    subcommand->add_option("--report-csv", report_csv_path_,
                          "Optional CSV report path");
    subcommand->add_flag("--db-log", db_log_,
                        "Log the run summary to PostgreSQL (requires GS_PG_* env vars)");
    subcommand->add_flag("--dry-run", dry_run_,
                        "Preview redactions without writing files");
    subcommand->add_flag("--skip-clean", skip_clean_,
                        "Do not write documents with no redactions");
    subcommand->add_option("-t,--threads", threads_,
                          "Number of worker threads")
                          ->check(CLI::Range(1, constants::limits::MAX_THREADS));
    subcommand->add_flag("-q,--quiet", quiet_,
                        "Quiet mode");
    subcommand->add_flag("--verbose", verbose_,
                        "Print one line per document");
    subcommand->add_flag("--json", json_output_,
                        "Print the run summary as JSON");

    subcommand->callback([this]() { was_called_ = true; });
}

bool RedactCommand::wasCalled() const {
    return was_called_;
}

bool RedactCommand::given(const std::string& option) const {
    return subcommand_ && subcommand_->count(option) > 0;
}

bool RedactCommand::validateArguments() const {
    if (quiet_ && verbose_) {
        std::cerr << "Error: --quiet and --verbose are mutually exclusive" << std::endl;
        return false;
    }
    return true;
}

std::optional<std::filesystem::path> RedactCommand::resolveOutputRoot() const {
    const auto& config = common::Config::instance().global();

    if (dry_run_) {
        if (output_path_.empty()) {
            return std::nullopt;
        }
        return std::filesystem::absolute(output_path_).lexically_normal();
    }

    std::string out = output_path_.empty() ? config.redact.output_dir : output_path_;
    std::filesystem::path root = std::filesystem::absolute(out).lexically_normal();

    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        throw RedactError(RedactErrorCode::CONFIGURATION_ERROR,
                          "failed to create output directory: " + ec.message(),
                          common::makeContext("Redact").with("path", root.string()));
    }
    return root;
}

std::string RedactCommand::resolveReportPath(const std::optional<std::filesystem::path>& output_root) const {
    if (!report_path_.empty()) {
        return report_path_;
    }

    const auto& json_name = common::Config::instance().global().report.json_name;
    if (dry_run_ || !output_root) {
        return (std::filesystem::path(".") / json_name).string();
    }
    return (*output_root / json_name).string();
}

int RedactCommand::execute() {
    if (!validateArguments()) {
        return 1;
    }

    const auto& config = common::Config::instance().global();
    auto start_time = std::chrono::steady_clock::now();

    std::filesystem::path input = std::filesystem::absolute(input_path_).lexically_normal();
    std::error_code ec;
    if (!std::filesystem::exists(input, ec)) {
        throw RedactError(RedactErrorCode::INPUT_NOT_FOUND,
                          "failed to access input path: " + input.string(),
                          common::makeContext("Redact").with("path", input.string()));
    }
    const bool input_is_directory = std::filesystem::is_directory(input, ec);

    auto output_root = resolveOutputRoot();

    auto detectors = buildActiveDetectors();
    if (detectors.empty()) {
        throw RedactError(RedactErrorCode::NO_PATTERNS, "no patterns configured",
                          common::makeContext("Redact"));
    }

    auto mask_config = redact::MaskConfig::create(
        given("--mask") ? mask_ : config.redact.mask,
        given("--mask-template") ? mask_template_ : config.redact.mask_template,
        hash_ || config.redact.hash,
        given("--salt") ? salt_ : config.redact.salt,
        given("--hash-length") ? hash_length_ : config.redact.hash_length);
    redact::MaskResolver resolver(mask_config);

    scan::CollectOptions collect_options;
    collect_options.extensions = scan::parseExtensions(given("--extensions") ? extensions_ : config.redact.extensions);

    std::vector<std::string> exclude_dirs = config.redact.exclude_dirs;
    exclude_dirs.insert(exclude_dirs.end(), exclude_dirs_.begin(), exclude_dirs_.end());
    collect_options.exclude_dirs = scan::buildExcludeDirs(exclude_dirs);

    std::vector<std::string> exclude_paths = config.redact.exclude_paths;
    exclude_paths.insert(exclude_paths.end(), exclude_paths_.begin(), exclude_paths_.end());
    collect_options.exclude_paths = scan::buildExcludePaths(exclude_paths);

    auto files = scan::collectFiles(input, collect_options);
    if (files.empty()) {
        throw RedactError(RedactErrorCode::NO_FILES, "no files to process",
                          common::makeContext("Redact").with("path", input.string()));
    }

    common::Logger::instance().info("[Redact] Run started | input={} | files={} | detectors={} | dry_run={}",
                                    input.string(), files.size(), detectors.size(), dry_run_);

    scan::ProcessOptions process_options;
    process_options.input_root = input;
    process_options.input_is_directory = input_is_directory;
    process_options.output_root = output_root;
    process_options.dry_run = dry_run_;
    process_options.skip_clean = skip_clean_ || config.redact.skip_clean;
    process_options.threads = threads_ > 0 ? threads_ : config.redact.threads;

    scan::DocumentProcessor processor(detectors, resolver, process_options);
    auto outcomes = processor.processAll(files);

    std::string output_label = output_root ? output_root->string() : constants::report::DRY_RUN_OUTPUT_LABEL;
    redact::RunAggregator aggregator(input.string(), output_label, dry_run_);
    for (auto& outcome : outcomes) {
        aggregator.add(std::move(outcome));
    }
    auto aggregate = aggregator.finalize();

    std::string report_path = resolveReportPath(output_root);
    report::writeJsonReport(report_path, aggregate);

    std::optional<std::string> csv_path;
    if (!report_csv_path_.empty()) {
        report::writeCsvReport(report_csv_path_, aggregate);
        csv_path = report_csv_path_;
    }

    if (db_log_) {
        runlog::PgRunLogSink sink(runlog::loadDbConfig());
        sink.record(aggregate, report_path, csv_path);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    common::Logger::instance().info("[Redact] Run complete | files={} | total={} | failed={} | duration_ms={}",
                                    aggregate.file_count, aggregate.total_redactions,
                                    aggregate.failed_files, common::formatDuration(elapsed));

    printResults(aggregate, report_path);

    return aggregate.failed_files > 0 ? 1 : 0;
}

void RedactCommand::printResults(const redact::RunAggregate& aggregate, const std::string& report_path) const {
    if (quiet_) {
        return;
    }

    report::SummaryFormatter formatter(json_output_ ? report::OutputFormat::JSON : report::OutputFormat::TEXT);
    formatter.setColorsEnabled(isatty(STDOUT_FILENO));
    formatter.setVerbose(verbose_);

    if (verbose_ && !json_output_) {
        for (const auto& outcome : aggregate.per_file) {
            formatter.formatDocument(outcome, std::cout);
        }
    }

    formatter.formatSummary(aggregate, report_path, std::cout);
}

}}
