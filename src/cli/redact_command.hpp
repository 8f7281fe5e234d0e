#pragma once

#include "main_command.hpp"
#include "essay_anonymizer/redact/aggregator.hpp"
#include <CLI/CLI.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace essay_anonymizer {
namespace cli {

class RedactCommand : public MainCommand {
public:
    RedactCommand();

    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

    bool validateArguments() const override;

private:
    bool was_called_;
    std::string input_path_;
    std::string output_path_;
    std::string extensions_;
    std::string mask_;
    std::string mask_template_;
    bool hash_ = false;
    std::string salt_;
    int hash_length_ = 0;
    std::vector<std::string> exclude_dirs_;
    std::vector<std::string> exclude_paths_;
    std::string report_path_;
    std::string report_csv_path_;
    bool db_log_ = false;
    bool dry_run_ = false;
    bool skip_clean_ = false;
    int threads_ = 0;
    bool quiet_ = false;
    bool verbose_ = false;
    bool json_output_ = false;

    bool given(const std::string& option) const;

    std::optional<std::filesystem::path> resolveOutputRoot() const;
    std::string resolveReportPath(const std::optional<std::filesystem::path>& output_root) const;

    void printResults(const redact::RunAggregate& aggregate, const std::string& report_path) const;
};

}}
