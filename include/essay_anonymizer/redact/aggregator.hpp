#pragma once

#include "../common/types.hpp"
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace essay_anonymizer {
namespace redact {

struct RunAggregate {
    std::string generated_at;
    std::string input_path;
    std::string output_path;
    bool dry_run = false;
    size_t file_count = 0;
    size_t skipped_files = 0;
    size_t failed_files = 0;
    int total_redactions = 0;
    std::map<std::string, int> by_label;
    std::vector<common::RedactionOutcome> per_file;
};

// Single-threaded fold over per-document outcomes. finalize() sorts the
// per-file list by source and hands the aggregate over; add() must not be
// called afterwards.
class RunAggregator {
public:
    RunAggregator(std::string input_path, std::string output_path, bool dry_run,
                  std::chrono::system_clock::time_point generated_at = std::chrono::system_clock::now());

    void add(common::RedactionOutcome outcome);
    RunAggregate finalize();

    const RunAggregate& current() const { return aggregate_; }

private:
    RunAggregate aggregate_;
    bool finalized_ = false;
};

std::string formatRfc3339Utc(std::chrono::system_clock::time_point tp);

}}
