#include "essay_anonymizer/redact/aggregator.hpp"
#include "essay_anonymizer/common/logger.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace essay_anonymizer {
namespace redact {

std::string formatRfc3339Utc(std::chrono::system_clock::time_point tp) {
    std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time_t_val, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

RunAggregator::RunAggregator(std::string input_path, std::string output_path, bool dry_run,
                             std::chrono::system_clock::time_point generated_at) {
    aggregate_.generated_at = formatRfc3339Utc(generated_at);
    aggregate_.input_path = std::move(input_path);
    aggregate_.output_path = std::move(output_path);
    aggregate_.dry_run = dry_run;
}

void RunAggregator::add(common::RedactionOutcome outcome) {
    if (finalized_) {
        throw std::logic_error("RunAggregator::add called after finalize");
    }

    ++aggregate_.file_count;
    if (outcome.skipped) {
        ++aggregate_.skipped_files;
    }
    if (outcome.failed()) {
        ++aggregate_.failed_files;
    }

    for (const auto& [label, count] : outcome.counts) {
        aggregate_.by_label[label] += count;
    }
    aggregate_.total_redactions += outcome.total;

    aggregate_.per_file.push_back(std::move(outcome));
}

RunAggregate RunAggregator::finalize() {
    finalized_ = true;

    std::sort(aggregate_.per_file.begin(), aggregate_.per_file.end(),
              [](const common::RedactionOutcome& a, const common::RedactionOutcome& b) {
                  return a.source < b.source;
              });

    common::Logger::instance().debug("[Aggregator] Finalized | files={} | total={} | labels={}",
                                     aggregate_.file_count, aggregate_.total_redactions,
                                     aggregate_.by_label.size());
    return std::move(aggregate_);
}

}}
