#include <catch2/catch_test_macros.hpp>
#include "essay_anonymizer/redact/aggregator.hpp"
#include "essay_anonymizer/core/error_codes.hpp"

#include <stdexcept>

using namespace essay_anonymizer;
using namespace essay_anonymizer::redact;

namespace {

common::RedactionOutcome outcome(const std::string& source, std::map<std::string, int> counts) {
    common::RedactionOutcome o;
    o.source = source;
    o.target = "/out/" + source;
    o.counts = std::move(counts);
    for (const auto& [label, count] : o.counts) {
        o.total += count;
    }
    return o;
}

} // anonymous namespace

TEST_CASE("generated_at is RFC 3339 UTC", "[aggregator]") {
    CHECK(formatRfc3339Utc(std::chrono::system_clock::from_time_t(0)) == "1970-01-01T00:00:00Z");
    CHECK(formatRfc3339Utc(std::chrono::system_clock::from_time_t(1700000000)) == "2023-11-14T22:13:20Z");
}

TEST_CASE("Aggregator folds counts across documents", "[aggregator]") {
    RunAggregator aggregator("/in", "/out", false, std::chrono::system_clock::from_time_t(0));

    aggregator.add(outcome("b.txt", {{"email", 2}, {"phone", 1}}));
    aggregator.add(outcome("a.txt", {{"email", 1}}));
    aggregator.add(outcome("c.txt", {}));

    auto aggregate = aggregator.finalize();

    CHECK(aggregate.generated_at == "1970-01-01T00:00:00Z");
    CHECK(aggregate.input_path == "/in");
    CHECK(aggregate.output_path == "/out");
    CHECK_FALSE(aggregate.dry_run);
    CHECK(aggregate.file_count == 3);
    CHECK(aggregate.total_redactions == 4);
    CHECK(aggregate.by_label == std::map<std::string, int>{{"email", 3}, {"phone", 1}});

    REQUIRE(aggregate.per_file.size() == 3);
    CHECK(aggregate.per_file[0].source == "a.txt");
    CHECK(aggregate.per_file[1].source == "b.txt");
    CHECK(aggregate.per_file[2].source == "c.txt");
}

TEST_CASE("Aggregator counts skipped and failed documents", "[aggregator]") {
    RunAggregator aggregator("/in", "(dry-run)", true);

    auto skipped = outcome("clean.txt", {});
    skipped.skipped = true;

    auto failed = outcome("broken.txt", {});
    failed.error_code = core::RedactErrorCode::DOCUMENT_READ_FAILED;
    failed.error_message = "failed to open broken.txt";

    aggregator.add(skipped);
    aggregator.add(failed);
    aggregator.add(outcome("ok.txt", {{"ssn", 1}}));

    auto aggregate = aggregator.finalize();

    CHECK(aggregate.dry_run);
    CHECK(aggregate.file_count == 3);
    CHECK(aggregate.skipped_files == 1);
    CHECK(aggregate.failed_files == 1);
    CHECK(aggregate.total_redactions == 1);
}

TEST_CASE("Total equals the sum of by_label", "[aggregator]") {
    RunAggregator aggregator("/in", "/out", false);
    aggregator.add(outcome("x", {{"email", 5}, {"name:Alice", 2}}));
    aggregator.add(outcome("y", {{"credit_card", 1}, {"email", 1}}));

    auto aggregate = aggregator.finalize();

    int sum = 0;
    for (const auto& [label, count] : aggregate.by_label) {
        sum += count;
    }
    CHECK(aggregate.total_redactions == sum);
}

TEST_CASE("Aggregator is read-only after finalize", "[aggregator]") {
    RunAggregator aggregator("/in", "/out", false);
    aggregator.add(outcome("x", {}));
    (void)aggregator.finalize();

    CHECK_THROWS_AS(aggregator.add(outcome("y", {})), std::logic_error);
}
