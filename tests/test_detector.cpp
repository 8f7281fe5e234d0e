#include <catch2/catch_test_macros.hpp>
#include "essay_anonymizer/redact/detector.hpp"
#include "test_helpers.hpp"

#include <sstream>

using namespace essay_anonymizer;
using namespace essay_anonymizer::redact;
using test_helpers::errorCodeOf;

namespace {

std::vector<std::string> labelsOf(const DetectorSet& set) {
    std::vector<std::string> labels;
    for (const auto& detector : set) {
        labels.push_back(detector.label);
    }
    return labels;
}

const Detector& byLabel(const DetectorSet& set, const std::string& label) {
    for (const auto& detector : set) {
        if (detector.label == label) {
            return detector;
        }
    }
    throw std::runtime_error("no detector " + label);
}

} // anonymous namespace

TEST_CASE("Built-in detectors come in fixed order", "[detector]") {
    CHECK(labelsOf(builtinDetectors()) == std::vector<std::string>{
        "email", "phone", "ssn", "dob", "street_address", "url", "ip_address", "credit_card"});
}

TEST_CASE("Custom and name detectors follow the built-ins", "[detector]") {
    auto set = buildDetectorSet({"foo\\d+", "bar"}, {"Alice", "Bob"});

    REQUIRE(set.size() == 12);
    CHECK(set[8].label == "custom:foo\\d+");
    CHECK(set[9].label == "custom:bar");
    CHECK(set[10].label == "name:Alice");
    CHECK(set[11].label == "name:Bob");
}

TEST_CASE("Invalid custom regex fails construction", "[detector]") {
    auto unbalanced = errorCodeOf([] { buildDetectorSet({"ok", "(unclosed"}, {}); });
    REQUIRE(unbalanced.has_value());
    CHECK(*unbalanced == core::RedactErrorCode::INVALID_PATTERN);

    auto empty = errorCodeOf([] { buildDetectorSet({""}, {}); });
    REQUIRE(empty.has_value());
    CHECK(*empty == core::RedactErrorCode::INVALID_PATTERN);

    auto blank = errorCodeOf([] { buildDetectorSet({" \t "}, {}); });
    REQUIRE(blank.has_value());
    CHECK(*blank == core::RedactErrorCode::INVALID_PATTERN);
}

TEST_CASE("Invalid pattern error names the raw pattern", "[detector]") {
    try {
        buildCustomDetectors({"[a-"});
        FAIL("expected RedactError");
    } catch (const core::RedactError& e) {
        CHECK(std::string(e.what()).find("[a-") != std::string::npos);
        CHECK(e.context().details.at("pattern") == "[a-");
    }
}

TEST_CASE("escapeRegex escapes metacharacters", "[detector]") {
    CHECK(escapeRegex("a.b*c") == "a\\.b\\*c");
    CHECK(escapeRegex("(x)[y]{z}") == "\\(x\\)\\[y\\]\\{z\\}");
    CHECK(escapeRegex("^$|?+\\") == "\\^\\$\\|\\?\\+\\\\");
    CHECK(escapeRegex("Jane Doe") == "Jane Doe");
}

TEST_CASE("Name detectors are case-insensitive whole words", "[detector]") {
    auto set = buildNameDetectors({"Alice", "J. Doe"});
    const auto& alice = byLabel(set, "name:Alice");
    const auto& doe = byLabel(set, "name:J. Doe");

    CHECK(std::regex_search("ALICE wrote this", alice.pattern));
    CHECK(std::regex_search("thanks, alice.", alice.pattern));
    CHECK_FALSE(std::regex_search("Malice aforethought", alice.pattern));
    CHECK_FALSE(std::regex_search("Alicent", alice.pattern));

    CHECK(std::regex_search("signed J. Doe today", doe.pattern));
    CHECK_FALSE(std::regex_search("signed JX Doe today", doe.pattern));
}

TEST_CASE("Built-in patterns match typical PII", "[detector]") {
    auto set = builtinDetectors();

    CHECK(std::regex_search("mail jane.doe+tag@example.co.uk now", byLabel(set, "email").pattern));
    CHECK(std::regex_search("call (555) 123-4567", byLabel(set, "phone").pattern));
    CHECK(std::regex_search("call +1 555.123.4567", byLabel(set, "phone").pattern));
    CHECK(std::regex_search("ssn 123-45-6789", byLabel(set, "ssn").pattern));
    CHECK(std::regex_search("born 07/04/1999", byLabel(set, "dob").pattern));
    CHECK_FALSE(std::regex_search("born 13/04/1999", byLabel(set, "dob").pattern));
    CHECK(std::regex_search("lives at 42 Elm Street", byLabel(set, "street_address").pattern));
    CHECK(std::regex_search("see https://example.com/a?b=c", byLabel(set, "url").pattern));
    CHECK(std::regex_search("host 10.0.0.1 up", byLabel(set, "ip_address").pattern));
    CHECK(std::regex_search("card 4111 1111 1111 1111", byLabel(set, "credit_card").pattern));
}

TEST_CASE("parseNames trims lines and skips blanks", "[detector]") {
    std::istringstream input("  Alice \n\n\t\nBob\r\n  Carol Ann  ");
    CHECK(parseNames(input) == std::vector<std::string>{"Alice", "Bob", "Carol Ann"});
}

TEST_CASE("loadNames reads a names file", "[detector]") {
    test_helpers::TempDir dir("names");
    auto path = dir.path() / "names.txt";
    test_helpers::writeFile(path, "Alice\n\nBob\n");

    CHECK(loadNames(path.string()) == std::vector<std::string>{"Alice", "Bob"});

    auto missing = errorCodeOf([&] { loadNames((dir.path() / "missing.txt").string()); });
    REQUIRE(missing.has_value());
    CHECK(*missing == core::RedactErrorCode::CONFIGURATION_ERROR);
}
