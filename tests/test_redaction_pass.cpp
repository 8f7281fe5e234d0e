#include <catch2/catch_test_macros.hpp>
#include "essay_anonymizer/redact/redaction_pass.hpp"
#include "essay_anonymizer/redact/pattern_filter.hpp"
#include <string>
#include <vector>

using namespace essay_anonymizer::redact;

namespace {

MaskResolver literalMask(const std::string& literal = "[REDACTED]") {
    return MaskResolver(MaskConfig::create(literal, "", false, "", 8));
}

DetectorSet pick(const DetectorSet& source, const std::vector<std::string>& labels) {
    DetectorSet picked;
    for (const auto& label : labels) {
        for (const auto& detector : source) {
            if (detector.label == label) {
                picked.push_back(detector);
            }
        }
    }
    return picked;
}

} // anonymous namespace

TEST_CASE("Literal masking is idempotent", "[pass]") {
    auto detectors = builtinDetectors();
    auto resolver = literalMask();

    auto first = applyPass("Email jane@example.com now", detectors, resolver);
    CHECK(first.content == "Email [REDACTED] now");
    CHECK(first.counts.at("email") == 1);
    CHECK(first.total == 1);

    auto second = applyPass(first.content, detectors, resolver);
    CHECK(second.content == first.content);
    CHECK(second.total == 0);
    CHECK(second.counts.empty());
}

TEST_CASE("Template index counts per detector within one document", "[pass]") {
    auto detectors = builtinDetectors();
    MaskResolver resolver(MaskConfig::create("[X]", "{label}#{n}", false, "", 8));

    auto result = applyPass("a@b.co c@d.co 555-123-4567", detectors, resolver);

    CHECK(result.content == "email#1 email#2 phone#1");
    CHECK(result.counts.at("email") == 2);
    CHECK(result.counts.at("phone") == 1);
    CHECK(result.total == 3);
}

TEST_CASE("Template output is deterministic", "[pass]") {
    auto detectors = builtinDetectors();
    MaskResolver resolver(MaskConfig::create("[X]", "[{label}:{n}]", false, "", 8));

    const std::string text = "a@x.com and b@y.org";
    auto first = applyPass(text, detectors, resolver);
    auto second = applyPass(text, detectors, resolver);

    CHECK(first.content == "[email:1] and [email:2]");
    CHECK(first.content == second.content);
    CHECK(first.counts == second.counts);
}

TEST_CASE("Hashed tokens are identical for identical matches", "[pass]") {
    auto detectors = builtinDetectors();
    MaskResolver resolver(MaskConfig::create("[X]", "", true, "pepper", 8));

    auto result = applyPass("jane@example.com wrote to jane@example.com", detectors, resolver);

    const std::string token = "[REDACTED:email:" + hashFragment("pepper", "jane@example.com", 8) + "]";
    CHECK(result.content == token + " wrote to " + token);
    CHECK(result.counts.at("email") == 2);
}

TEST_CASE("Detector order decides what later detectors see", "[pass]") {
    auto detectors = builtinDetectors();
    auto resolver = literalMask();

    auto result = applyPass("123 Main St, 192.168.1.1", detectors, resolver);

    CHECK(result.content == "[REDACTED], [REDACTED]");
    CHECK(result.counts.at("street_address") == 1);
    CHECK(result.counts.at("ip_address") == 1);
    CHECK(result.total == 2);
}

TEST_CASE("An earlier detector hides its match from later ones", "[pass]") {
    auto builtin = builtinDetectors();
    auto resolver = literalMask();
    const std::string text = "Apt 10 192.168.1.1 Main Street";

    SECTION("address before ip swallows the ip-shaped span") {
        auto result = applyPass(text, pick(builtin, {"street_address", "ip_address"}), resolver);
        CHECK(result.content == "Apt [REDACTED]");
        CHECK(result.counts.at("street_address") == 1);
        CHECK(result.counts.count("ip_address") == 0);
    }

    SECTION("ip before address breaks the address") {
        auto result = applyPass(text, pick(builtin, {"ip_address", "street_address"}), resolver);
        CHECK(result.content == "Apt 10 [REDACTED] Main Street");
        CHECK(result.counts.at("ip_address") == 1);
        CHECK(result.counts.count("street_address") == 0);
    }
}

TEST_CASE("Long documents do not exhaust the matcher", "[pass]") {
    auto detectors = builtinDetectors();
    auto resolver = literalMask();

    SECTION("comma-free prose after a number") {
        std::string text = "Essay 2024\n\n";
        while (text.size() < 100 * 1024) {
            text += "The scholarship essay describes my journey from grade 9 through senior year.\n"
                    "I worked hard and learned a lot. ";
        }

        auto result = applyPass(text, detectors, resolver);
        CHECK(result.total == 0);
        CHECK(result.content == text);
    }

    SECTION("a single very long url") {
        const std::string text = "see https://example.org/?q=" + std::string(50000, 'A');

        auto result = applyPass(text, detectors, resolver);
        CHECK(result.counts.at("url") == 1);
        CHECK(result.content.rfind("see [REDACTED]", 0) == 0);
        CHECK(result.content.size() < text.size());
    }

    SECTION("a long word run after a number") {
        const std::string text = "1 " + std::string(40000, 'a');

        auto result = applyPass(text, detectors, resolver);
        CHECK(result.total == 0);
    }
}

TEST_CASE("Credit card matches are gated by the Luhn check", "[pass]") {
    auto detectors = builtinDetectors();
    auto resolver = literalMask();

    auto result = applyPass("valid 4111 1111 1111 1111 invalid 4111 1111 1111 1112", detectors, resolver);

    CHECK(result.content == "valid [REDACTED] invalid 4111 1111 1111 1112");
    CHECK(result.counts.at("credit_card") == 1);
    CHECK(result.total == 1);
}

TEST_CASE("Skip-clean marks documents without matches", "[pass]") {
    auto detectors = builtinDetectors();
    auto resolver = literalMask();

    PassOptions skip_clean;
    skip_clean.skip_clean = true;

    SECTION("clean document is skipped") {
        auto result = applyPass("nothing to see here", detectors, resolver, skip_clean);
        CHECK(result.skipped);
        CHECK_FALSE(result.should_write);
        CHECK(result.total == 0);
        CHECK(result.content == "nothing to see here");
    }

    SECTION("document with matches is written") {
        auto result = applyPass("ssn 123-45-6789", detectors, resolver, skip_clean);
        CHECK_FALSE(result.skipped);
        CHECK(result.should_write);
        CHECK(result.counts.at("ssn") == 1);
    }

    SECTION("without skip-clean a clean document is still written") {
        auto result = applyPass("nothing to see here", detectors, resolver);
        CHECK_FALSE(result.skipped);
        CHECK(result.should_write);
    }
}

TEST_CASE("Preview never writes but still reports", "[pass]") {
    auto detectors = builtinDetectors();
    auto resolver = literalMask();

    PassOptions preview;
    preview.preview_only = true;

    auto result = applyPass("ssn 123-45-6789", detectors, resolver, preview);
    CHECK_FALSE(result.should_write);
    CHECK_FALSE(result.skipped);
    CHECK(result.content == "ssn [REDACTED]");
    CHECK(result.total == 1);
}

TEST_CASE("Zero-length custom matches are not redactions", "[pass]") {
    auto detectors = buildDetectorSet({"x*"}, {});
    auto resolver = literalMask();

    auto result = applyPass("abc", detectors, resolver);
    CHECK(result.content == "abc");
    CHECK(result.total == 0);
}

TEST_CASE("Name detectors redact case-insensitively", "[pass]") {
    auto detectors = buildDetectorSet({}, {"Alice"});
    MaskResolver resolver(MaskConfig::create("[X]", "<{label}>", false, "", 8));

    auto result = applyPass("alice met ALICE and Malice", detectors, resolver);
    CHECK(result.content == "<name:Alice> met <name:Alice> and Malice");
    CHECK(result.counts.at("name:Alice") == 2);
}

TEST_CASE("Detectors sharing a label have their counts summed", "[pass]") {
    auto detectors = buildDetectorSet({"foo", "bar"}, {});
    detectors.back().label = detectors[detectors.size() - 2].label;
    auto resolver = literalMask("#");

    auto result = applyPass("foo bar foo", detectors, resolver);
    CHECK(result.content == "# # #");
    CHECK(result.counts.size() == 1);
    CHECK(result.counts.at("custom:foo") == 3);
}

TEST_CASE("Total equals the sum of per-label counts", "[pass]") {
    auto detectors = filterDetectors(builtinDetectors(), std::vector<std::string>{"url"});
    auto resolver = literalMask();

    auto result = applyPass("jane@example.com, 123-45-6789, 10.0.0.1, https://x.org", detectors, resolver);

    int sum = 0;
    for (const auto& [label, count] : result.counts) {
        sum += count;
    }
    CHECK(result.total == sum);
    CHECK(result.counts.count("url") == 0);
    CHECK(result.content.find("https://x.org") != std::string::npos);
}
