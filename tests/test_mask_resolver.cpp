#include <catch2/catch_test_macros.hpp>
#include "essay_anonymizer/redact/mask_resolver.hpp"
#include "test_helpers.hpp"

using namespace essay_anonymizer;
using namespace essay_anonymizer::redact;
using test_helpers::errorCodeOf;

TEST_CASE("applyTemplate substitutes label and index", "[mask]") {
    CHECK(applyTemplate("[REDACTED:{label}:{n}]", "email", 3) == "[REDACTED:email:3]");
    CHECK(applyTemplate("{label}-{label} #{n}{n}", "ssn", 2) == "ssn-ssn #22");
    CHECK(applyTemplate("<{foo}:{label}>", "url", 1) == "<{foo}:url>");
    CHECK(applyTemplate("plain", "phone", 7) == "plain");
}

TEST_CASE("hashFragment is truncated lowercase SHA-256 of salt and value", "[mask]") {
    const std::string abc_sha256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

    CHECK(hashFragment("", "abc", 64) == abc_sha256);
    CHECK(hashFragment("", "abc", 8) == "ba7816bf");
    CHECK(hashFragment("", "abc", 1) == "b");
    CHECK(hashFragment("s", "abc", 16) == hashFragment("", "sabc", 16));
    CHECK(hashFragment("pepper", "abc", 8) != hashFragment("salt", "abc", 8));
}

TEST_CASE("MaskConfig without template uses the literal mask", "[mask]") {
    auto config = MaskConfig::create("[X]", "", false, "", 8);
    MaskResolver resolver(config);

    CHECK_FALSE(config.mask_template.has_value());
    CHECK(resolver.resolve("email", 1, "a@b.co") == "[X]");
    CHECK(resolver.resolve("phone", 9, "555-123-4567") == "[X]");
}

TEST_CASE("MaskConfig treats a whitespace-only template as absent", "[mask]") {
    auto config = MaskConfig::create("[X]", "   \t", false, "", 8);
    CHECK_FALSE(config.mask_template.has_value());
    CHECK(MaskResolver(config).resolve("email", 1, "a@b.co") == "[X]");
}

TEST_CASE("MaskConfig with hashing selects the default template", "[mask]") {
    auto config = MaskConfig::create("[X]", "", true, "", 8);
    REQUIRE(config.mask_template.has_value());
    CHECK(*config.mask_template == "[REDACTED:{label}:{hash}]");

    MaskResolver resolver(config);
    CHECK(resolver.resolve("email", 1, "abc") == "[REDACTED:email:ba7816bf]");
}

TEST_CASE("MaskConfig rejects invalid hashing configuration", "[mask]") {
    SECTION("explicit template without {hash}") {
        auto code = errorCodeOf([] { MaskConfig::create("[X]", "[{label}:{n}]", true, "", 8); });
        REQUIRE(code.has_value());
        CHECK(*code == core::RedactErrorCode::CONFIGURATION_ERROR);
    }

    SECTION("hash length out of range") {
        auto too_short = errorCodeOf([] { MaskConfig::create("[X]", "", true, "", 0); });
        auto too_long = errorCodeOf([] { MaskConfig::create("[X]", "", true, "", 65); });
        REQUIRE(too_short.has_value());
        REQUIRE(too_long.has_value());
        CHECK(*too_short == core::RedactErrorCode::CONFIGURATION_ERROR);
        CHECK(*too_long == core::RedactErrorCode::CONFIGURATION_ERROR);
    }

    SECTION("hash length bounds are inclusive") {
        CHECK_FALSE(errorCodeOf([] { MaskConfig::create("[X]", "", true, "", 1); }).has_value());
        CHECK_FALSE(errorCodeOf([] { MaskConfig::create("[X]", "", true, "", 64); }).has_value());
    }

    SECTION("hash length is not checked when hashing is off") {
        CHECK_FALSE(errorCodeOf([] { MaskConfig::create("[X]", "", false, "", 0); }).has_value());
    }
}

TEST_CASE("Template with hash substitutes every placeholder", "[mask]") {
    auto config = MaskConfig::create("[X]", "<{label}#{n}:{hash}:{hash}>", true, "pepper", 6);
    MaskResolver resolver(config);

    std::string fragment = hashFragment("pepper", "jane@example.com", 6);
    CHECK(resolver.resolve("email", 2, "jane@example.com") ==
          "<email#2:" + fragment + ":" + fragment + ">");
}

TEST_CASE("{hash} is left verbatim when hashing is disabled", "[mask]") {
    auto config = MaskConfig::create("[X]", "[{label}:{hash}]", false, "", 8);
    CHECK(MaskResolver(config).resolve("ssn", 1, "123-45-6789") == "[ssn:{hash}]");
}
