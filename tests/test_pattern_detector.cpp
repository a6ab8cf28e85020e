#include <catch2/catch_test_macros.hpp>
#include "detection/pattern_detector.hpp"

#include <algorithm>
#include <iterator>

using namespace privguard;

namespace {

std::vector<Entity> of_kind(const std::vector<Entity>& entities, std::string_view k) {
    std::vector<Entity> out;
    std::copy_if(entities.begin(), entities.end(), std::back_inserter(out),
                 [&](const Entity& e) { return e.kind == k; });
    return out;
}

} // anonymous namespace

// ============================================================================
// Validators
// ============================================================================

TEST_CASE("PatternDetector: Luhn validation", "[pattern_detector]") {
    CHECK(PatternDetector::luhn_validate("4111111111111111"));
    CHECK(PatternDetector::luhn_validate("4111 1111 1111 1111"));
    CHECK(PatternDetector::luhn_validate("5500-0055-5555-5559"));
    CHECK_FALSE(PatternDetector::luhn_validate("4111111111111112"));
    CHECK_FALSE(PatternDetector::luhn_validate("1234"));
}

TEST_CASE("PatternDetector: SSN sanity checks", "[pattern_detector]") {
    CHECK(PatternDetector::validate_ssn("123-45-6789"));
    CHECK_FALSE(PatternDetector::validate_ssn("000-45-6789"));
    CHECK_FALSE(PatternDetector::validate_ssn("666-45-6789"));
    CHECK_FALSE(PatternDetector::validate_ssn("912-45-6789"));
    CHECK_FALSE(PatternDetector::validate_ssn("123-00-6789"));
    CHECK_FALSE(PatternDetector::validate_ssn("123-45-0000"));
}

// ============================================================================
// Detection
// ============================================================================

TEST_CASE("PatternDetector: structured identifiers", "[pattern_detector]") {
    PatternDetector detector;

    SECTION("email") {
        const std::string text = "Write to jane.doe@example.com today";
        auto found = of_kind(detector.detect(text), "email");
        REQUIRE(found.size() == 1);
        CHECK(found[0].raw_value == "jane.doe@example.com");
        CHECK(found[0].start == 9);
        CHECK(found[0].source == DetectionSource::PATTERN);
    }

    SECTION("credit card requires a valid checksum") {
        auto valid = of_kind(detector.detect("Card 4111 1111 1111 1111."), "credit_card");
        REQUIRE(valid.size() == 1);
        CHECK(valid[0].raw_value == "4111 1111 1111 1111");

        CHECK(of_kind(detector.detect("Card 4111 1111 1111 1112."), "credit_card").empty());
    }

    SECTION("dates in three forms") {
        auto found = of_kind(detector.detect("Born 15/06/1987, admitted 2024-03-12, exp 09/27"),
                             "date");
        REQUIRE(found.size() == 3);
        CHECK(found[0].raw_value == "15/06/1987");
        CHECK(found[1].raw_value == "2024-03-12");
        CHECK(found[2].raw_value == "09/27");
    }

    SECTION("ssn, RUT and ip address") {
        const auto entities = detector.detect(
            "SSN 123-45-6789, RUT 12.345.678-K, from 192.168.1.20");
        CHECK(of_kind(entities, "ssn").size() == 1);
        CHECK(of_kind(entities, "national_id").size() == 1);
        auto ip = of_kind(entities, "ip_address");
        REQUIRE(ip.size() == 1);
        CHECK(ip[0].raw_value == "192.168.1.20");
    }

    SECTION("record and account numbers") {
        const auto entities = detector.detect("mrn: 00123456 and ACCT 123456789012");
        CHECK(of_kind(entities, "medical_record_number").size() == 1);
        CHECK(of_kind(entities, "account_number").size() == 1);
    }

    SECTION("url and device identifier") {
        const auto entities = detector.detect(
            "see https://portal.example.com/p?id=7 from 00:1A:2B:3C:4D:5E");
        CHECK(of_kind(entities, "url").size() == 1);
        CHECK(of_kind(entities, "device_identifier").size() == 1);
    }

    SECTION("phone") {
        auto found = of_kind(detector.detect("Call 555-123-4567 now"), "phone");
        REQUIRE(found.size() == 1);
        CHECK(found[0].raw_value == "555-123-4567");
    }
}

TEST_CASE("PatternDetector: phone does not fire inside card numbers", "[pattern_detector]") {
    PatternDetector detector;
    CHECK(of_kind(detector.detect("4111111111111111"), "phone").empty());
}

TEST_CASE("PatternDetector: CVV needs a nearby payment keyword", "[pattern_detector]") {
    PatternDetector detector;

    SECTION("after a keyword") {
        auto found = of_kind(detector.detect("Card ok, CVV: 123, thanks"), "cvv");
        REQUIRE(found.size() == 1);
        CHECK(found[0].raw_value == "123");
    }

    SECTION("Spanish keyword") {
        auto found = of_kind(detector.detect("c\xc3\xb3" "digo de seguridad 4567"), "cvv");
        CHECK(found.size() == 1);
    }

    SECTION("no keyword, no cvv") {
        CHECK(of_kind(detector.detect("Room 123 is free"), "cvv").empty());
    }

    SECTION("connector words and trailing punctuation") {
        CHECK(of_kind(detector.detect("The security code is 321"), "cvv").size() == 1);
        CHECK(of_kind(detector.detect("CVV2: 1234."), "cvv").size() == 1);
    }

    SECTION("only the number right after the keyword") {
        CHECK(of_kind(detector.detect("CVV unknown, ticket 482 open"), "cvv").empty());
    }

    SECTION("too far from the keyword") {
        const std::string text = "security code follows after a very long digression of words: 321";
        CHECK(of_kind(detector.detect(text), "cvv").empty());
    }
}

TEST_CASE("PatternDetector: anonymized output near a payment keyword is not a CVV",
          "[pattern_detector]") {
    PatternDetector detector;

    SECTION("keyword inside placeholders") {
        CHECK(detector.detect("CVV <CVV_0>, exp year 2025").empty());
        CHECK(detector.detect("[CVV] 123").empty());
        CHECK(detector.detect("<CVV_12> 456").empty());
    }

    SECTION("generalized, masked and truncated values") {
        CHECK(detector.detect("CVV 902** zip").empty());
        CHECK(detector.detect("CVV year 2025").empty());
        CHECK(detector.detect("CVV 4111[...]").empty());
        CHECK(detector.detect("CVV 192.168.x.x").empty());
        CHECK(detector.detect("CVV ***-***-4567").empty());
    }
}

TEST_CASE("PatternDetector: output is sorted by start", "[pattern_detector]") {
    PatternDetector detector;
    const auto entities = detector.detect(
        "a@b.com then 4111111111111111 then 2024-01-01 then c@d.org");

    REQUIRE(entities.size() >= 4);
    for (size_t i = 1; i < entities.size(); ++i) {
        CHECK(entities[i - 1].start <= entities[i].start);
    }
}

TEST_CASE("PatternDetector: supported kinds include cvv", "[pattern_detector]") {
    PatternDetector detector;
    const auto kinds = detector.supported_kinds();
    CHECK(std::find(kinds.begin(), kinds.end(), "cvv") != kinds.end());
    CHECK(std::find(kinds.begin(), kinds.end(), "email") != kinds.end());
}
