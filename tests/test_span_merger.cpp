#include <catch2/catch_test_macros.hpp>
#include "engine/span_merger.hpp"

#include <string>

using namespace privguard;

namespace {

Entity pattern(std::string_view k, size_t s, size_t e, double conf = 1.0) {
    return Entity(std::string(k), s, e, "", DetectionSource::PATTERN, conf);
}

Entity inferred(std::string_view k, size_t s, size_t e) {
    return Entity(std::string(k), s, e, "", DetectionSource::INFERRED, 0.85);
}

bool disjoint_and_sorted(const std::vector<Entity>& entities) {
    for (size_t i = 1; i < entities.size(); ++i) {
        if (entities[i].start < entities[i - 1].end) return false;
    }
    return true;
}

} // anonymous namespace

// ============================================================================
// Validity
// ============================================================================

TEST_CASE("SpanMerger: span validity", "[span_merger]") {
    CHECK(SpanMerger::is_valid_span(pattern("email", 0, 5), 5));
    CHECK_FALSE(SpanMerger::is_valid_span(pattern("email", 3, 3), 10));
    CHECK_FALSE(SpanMerger::is_valid_span(pattern("email", 4, 2), 10));
    CHECK_FALSE(SpanMerger::is_valid_span(pattern("email", 0, 11), 10));
}

TEST_CASE("SpanMerger: malformed spans are dropped and noted", "[span_merger]") {
    const std::string text = "Call 555-123-4567 now";

    auto result = SpanMerger::merge(text,
        {pattern("phone", 5, 17), pattern("phone", 10, 100)},
        {inferred("person_name", 8, 8)});

    REQUIRE(result.entities.size() == 1);
    CHECK(result.entities[0].start == 5);
    CHECK(result.rejected == 2);
    REQUIRE(result.notes.size() == 2);
    CHECK(result.notes[0].find("malformed span dropped") != std::string::npos);
}

// ============================================================================
// Overlap resolution
// ============================================================================

TEST_CASE("SpanMerger: pattern beats inferred on overlap", "[span_merger]") {
    const std::string text = "Contact jane.doe@example.com today";
    //                        0       8                   28

    SECTION("inferred starts first") {
        auto result = SpanMerger::merge(text,
            {pattern("email", 8, 28)},
            {inferred("person_name", 8, 16)});
        REQUIRE(result.entities.size() == 1);
        CHECK(result.entities[0].kind == "email");
        CHECK(result.entities[0].source == DetectionSource::PATTERN);
    }

    SECTION("inferred span is wider than the pattern span") {
        auto result = SpanMerger::merge(text,
            {pattern("email", 8, 28)},
            {inferred("contact", 0, 34)});
        REQUIRE(result.entities.size() == 1);
        CHECK(result.entities[0].kind == "email");
    }

    SECTION("pattern evicts several inferred spans") {
        auto result = SpanMerger::merge(text,
            {pattern("email", 8, 28)},
            {inferred("person_name", 8, 12), inferred("organization", 17, 24)});
        REQUIRE(result.entities.size() == 1);
        CHECK(result.entities[0].kind == "email");
    }
}

TEST_CASE("SpanMerger: overlapping pattern spans keep the earlier one", "[span_merger]") {
    const std::string text = "0123456789abcdefghij";

    auto result = SpanMerger::merge(text,
        {pattern("zip_code", 2, 7), pattern("phone", 4, 12)},
        {});

    REQUIRE(result.entities.size() == 1);
    CHECK(result.entities[0].kind == "zip_code");
    REQUIRE(result.notes.size() == 1);
    CHECK(result.notes[0].find("pattern conflict") != std::string::npos);
}

TEST_CASE("SpanMerger: identical pattern spans merge to max confidence", "[span_merger]") {
    const std::string text = "4111 1111 1111 1111";

    auto result = SpanMerger::merge(text,
        {pattern("credit_card", 0, 19, 0.7), pattern("credit_card", 0, 19, 0.95)},
        {});

    REQUIRE(result.entities.size() == 1);
    CHECK(result.entities[0].confidence == 0.95);
    CHECK(result.notes.empty());
}

TEST_CASE("SpanMerger: inferred overlapping inferred keeps the first", "[span_merger]") {
    const std::string text = "Dr. Jane Doe at Mercy Hospital";

    auto result = SpanMerger::merge(text, {},
        {inferred("physician_name", 0, 12), inferred("person_name", 4, 12),
         inferred("organization", 16, 30)});

    REQUIRE(result.entities.size() == 2);
    CHECK(result.entities[0].kind == "physician_name");
    CHECK(result.entities[1].kind == "organization");
}

// ============================================================================
// Output shape
// ============================================================================

TEST_CASE("SpanMerger: output is start-sorted, disjoint, and re-sliced", "[span_merger]") {
    const std::string text = "Jane Doe <jane@x.org> paid with 4111 1111 1111 1111 on 12/03/2024";

    std::vector<Entity> pats = {
        pattern("date", 55, 65),
        pattern("email", 10, 20),
        pattern("credit_card", 32, 51),
    };
    std::vector<Entity> infs = {
        inferred("person_name", 0, 8),
        inferred("person_name", 10, 14),
    };
    infs[0].raw_value = "something else";

    auto result = SpanMerger::merge(text, pats, infs);

    REQUIRE(result.entities.size() == 4);
    CHECK(disjoint_and_sorted(result.entities));
    CHECK(result.entities[0].raw_value == "Jane Doe");
    for (const auto& e : result.entities) {
        CHECK(e.raw_value == text.substr(e.start, e.end - e.start));
    }
}

TEST_CASE("SpanMerger: adjacent spans do not overlap", "[span_merger]") {
    const std::string text = "abcdef";

    auto result = SpanMerger::merge(text,
        {pattern("a", 0, 3)},
        {inferred("b", 3, 6)});

    CHECK(result.entities.size() == 2);
}

TEST_CASE("SpanMerger: empty inputs", "[span_merger]") {
    auto result = SpanMerger::merge("", {}, {});
    CHECK(result.entities.empty());
    CHECK(result.notes.empty());
    CHECK(result.rejected == 0);
}
