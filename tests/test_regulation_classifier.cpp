#include <catch2/catch_test_macros.hpp>
#include "engine/regulation_classifier.hpp"
#include "mocks/mock_collaborators.hpp"

using namespace privguard;
using privguard::testing::MockKindClassifier;

namespace {

Entity make(std::string_view k, size_t s = 0, size_t e = 1) {
    return Entity(std::string(k), s, e, "x", DetectionSource::PATTERN, 1.0);
}

} // anonymous namespace

// ============================================================================
// Table lookup
// ============================================================================

TEST_CASE("RegulationClassifier: default table rows", "[classifier]") {
    RegulationClassifier classifier;

    auto card = classifier.lookup("credit_card");
    REQUIRE(card.has_value());
    CHECK(card->sensitivity == Sensitivity::CRITICAL);
    CHECK(card->regulations.contains(Regulation::PCI_DSS));

    auto patient = classifier.lookup("patient_name");
    REQUIRE(patient.has_value());
    CHECK(patient->regulations.contains(Regulation::HIPAA));
    CHECK(patient->regulations.contains(Regulation::GDPR));

    CHECK_FALSE(classifier.lookup("favourite_colour").has_value());
}

TEST_CASE("RegulationClassifier: register_kind adds and replaces rows", "[classifier]") {
    RegulationClassifier classifier;
    classifier.register_kind("employee_id", {Sensitivity::HIGH, {Regulation::GDPR}});
    classifier.register_kind("email", {Sensitivity::LOW, {Regulation::GDPR}});

    REQUIRE(classifier.lookup("employee_id").has_value());
    CHECK(classifier.lookup("email")->sensitivity == Sensitivity::LOW);
}

// ============================================================================
// Primary regulation
// ============================================================================

TEST_CASE("RegulationClassifier: primary regulation precedence", "[classifier]") {
    RegulationClassifier classifier;

    SECTION("card data makes PCI_DSS primary") {
        auto out = classifier.classify(
            {make("email", 0, 5), make("credit_card", 6, 25), make("patient_name", 26, 30)},
            std::nullopt, nullptr);
        CHECK(out.decision.primary == Regulation::PCI_DSS);
        CHECK(out.decision.flags.contains(Regulation::GDPR));
        CHECK(out.decision.flags.contains(Regulation::HIPAA));
    }

    SECTION("cvv alone is enough for PCI_DSS") {
        auto out = classifier.classify({make("cvv")}, std::nullopt, nullptr);
        CHECK(out.decision.primary == Regulation::PCI_DSS);
    }

    SECTION("HIPAA-flagged entity without card data") {
        auto out = classifier.classify({make("email"), make("medical_record_number", 2, 5)},
                                       std::nullopt, nullptr);
        CHECK(out.decision.primary == Regulation::HIPAA);
    }

    SECTION("plain personal data is GDPR") {
        auto out = classifier.classify({make("person_name"), make("phone", 2, 4)},
                                       std::nullopt, nullptr);
        CHECK(out.decision.primary == Regulation::GDPR);
    }

    SECTION("no entities defaults to GDPR") {
        auto out = classifier.classify({}, std::nullopt, nullptr);
        CHECK(out.decision.primary == Regulation::GDPR);
        CHECK(out.decision.flags.contains(Regulation::GDPR));
        CHECK(out.entities.empty());
    }
}

TEST_CASE("RegulationClassifier: hint raises the primary", "[classifier]") {
    RegulationClassifier classifier;

    auto out = classifier.classify({make("email")}, Regulation::HIPAA, nullptr);
    CHECK(out.decision.primary == Regulation::HIPAA);
    CHECK(out.decision.flags.contains(Regulation::HIPAA));
    CHECK(out.decision.flags.contains(Regulation::GDPR));
    CHECK(out.notes.empty());
}

TEST_CASE("RegulationClassifier: hint never lowers the primary", "[classifier]") {
    RegulationClassifier classifier;

    SECTION("card document hinted as GDPR stays PCI_DSS") {
        auto out = classifier.classify({make("credit_card")}, Regulation::GDPR, nullptr);
        CHECK(out.decision.primary == Regulation::PCI_DSS);
        CHECK(out.decision.flags.contains(Regulation::GDPR));
        REQUIRE(out.notes.size() == 1);
        CHECK(out.notes[0].find("GDPR") != std::string::npos);
    }

    SECTION("card document hinted as HIPAA stays PCI_DSS") {
        auto out = classifier.classify({make("credit_card")}, Regulation::HIPAA, nullptr);
        CHECK(out.decision.primary == Regulation::PCI_DSS);
        CHECK(out.decision.flags.contains(Regulation::HIPAA));
    }
}

TEST_CASE("RegulationClassifier: stricter follows PCI_DSS > HIPAA > GDPR", "[classifier]") {
    CHECK(RegulationClassifier::stricter(Regulation::GDPR, Regulation::HIPAA) == Regulation::HIPAA);
    CHECK(RegulationClassifier::stricter(Regulation::PCI_DSS, Regulation::HIPAA) == Regulation::PCI_DSS);
    CHECK(RegulationClassifier::stricter(Regulation::GDPR, Regulation::GDPR) == Regulation::GDPR);
}

TEST_CASE("RegulationClassifier: every entity gets non-empty regulations", "[classifier]") {
    RegulationClassifier classifier;
    MockKindClassifier fallback;
    fallback.set("pet_name", Sensitivity::LOW, {});

    auto out = classifier.classify({make("email"), make("pet_name", 2, 3), make("mystery", 4, 5)},
                                   std::nullopt, &fallback);
    REQUIRE(out.entities.size() == 3);
    for (const auto& ce : out.entities) {
        CHECK_FALSE(ce.regulations.empty());
    }
    CHECK(out.entities[1].sensitivity == Sensitivity::LOW);
    CHECK(out.entities[1].regulations.contains(Regulation::GDPR));
}

// ============================================================================
// Unknown kinds
// ============================================================================

TEST_CASE("RegulationClassifier: unknown kinds use the fallback once per run", "[classifier]") {
    RegulationClassifier classifier;
    MockKindClassifier fallback;
    fallback.set("insurance_policy", Sensitivity::CRITICAL, {Regulation::HIPAA});

    auto out = classifier.classify(
        {make("insurance_policy", 0, 2), make("insurance_policy", 5, 7)},
        std::nullopt, &fallback);

    CHECK(fallback.call_count() == 1);
    REQUIRE(out.entities.size() == 2);
    CHECK(out.entities[0].sensitivity == Sensitivity::CRITICAL);
    CHECK(out.entities[1].regulations.contains(Regulation::HIPAA));
    CHECK(out.decision.primary == Regulation::HIPAA);
    CHECK(out.notes.empty());
}

TEST_CASE("RegulationClassifier: unavailable fallback defaults to HIGH/GDPR", "[classifier]") {
    RegulationClassifier classifier;

    SECTION("collaborator reports unavailable") {
        MockKindClassifier fallback(false);
        auto out = classifier.classify({make("mystery")}, std::nullopt, &fallback);
        REQUIRE(out.entities.size() == 1);
        CHECK(out.entities[0].sensitivity == Sensitivity::HIGH);
        CHECK(out.entities[0].regulations == RegulationSet{Regulation::GDPR});
        REQUIRE(out.notes.size() == 1);
        CHECK(out.notes[0].find("'mystery' defaulted to high/GDPR") != std::string::npos);
    }

    SECTION("no collaborator at all") {
        auto out = classifier.classify({make("mystery"), make("mystery", 3, 4)},
                                       std::nullopt, nullptr);
        CHECK(out.entities[1].sensitivity == Sensitivity::HIGH);
        CHECK(out.notes.size() == 1);
    }
}

TEST_CASE("RegulationClassifier: known kinds never call the fallback", "[classifier]") {
    RegulationClassifier classifier;
    MockKindClassifier fallback;

    (void)classifier.classify({make("email"), make("ssn", 2, 3)}, std::nullopt, &fallback);
    CHECK(fallback.call_count() == 0);
}
