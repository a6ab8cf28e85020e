#include <catch2/catch_test_macros.hpp>
#include "core/json.hpp"
#include "llm/llm_client.hpp"
#include "llm/llm_collaborators.hpp"

#include <memory>

using namespace privguard;

static LlmClient::Config enabled_config() {
    LlmClient::Config cfg;
    cfg.enabled = true;
    cfg.endpoint = "http://127.0.0.1:9";
    cfg.api_key = "test-key";
    cfg.timeout_ms = 500;
    cfg.max_retries = 0;
    cfg.max_requests_per_minute = 2;
    return cfg;
}

// ============================================================================
// LlmClient
// ============================================================================

TEST_CASE("LlmClient", "[llm]") {

    SECTION("Disabled returns error") {
        LlmClient client;
        REQUIRE_FALSE(client.is_enabled());

        LlmRequest req;
        req.prompt = "text";
        auto resp = client.complete(req);
        REQUIRE_FALSE(resp.success);
        CHECK(resp.error == "LLM client is disabled");
        CHECK(client.get_stats().total_requests == 1);
        CHECK(client.get_stats().api_calls == 0);
    }

    SECTION("Missing API key fails before any network call") {
        auto cfg = enabled_config();
        cfg.api_key.clear();
        LlmClient client(cfg);

        auto resp = client.complete(LlmRequest{});
        REQUIRE_FALSE(resp.success);
        CHECK(resp.error.find("API key") != std::string::npos);
        CHECK(client.get_stats().api_errors == 1);
    }

    SECTION("Rate limiting") {
        auto cfg = enabled_config();
        cfg.api_key.clear();
        LlmClient client(cfg);

        (void)client.complete(LlmRequest{});
        (void)client.complete(LlmRequest{});
        auto third = client.complete(LlmRequest{});
        REQUIRE_FALSE(third.success);
        CHECK(third.error.find("Rate limited") != std::string::npos);
        CHECK(client.get_stats().rate_limited == 1);
    }

    SECTION("System prompts per use case") {
        CHECK(LlmClient::get_system_prompt(LlmUseCase::ENTITY_EXTRACTION).find("JSON")
              != std::string::npos);
        CHECK(LlmClient::get_system_prompt(LlmUseCase::KIND_CLASSIFICATION).find("sensitivity_level")
              != std::string::npos);
        CHECK(LlmClient::get_system_prompt(LlmUseCase::RESIDUAL_PII_CHECK).find("contains_pii")
              != std::string::npos);
    }

    SECTION("Rejected requests do not take window slots") {
        auto cfg = enabled_config();
        cfg.api_key.clear();
        LlmClient client(cfg);
        for (int i = 0; i < 5; ++i) {
            (void)client.complete(LlmRequest{});
        }
        const auto stats = client.get_stats();
        CHECK(stats.total_requests == 5);
        CHECK(stats.rate_limited == 3);
        CHECK(stats.api_errors == 2);
        CHECK(stats.api_calls == 0);
    }
}

TEST_CASE("LlmClient: request body", "[llm]") {
    LlmRequest req;
    req.use_case = LlmUseCase::RESIDUAL_PII_CHECK;
    req.prompt = "Line \"one\"\nline two";
    req.max_tokens = 512;

    SECTION("chat-completions shape with JSON mode") {
        LlmClient client(enabled_config());
        const auto body = JsonValue::parse(client.request_body(req));
        CHECK(body.value<std::string>("model", "") == "gpt-4o-mini");
        CHECK(body.value<int>("max_tokens", 0) == 512);

        const auto messages = body["messages"].elements();
        REQUIRE(messages.size() == 2);
        CHECK(messages[0].value<std::string>("role", "") == "system");
        CHECK(messages[0].value<std::string>("content", "").find("contains_pii")
              != std::string::npos);
        CHECK(messages[1].value<std::string>("content", "") == "Line \"one\"\nline two");
        CHECK(body["response_format"].value<std::string>("type", "") == "json_object");
    }

    SECTION("explicit model and no JSON mode") {
        auto cfg = enabled_config();
        cfg.json_mode = false;
        LlmClient client(cfg);
        req.model = "llama-3.1-70b-versatile";

        const auto body = JsonValue::parse(client.request_body(req));
        CHECK(body.value<std::string>("model", "") == "llama-3.1-70b-versatile");
        CHECK_FALSE(body.contains("response_format"));
    }
}

TEST_CASE("LlmClient: content extraction", "[llm]") {
    SECTION("first choice message content") {
        const std::string body =
            R"({"id":"x","choices":[{"message":{"role":"assistant","content":"{\"entities\":[]}"}}]})";
        const auto content = LlmClient::extract_content(body);
        REQUIRE(content.has_value());
        CHECK(*content == R"({"entities":[]})");
    }

    SECTION("bodies without message content") {
        CHECK_FALSE(LlmClient::extract_content(R"({"choices":[]})").has_value());
        CHECK_FALSE(LlmClient::extract_content(
            R"({"choices":[{"message":{"content":null}}]})").has_value());
        CHECK_FALSE(LlmClient::extract_content(R"({"error":{"message":"bad key"}})").has_value());
        CHECK_FALSE(LlmClient::extract_content("<html>502</html>").has_value());
    }
}

// ============================================================================
// Adapters over a disabled client
// ============================================================================

TEST_CASE("LLM adapters report unavailable when the client is disabled", "[llm]") {
    auto client = std::make_shared<LlmClient>();

    LlmContextualDetector detector(client);
    auto entities = detector.detect("Jane Doe");
    REQUIRE(entities.is_error());
    CHECK(entities.error_category() == ErrorCategory::COLLABORATOR_UNAVAILABLE);

    LlmKindClassifier classifier(client);
    auto kind = classifier.classify("pet_name");
    REQUIRE(kind.is_error());
    CHECK(kind.error_category() == ErrorCategory::COLLABORATOR_UNAVAILABLE);

    LlmResidualPiiChecker checker(nullptr);
    auto residual = checker.check("text");
    REQUIRE(residual.is_error());
    CHECK(residual.error_category() == ErrorCategory::COLLABORATOR_UNAVAILABLE);
}

// ============================================================================
// Reply parsing
// ============================================================================

TEST_CASE("strip_code_fences", "[llm]") {
    CHECK(strip_code_fences("```json\n[1, 2]\n```") == "[1, 2]");
    CHECK(strip_code_fences("  {\"a\": 1}  ") == "{\"a\": 1}");
    CHECK(strip_code_fences("```\n{}\n```") == "{}");
}

TEST_CASE("LlmContextualDetector: parse_entities", "[llm]") {
    const std::string text = "Dr. Ana Ruiz saw Ana Ruiz's brother at Clinica Sur.";

    SECTION("every occurrence of a value becomes an entity") {
        auto parsed = LlmContextualDetector::parse_entities(
            R"([{"value": "Ana Ruiz", "type": "Person Name"},
                {"value": "Clinica Sur", "type": "organization"}])", text);
        REQUIRE(parsed.is_ok());
        const auto& entities = parsed.value();
        REQUIRE(entities.size() == 3);
        CHECK(entities[0].kind == "person_name");
        CHECK(entities[0].start == 4);
        CHECK(entities[1].start == 17);
        CHECK(entities[2].kind == "organization");
        CHECK(entities[0].source == DetectionSource::INFERRED);
        CHECK(entities[0].confidence == LlmContextualDetector::kInferredConfidence);
    }

    SECTION("wrapped object form and fenced reply") {
        auto parsed = LlmContextualDetector::parse_entities(
            "```json\n{\"entities\": [{\"value\": \"Clinica Sur\", \"type\": \"organization\"}]}\n```",
            text);
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value().size() == 1);
    }

    SECTION("paraphrased values are skipped") {
        auto parsed = LlmContextualDetector::parse_entities(
            R"([{"value": "Ana R.", "type": "person_name"}, {"value": "", "type": "x"}])", text);
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value().empty());
    }

    SECTION("values only match as whole words") {
        const std::string chart = "Ana takes Anastrozole; ask Ana_B or Banana. Ana.";
        auto parsed = LlmContextualDetector::parse_entities(
            R"([{"value": "Ana", "type": "person_name"}])", chart);
        REQUIRE(parsed.is_ok());
        const auto& entities = parsed.value();
        REQUIRE(entities.size() == 2);
        CHECK(entities[0].start == 0);
        CHECK(entities[1].start == chart.rfind("Ana"));
        CHECK(entities[1].end == chart.size() - 1);
    }

    SECTION("accented letters continue a word") {
        auto parsed = LlmContextualDetector::parse_entities(
            R"([{"value": "Ana", "type": "person_name"}])", "Ana\xc3\xafs came in");
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value().empty());
    }

    SECTION("punctuated values match next to words") {
        const std::string line = "call(555) 010-9999 today";
        auto parsed = LlmContextualDetector::parse_entities(
            R"([{"value": "(555) 010-9999", "type": "phone"}])", line);
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.value().size() == 1);
        CHECK(parsed.value()[0].start == 4);
    }

    SECTION("non-JSON reply is unavailable") {
        auto parsed = LlmContextualDetector::parse_entities("I found Ana Ruiz.", text);
        REQUIRE(parsed.is_error());
        CHECK(parsed.error_category() == ErrorCategory::COLLABORATOR_UNAVAILABLE);
    }
}

TEST_CASE("LlmKindClassifier: parse_classification", "[llm]") {
    SECTION("valid reply") {
        auto parsed = LlmKindClassifier::parse_classification(
            R"({"sensitivity_level": "critical", "applicable_regulations": ["HIPAA", "PCI DSS", "CCPA"]})");
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value().sensitivity == Sensitivity::CRITICAL);
        CHECK(parsed.value().regulations.contains(Regulation::HIPAA));
        CHECK(parsed.value().regulations.contains(Regulation::PCI_DSS));
        CHECK_FALSE(parsed.value().regulations.contains(Regulation::GDPR));
    }

    SECTION("missing sensitivity") {
        auto parsed = LlmKindClassifier::parse_classification(R"({"applicable_regulations": []})");
        REQUIRE(parsed.is_error());
    }
}

TEST_CASE("LlmResidualPiiChecker: parse_residual", "[llm]") {
    SECTION("clean") {
        auto parsed = LlmResidualPiiChecker::parse_residual(R"({"contains_pii": false, "issues": []})");
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value().empty());
    }

    SECTION("categories are normalized and de-duplicated") {
        auto parsed = LlmResidualPiiChecker::parse_residual(
            R"({"contains_pii": true, "issues": ["Person Name", "person-name", "address"]})");
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value() == std::vector<std::string>{"person_name", "address"});
    }

    SECTION("long entries look like quoted values and are replaced") {
        auto parsed = LlmResidualPiiChecker::parse_residual(
            R"({"contains_pii": true, "issues": ["the name Jane Doe still appears in the second paragraph"]})");
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value() == std::vector<std::string>{"unspecified"});
    }

    SECTION("flagged without issues") {
        auto parsed = LlmResidualPiiChecker::parse_residual(R"({"contains_pii": true})");
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value() == std::vector<std::string>{"unspecified"});
    }

    SECTION("missing flag") {
        auto parsed = LlmResidualPiiChecker::parse_residual(R"({"issues": ["x"]})");
        REQUIRE(parsed.is_error());
        CHECK(parsed.error_category() == ErrorCategory::COLLABORATOR_UNAVAILABLE);
    }
}
