#include "llm/llm_collaborators.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace privguard {

namespace {

constexpr size_t kMaxCategoryLength = 48;

std::string normalize_kind(std::string_view raw) {
    std::string kind = utils::to_lower(utils::trim(raw));
    std::replace(kind.begin(), kind.end(), ' ', '_');
    std::replace(kind.begin(), kind.end(), '-', '_');
    return kind;
}

/// Non-ASCII bytes count as word bytes so "Ana" stays out of "Anaïs"
bool is_word_byte(char c) {
    const auto u = static_cast<unsigned char>(c);
    return u >= 0x80 || std::isalnum(u) || c == '_';
}

/// A hit must not continue a word on either side where the value itself
/// starts or ends with a word byte
bool on_word_boundaries(const std::string& text, const std::string& value, size_t pos) {
    const size_t end = pos + value.size();
    if (is_word_byte(value.front()) && pos > 0 && is_word_byte(text[pos - 1])) {
        return false;
    }
    if (is_word_byte(value.back()) && end < text.size() && is_word_byte(text[end])) {
        return false;
    }
    return true;
}

template<typename T>
Result<T> unavailable(const std::string& what) {
    return Result<T>::error(ErrorCategory::COLLABORATOR_UNAVAILABLE, what);
}

Result<JsonValue> parse_reply(const std::string& content) {
    try {
        return Result<JsonValue>::ok(JsonValue::parse(strip_code_fences(content)));
    } catch (const JsonValue::parse_error&) {
        return unavailable<JsonValue>("model reply is not valid JSON");
    }
}

} // anonymous namespace

std::string strip_code_fences(std::string_view content) {
    std::string body = utils::trim(content);
    if (body.starts_with("```")) {
        const auto newline = body.find('\n');
        body = newline == std::string::npos ? "" : body.substr(newline + 1);
    }
    if (body.ends_with("```")) {
        body.resize(body.size() - 3);
    }
    return utils::trim(body);
}

// ============================================================================
// Contextual detector
// ============================================================================

LlmContextualDetector::LlmContextualDetector(std::shared_ptr<LlmClient> client)
    : client_(std::move(client)) {}

Result<std::vector<Entity>> LlmContextualDetector::detect(const std::string& text) {
    if (!client_ || !client_->is_enabled()) {
        return unavailable<std::vector<Entity>>("LLM client is disabled");
    }

    LlmRequest request;
    request.use_case = LlmUseCase::ENTITY_EXTRACTION;
    request.prompt = "Text:\n" + text;
    request.temperature = 0.0;

    const auto response = client_->complete(request);
    if (!response.success) {
        return unavailable<std::vector<Entity>>(response.error);
    }
    return parse_entities(response.content, text);
}

Result<std::vector<Entity>> LlmContextualDetector::parse_entities(
    const std::string& content, const std::string& text) {

    auto parsed = parse_reply(content);
    if (parsed.is_error()) {
        return Result<std::vector<Entity>>::propagate(parsed);
    }

    JsonValue root = parsed.value();
    if (root.is_object() && root.contains("entities")) {
        root = root["entities"];
    }
    if (!root.is_array()) {
        return unavailable<std::vector<Entity>>("model reply is not an entity array");
    }

    std::vector<Entity> entities;
    for (const auto& item : root.elements()) {
        const auto value = item.value<std::string>("value", "");
        const auto type = normalize_kind(item.value<std::string>("type", ""));
        if (value.empty() || type.empty()) continue;

        // Values the model paraphrased are not in the text and are skipped
        size_t pos = text.find(value);
        while (pos != std::string::npos) {
            if (!on_word_boundaries(text, value, pos)) {
                pos = text.find(value, pos + 1);
                continue;
            }

            const size_t end = pos + value.size();
            const bool seen = std::any_of(entities.begin(), entities.end(), [&](const Entity& e) {
                return e.kind == type && e.start == pos && e.end == end;
            });
            if (!seen) {
                entities.emplace_back(type, pos, end, value, DetectionSource::INFERRED,
                                      kInferredConfidence);
            }
            pos = text.find(value, end);
        }
    }

    std::sort(entities.begin(), entities.end(), [](const Entity& a, const Entity& b) {
        return a.start != b.start ? a.start < b.start : a.end > b.end;
    });
    return Result<std::vector<Entity>>::ok(std::move(entities));
}

// ============================================================================
// Kind classifier
// ============================================================================

LlmKindClassifier::LlmKindClassifier(std::shared_ptr<LlmClient> client)
    : client_(std::move(client)) {}

Result<KindClassification> LlmKindClassifier::classify(const EntityKind& kind) {
    if (!client_ || !client_->is_enabled()) {
        return unavailable<KindClassification>("LLM client is disabled");
    }

    LlmRequest request;
    request.use_case = LlmUseCase::KIND_CLASSIFICATION;
    request.prompt = "Entity category: " + kind;
    request.max_tokens = 256;

    const auto response = client_->complete(request);
    if (!response.success) {
        return unavailable<KindClassification>(response.error);
    }
    return parse_classification(response.content);
}

Result<KindClassification> LlmKindClassifier::parse_classification(const std::string& content) {
    auto parsed = parse_reply(content);
    if (parsed.is_error()) {
        return Result<KindClassification>::propagate(parsed);
    }
    const JsonValue& root = parsed.value();

    const auto sensitivity = parse_sensitivity(root.value<std::string>("sensitivity_level", ""));
    if (!sensitivity) {
        return unavailable<KindClassification>("model reply has no valid sensitivity_level");
    }

    KindClassification result;
    result.sensitivity = *sensitivity;
    for (const auto& reg : root["applicable_regulations"].elements()) {
        if (!reg.is_string()) continue;
        if (const auto r = parse_regulation(reg.get<std::string>())) {
            result.regulations.insert(*r);
        }
    }
    return Result<KindClassification>::ok(result);
}

// ============================================================================
// Residual PII checker
// ============================================================================

LlmResidualPiiChecker::LlmResidualPiiChecker(std::shared_ptr<LlmClient> client)
    : client_(std::move(client)) {}

Result<std::vector<std::string>> LlmResidualPiiChecker::check(const std::string& text) {
    if (!client_ || !client_->is_enabled()) {
        return unavailable<std::vector<std::string>>("LLM client is disabled");
    }

    LlmRequest request;
    request.use_case = LlmUseCase::RESIDUAL_PII_CHECK;
    request.prompt = "Anonymized text:\n" + text;
    request.max_tokens = 512;

    const auto response = client_->complete(request);
    if (!response.success) {
        return unavailable<std::vector<std::string>>(response.error);
    }
    return parse_residual(response.content);
}

Result<std::vector<std::string>> LlmResidualPiiChecker::parse_residual(const std::string& content) {
    auto parsed = parse_reply(content);
    if (parsed.is_error()) {
        return Result<std::vector<std::string>>::propagate(parsed);
    }
    const JsonValue& root = parsed.value();
    if (!root.is_object() || !root["contains_pii"].is_boolean()) {
        return unavailable<std::vector<std::string>>("model reply has no contains_pii flag");
    }

    std::vector<std::string> categories;
    if (!root["contains_pii"].get<bool>()) {
        return Result<std::vector<std::string>>::ok(std::move(categories));
    }

    for (const auto& issue : root["issues"].elements()) {
        if (!issue.is_string()) continue;
        // Categories only; anything longer is likely a quoted value
        auto category = normalize_kind(issue.get<std::string>());
        if (category.empty()) continue;
        if (category.size() > kMaxCategoryLength) {
            category = "unspecified";
        }
        if (std::find(categories.begin(), categories.end(), category) == categories.end()) {
            categories.push_back(std::move(category));
        }
    }
    if (categories.empty()) {
        categories.emplace_back("unspecified");
    }
    return Result<std::vector<std::string>>::ok(std::move(categories));
}

} // namespace privguard
