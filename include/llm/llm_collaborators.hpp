#pragma once

#include "core/collaborators.hpp"
#include "llm/llm_client.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace privguard {

/**
 * @brief Model-backed collaborators.
 *
 * Each adapter turns one LlmClient use case into a collaborator interface.
 * A disabled client, a failed request, or an unparseable reply all surface
 * as COLLABORATOR_UNAVAILABLE. The parse_* functions are pure.
 */

/// Entity extraction; every occurrence of each returned value becomes an entity
class LlmContextualDetector : public IContextualDetector {
public:
    explicit LlmContextualDetector(std::shared_ptr<LlmClient> client);

    [[nodiscard]] Result<std::vector<Entity>> detect(const std::string& text) override;

    [[nodiscard]] static Result<std::vector<Entity>> parse_entities(
        const std::string& content, const std::string& text);

    static constexpr double kInferredConfidence = 0.85;

private:
    std::shared_ptr<LlmClient> client_;
};

class LlmKindClassifier : public IKindClassifier {
public:
    explicit LlmKindClassifier(std::shared_ptr<LlmClient> client);

    [[nodiscard]] Result<KindClassification> classify(const EntityKind& kind) override;

    [[nodiscard]] static Result<KindClassification> parse_classification(const std::string& content);

private:
    std::shared_ptr<LlmClient> client_;
};

/// Returns flagged categories, never values
class LlmResidualPiiChecker : public IResidualPiiChecker {
public:
    explicit LlmResidualPiiChecker(std::shared_ptr<LlmClient> client);

    [[nodiscard]] Result<std::vector<std::string>> check(const std::string& text) override;

    [[nodiscard]] static Result<std::vector<std::string>> parse_residual(const std::string& content);

private:
    std::shared_ptr<LlmClient> client_;
};

/// Drop surrounding ``` / ```json fences from a model reply
[[nodiscard]] std::string strip_code_fences(std::string_view content);

} // namespace privguard
