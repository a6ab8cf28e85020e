#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace privguard {

/**
 * @brief Deterministic, pure detector (regex based in the shipped build).
 *
 * Used twice per run: during ingestion and by the quality gate, so the same
 * implementation must be passed to both.
 */
class IPatternDetector {
public:
    virtual ~IPatternDetector() = default;

    [[nodiscard]] virtual std::vector<Entity> detect(const std::string& text) const = 0;
};

/**
 * @brief Contextual (inference-backed) detector.
 *
 * May block on the network and may fail. Failure is reported as
 * COLLABORATOR_UNAVAILABLE; the pipeline continues with pattern detections.
 */
class IContextualDetector {
public:
    virtual ~IContextualDetector() = default;

    [[nodiscard]] virtual Result<std::vector<Entity>> detect(const std::string& text) = 0;
};

struct KindClassification {
    Sensitivity sensitivity = Sensitivity::HIGH;
    RegulationSet regulations;
};

/// Classifies entity kinds missing from the static table
class IKindClassifier {
public:
    virtual ~IKindClassifier() = default;

    [[nodiscard]] virtual Result<KindClassification> classify(const EntityKind& kind) = 0;
};

/// Regulation-text retrieval used to enrich justifications (best effort)
class ICitationSource {
public:
    virtual ~ICitationSource() = default;

    [[nodiscard]] virtual Result<std::vector<Citation>> fetch(
        Regulation regulation,
        const std::vector<EntityKind>& kinds) = 0;
};

/// Final contextual residual-PII review of anonymized text (best effort)
class IResidualPiiChecker {
public:
    virtual ~IResidualPiiChecker() = default;

    [[nodiscard]] virtual Result<std::vector<std::string>> check(const std::string& text) = 0;
};

/**
 * @brief Collaborator bundle handed to the orchestrator.
 *
 * Only `patterns` is required; null optional collaborators are treated as
 * unavailable.
 */
struct Collaborators {
    std::shared_ptr<IPatternDetector> patterns;
    std::shared_ptr<IContextualDetector> contextual;
    std::shared_ptr<IKindClassifier> kind_classifier;
    std::shared_ptr<ICitationSource> citations;
    std::shared_ptr<IResidualPiiChecker> residual_checker;
};

} // namespace privguard
