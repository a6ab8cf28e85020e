#pragma once

#include "core/collaborators.hpp"
#include "core/types.hpp"
#include "engine/anonymization_engine.hpp"

#include <memory>
#include <string>
#include <vector>

namespace privguard {

struct QualityReport {
    bool passed = false;
    std::vector<QualityIssue> issues;
    bool residual_check_available = false;
    std::vector<std::string> notes;

    /// Distinct plan actions implicated by the issues, ascending
    [[nodiscard]] std::vector<size_t> offending_actions() const;
};

/**
 * @brief Post-anonymization leak check
 *
 * 1. Pattern re-detection on the output (KEEP kinds are allowed)
 * 2. Verbatim search for every non-KEEP original value
 * 3. Residual-PII collaborator, best effort
 *
 * Issue descriptions carry kinds and offsets only, never values.
 */
class QualityGate {
public:
    QualityGate(std::shared_ptr<IPatternDetector> patterns,
                std::shared_ptr<IResidualPiiChecker> residual_checker);

    [[nodiscard]] QualityReport evaluate(const AnonymizationOutput& output) const;

private:
    std::shared_ptr<IPatternDetector> patterns_;
    std::shared_ptr<IResidualPiiChecker> residual_checker_;
};

} // namespace privguard
