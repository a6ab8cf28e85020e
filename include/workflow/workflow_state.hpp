#pragma once

#include "core/types.hpp"
#include "engine/anonymization_engine.hpp"
#include "engine/quality_gate.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace privguard {

enum class WorkflowStage : uint8_t {
    INGEST,
    CLASSIFY,
    ROUTE,
    JUSTIFY,
    ANONYMIZE,
    QUALITY_CHECK,
    DONE
};

[[nodiscard]] inline const char* workflow_stage_to_string(WorkflowStage stage) {
    switch (stage) {
        case WorkflowStage::INGEST:        return "ingest";
        case WorkflowStage::CLASSIFY:      return "classify";
        case WorkflowStage::ROUTE:         return "route";
        case WorkflowStage::JUSTIFY:       return "justify";
        case WorkflowStage::ANONYMIZE:     return "anonymize";
        case WorkflowStage::QUALITY_CHECK: return "quality_check";
        case WorkflowStage::DONE:          return "done";
    }
    return "done";
}

/// Which regulation's catalogue justifies the plan
enum class JustificationPath : uint8_t {
    GDPR,
    HIPAA,
    PCI_DSS
};

[[nodiscard]] inline Regulation path_regulation(JustificationPath path) {
    switch (path) {
        case JustificationPath::GDPR:    return Regulation::GDPR;
        case JustificationPath::HIPAA:   return Regulation::HIPAA;
        case JustificationPath::PCI_DSS: return Regulation::PCI_DSS;
    }
    return Regulation::GDPR;
}

/**
 * @brief Transition function of the workflow state machine
 *
 * Linear until QUALITY_CHECK, which loops back to ANONYMIZE while the
 * check fails and retries remain. DONE maps to itself.
 */
[[nodiscard]] inline WorkflowStage next_stage(WorkflowStage current,
                                              bool quality_passed,
                                              uint32_t retry_count,
                                              uint32_t max_retries) {
    switch (current) {
        case WorkflowStage::INGEST:    return WorkflowStage::CLASSIFY;
        case WorkflowStage::CLASSIFY:  return WorkflowStage::ROUTE;
        case WorkflowStage::ROUTE:     return WorkflowStage::JUSTIFY;
        case WorkflowStage::JUSTIFY:   return WorkflowStage::ANONYMIZE;
        case WorkflowStage::ANONYMIZE: return WorkflowStage::QUALITY_CHECK;
        case WorkflowStage::QUALITY_CHECK:
            if (quality_passed || retry_count >= max_retries) {
                return WorkflowStage::DONE;
            }
            return WorkflowStage::ANONYMIZE;
        case WorkflowStage::DONE:      return WorkflowStage::DONE;
    }
    return WorkflowStage::DONE;
}

/**
 * @brief Everything one document run accumulates, moved through the stages
 *
 * Owned by a single process() call.
 */
struct WorkflowState {
    std::string run_id;
    std::string text;
    std::optional<Regulation> regulation_hint;

    // INGEST
    std::vector<Entity> entities;

    // CLASSIFY
    RegulationDecision decision;
    std::vector<ClassifiedEntity> classified;

    // ROUTE
    JustificationPath path = JustificationPath::GDPR;

    // JUSTIFY
    TransformationPlan plan;
    std::vector<Citation> citations;
    std::vector<Justification> justifications;

    // ANONYMIZE / QUALITY_CHECK
    std::optional<AnonymizationOutput> anonymized;
    QualityReport quality;
    uint32_t retry_count = 0;

    uint32_t steps = 0;
    std::vector<std::string> notes;
};

} // namespace privguard
