#pragma once

#include "citation/citation_catalog.hpp"
#include "core/collaborators.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "engine/anonymization_engine.hpp"
#include "engine/quality_gate.hpp"
#include "engine/regulation_classifier.hpp"
#include "engine/transform_planner.hpp"
#include "workflow/workflow_state.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace privguard {

struct WorkflowOptions {
    uint32_t max_retries = 2;
    AnonymizerConfig anonymizer;
    std::vector<PlanningRule> planning_rules = TransformPlanner::default_rules();
    RegulationClassifier::KindTable extra_kinds;    // merged over the default table
};

/**
 * @brief Drives one document through the anonymization state machine
 *
 *   INGEST -> CLASSIFY -> ROUTE -> JUSTIFY -> ANONYMIZE -> QUALITY_CHECK -> DONE
 *                                                 ^              |
 *                                                 +-- escalate --+  (max_retries)
 *
 * Fatal: UNRESOLVED_ENTITY, OFFSET_OUT_OF_BOUNDS, INTERNAL_ERROR.
 * Collaborator failures degrade the run and are recorded in notes.
 *
 * Holds no per-run state; concurrent process() calls are safe when the
 * collaborators are.
 */
class WorkflowOrchestrator {
public:
    /// @throws std::invalid_argument if no pattern detector is supplied
    explicit WorkflowOrchestrator(Collaborators collaborators, WorkflowOptions options = {});

    [[nodiscard]] Result<ProcessingResult> process(
        const std::string& text,
        std::optional<Regulation> regulation_hint = std::nullopt) const;

    [[nodiscard]] static JustificationPath route(const RegulationDecision& decision);

    [[nodiscard]] uint32_t max_retries() const { return options_.max_retries; }

private:
    [[nodiscard]] Result<WorkflowStage> run_stage(WorkflowStage stage, WorkflowState& state) const;

    [[nodiscard]] WorkflowStage ingest(WorkflowState& state) const;
    [[nodiscard]] WorkflowStage classify(WorkflowState& state) const;
    [[nodiscard]] WorkflowStage route_stage(WorkflowState& state) const;
    [[nodiscard]] Result<WorkflowStage> justify(WorkflowState& state) const;
    [[nodiscard]] Result<WorkflowStage> anonymize(WorkflowState& state) const;
    [[nodiscard]] WorkflowStage quality_check(WorkflowState& state) const;

    [[nodiscard]] std::vector<Justification> build_justifications(const WorkflowState& state) const;
    [[nodiscard]] ProcessingResult build_result(WorkflowState& state) const;

    Collaborators collaborators_;
    WorkflowOptions options_;

    RegulationClassifier classifier_;
    TransformPlanner planner_;
    AnonymizationEngine engine_;
    QualityGate gate_;
    CitationCatalog catalog_;
};

} // namespace privguard
