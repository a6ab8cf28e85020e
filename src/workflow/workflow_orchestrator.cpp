#include "workflow/workflow_orchestrator.hpp"
#include "core/utils.hpp"
#include "engine/span_merger.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <format>
#include <stdexcept>

namespace privguard {

namespace {

void add_note(std::vector<std::string>& notes, std::string note) {
    if (std::find(notes.begin(), notes.end(), note) == notes.end()) {
        notes.push_back(std::move(note));
    }
}

const char* path_to_string(JustificationPath path) {
    return regulation_to_string(path_regulation(path));
}

} // anonymous namespace

WorkflowOrchestrator::WorkflowOrchestrator(Collaborators collaborators, WorkflowOptions options)
    : collaborators_(std::move(collaborators)),
      options_(std::move(options)),
      planner_(options_.planning_rules),
      engine_(options_.anonymizer),
      gate_(collaborators_.patterns, collaborators_.residual_checker) {

    if (!collaborators_.patterns) {
        throw std::invalid_argument("WorkflowOrchestrator requires a pattern detector");
    }
    for (const auto& [kind, profile] : options_.extra_kinds) {
        classifier_.register_kind(kind, profile);
    }
}

JustificationPath WorkflowOrchestrator::route(const RegulationDecision& decision) {
    switch (decision.primary) {
        case Regulation::PCI_DSS:
            // Card data next to ordinary personal data follows the GDPR path
            return decision.flags.contains(Regulation::GDPR)
                ? JustificationPath::GDPR
                : JustificationPath::PCI_DSS;
        case Regulation::HIPAA:
            return JustificationPath::HIPAA;
        case Regulation::GDPR:
            return JustificationPath::GDPR;
    }
    return JustificationPath::GDPR;
}

// ============================================================================
// Driver
// ============================================================================

Result<ProcessingResult> WorkflowOrchestrator::process(
    const std::string& text,
    std::optional<Regulation> regulation_hint) const {

    utils::Timer timer;

    WorkflowState state;
    state.run_id = utils::generate_uuid();
    state.text = text;
    state.regulation_hint = regulation_hint;

    // Linear stages + one ANONYMIZE/QUALITY_CHECK pair per attempt
    const uint32_t step_budget = 4 + 2 * (options_.max_retries + 1);

    utils::log::info(std::format("[{}] Processing document ({} bytes)", state.run_id, text.size()));

    try {
        WorkflowStage stage = WorkflowStage::INGEST;
        while (stage != WorkflowStage::DONE) {
            if (++state.steps > step_budget) {
                utils::log::error(std::format("[{}] Step budget ({}) exhausted at {}",
                    state.run_id, step_budget, workflow_stage_to_string(stage)));
                return Result<ProcessingResult>::error(ErrorCategory::INTERNAL_ERROR,
                    std::format("Workflow step budget exhausted at stage {}",
                        workflow_stage_to_string(stage)));
            }

            utils::log::debug(std::format("[{}] Stage {}", state.run_id, workflow_stage_to_string(stage)));

            auto next = run_stage(stage, state);
            if (next.is_error()) {
                utils::log::error(std::format("[{}] {} failed: {}", state.run_id,
                    workflow_stage_to_string(stage), next.error_message()));
                return Result<ProcessingResult>::propagate(next);
            }
            stage = next.value();
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("[{}] Unexpected error: {}", state.run_id, e.what()));
        return Result<ProcessingResult>::error(ErrorCategory::INTERNAL_ERROR, e.what());
    }

    auto result = build_result(state);

    utils::log::info(std::format("[{}] Done in {}ms: regulation={} entities={} quality={} retries={}",
        state.run_id, timer.elapsed_ms().count(), regulation_to_string(result.primary_regulation),
        result.entities.size(), result.quality_passed ? "passed" : "failed", result.retry_count));

    return Result<ProcessingResult>::ok(std::move(result));
}

Result<WorkflowStage> WorkflowOrchestrator::run_stage(WorkflowStage stage, WorkflowState& state) const {
    switch (stage) {
        case WorkflowStage::INGEST:        return Result<WorkflowStage>::ok(ingest(state));
        case WorkflowStage::CLASSIFY:      return Result<WorkflowStage>::ok(classify(state));
        case WorkflowStage::ROUTE:         return Result<WorkflowStage>::ok(route_stage(state));
        case WorkflowStage::JUSTIFY:       return justify(state);
        case WorkflowStage::ANONYMIZE:     return anonymize(state);
        case WorkflowStage::QUALITY_CHECK: return Result<WorkflowStage>::ok(quality_check(state));
        case WorkflowStage::DONE:          return Result<WorkflowStage>::ok(WorkflowStage::DONE);
    }
    return Result<WorkflowStage>::error(ErrorCategory::INTERNAL_ERROR, "Unknown workflow stage");
}

// ============================================================================
// Stages
// ============================================================================

WorkflowStage WorkflowOrchestrator::ingest(WorkflowState& state) const {
    auto pattern_entities = collaborators_.patterns->detect(state.text);

    std::vector<Entity> inferred;
    if (!collaborators_.contextual) {
        add_note(state.notes, "contextual detection unavailable: no detector configured");
    } else {
        try {
            auto detected = collaborators_.contextual->detect(state.text);
            if (detected.is_ok()) {
                inferred = std::move(detected.value());
            } else {
                utils::log::warn(std::format("[{}] Contextual detection unavailable: {}",
                    state.run_id, detected.error_message()));
                add_note(state.notes, std::format("contextual detection unavailable: {}",
                    detected.error_message()));
            }
        } catch (const std::exception& e) {
            utils::log::warn(std::format("[{}] Contextual detector threw: {}", state.run_id, e.what()));
            add_note(state.notes, std::format("contextual detection unavailable: {}", e.what()));
        }
    }

    const size_t pattern_count = pattern_entities.size();
    const size_t inferred_count = inferred.size();

    auto merged = SpanMerger::merge(state.text, std::move(pattern_entities), std::move(inferred));
    for (auto& note : merged.notes) {
        add_note(state.notes, std::move(note));
    }
    state.entities = std::move(merged.entities);

    utils::log::debug(std::format("[{}] Ingest: {} pattern + {} inferred -> {} entities",
        state.run_id, pattern_count, inferred_count, state.entities.size()));

    return next_stage(WorkflowStage::INGEST, false, state.retry_count, options_.max_retries);
}

WorkflowStage WorkflowOrchestrator::classify(WorkflowState& state) const {
    auto output = classifier_.classify(state.entities, state.regulation_hint,
                                       collaborators_.kind_classifier.get());
    state.decision = output.decision;
    state.classified = std::move(output.entities);
    for (auto& note : output.notes) {
        add_note(state.notes, std::move(note));
    }
    return next_stage(WorkflowStage::CLASSIFY, false, state.retry_count, options_.max_retries);
}

WorkflowStage WorkflowOrchestrator::route_stage(WorkflowState& state) const {
    state.path = route(state.decision);
    utils::log::debug(std::format("[{}] Route: primary={} path={}", state.run_id,
        regulation_to_string(state.decision.primary), path_to_string(state.path)));
    return next_stage(WorkflowStage::ROUTE, false, state.retry_count, options_.max_retries);
}

Result<WorkflowStage> WorkflowOrchestrator::justify(WorkflowState& state) const {
    auto plan = planner_.plan(state.classified, state.decision.primary);
    if (plan.is_error()) {
        return Result<WorkflowStage>::propagate(plan);
    }
    state.plan = std::move(plan.value());

    // Citation texts are enrichment only
    if (!collaborators_.citations) {
        add_note(state.notes, "citation source unavailable: no source configured");
    } else if (!state.plan.empty()) {
        std::vector<EntityKind> kinds;
        for (const auto& action : state.plan.actions) {
            const auto& k = action.target.entity.kind;
            if (std::find(kinds.begin(), kinds.end(), k) == kinds.end()) {
                kinds.push_back(k);
            }
        }
        try {
            auto fetched = collaborators_.citations->fetch(path_regulation(state.path), kinds);
            if (fetched.is_ok()) {
                state.citations = std::move(fetched.value());
            } else {
                utils::log::warn(std::format("[{}] Citation source unavailable: {}",
                    state.run_id, fetched.error_message()));
                add_note(state.notes, std::format("citation source unavailable: {}",
                    fetched.error_message()));
            }
        } catch (const std::exception& e) {
            utils::log::warn(std::format("[{}] Citation source threw: {}", state.run_id, e.what()));
            add_note(state.notes, std::format("citation source unavailable: {}", e.what()));
        }
    }

    state.justifications = build_justifications(state);
    return Result<WorkflowStage>::ok(
        next_stage(WorkflowStage::JUSTIFY, false, state.retry_count, options_.max_retries));
}

Result<WorkflowStage> WorkflowOrchestrator::anonymize(WorkflowState& state) const {
    auto output = engine_.apply(state.text, state.plan);
    if (output.is_error()) {
        return Result<WorkflowStage>::propagate(output);
    }
    state.anonymized = std::move(output.value());
    return Result<WorkflowStage>::ok(
        next_stage(WorkflowStage::ANONYMIZE, false, state.retry_count, options_.max_retries));
}

WorkflowStage WorkflowOrchestrator::quality_check(WorkflowState& state) const {
    state.quality = gate_.evaluate(*state.anonymized);
    for (auto& note : state.quality.notes) {
        add_note(state.notes, std::move(note));
    }
    state.quality.notes.clear();

    const auto next = next_stage(WorkflowStage::QUALITY_CHECK, state.quality.passed,
                                 state.retry_count, options_.max_retries);

    if (next == WorkflowStage::ANONYMIZE) {
        ++state.retry_count;
        const auto offending = state.quality.offending_actions();
        utils::log::warn(std::format("[{}] Quality check failed with {} issue(s); retry {}/{} "
            "escalating {} action(s)", state.run_id, state.quality.issues.size(),
            state.retry_count, options_.max_retries, offending.size()));

        state.plan = TransformPlanner::escalate(state.plan, offending);
        state.justifications = build_justifications(state);
    } else if (!state.quality.passed) {
        utils::log::warn(std::format("[{}] Quality check failed after {} retries; {} issue(s) remain",
            state.run_id, state.retry_count, state.quality.issues.size()));
    }

    return next;
}

// ============================================================================
// Helpers
// ============================================================================

std::vector<Justification> WorkflowOrchestrator::build_justifications(const WorkflowState& state) const {
    const Regulation regulation = path_regulation(state.path);

    std::vector<Justification> out;
    out.reserve(state.plan.size());

    for (const auto& action : state.plan.actions) {
        Justification j;
        j.entity_kind = action.target.entity.kind;
        j.technique = action.technique;
        j.regulation = regulation;
        j.article = catalog_.article_for(regulation, j.entity_kind, j.technique);
        j.rationale = CitationCatalog::rationale_for(j.technique);
        for (const auto& citation : state.citations) {
            if (citation.article == j.article) {
                j.citations.push_back(citation);
            }
        }
        out.push_back(std::move(j));
    }
    return out;
}

ProcessingResult WorkflowOrchestrator::build_result(WorkflowState& state) const {
    ProcessingResult result;

    auto& output = *state.anonymized;
    result.anonymized_text = std::move(output.text);
    result.entities = std::move(output.audit);
    result.primary_regulation = state.decision.primary;
    result.regulation_flags = state.decision.flags;
    result.quality_passed = state.quality.passed;
    result.retry_count = state.retry_count;
    result.issues = std::move(state.quality.issues);
    result.justifications = std::move(state.justifications);
    result.notes = std::move(state.notes);

    result.summary.run_id = state.run_id;
    result.summary.completed_at = utils::format_timestamp(std::chrono::system_clock::now());
    result.summary.primary_regulation = result.primary_regulation;
    result.summary.quality_passed = result.quality_passed;
    result.summary.retry_count = result.retry_count;
    result.summary.entity_count = result.entities.size();

    return result;
}

} // namespace privguard
