#include "engine/transform_planner.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace privguard {

namespace {

template<typename T>
bool matches_set(const std::vector<T>& set, const T& value) {
    return set.empty() || std::find(set.begin(), set.end(), value) != set.end();
}

} // anonymous namespace

bool PlanningRule::matches(const ClassifiedEntity& entity, Regulation primary) const {
    return matches_set(kinds, entity.entity.kind)
        && matches_set(sensitivities, entity.sensitivity)
        && matches_set(regulations, primary);
}

std::vector<EntityKind> TransformPlanner::default_keep_kinds() {
    return {std::string(kind::kMedicalDiagnosis), std::string(kind::kMedication)};
}

std::vector<PlanningRule> TransformPlanner::default_rules(const std::vector<EntityKind>& keep_kinds) {
    using S = Sensitivity;
    using R = Regulation;

    std::vector<PlanningRule> rules;

    if (!keep_kinds.empty()) {
        rules.push_back({"keep_allow_list", keep_kinds, {}, {}, Technique::KEEP});
    }
    rules.push_back({"hipaa_critical", {}, {S::CRITICAL}, {R::HIPAA}, Technique::REMOVE});
    rules.push_back({"regulated_sensitive", {}, {S::HIGH, S::CRITICAL},
                     {R::PCI_DSS, R::HIPAA}, Technique::TOKENIZE});
    rules.push_back({"structured_contact",
                     {std::string(kind::kEmail), std::string(kind::kPhone)},
                     {}, {}, Technique::MASK});
    rules.push_back({"gdpr_identifier",
                     {std::string(kind::kPersonName), std::string(kind::kPatientName),
                      std::string(kind::kPhysicianName), std::string(kind::kSsn),
                      std::string(kind::kNationalId), std::string(kind::kAccountNumber),
                      std::string(kind::kMedicalRecordNumber),
                      std::string(kind::kHealthPlanNumber),
                      std::string(kind::kDeviceIdentifier)},
                     {}, {R::GDPR}, Technique::PSEUDONYMIZE});
    rules.push_back({"gdpr_sensitive", {}, {S::HIGH, S::CRITICAL}, {R::GDPR},
                     Technique::PSEUDONYMIZE});
    rules.push_back({"quasi_identifier", {}, {S::MEDIUM}, {}, Technique::GENERALIZE});
    rules.push_back({"low_sensitivity", {}, {S::LOW}, {}, Technique::TRUNCATE});

    return rules;
}

TransformPlanner::TransformPlanner()
    : rules_(default_rules()) {}

TransformPlanner::TransformPlanner(std::vector<PlanningRule> rules)
    : rules_(std::move(rules)) {}

Result<TransformationPlan> TransformPlanner::plan(
    const std::vector<ClassifiedEntity>& entities,
    Regulation primary) const {

    TransformationPlan result;
    result.regulation = primary;
    result.actions.reserve(entities.size());

    for (const auto& entity : entities) {
        const auto rule = std::find_if(rules_.begin(), rules_.end(),
            [&](const PlanningRule& r) { return r.matches(entity, primary); });

        if (rule == rules_.end()) {
            return Result<TransformationPlan>::error(ErrorCategory::UNRESOLVED_ENTITY,
                std::format("No planning rule for kind '{}' ({}, {}) at [{}, {})",
                    entity.entity.kind, sensitivity_to_string(entity.sensitivity),
                    regulation_to_string(primary), entity.entity.start, entity.entity.end));
        }

        TransformAction action;
        action.target = entity;
        action.technique = rule->technique;
        action.matched_rule = rule->name;
        result.actions.push_back(std::move(action));
    }

    return Result<TransformationPlan>::ok(std::move(result));
}

TransformationPlan TransformPlanner::escalate(
    const TransformationPlan& plan,
    const std::vector<size_t>& offending) {

    TransformationPlan escalated = plan;
    for (const size_t idx : offending) {
        if (idx >= escalated.actions.size()) continue;

        auto& action = escalated.actions[idx];
        if (action.technique == Technique::KEEP || action.technique == Technique::REMOVE) {
            continue;
        }
        utils::log::debug(std::format("Escalating action {} ({}) from {} to remove",
            idx, action.target.entity.kind, technique_to_string(action.technique)));
        action.technique = Technique::REMOVE;
        action.matched_rule = "escalated";
        action.replacement.clear();
    }
    return escalated;
}

} // namespace privguard
