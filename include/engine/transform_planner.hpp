#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace privguard {

/**
 * @brief One row of the planning table. Empty sets match anything.
 *
 * `regulations` is matched against the document's primary regulation,
 * not the entity's own flags.
 */
struct PlanningRule {
    std::string name;
    std::vector<EntityKind> kinds;
    std::vector<Sensitivity> sensitivities;
    std::vector<Regulation> regulations;
    Technique technique = Technique::REMOVE;

    [[nodiscard]] bool matches(const ClassifiedEntity& entity, Regulation primary) const;
};

/**
 * @brief Chooses one technique per entity (first matching rule wins)
 *
 * Default table:
 *   keep_allow_list      -> KEEP
 *   hipaa_critical       -> REMOVE
 *   regulated_sensitive  -> TOKENIZE      (HIGH/CRITICAL under PCI_DSS or HIPAA)
 *   structured_contact   -> MASK          (email, phone)
 *   gdpr_identifier      -> PSEUDONYMIZE  (names and identifiers under GDPR)
 *   gdpr_sensitive       -> PSEUDONYMIZE  (HIGH/CRITICAL under GDPR)
 *   quasi_identifier     -> GENERALIZE    (MEDIUM)
 *   low_sensitivity      -> TRUNCATE      (LOW)
 */
class TransformPlanner {
public:
    TransformPlanner();
    explicit TransformPlanner(std::vector<PlanningRule> rules);

    [[nodiscard]] static std::vector<EntityKind> default_keep_kinds();
    [[nodiscard]] static std::vector<PlanningRule> default_rules(
        const std::vector<EntityKind>& keep_kinds = default_keep_kinds());

    /**
     * @brief Build a plan for start-sorted, non-overlapping entities
     * @return UNRESOLVED_ENTITY when an entity matches no rule
     */
    [[nodiscard]] Result<TransformationPlan> plan(
        const std::vector<ClassifiedEntity>& entities,
        Regulation primary) const;

    /// Copy of `plan` with each offending non-KEEP action switched to REMOVE
    [[nodiscard]] static TransformationPlan escalate(
        const TransformationPlan& plan,
        const std::vector<size_t>& offending);

    [[nodiscard]] const std::vector<PlanningRule>& rules() const { return rules_; }

private:
    std::vector<PlanningRule> rules_;
};

} // namespace privguard
