#pragma once

#include "core/collaborators.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace privguard {

struct KindProfile {
    Sensitivity sensitivity = Sensitivity::HIGH;
    RegulationSet regulations;
};

struct ClassificationOutput {
    RegulationDecision decision;
    std::vector<ClassifiedEntity> entities;
    std::vector<std::string> notes;
};

/**
 * @brief Assigns sensitivity and regulation flags per entity, then derives
 * the document's primary regulation.
 *
 * Primary regulation order is fixed: PCI_DSS > HIPAA > GDPR.
 * - PCI_DSS when any credit_card or cvv entity is present
 * - HIPAA when any entity carries the HIPAA flag
 * - GDPR otherwise (including documents with no entities)
 *
 * A caller hint can only raise the primary along that order, never lower it.
 *
 * Kinds missing from the table go to the IKindClassifier collaborator,
 * cached per classify() call. Unavailable collaborator -> HIGH {GDPR}.
 */
class RegulationClassifier {
public:
    using KindTable = std::unordered_map<EntityKind, KindProfile>;

    RegulationClassifier();
    explicit RegulationClassifier(KindTable table);

    /// Add or replace a table row
    void register_kind(const EntityKind& kind, KindProfile profile);

    [[nodiscard]] std::optional<KindProfile> lookup(const EntityKind& kind) const;

    [[nodiscard]] ClassificationOutput classify(
        const std::vector<Entity>& entities,
        std::optional<Regulation> regulation_hint,
        IKindClassifier* fallback) const;

    [[nodiscard]] static Regulation derive_primary(const std::vector<ClassifiedEntity>& entities);

    /// The more restrictive of two regulations in PCI_DSS > HIPAA > GDPR order
    [[nodiscard]] static Regulation stricter(Regulation a, Regulation b);

    [[nodiscard]] static const KindTable& default_table();

private:
    KindTable table_;
};

} // namespace privguard
