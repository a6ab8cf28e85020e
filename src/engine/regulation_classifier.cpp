#include "engine/regulation_classifier.hpp"
#include "core/utils.hpp"

#include <exception>
#include <format>

namespace privguard {

namespace {

KindProfile profile(Sensitivity s, std::initializer_list<Regulation> regs) {
    return KindProfile{s, RegulationSet(regs)};
}

} // anonymous namespace

const RegulationClassifier::KindTable& RegulationClassifier::default_table() {
    using S = Sensitivity;
    using R = Regulation;

    static const KindTable table = {
        // Payment data
        {std::string(kind::kCreditCard),          profile(S::CRITICAL, {R::PCI_DSS})},
        {std::string(kind::kCvv),                 profile(S::CRITICAL, {R::PCI_DSS})},

        // General personal data
        {std::string(kind::kEmail),               profile(S::MEDIUM, {R::GDPR})},
        {std::string(kind::kPhone),               profile(S::HIGH, {R::GDPR})},
        {std::string(kind::kDate),                profile(S::MEDIUM, {R::GDPR})},
        {std::string(kind::kSsn),                 profile(S::HIGH, {R::GDPR})},
        {std::string(kind::kNationalId),          profile(S::HIGH, {R::GDPR})},
        {std::string(kind::kZipCode),             profile(S::MEDIUM, {R::GDPR})},
        {std::string(kind::kIpAddress),           profile(S::MEDIUM, {R::GDPR})},
        {std::string(kind::kUrl),                 profile(S::LOW, {R::GDPR})},
        {std::string(kind::kAccountNumber),       profile(S::HIGH, {R::GDPR})},
        {std::string(kind::kDeviceIdentifier),    profile(S::MEDIUM, {R::GDPR})},
        {std::string(kind::kPersonName),          profile(S::HIGH, {R::GDPR})},
        {std::string(kind::kOrganization),        profile(S::MEDIUM, {R::GDPR})},
        {std::string(kind::kAddress),             profile(S::MEDIUM, {R::GDPR})},
        {std::string(kind::kJobTitle),            profile(S::LOW, {R::GDPR})},

        // Health data
        {std::string(kind::kPatientName),         profile(S::HIGH, {R::HIPAA, R::GDPR})},
        {std::string(kind::kPhysicianName),       profile(S::HIGH, {R::HIPAA, R::GDPR})},
        {std::string(kind::kMedicalDiagnosis),    profile(S::HIGH, {R::HIPAA})},
        {std::string(kind::kMedication),          profile(S::HIGH, {R::HIPAA})},
        {std::string(kind::kMedicalRecordNumber), profile(S::CRITICAL, {R::HIPAA})},
        {std::string(kind::kHealthPlanNumber),    profile(S::HIGH, {R::HIPAA})},
        {std::string(kind::kBiometricIdentifier), profile(S::CRITICAL, {R::HIPAA})},
    };
    return table;
}

RegulationClassifier::RegulationClassifier()
    : table_(default_table()) {}

RegulationClassifier::RegulationClassifier(KindTable table)
    : table_(std::move(table)) {}

void RegulationClassifier::register_kind(const EntityKind& kind, KindProfile profile) {
    table_[kind] = profile;
}

std::optional<KindProfile> RegulationClassifier::lookup(const EntityKind& kind) const {
    const auto it = table_.find(kind);
    if (it == table_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Regulation RegulationClassifier::derive_primary(const std::vector<ClassifiedEntity>& entities) {
    bool hipaa = false;
    for (const auto& ce : entities) {
        if (ce.entity.kind == kind::kCreditCard || ce.entity.kind == kind::kCvv) {
            return Regulation::PCI_DSS;
        }
        hipaa = hipaa || ce.regulations.contains(Regulation::HIPAA);
    }
    return hipaa ? Regulation::HIPAA : Regulation::GDPR;
}

Regulation RegulationClassifier::stricter(Regulation a, Regulation b) {
    // Enumerators are declared in ascending order of restrictiveness
    return static_cast<uint8_t>(a) >= static_cast<uint8_t>(b) ? a : b;
}

ClassificationOutput RegulationClassifier::classify(
    const std::vector<Entity>& entities,
    std::optional<Regulation> regulation_hint,
    IKindClassifier* fallback) const {

    ClassificationOutput output;
    output.entities.reserve(entities.size());

    // Per-run cache for kinds resolved outside the table
    std::unordered_map<EntityKind, KindProfile> resolved;

    auto resolve = [&](const EntityKind& kind) -> KindProfile {
        if (auto row = lookup(kind)) {
            return *row;
        }
        if (const auto it = resolved.find(kind); it != resolved.end()) {
            return it->second;
        }

        KindProfile result{Sensitivity::HIGH, RegulationSet{Regulation::GDPR}};

        if (fallback == nullptr) {
            output.notes.push_back(std::format(
                "kind classifier unavailable; '{}' defaulted to high/GDPR", kind));
        } else {
            try {
                const auto answer = fallback->classify(kind);
                if (answer.is_ok()) {
                    result.sensitivity = answer.value().sensitivity;
                    if (!answer.value().regulations.empty()) {
                        result.regulations = answer.value().regulations;
                    }
                } else {
                    utils::log::warn(std::format("Kind classification failed for '{}': {}",
                        kind, answer.error_message()));
                    output.notes.push_back(std::format(
                        "kind classifier unavailable; '{}' defaulted to high/GDPR", kind));
                }
            } catch (const std::exception& e) {
                utils::log::warn(std::format("Kind classifier threw for '{}': {}", kind, e.what()));
                output.notes.push_back(std::format(
                    "kind classifier unavailable; '{}' defaulted to high/GDPR", kind));
            }
        }

        resolved.emplace(kind, result);
        return result;
    };

    for (const auto& entity : entities) {
        const KindProfile p = resolve(entity.kind);
        output.entities.push_back(ClassifiedEntity{entity, p.sensitivity, p.regulations});
        output.decision.flags.merge(p.regulations);
    }

    const Regulation derived = derive_primary(output.entities);
    output.decision.primary = derived;
    if (regulation_hint) {
        output.decision.flags.insert(*regulation_hint);
        output.decision.primary = stricter(derived, *regulation_hint);
        if (output.decision.primary != *regulation_hint) {
            output.notes.push_back(std::format(
                "regulation hint {} kept as a flag; document requires {}",
                regulation_to_string(*regulation_hint),
                regulation_to_string(output.decision.primary)));
        }
    }
    output.decision.flags.insert(output.decision.primary);

    return output;
}

} // namespace privguard
