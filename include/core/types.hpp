#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace privguard {

// ============================================================================
// Basic Enums
// ============================================================================

// Declared in ascending order of restrictiveness
enum class Regulation : uint8_t {
    GDPR,
    HIPAA,
    PCI_DSS
};

enum class Sensitivity : uint8_t {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

enum class DetectionSource : uint8_t {
    PATTERN,
    INFERRED
};

/// Closed set of transformations. Every switch over it is exhaustive.
enum class Technique : uint8_t {
    REMOVE,
    TRUNCATE,
    TOKENIZE,
    PSEUDONYMIZE,
    MASK,
    GENERALIZE,
    KEEP
};

[[nodiscard]] inline const char* regulation_to_string(Regulation r) {
    switch (r) {
        case Regulation::GDPR:    return "GDPR";
        case Regulation::HIPAA:   return "HIPAA";
        case Regulation::PCI_DSS: return "PCI_DSS";
    }
    return "GDPR";
}

[[nodiscard]] inline const char* sensitivity_to_string(Sensitivity s) {
    switch (s) {
        case Sensitivity::LOW:      return "low";
        case Sensitivity::MEDIUM:   return "medium";
        case Sensitivity::HIGH:     return "high";
        case Sensitivity::CRITICAL: return "critical";
    }
    return "high";
}

[[nodiscard]] inline const char* technique_to_string(Technique t) {
    switch (t) {
        case Technique::REMOVE:       return "remove";
        case Technique::TRUNCATE:     return "truncate";
        case Technique::TOKENIZE:     return "tokenize";
        case Technique::PSEUDONYMIZE: return "pseudonymize";
        case Technique::MASK:         return "mask";
        case Technique::GENERALIZE:   return "generalize";
        case Technique::KEEP:         return "keep";
    }
    return "remove";
}

[[nodiscard]] inline const char* source_to_string(DetectionSource s) {
    return s == DetectionSource::PATTERN ? "pattern" : "inferred";
}

/// Accepts "GDPR", "HIPAA", "PCI_DSS", "PCI DSS", "PCI-DSS" (any case)
[[nodiscard]] std::optional<Regulation> parse_regulation(std::string_view name);
[[nodiscard]] std::optional<Sensitivity> parse_sensitivity(std::string_view name);
[[nodiscard]] std::optional<Technique> parse_technique(std::string_view name);

// ============================================================================
// Regulation Set (small bitset, iteration order GDPR, HIPAA, PCI_DSS)
// ============================================================================

class RegulationSet {
public:
    RegulationSet() = default;
    RegulationSet(std::initializer_list<Regulation> regs) {
        for (const auto r : regs) insert(r);
    }

    void insert(Regulation r) { bits_ |= bit(r); }
    void merge(RegulationSet other) { bits_ |= other.bits_; }
    [[nodiscard]] bool contains(Regulation r) const { return (bits_ & bit(r)) != 0; }
    [[nodiscard]] bool empty() const { return bits_ == 0; }

    [[nodiscard]] std::vector<Regulation> to_vector() const {
        std::vector<Regulation> out;
        for (const auto r : {Regulation::GDPR, Regulation::HIPAA, Regulation::PCI_DSS}) {
            if (contains(r)) out.push_back(r);
        }
        return out;
    }

    bool operator==(const RegulationSet&) const = default;

private:
    static constexpr uint8_t bit(Regulation r) {
        return static_cast<uint8_t>(1u << static_cast<unsigned>(r));
    }
    uint8_t bits_ = 0;
};

// ============================================================================
// Entity Kinds
// ============================================================================

// Detectors may emit any tag; these are the ones the pipeline knows about.
using EntityKind = std::string;

namespace kind {
    inline constexpr std::string_view kEmail = "email";
    inline constexpr std::string_view kPhone = "phone";
    inline constexpr std::string_view kCreditCard = "credit_card";
    inline constexpr std::string_view kCvv = "cvv";
    inline constexpr std::string_view kDate = "date";
    inline constexpr std::string_view kSsn = "ssn";
    inline constexpr std::string_view kNationalId = "national_id";
    inline constexpr std::string_view kZipCode = "zip_code";
    inline constexpr std::string_view kIpAddress = "ip_address";
    inline constexpr std::string_view kUrl = "url";
    inline constexpr std::string_view kAccountNumber = "account_number";
    inline constexpr std::string_view kDeviceIdentifier = "device_identifier";
    inline constexpr std::string_view kMedicalRecordNumber = "medical_record_number";
    inline constexpr std::string_view kHealthPlanNumber = "health_plan_number";
    inline constexpr std::string_view kPersonName = "person_name";
    inline constexpr std::string_view kPatientName = "patient_name";
    inline constexpr std::string_view kPhysicianName = "physician_name";
    inline constexpr std::string_view kOrganization = "organization";
    inline constexpr std::string_view kAddress = "address";
    inline constexpr std::string_view kJobTitle = "job_title";
    inline constexpr std::string_view kMedicalDiagnosis = "medical_diagnosis";
    inline constexpr std::string_view kMedication = "medication";
    inline constexpr std::string_view kBiometricIdentifier = "biometric_identifier";
} // namespace kind

// ============================================================================
// Entities
// ============================================================================

/// Half-open byte range [start, end) into the original text
struct Span {
    size_t start = 0;
    size_t end = 0;

    [[nodiscard]] size_t length() const { return end - start; }
    [[nodiscard]] bool overlaps(const Span& other) const {
        return start < other.end && other.start < end;
    }
    bool operator==(const Span&) const = default;
};

struct Entity {
    EntityKind kind;
    size_t start = 0;
    size_t end = 0;
    std::string raw_value;
    DetectionSource source = DetectionSource::PATTERN;
    double confidence = 1.0;

    Entity() = default;
    Entity(EntityKind k, size_t s, size_t e, std::string value,
           DetectionSource src, double conf)
        : kind(std::move(k)), start(s), end(e), raw_value(std::move(value)),
          source(src), confidence(conf) {}

    [[nodiscard]] Span span() const { return {start, end}; }
};

struct ClassifiedEntity {
    Entity entity;
    Sensitivity sensitivity = Sensitivity::HIGH;
    RegulationSet regulations;
};

struct RegulationDecision {
    Regulation primary = Regulation::GDPR;
    RegulationSet flags;
};

// ============================================================================
// Transformation Plan
// ============================================================================

struct TransformAction {
    ClassifiedEntity target;
    Technique technique = Technique::REMOVE;
    std::string matched_rule;   // Planner rule that selected the technique
    std::string replacement;    // Filled at apply time
};

struct TransformationPlan {
    Regulation regulation = Regulation::GDPR;
    std::vector<TransformAction> actions;   // start-ascending, non-overlapping

    [[nodiscard]] bool empty() const { return actions.empty(); }
    [[nodiscard]] size_t size() const { return actions.size(); }
};

// ============================================================================
// Audit Trail
// ============================================================================

/// One row per applied action. Never carries the original value.
struct AuditEntry {
    EntityKind entity_kind;
    Sensitivity sensitivity = Sensitivity::HIGH;
    Technique technique = Technique::REMOVE;
    Span original_span;
    size_t replacement_length = 0;
    Regulation regulation = Regulation::GDPR;
};

/// One row per document run
struct DocumentRunSummary {
    std::string run_id;
    std::string completed_at;
    Regulation primary_regulation = Regulation::GDPR;
    bool quality_passed = false;
    uint32_t retry_count = 0;
    size_t entity_count = 0;
};

// ============================================================================
// Quality Issues
// ============================================================================

enum class IssueSource : uint8_t {
    PATTERN_LEAK,     // Pattern detector re-triggered on the output
    VERBATIM_LEAK,    // Original value still present in the output
    RESIDUAL_CHECK    // Reported by the residual-PII collaborator
};

[[nodiscard]] inline const char* issue_source_to_string(IssueSource s) {
    switch (s) {
        case IssueSource::PATTERN_LEAK:   return "pattern_leak";
        case IssueSource::VERBATIM_LEAK:  return "verbatim_leak";
        case IssueSource::RESIDUAL_CHECK: return "residual_check";
    }
    return "residual_check";
}

struct QualityIssue {
    IssueSource source = IssueSource::PATTERN_LEAK;
    EntityKind kind;
    std::string description;
    std::optional<size_t> action_index;  // Plan action responsible, if known
};

// ============================================================================
// Justification
// ============================================================================

struct Citation {
    Regulation regulation = Regulation::GDPR;
    std::string article;
    std::string text;
};

struct Justification {
    EntityKind entity_kind;
    Technique technique = Technique::REMOVE;
    Regulation regulation = Regulation::GDPR;
    std::string article;
    std::string rationale;
    std::vector<Citation> citations;
};

// ============================================================================
// Pipeline Output
// ============================================================================

struct ProcessingResult {
    std::string anonymized_text;
    std::vector<AuditEntry> entities;
    Regulation primary_regulation = Regulation::GDPR;
    RegulationSet regulation_flags;
    bool quality_passed = false;
    uint32_t retry_count = 0;

    std::vector<QualityIssue> issues;
    std::vector<Justification> justifications;
    std::vector<std::string> notes;   // Degradations absorbed during the run
    DocumentRunSummary summary;
};

} // namespace privguard
