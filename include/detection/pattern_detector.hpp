#pragma once

#include "core/collaborators.hpp"
#include "core/types.hpp"

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace privguard {

/**
 * @brief Regex-based deterministic detector
 *
 * Structured identifiers only (emails, cards, dates, national IDs, ...).
 * Validated kinds:
 * - credit_card: Luhn checksum
 * - ssn:         area/group/serial sanity checks
 * - phone:       9-15 digits, not embedded in a longer number
 * - cvv:         a standalone 3-4 digit number right after a payment keyword
 *                (within 50 bytes); keywords inside placeholders are ignored
 *
 * Output is sorted by start, ties longest first. Overlapping matches of
 * different kinds are left for the SpanMerger to adjudicate.
 */
class PatternDetector : public IPatternDetector {
public:
    PatternDetector();

    [[nodiscard]] std::vector<Entity> detect(const std::string& text) const override;

    /// Kinds this detector can emit
    [[nodiscard]] std::vector<EntityKind> supported_kinds() const;

    [[nodiscard]] static bool luhn_validate(std::string_view number);
    [[nodiscard]] static bool validate_ssn(std::string_view value);

private:
    using Validator = bool (*)(std::string_view match, const std::string& text, size_t start);

    struct PatternRule {
        EntityKind kind;
        std::regex regex;
        double confidence;
        Validator validator;
    };

    void detect_cvv(const std::string& text, std::vector<Entity>& out) const;

    std::vector<PatternRule> rules_;
    std::regex cvv_digits_regex_;
};

} // namespace privguard
