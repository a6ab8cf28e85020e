#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace privguard {

enum class PseudonymStyle : uint8_t {
    COUNTER,    // Subject-001, Subject-002, ...
    HASH        // Subject-<first 8 hex of SHA-256(kind|normalized value)>
};

struct AnonymizerConfig {
    size_t truncate_keep_chars = 4;
    std::string truncate_marker = "[...]";
    char mask_char = '*';
    size_t mask_width = 4;
    PseudonymStyle pseudonym_style = PseudonymStyle::COUNTER;
    std::string pseudonym_prefix = "Subject";
};

/// Where the replacement for plan action `action_index` sits in the output
struct AppliedSpan {
    size_t action_index = 0;
    size_t out_start = 0;
    size_t out_end = 0;
};

struct AnonymizationOutput {
    std::string text;
    TransformationPlan plan;            // input plan with replacements filled
    std::vector<AuditEntry> audit;      // one per action, plan order
    std::vector<AppliedSpan> applied;   // one per action, plan order
};

/**
 * @brief Applies a TransformationPlan to a document
 *
 * Replacements are computed in reading order and spliced right to left, so
 * earlier offsets stay valid. Pseudonym and token state lives only for one
 * apply() call: the same (text, plan) always yields the same output.
 *
 * Techniques:
 * - REMOVE:       ""
 * - TRUNCATE:     first min(N, chars/2) characters + marker
 * - TOKENIZE:     <KIND_n>, same (kind, value) reuses its token
 * - PSEUDONYMIZE: per (kind, normalized value), counter or hash style
 * - MASK:         email keeps @domain, phone keeps last four digits
 * - GENERALIZE:   date->year, zip->3 digits, address->region, ip->/16
 * - KEEP:         original value
 */
class AnonymizationEngine {
public:
    AnonymizationEngine() = default;
    explicit AnonymizationEngine(AnonymizerConfig config);

    /**
     * @return OFFSET_OUT_OF_BOUNDS when an action's span is outside the
     *         text, empty, or overlaps/precedes the previous action
     */
    [[nodiscard]] Result<AnonymizationOutput> apply(
        const std::string& text,
        const TransformationPlan& plan) const;

    [[nodiscard]] const AnonymizerConfig& config() const { return config_; }

    // Stateless helpers (exposed for testing)
    [[nodiscard]] std::string truncate(std::string_view value) const;
    [[nodiscard]] std::string mask(const EntityKind& kind, std::string_view value) const;
    [[nodiscard]] static std::string generalize(const EntityKind& kind, std::string_view value);
    [[nodiscard]] static std::string hash_hex8(std::string_view input);

private:
    AnonymizerConfig config_;
};

} // namespace privguard
