#include "engine/anonymization_engine.hpp"
#include "core/utils.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <format>
#include <unordered_map>

namespace privguard {

namespace {

// Per-apply() replacement state. Never outlives one call.
struct ReplacementState {
    std::unordered_map<std::string, std::string> tokens;
    std::unordered_map<std::string, size_t> token_counters;
    std::unordered_map<std::string, std::string> pseudonyms;
    size_t pseudonym_counter = 0;
};

std::string category_label(const EntityKind& kind) {
    return std::format("[{}]", utils::to_upper(kind));
}

std::string generalize_date(std::string_view value) {
    // Any four-digit run is taken as the year
    size_t run = 0;
    for (size_t i = 0; i < value.size(); ++i) {
        if (std::isdigit(static_cast<unsigned char>(value[i]))) {
            if (++run == 4 && (i + 1 == value.size() ||
                               !std::isdigit(static_cast<unsigned char>(value[i + 1])))) {
                return std::format("year {}", value.substr(i - 3, 4));
            }
        } else {
            run = 0;
        }
    }

    // MM/YY card expiry
    if (value.size() == 5 && value[2] == '/' &&
        std::isdigit(static_cast<unsigned char>(value[3])) &&
        std::isdigit(static_cast<unsigned char>(value[4]))) {
        return std::format("year 20{}", value.substr(3, 2));
    }
    return category_label(std::string(kind::kDate));
}

std::string generalize_zip(std::string_view value) {
    std::string digits;
    for (const char c : value) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
            if (digits.size() == 3) {
                return digits + "**";
            }
        }
    }
    return category_label(std::string(kind::kZipCode));
}

std::string generalize_address(std::string_view value) {
    const auto comma = value.rfind(',');
    if (comma != std::string_view::npos) {
        auto region = utils::trim(value.substr(comma + 1));
        if (!region.empty()) {
            return region;
        }
    }
    return "[LOCATION]";
}

std::string generalize_ip(std::string_view value) {
    const auto first = value.find('.');
    if (first == std::string_view::npos) {
        return category_label(std::string(kind::kIpAddress));
    }
    const auto second = value.find('.', first + 1);
    if (second == std::string_view::npos) {
        return category_label(std::string(kind::kIpAddress));
    }
    return std::format("{}.x.x", value.substr(0, second));
}

} // anonymous namespace

AnonymizationEngine::AnonymizationEngine(AnonymizerConfig config)
    : config_(std::move(config)) {}

// ============================================================================
// Technique helpers
// ============================================================================

std::string AnonymizationEngine::truncate(std::string_view value) const {
    const size_t keep = std::min(config_.truncate_keep_chars, utils::utf8_length(value) / 2);
    const size_t bytes = utils::utf8_prefix_bytes(value, keep);
    return std::format("{}{}", value.substr(0, bytes), config_.truncate_marker);
}

std::string AnonymizationEngine::mask(const EntityKind& kind, std::string_view value) const {
    const std::string fixed(config_.mask_width, config_.mask_char);

    if (kind == kind::kEmail) {
        const auto at = value.rfind('@');
        if (at == std::string_view::npos) {
            return fixed;
        }
        return std::format("{}{}", fixed, value.substr(at));
    }

    if (kind == kind::kPhone) {
        size_t total_digits = 0;
        for (const char c : value) {
            if (std::isdigit(static_cast<unsigned char>(c))) ++total_digits;
        }
        const size_t visible_from = total_digits > 4 ? total_digits - 4 : 0;

        std::string result(value);
        size_t digit_index = 0;
        for (char& c : result) {
            if (!std::isdigit(static_cast<unsigned char>(c))) continue;
            if (digit_index++ < visible_from) {
                c = config_.mask_char;
            }
        }
        return result;
    }

    return fixed;
}

std::string AnonymizationEngine::generalize(const EntityKind& kind, std::string_view value) {
    if (kind == kind::kDate) return generalize_date(value);
    if (kind == kind::kZipCode) return generalize_zip(value);
    if (kind == kind::kAddress) return generalize_address(value);
    if (kind == kind::kIpAddress) return generalize_ip(value);
    return category_label(kind);
}

std::string AnonymizationEngine::hash_hex8(std::string_view input) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), hash);

    std::string result;
    result.reserve(8);
    for (int i = 0; i < 4; ++i) {
        result += std::format("{:02x}", hash[i]);
    }
    return result;
}

// ============================================================================
// Apply
// ============================================================================

Result<AnonymizationOutput> AnonymizationEngine::apply(
    const std::string& text,
    const TransformationPlan& plan) const {

    // Validate before touching anything
    for (size_t i = 0; i < plan.actions.size(); ++i) {
        const auto& e = plan.actions[i].target.entity;
        if (e.start >= e.end || e.end > text.size()) {
            return Result<AnonymizationOutput>::error(ErrorCategory::OFFSET_OUT_OF_BOUNDS,
                std::format("Action {} ({}) span [{}, {}) invalid for text of {} bytes",
                    i, e.kind, e.start, e.end, text.size()));
        }
        if (i > 0 && e.start < plan.actions[i - 1].target.entity.end) {
            return Result<AnonymizationOutput>::error(ErrorCategory::OFFSET_OUT_OF_BOUNDS,
                std::format("Action {} ({}) at {} overlaps or precedes the previous action",
                    i, e.kind, e.start));
        }
    }

    AnonymizationOutput output;
    output.plan = plan;
    output.audit.reserve(plan.actions.size());
    output.applied.reserve(plan.actions.size());

    ReplacementState state;

    auto replacement_for = [&](const TransformAction& action, std::string_view value) -> std::string {
        const EntityKind& kind = action.target.entity.kind;

        switch (action.technique) {
            case Technique::REMOVE:
                return "";

            case Technique::TRUNCATE:
                return truncate(value);

            case Technique::TOKENIZE: {
                auto key = std::format("{}\x1f{}", kind, value);
                if (const auto it = state.tokens.find(key); it != state.tokens.end()) {
                    return it->second;
                }
                const size_t n = state.token_counters[kind]++;
                auto token = std::format("<{}_{}>", utils::to_upper(kind), n);
                state.tokens.emplace(std::move(key), token);
                return token;
            }

            case Technique::PSEUDONYMIZE: {
                auto key = std::format("{}|{}", kind, utils::normalize_key(value));
                if (const auto it = state.pseudonyms.find(key); it != state.pseudonyms.end()) {
                    return it->second;
                }
                std::string pseudonym;
                if (config_.pseudonym_style == PseudonymStyle::HASH) {
                    pseudonym = std::format("{}-{}", config_.pseudonym_prefix, hash_hex8(key));
                } else {
                    pseudonym = std::format("{}-{:03d}", config_.pseudonym_prefix,
                                            ++state.pseudonym_counter);
                }
                state.pseudonyms.emplace(std::move(key), pseudonym);
                return pseudonym;
            }

            case Technique::MASK:
                return mask(kind, value);

            case Technique::GENERALIZE:
                return generalize(kind, value);

            case Technique::KEEP:
                return std::string(value);
        }
        return "";
    };

    // Reading order: counters and pseudonyms number from the top of the document
    std::ptrdiff_t shift = 0;
    for (size_t i = 0; i < output.plan.actions.size(); ++i) {
        auto& action = output.plan.actions[i];
        const auto& e = action.target.entity;
        const std::string_view value(text.data() + e.start, e.end - e.start);

        action.replacement = replacement_for(action, value);

        const auto out_start = static_cast<size_t>(static_cast<std::ptrdiff_t>(e.start) + shift);
        output.applied.push_back({i, out_start, out_start + action.replacement.size()});
        shift += static_cast<std::ptrdiff_t>(action.replacement.size()) -
                 static_cast<std::ptrdiff_t>(e.end - e.start);

        output.audit.push_back(AuditEntry{
            e.kind,
            action.target.sensitivity,
            action.technique,
            e.span(),
            action.replacement.size(),
            plan.regulation
        });
    }

    // Splice right to left so pending offsets stay valid
    output.text = text;
    for (auto it = output.plan.actions.rbegin(); it != output.plan.actions.rend(); ++it) {
        const auto& e = it->target.entity;
        output.text.replace(e.start, e.end - e.start, it->replacement);
    }

    return Result<AnonymizationOutput>::ok(std::move(output));
}

} // namespace privguard
