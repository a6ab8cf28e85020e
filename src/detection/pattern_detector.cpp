#include "detection/pattern_detector.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace privguard {

namespace {

// Payment keywords that make a nearby 3-4 digit number a CVV
constexpr std::array<std::string_view, 5> kCvvKeywords = {
    "cvv", "cvc", "cvv2", "security code", "c\xc3\xb3" "digo de seguridad"
};
constexpr size_t kCvvWindow = 50;

size_t count_digits(std::string_view value) {
    return static_cast<size_t>(std::count_if(value.begin(), value.end(),
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }));
}

bool is_digit_at(const std::string& text, size_t pos) {
    return pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]));
}

bool is_word_or_placeholder_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '<' || c == '[';
}

bool accept_any(std::string_view, const std::string&, size_t) {
    return true;
}

bool validate_card(std::string_view match, const std::string&, size_t) {
    return PatternDetector::luhn_validate(match);
}

bool validate_ssn_match(std::string_view match, const std::string&, size_t) {
    return PatternDetector::validate_ssn(match);
}

bool validate_phone(std::string_view match, const std::string& text, size_t start) {
    // Reject fragments of longer digit runs (card numbers, account numbers)
    if (start > 0 && is_digit_at(text, start - 1)) {
        return false;
    }
    const size_t digits = count_digits(match);
    return digits >= 9 && digits <= 15;
}

} // anonymous namespace

// ============================================================================
// Validators
// ============================================================================

bool PatternDetector::luhn_validate(std::string_view number) {
    std::string digits;
    digits.reserve(number.size());
    for (const char c : number) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
        }
    }

    if (digits.size() < 13 || digits.size() > 19) {
        return false;
    }

    int sum = 0;
    bool double_digit = false;

    for (int i = static_cast<int>(digits.size()) - 1; i >= 0; --i) {
        int digit = digits[static_cast<size_t>(i)] - '0';
        if (double_digit) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        sum += digit;
        double_digit = !double_digit;
    }

    return (sum % 10) == 0;
}

bool PatternDetector::validate_ssn(std::string_view value) {
    std::string digits;
    digits.reserve(9);
    for (const char c : value) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
        }
    }

    if (digits.size() != 9) {
        return false;
    }

    // Area cannot be 000, 666 or 9xx; group cannot be 00; serial cannot be 0000
    const int area = std::stoi(digits.substr(0, 3));
    if (area == 0 || area == 666 || area >= 900) {
        return false;
    }
    if (std::stoi(digits.substr(3, 2)) == 0) {
        return false;
    }
    return std::stoi(digits.substr(5, 4)) != 0;
}

// ============================================================================
// Construction
// ============================================================================

PatternDetector::PatternDetector() {
    const auto icase = std::regex::ECMAScript | std::regex::icase;

    rules_.push_back({std::string(kind::kEmail),
        std::regex(R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)"),
        1.0, &accept_any});

    rules_.push_back({std::string(kind::kCreditCard),
        std::regex(R"(\b\d{4}[\s.-]?\d{4}[\s.-]?\d{4}[\s.-]?\d{4}\b)"),
        1.0, &validate_card});

    rules_.push_back({std::string(kind::kSsn),
        std::regex(R"(\b\d{3}-\d{2}-\d{4}\b)"),
        1.0, &validate_ssn_match});

    // Chilean RUT: 12.345.678-9 / 1.234.567-K
    rules_.push_back({std::string(kind::kNationalId),
        std::regex(R"(\b\d{1,2}\.\d{3}\.\d{3}-[\dkK]\b)"),
        1.0, &accept_any});

    rules_.push_back({std::string(kind::kPhone),
        std::regex(R"((?:\+\d{1,3}[\s.-]?)?\(?\d{2,4}\)?[\s.-]?\d{3,4}[\s.-]?\d{3,4}\b)"),
        0.9, &validate_phone});

    // dd/mm/yyyy, yyyy-mm-dd, and MM/YY card expiry
    rules_.push_back({std::string(kind::kDate),
        std::regex(R"(\b\d{2}/\d{2}/\d{4}\b)"), 1.0, &accept_any});
    rules_.push_back({std::string(kind::kDate),
        std::regex(R"(\b\d{4}-\d{2}-\d{2}\b)"), 1.0, &accept_any});
    rules_.push_back({std::string(kind::kDate),
        std::regex(R"(\b(?:0[1-9]|1[0-2])/\d{2}\b)"), 0.9, &accept_any});

    rules_.push_back({std::string(kind::kZipCode),
        std::regex(R"(\b\d{5}(?:-\d{4})?\b)"),
        0.8, &accept_any});

    rules_.push_back({std::string(kind::kIpAddress),
        std::regex(R"(\b(?:(?:25[0-5]|2[0-4]\d|[01]?\d\d?)\.){3}(?:25[0-5]|2[0-4]\d|[01]?\d\d?)\b)"),
        1.0, &accept_any});

    rules_.push_back({std::string(kind::kUrl),
        std::regex(R"(https?://(?:www\.)?[-a-zA-Z0-9@:%._+~#=]{1,256}\.[a-zA-Z0-9()]{1,6}\b[-a-zA-Z0-9()@:%_+.~#?&/=]*)"),
        1.0, &accept_any});

    rules_.push_back({std::string(kind::kAccountNumber),
        std::regex(R"(\b(?:ACCT|ACC|Account)[\s#:]*\d{8,17}\b)", icase),
        1.0, &accept_any});

    rules_.push_back({std::string(kind::kMedicalRecordNumber),
        std::regex(R"(\bMRN[\s#:]*\d{6,10}\b)", icase),
        1.0, &accept_any});

    rules_.push_back({std::string(kind::kDeviceIdentifier),
        std::regex(R"(\b(?:[0-9A-F]{2}[:-]){5}[0-9A-F]{2}\b|\b(?:SN|Serial)[\s#:]*[A-Z0-9]{8,20}\b)", icase),
        0.9, &accept_any});

    // The number right after the keyword, optionally behind "is"/"number"/"no.";
    // it must stand alone (not 902**, 4111[...] or 192.168.x.x)
    cvv_digits_regex_ = std::regex(
        R"([\s:#=-]*(?:(?:is|es|number|no)\.?[\s:#=]+)?(\d{3,4})(?=$|[\s,;)]|\.(?:\s|$)))",
        icase);
}

std::vector<EntityKind> PatternDetector::supported_kinds() const {
    std::vector<EntityKind> kinds;
    for (const auto& rule : rules_) {
        if (std::find(kinds.begin(), kinds.end(), rule.kind) == kinds.end()) {
            kinds.push_back(rule.kind);
        }
    }
    kinds.emplace_back(kind::kCvv);
    return kinds;
}

// ============================================================================
// Detection
// ============================================================================

std::vector<Entity> PatternDetector::detect(const std::string& text) const {
    std::vector<Entity> entities;

    for (const auto& rule : rules_) {
        auto it = std::sregex_iterator(text.begin(), text.end(), rule.regex);
        const auto end = std::sregex_iterator();
        for (; it != end; ++it) {
            const auto& match = *it;
            if (match.length(0) == 0) continue;

            const auto start = static_cast<size_t>(match.position(0));
            const auto len = static_cast<size_t>(match.length(0));
            const std::string_view value(text.data() + start, len);
            if (!rule.validator(value, text, start)) continue;

            entities.emplace_back(rule.kind, start, start + len, std::string(value),
                                  DetectionSource::PATTERN, rule.confidence);
        }
    }

    detect_cvv(text, entities);

    std::sort(entities.begin(), entities.end(), [](const Entity& a, const Entity& b) {
        if (a.start != b.start) return a.start < b.start;
        if (a.end != b.end) return a.end > b.end;
        return a.kind < b.kind;
    });
    return entities;
}

void PatternDetector::detect_cvv(const std::string& text, std::vector<Entity>& out) const {
    const std::string lower = utils::to_lower(text);

    for (const auto keyword : kCvvKeywords) {
        size_t pos = lower.find(keyword);
        for (; pos != std::string::npos; pos = lower.find(keyword, pos + keyword.size())) {
            // Keywords inside placeholders (<CVV_0>, [CVV]) or longer words do not count
            if (pos > 0 && is_word_or_placeholder_char(lower[pos - 1])) continue;

            const auto after = text.cbegin() + static_cast<std::ptrdiff_t>(pos + keyword.size());
            std::smatch match;
            if (!std::regex_search(after, text.cend(), match, cvv_digits_regex_,
                                   std::regex_constants::match_continuous)) {
                continue;
            }

            const size_t start = static_cast<size_t>(match[1].first - text.cbegin());
            const size_t end = static_cast<size_t>(match[1].second - text.cbegin());
            if (end - pos > kCvvWindow) continue;

            const bool seen = std::any_of(out.begin(), out.end(), [&](const Entity& e) {
                return e.kind == kind::kCvv && e.start == start && e.end == end;
            });
            if (!seen) {
                out.emplace_back(std::string(kind::kCvv), start, end,
                                 text.substr(start, end - start),
                                 DetectionSource::PATTERN, 0.95);
            }
        }
    }
}

} // namespace privguard
