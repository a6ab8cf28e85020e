#include "core/types.hpp"
#include "core/utils.hpp"

#include <unordered_map>

namespace privguard {

std::optional<Regulation> parse_regulation(std::string_view name) {
    std::string key = utils::to_upper(utils::trim(name));
    for (char& c : key) {
        if (c == ' ' || c == '-') c = '_';
    }

    static const std::unordered_map<std::string, Regulation> lookup = {
        {"GDPR",    Regulation::GDPR},
        {"HIPAA",   Regulation::HIPAA},
        {"PCI_DSS", Regulation::PCI_DSS},
        {"PCI",     Regulation::PCI_DSS},
    };

    const auto it = lookup.find(key);
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<Sensitivity> parse_sensitivity(std::string_view name) {
    static const std::unordered_map<std::string, Sensitivity> lookup = {
        {"low",      Sensitivity::LOW},
        {"medium",   Sensitivity::MEDIUM},
        {"high",     Sensitivity::HIGH},
        {"critical", Sensitivity::CRITICAL},
    };

    const auto it = lookup.find(utils::to_lower(utils::trim(name)));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<Technique> parse_technique(std::string_view name) {
    static const std::unordered_map<std::string, Technique> lookup = {
        {"remove",       Technique::REMOVE},
        {"truncate",     Technique::TRUNCATE},
        {"tokenize",     Technique::TOKENIZE},
        {"pseudonymize", Technique::PSEUDONYMIZE},
        {"mask",         Technique::MASK},
        {"generalize",   Technique::GENERALIZE},
        {"keep",         Technique::KEEP},
    };

    const auto it = lookup.find(utils::to_lower(utils::trim(name)));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

} // namespace privguard
