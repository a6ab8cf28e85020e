#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace privguard {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

std::vector<Sensitivity> parse_sensitivities(const std::vector<std::string>& names,
                                             std::string_view where) {
    std::vector<Sensitivity> out;
    for (const auto& name : names) {
        const auto s = parse_sensitivity(name);
        if (!s) {
            throw std::runtime_error(std::format("{}: unknown sensitivity '{}'", where, name));
        }
        out.push_back(*s);
    }
    return out;
}

std::vector<Regulation> parse_regulations(const std::vector<std::string>& names,
                                          std::string_view where) {
    std::vector<Regulation> out;
    for (const auto& name : names) {
        const auto r = parse_regulation(name);
        if (!r) {
            throw std::runtime_error(std::format("{}: unknown regulation '{}'", where, name));
        }
        out.push_back(*r);
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// Section extractors
// ============================================================================

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* l = root["logging"].as_table()) {
        cfg.level = (*l)["level"].value_or("info"s);
    }
    return cfg;
}

uint32_t ConfigLoader::extract_max_retries(const toml::table& root) {
    const auto* w = root["workflow"].as_table();
    if (!w) return 2;
    const int64_t value = (*w)["max_retries"].value_or(int64_t{2});
    if (value < 0) {
        throw std::runtime_error(std::format("workflow.max_retries must be >= 0, got {}", value));
    }
    return static_cast<uint32_t>(value);
}

AnonymizerConfig ConfigLoader::extract_anonymizer(const toml::table& root) {
    AnonymizerConfig cfg;
    const auto* a = root["anonymizer"].as_table();
    if (!a) return cfg;

    cfg.truncate_keep_chars = static_cast<size_t>((*a)["truncate_keep_chars"].value_or(int64_t{4}));
    cfg.truncate_marker = (*a)["truncate_marker"].value_or("[...]"s);
    cfg.mask_width = static_cast<size_t>((*a)["mask_width"].value_or(int64_t{4}));
    cfg.pseudonym_prefix = (*a)["pseudonym_prefix"].value_or("Subject"s);

    const auto mask_char = (*a)["mask_char"].value_or("*"s);
    if (mask_char.size() != 1) {
        throw std::runtime_error(
            std::format("anonymizer.mask_char must be a single character, got '{}'", mask_char));
    }
    cfg.mask_char = mask_char[0];

    const auto style = utils::to_lower((*a)["pseudonym_style"].value_or("counter"s));
    if (style == "counter") {
        cfg.pseudonym_style = PseudonymStyle::COUNTER;
    } else if (style == "hash") {
        cfg.pseudonym_style = PseudonymStyle::HASH;
    } else {
        throw std::runtime_error(
            std::format("anonymizer.pseudonym_style must be 'counter' or 'hash', got '{}'", style));
    }
    return cfg;
}

std::vector<EntityKind> ConfigLoader::extract_keep_kinds(const toml::table& root) {
    const auto* p = root["planner"].as_table();
    if (!p || !(*p)["keep_kinds"].is_array()) {
        return TransformPlanner::default_keep_kinds();
    }
    return toml_string_array(*p, "keep_kinds");
}

std::vector<PlanningRule> ConfigLoader::extract_planning_rules(
    const toml::table& root,
    const std::vector<EntityKind>& keep_kinds) {

    const auto* p = root["planner"].as_table();
    const auto* arr = p ? (*p)["rules"].as_array() : nullptr;
    if (!arr) {
        return TransformPlanner::default_rules(keep_kinds);
    }

    std::vector<PlanningRule> rules;
    size_t index = 0;
    for (const auto& elem : *arr) {
        const auto* tbl = elem.as_table();
        if (!tbl) {
            throw std::runtime_error(std::format("planner.rules[{}] must be a table", index));
        }
        const auto& r = *tbl;

        PlanningRule rule;
        rule.name = r["name"].value_or(std::format("rule_{}", index));
        const auto where = std::format("planner.rules[{}] ({})", index, rule.name);

        const auto technique = r["technique"].value<std::string>();
        if (!technique) {
            throw std::runtime_error(std::format("{}: technique is required", where));
        }
        const auto parsed = parse_technique(*technique);
        if (!parsed) {
            throw std::runtime_error(std::format("{}: unknown technique '{}'", where, *technique));
        }
        rule.technique = *parsed;
        rule.kinds = toml_string_array(r, "kinds");
        rule.sensitivities = parse_sensitivities(toml_string_array(r, "sensitivities"), where);
        rule.regulations = parse_regulations(toml_string_array(r, "regulations"), where);

        rules.push_back(std::move(rule));
        ++index;
    }
    return rules;
}

RegulationClassifier::KindTable ConfigLoader::extract_classifier_kinds(const toml::table& root) {
    RegulationClassifier::KindTable table;

    const auto* c = root["classifier"].as_table();
    const auto* arr = c ? (*c)["kinds"].as_array() : nullptr;
    if (!arr) return table;

    size_t index = 0;
    for (const auto& elem : *arr) {
        const auto* tbl = elem.as_table();
        if (!tbl) {
            throw std::runtime_error(std::format("classifier.kinds[{}] must be a table", index));
        }
        const auto& k = *tbl;
        const auto where = std::format("classifier.kinds[{}]", index);

        const auto kind = k["kind"].value_or(""s);
        if (kind.empty()) {
            throw std::runtime_error(std::format("{}: kind is required", where));
        }
        const auto sensitivity = parse_sensitivity(k["sensitivity"].value_or("high"s));
        if (!sensitivity) {
            throw std::runtime_error(std::format("{}: unknown sensitivity", where));
        }

        KindProfile profile;
        profile.sensitivity = *sensitivity;
        for (const auto r : parse_regulations(toml_string_array(k, "regulations"), where)) {
            profile.regulations.insert(r);
        }
        if (profile.regulations.empty()) {
            profile.regulations.insert(Regulation::GDPR);
        }

        table[kind] = profile;
        ++index;
    }
    return table;
}

LlmClient::Config ConfigLoader::extract_llm(const toml::table& root) {
    LlmClient::Config cfg;
    const auto* l = root["llm"].as_table();
    if (!l) return cfg;
    const auto& s = *l;

    cfg.enabled = s["enabled"].value_or(false);
    cfg.endpoint = s["endpoint"].value_or("https://api.openai.com"s);
    cfg.api_path = s["api_path"].value_or("/v1/chat/completions"s);
    cfg.api_key = s["api_key"].value_or(""s);
    cfg.default_model = s["model"].value_or("gpt-4o-mini"s);
    cfg.json_mode = s["json_mode"].value_or(true);
    cfg.timeout_ms = static_cast<uint32_t>(s["timeout_ms"].value_or(int64_t{30000}));
    cfg.max_retries = static_cast<uint32_t>(s["max_retries"].value_or(int64_t{2}));
    cfg.max_requests_per_minute = static_cast<uint32_t>(
        s["max_requests_per_minute"].value_or(int64_t{60}));
    return cfg;
}

AuditConfig ConfigLoader::extract_audit(const toml::table& root) {
    AuditConfig cfg;
    const auto* a = root["audit"].as_table();
    if (!a) return cfg;

    cfg.enabled = (*a)["enabled"].value_or(true);
    cfg.output_file = (*a)["output_file"].value_or("privguard_audit.jsonl"s);
    cfg.max_file_size_bytes = static_cast<size_t>(
        (*a)["max_file_size_bytes"].value_or(int64_t{10LL * 1024 * 1024}));
    cfg.max_files = static_cast<int>((*a)["max_files"].value_or(int64_t{5}));
    return cfg;
}

// ============================================================================
// Assembly
// ============================================================================

AppConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    AppConfig config;
    config.logging = extract_logging(root);
    config.keep_kinds = extract_keep_kinds(root);
    config.workflow.max_retries = extract_max_retries(root);
    config.workflow.anonymizer = extract_anonymizer(root);
    config.workflow.planning_rules = extract_planning_rules(root, config.keep_kinds);
    config.workflow.extra_kinds = extract_classifier_kinds(root);
    config.llm = extract_llm(root);
    config.audit = extract_audit(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;

    const auto level = utils::to_lower(config.logging.level);
    if (level != "debug" && level != "info" && level != "warn" &&
        level != "warning" && level != "error") {
        errors.push_back(std::format("logging.level must be debug|info|warn|error, got '{}'",
            config.logging.level));
    }

    if (config.workflow.max_retries > kMaxRetriesLimit) {
        errors.push_back(std::format("workflow.max_retries must be 0-{}, got {}",
            kMaxRetriesLimit, config.workflow.max_retries));
    }

    const auto& anon = config.workflow.anonymizer;
    if (anon.truncate_keep_chars == 0) {
        errors.push_back("anonymizer.truncate_keep_chars must be >= 1");
    }
    if (anon.mask_width == 0) {
        errors.push_back("anonymizer.mask_width must be >= 1");
    }
    // Masked output must not rebuild an email, phone or card number
    if (std::isalnum(static_cast<unsigned char>(anon.mask_char)) ||
        std::string_view("._%+-").find(anon.mask_char) != std::string_view::npos) {
        errors.push_back(std::format(
            "anonymizer.mask_char must not be a letter, digit or one of ._%+-, got '{}'",
            anon.mask_char));
    }
    if (anon.pseudonym_prefix.empty()) {
        errors.push_back("anonymizer.pseudonym_prefix must not be empty");
    }

    if (config.workflow.planning_rules.empty()) {
        errors.push_back("planner.rules must contain at least one rule");
    }

    if (config.llm.enabled) {
        if (config.llm.endpoint.empty()) {
            errors.push_back("llm.endpoint required when llm is enabled");
        }
        if (!config.llm.api_path.starts_with('/')) {
            errors.push_back(std::format("llm.api_path must start with '/', got '{}'",
                config.llm.api_path));
        }
        if (config.llm.max_retries > kMaxRetriesLimit) {
            errors.push_back(std::format("llm.max_retries must be 0-{}, got {}",
                kMaxRetriesLimit, config.llm.max_retries));
        }
        if (config.llm.max_requests_per_minute == 0) {
            errors.push_back("llm.max_requests_per_minute must be >= 1");
        }
    }

    if (config.audit.enabled) {
        if (config.audit.output_file.empty()) {
            errors.push_back("audit.output_file required when audit is enabled");
        }
        if (config.audit.max_files < 1) {
            errors.push_back(std::format("audit.max_files must be >= 1, got {}",
                config.audit.max_files));
        }
        if (config.audit.max_file_size_bytes == 0) {
            errors.push_back("audit.max_file_size_bytes must be > 0");
        }
    }

    return errors;
}

} // namespace privguard
