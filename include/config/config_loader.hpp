#pragma once

#include "core/types.hpp"
#include "llm/llm_client.hpp"
#include "workflow/workflow_orchestrator.hpp"

#include <toml++/toml.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace privguard {

// ============================================================================
// Section Configs (mirror the TOML hierarchy)
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct AuditConfig {
    bool enabled = true;
    std::string output_file = "privguard_audit.jsonl";
    size_t max_file_size_bytes = 10ULL * 1024 * 1024;
    int max_files = 5;
};

struct AppConfig {
    LoggingConfig logging;
    WorkflowOptions workflow;                 // [workflow], [anonymizer], [planner], [[classifier.kinds]]
    std::vector<EntityKind> keep_kinds = TransformPlanner::default_keep_kinds();
    LlmClient::Config llm;
    AuditConfig audit;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * String values may reference the environment as ${VAR}; unset variables
 * expand to "". Missing sections keep their defaults.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Empty when the config is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

    static constexpr uint32_t kMaxRetriesLimit = 5;

private:
    static AppConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(AppConfig config);

    static LoggingConfig extract_logging(const toml::table& root);
    static uint32_t extract_max_retries(const toml::table& root);
    static AnonymizerConfig extract_anonymizer(const toml::table& root);
    static std::vector<EntityKind> extract_keep_kinds(const toml::table& root);
    static std::vector<PlanningRule> extract_planning_rules(const toml::table& root,
                                                            const std::vector<EntityKind>& keep_kinds);
    static RegulationClassifier::KindTable extract_classifier_kinds(const toml::table& root);
    static LlmClient::Config extract_llm(const toml::table& root);
    static AuditConfig extract_audit(const toml::table& root);
};

} // namespace privguard
