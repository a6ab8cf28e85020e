#include "audit/audit_serializer.hpp"
#include "audit/file_sink.hpp"
#include "citation/citation_catalog.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "detection/pattern_detector.hpp"
#include "llm/llm_client.hpp"
#include "llm/llm_collaborators.hpp"
#include "workflow/workflow_orchestrator.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace privguard;
namespace fs = std::filesystem;

namespace {

struct CliOptions {
    std::string config_file;
    std::optional<Regulation> regulation;
    std::string output_dir = ".";
    std::vector<std::string> inputs;
};

void print_usage() {
    std::cerr << "usage: privguard [--config FILE] [--regulation GDPR|HIPAA|PCI_DSS|AUTO]\n"
                 "                 [--output-dir DIR] FILE...\n";
}

/// nullopt on a usage error (already reported)
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (arg == "--config") {
            if (!has_value) return std::nullopt;
            opts.config_file = argv[++i];
        } else if (arg == "--regulation") {
            if (!has_value) return std::nullopt;
            const std::string value = argv[++i];
            if (utils::to_upper(value) == "AUTO") {
                opts.regulation.reset();
                continue;
            }
            opts.regulation = parse_regulation(value);
            if (!opts.regulation) {
                utils::log::error(std::format("Unknown regulation '{}'", value));
                return std::nullopt;
            }
        } else if (arg == "--output-dir") {
            if (!has_value) return std::nullopt;
            opts.output_dir = argv[++i];
        } else if (arg.starts_with("--")) {
            utils::log::error(std::format("Unknown option '{}'", arg));
            return std::nullopt;
        } else {
            opts.inputs.push_back(arg);
        }
    }
    if (opts.inputs.empty()) return std::nullopt;
    return opts;
}

std::optional<std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) return false;
    out << content;
    return static_cast<bool>(out);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return 2;
    }

    try {
        // =====================================================================
        // [1/4] Configuration
        // =====================================================================
        AppConfig config;
        if (!opts->config_file.empty()) {
            utils::log::info(std::format("[1/4] Loading configuration from {}", opts->config_file));
            auto loaded = ConfigLoader::load_from_file(opts->config_file);
            if (!loaded.success) {
                utils::log::error(loaded.error_message);
                return 1;
            }
            config = std::move(loaded.config);
        } else {
            utils::log::info("[1/4] No config file given, using defaults");
        }
        utils::log::set_level(utils::log::parse_level(config.logging.level));

        // =====================================================================
        // [2/4] Collaborators
        // =====================================================================
        auto llm = std::make_shared<LlmClient>(config.llm);
        utils::log::info(std::format("[2/4] LLM collaborators: {}",
            llm->is_enabled()
                ? std::format("{} ({})", config.llm.endpoint, config.llm.default_model)
                : std::string("disabled (pattern-only detection)")));

        Collaborators collaborators;
        collaborators.patterns = std::make_shared<PatternDetector>();
        collaborators.contextual = std::make_shared<LlmContextualDetector>(llm);
        collaborators.kind_classifier = std::make_shared<LlmKindClassifier>(llm);
        collaborators.citations = std::make_shared<CitationCatalog>();
        collaborators.residual_checker = std::make_shared<LlmResidualPiiChecker>(llm);

        const WorkflowOrchestrator orchestrator(std::move(collaborators), config.workflow);
        utils::log::info(std::format("[3/4] Workflow: max_retries={}, {} planning rules",
            orchestrator.max_retries(), config.workflow.planning_rules.size()));

        std::unique_ptr<FileSink> audit_sink;
        if (config.audit.enabled) {
            audit_sink = std::make_unique<FileSink>(FileSink::Config{
                config.audit.output_file,
                config.audit.max_file_size_bytes,
                config.audit.max_files});
            utils::log::info(std::format("Audit: writing to {}", config.audit.output_file));
        }

        std::error_code ec;
        fs::create_directories(opts->output_dir, ec);
        if (ec) {
            utils::log::error(std::format("Cannot create output directory {}: {}",
                opts->output_dir, ec.message()));
            return 1;
        }

        // =====================================================================
        // [4/4] Documents
        // =====================================================================
        utils::log::info(std::format("[4/4] Processing {} document(s)", opts->inputs.size()));

        std::vector<std::string> result_docs;
        std::vector<std::string> report_sections;
        size_t failures = 0;

        for (const auto& input : opts->inputs) {
            const fs::path input_path(input);
            const auto text = read_file(input_path);
            if (!text) {
                utils::log::error(std::format("{}: cannot read file", input));
                ++failures;
                continue;
            }

            const auto result = orchestrator.process(*text, opts->regulation);
            if (result.is_error()) {
                utils::log::error(std::format("{}: {} ({})", input,
                    result.error_message(), error_category_to_string(result.error_category())));
                ++failures;
                continue;
            }
            const auto& r = result.value();

            const auto out_path = fs::path(opts->output_dir) /
                (input_path.stem().string() + ".anonymized.txt");
            if (!write_file(out_path, r.anonymized_text)) {
                utils::log::error(std::format("{}: cannot write {}", input, out_path.string()));
                ++failures;
                continue;
            }

            if (audit_sink) {
                bool written = true;
                for (const auto& entry : r.entities) {
                    written = audit_sink->write(audit::serialize_entry(entry, r.summary.run_id)) && written;
                }
                written = audit_sink->write(audit::serialize_summary(r.summary)) && written;
                if (!written) {
                    utils::log::warn(std::format("{}: audit rows not fully written", input));
                }
            }

            result_docs.push_back(audit::serialize_result(r, input_path.filename().string()));
            report_sections.push_back(
                audit::serialize_result_markdown(r, input_path.filename().string()));

            for (const auto& note : r.notes) {
                utils::log::warn(std::format("{}: {}", input, note));
            }
            utils::log::info(std::format("{}: {} entities, {} regime, quality {} after {} retries",
                input, r.entities.size(), regulation_to_string(r.primary_regulation),
                r.quality_passed ? "passed" : "FAILED", r.retry_count));
        }

        if (audit_sink) audit_sink->shutdown();

        std::string results = "[";
        for (size_t i = 0; i < result_docs.size(); ++i) {
            if (i > 0) results += ",\n";
            results += result_docs[i];
        }
        results += "]\n";

        const auto results_path = fs::path(opts->output_dir) / "results.json";
        if (!write_file(results_path, results)) {
            utils::log::error(std::format("Cannot write {}", results_path.string()));
            return 1;
        }

        std::string report = "# PII Anonymization Results\n";
        for (const auto& section : report_sections) {
            report += "\n";
            report += section;
            report += "\n---\n";
        }

        const auto report_path = fs::path(opts->output_dir) / "results.md";
        if (!write_file(report_path, report)) {
            utils::log::error(std::format("Cannot write {}", report_path.string()));
            return 1;
        }
        utils::log::info(std::format("Results written to {} and {}",
            results_path.string(), report_path.string()));

        return failures == 0 ? 0 : 1;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }
}
