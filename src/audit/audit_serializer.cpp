#include "audit/audit_serializer.hpp"
#include "core/utils.hpp"

#include <format>

namespace privguard::audit {

namespace {

std::string regulation_list(const RegulationSet& set) {
    std::string out = "[";
    bool first = true;
    for (const auto r : set.to_vector()) {
        if (!first) out += ',';
        out += std::format("\"{}\"", regulation_to_string(r));
        first = false;
    }
    out += ']';
    return out;
}

std::string entry_fields(const AuditEntry& e) {
    return std::format(
        "\"entity_kind\":\"{}\",\"sensitivity\":\"{}\",\"technique\":\"{}\","
        "\"start\":{},\"end\":{},\"replacement_length\":{},\"regulation\":\"{}\"",
        utils::escape_json(e.entity_kind), sensitivity_to_string(e.sensitivity),
        technique_to_string(e.technique), e.original_span.start, e.original_span.end,
        e.replacement_length, regulation_to_string(e.regulation));
}

/// Table cells cannot hold pipes or line breaks
std::string md_cell(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (const char c : s) {
        if (c == '|') {
            out += "\\|";
        } else if (c == '\n' || c == '\r') {
            out += ' ';
        } else {
            out += c;
        }
    }
    return out;
}

} // anonymous namespace

std::string serialize_entry(const AuditEntry& entry, std::string_view run_id) {
    return std::format("{{\"record\":\"entity\",\"run_id\":\"{}\",{}}}",
        utils::escape_json(run_id), entry_fields(entry));
}

std::string serialize_summary(const DocumentRunSummary& s) {
    return std::format(
        "{{\"record\":\"run\",\"run_id\":\"{}\",\"completed_at\":\"{}\","
        "\"primary_regulation\":\"{}\",\"quality_passed\":{},\"retry_count\":{},"
        "\"entity_count\":{}}}",
        utils::escape_json(s.run_id), s.completed_at, regulation_to_string(s.primary_regulation),
        utils::booltostr(s.quality_passed), s.retry_count, s.entity_count);
}

std::string serialize_result(const ProcessingResult& r, std::string_view source_name) {
    std::string out;
    out.reserve(r.anonymized_text.size() + 1024);

    out += std::format("{{\"source\":\"{}\",\"run_id\":\"{}\",",
        utils::escape_json(source_name), utils::escape_json(r.summary.run_id));
    out += std::format("\"anonymized_text\":\"{}\",", utils::escape_json(r.anonymized_text));
    out += std::format("\"primary_regulation\":\"{}\",\"regulations\":{},",
        regulation_to_string(r.primary_regulation), regulation_list(r.regulation_flags));
    out += std::format("\"quality_passed\":{},\"retry_count\":{},",
        utils::booltostr(r.quality_passed), r.retry_count);

    out += "\"entities\":[";
    for (size_t i = 0; i < r.entities.size(); ++i) {
        if (i > 0) out += ',';
        out += '{';
        out += entry_fields(r.entities[i]);
        out += '}';
    }
    out += "],";

    out += "\"issues\":[";
    for (size_t i = 0; i < r.issues.size(); ++i) {
        const auto& issue = r.issues[i];
        if (i > 0) out += ',';
        out += std::format("{{\"source\":\"{}\",\"kind\":\"{}\",\"description\":\"{}\"",
            issue_source_to_string(issue.source), utils::escape_json(issue.kind),
            utils::escape_json(issue.description));
        if (issue.action_index) {
            out += std::format(",\"action_index\":{}", *issue.action_index);
        }
        out += '}';
    }
    out += "],";

    out += "\"justifications\":[";
    for (size_t i = 0; i < r.justifications.size(); ++i) {
        const auto& j = r.justifications[i];
        if (i > 0) out += ',';
        out += std::format(
            "{{\"entity_kind\":\"{}\",\"technique\":\"{}\",\"regulation\":\"{}\","
            "\"article\":\"{}\",\"rationale\":\"{}\",\"citations\":[",
            utils::escape_json(j.entity_kind), technique_to_string(j.technique),
            regulation_to_string(j.regulation), utils::escape_json(j.article),
            utils::escape_json(j.rationale));
        for (size_t c = 0; c < j.citations.size(); ++c) {
            if (c > 0) out += ',';
            out += std::format("\"{}\"", utils::escape_json(j.citations[c].text));
        }
        out += "]}";
    }
    out += "],";

    out += "\"notes\":[";
    for (size_t i = 0; i < r.notes.size(); ++i) {
        if (i > 0) out += ',';
        out += std::format("\"{}\"", utils::escape_json(r.notes[i]));
    }
    out += "]}";

    return out;
}

std::string serialize_result_markdown(const ProcessingResult& r, std::string_view source_name) {
    std::string out;
    out.reserve(r.anonymized_text.size() + 2048);

    out += std::format("## {} ({})\n\n", md_cell(source_name),
        regulation_to_string(r.primary_regulation));

    std::string flags;
    for (const auto reg : r.regulation_flags.to_vector()) {
        if (!flags.empty()) flags += ", ";
        flags += regulation_to_string(reg);
    }
    out += std::format("- **Run**: {}\n", r.summary.run_id);
    out += std::format("- **Primary regulation**: {}\n", regulation_to_string(r.primary_regulation));
    out += std::format("- **Regulations flagged**: {}\n", flags.empty() ? "none" : flags);
    out += std::format("- **Quality check**: {} after {} retr{}\n\n",
        r.quality_passed ? "passed" : "FAILED", r.retry_count, r.retry_count == 1 ? "y" : "ies");

    // ========================================================================
    // Entities
    // ========================================================================
    out += "### Transformations\n\n";
    if (r.entities.empty()) {
        out += "No entities detected.\n\n";
    } else {
        out += "| # | Entity | Sensitivity | Technique | Span | Regulation |\n";
        out += "|---|--------|-------------|-----------|------|------------|\n";
        for (size_t i = 0; i < r.entities.size(); ++i) {
            const auto& e = r.entities[i];
            out += std::format("| {} | {} | {} | {} | [{}, {}) | {} |\n",
                i + 1, md_cell(e.entity_kind), sensitivity_to_string(e.sensitivity),
                technique_to_string(e.technique), e.original_span.start, e.original_span.end,
                regulation_to_string(e.regulation));
        }
        out += '\n';
    }

    if (!r.justifications.empty()) {
        out += "### Justifications\n\n";
        for (const auto& j : r.justifications) {
            out += std::format("- **{}**: {} under {} ({}). {}\n", md_cell(j.entity_kind),
                technique_to_string(j.technique), regulation_to_string(j.regulation),
                md_cell(j.article), md_cell(j.rationale));
        }
        out += '\n';
    }

    if (!r.issues.empty()) {
        out += "### Open issues\n\n";
        for (const auto& issue : r.issues) {
            out += std::format("- `{}` {}: {}\n", issue_source_to_string(issue.source),
                md_cell(issue.kind), md_cell(issue.description));
        }
        out += '\n';
    }

    if (!r.notes.empty()) {
        out += "### Notes\n\n";
        for (const auto& note : r.notes) {
            out += std::format("- {}\n", md_cell(note));
        }
        out += '\n';
    }

    out += "### Anonymized text\n\n";
    if (r.quality_passed) {
        out += std::format("```\n{}\n```\n", r.anonymized_text);
    } else {
        out += "_Withheld: the quality check did not pass._\n";
    }

    return out;
}

} // namespace privguard::audit
