#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>

namespace privguard {

/**
 * @brief Single-line JSON for audit rows and run results
 *
 * Audit rows (entity + run summary) never carry entity values; they are
 * the only records written to an IAuditSink. The full result document is
 * the CLI's results.json entry and does include the anonymized text.
 * The Markdown form is the human-readable results.md section.
 */
namespace audit {

[[nodiscard]] std::string serialize_entry(const AuditEntry& entry, std::string_view run_id);

[[nodiscard]] std::string serialize_summary(const DocumentRunSummary& summary);

[[nodiscard]] std::string serialize_result(const ProcessingResult& result,
                                           std::string_view source_name);

/**
 * @brief One results.md section for a processed document
 *
 * Lists regulation, quality status, an entity/technique table, justifications,
 * issues and notes. Entity values never appear; the anonymized text is shown
 * only when the quality gate passed.
 */
[[nodiscard]] std::string serialize_result_markdown(const ProcessingResult& result,
                                                    std::string_view source_name);

} // namespace audit

} // namespace privguard
