#include "engine/quality_gate.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <unordered_set>

namespace privguard {

std::vector<size_t> QualityReport::offending_actions() const {
    std::vector<size_t> indices;
    for (const auto& issue : issues) {
        if (issue.action_index) {
            indices.push_back(*issue.action_index);
        }
    }
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
    return indices;
}

QualityGate::QualityGate(std::shared_ptr<IPatternDetector> patterns,
                         std::shared_ptr<IResidualPiiChecker> residual_checker)
    : patterns_(std::move(patterns)),
      residual_checker_(std::move(residual_checker)) {}

QualityReport QualityGate::evaluate(const AnonymizationOutput& output) const {
    QualityReport report;
    const auto& actions = output.plan.actions;

    std::unordered_set<EntityKind> allowed_kinds;
    for (const auto& action : actions) {
        if (action.technique == Technique::KEEP) {
            allowed_kinds.insert(action.target.entity.kind);
        }
    }

    // Replacement region an output span falls in, if any
    auto owning_action = [&](const Span& span) -> std::optional<size_t> {
        for (const auto& applied : output.applied) {
            const Span region{applied.out_start, applied.out_end};
            if (region.length() > 0 && region.overlaps(span)) {
                return applied.action_index;
            }
        }
        return std::nullopt;
    };

    // 1. Pattern re-detection
    if (patterns_) {
        for (const auto& leak : patterns_->detect(output.text)) {
            if (allowed_kinds.contains(leak.kind)) continue;

            QualityIssue issue;
            issue.source = IssueSource::PATTERN_LEAK;
            issue.kind = leak.kind;
            issue.action_index = owning_action(leak.span());
            issue.description = std::format("{} pattern matched output at [{}, {})",
                leak.kind, leak.start, leak.end);
            report.issues.push_back(std::move(issue));
        }
    }

    // 2. Verbatim originals
    for (size_t i = 0; i < actions.size(); ++i) {
        const auto& action = actions[i];
        if (action.technique == Technique::KEEP) continue;

        const auto& raw = action.target.entity.raw_value;
        if (raw.empty()) continue;

        const auto pos = output.text.find(raw);
        if (pos == std::string::npos) continue;

        QualityIssue issue;
        issue.source = IssueSource::VERBATIM_LEAK;
        issue.kind = action.target.entity.kind;
        issue.action_index = i;
        issue.description = std::format("original {} value still present at output offset {}",
            issue.kind, pos);
        report.issues.push_back(std::move(issue));
    }

    // 3. Residual check (best effort)
    if (!residual_checker_) {
        report.notes.emplace_back("residual check unavailable: no checker configured");
    } else {
        try {
            const auto residual = residual_checker_->check(output.text);
            if (residual.is_ok()) {
                report.residual_check_available = true;
                for (const auto& category : residual.value()) {
                    QualityIssue issue;
                    issue.source = IssueSource::RESIDUAL_CHECK;
                    issue.kind = category;
                    issue.description = std::format("residual check flagged possible {}", category);
                    report.issues.push_back(std::move(issue));
                }
            } else {
                utils::log::warn(std::format("Residual PII check unavailable: {}",
                    residual.error_message()));
                report.notes.push_back(std::format("residual check unavailable: {}",
                    residual.error_message()));
            }
        } catch (const std::exception& e) {
            utils::log::warn(std::format("Residual PII checker threw: {}", e.what()));
            report.notes.push_back(std::format("residual check unavailable: {}", e.what()));
        }
    }

    report.passed = report.issues.empty();
    return report;
}

} // namespace privguard
