#include "engine/span_merger.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace privguard {

namespace {

std::string describe(const Entity& e) {
    return std::format("{} [{}, {}) ({})", e.kind, e.start, e.end, source_to_string(e.source));
}

} // anonymous namespace

bool SpanMerger::is_valid_span(const Entity& entity, size_t text_length) {
    return entity.start < entity.end && entity.end <= text_length;
}

MergeResult SpanMerger::merge(
    const std::string& text,
    std::vector<Entity> pattern,
    std::vector<Entity> inferred) {

    MergeResult result;

    std::vector<Entity> candidates;
    candidates.reserve(pattern.size() + inferred.size());

    auto admit = [&](std::vector<Entity>& list) {
        for (auto& e : list) {
            if (!is_valid_span(e, text.size())) {
                ++result.rejected;
                const auto note = std::format("malformed span dropped: {}", describe(e));
                utils::log::warn(note);
                result.notes.push_back(note);
                continue;
            }
            candidates.push_back(std::move(e));
        }
    };
    admit(pattern);
    admit(inferred);

    std::stable_sort(candidates.begin(), candidates.end(), [](const Entity& a, const Entity& b) {
        if (a.start != b.start) return a.start < b.start;
        if (a.end != b.end) return a.end > b.end;
        return a.source == DetectionSource::PATTERN && b.source == DetectionSource::INFERRED;
    });

    auto& accepted = result.entities;
    accepted.reserve(candidates.size());

    for (auto& candidate : candidates) {
        // Accepted spans are sorted and disjoint, so only the last one can
        // overlap a candidate that starts at or after it.
        while (true) {
            if (accepted.empty() || !accepted.back().span().overlaps(candidate.span())) {
                accepted.push_back(std::move(candidate));
                break;
            }

            Entity& last = accepted.back();

            if (candidate.source == DetectionSource::PATTERN &&
                last.source == DetectionSource::INFERRED) {
                utils::log::debug(std::format("pattern {} evicts {}",
                    describe(candidate), describe(last)));
                accepted.pop_back();
                continue;
            }

            if (candidate.source == DetectionSource::PATTERN &&
                last.source == DetectionSource::PATTERN) {
                if (candidate.start == last.start && candidate.end == last.end &&
                    candidate.kind == last.kind) {
                    last.confidence = std::max(last.confidence, candidate.confidence);
                } else {
                    result.notes.push_back(std::format("pattern conflict: kept {} over {}",
                        describe(last), describe(candidate)));
                }
                break;
            }

            // Inferred candidate overlapping anything accepted
            break;
        }
    }

    for (auto& e : accepted) {
        e.raw_value = text.substr(e.start, e.end - e.start);
    }

    return result;
}

} // namespace privguard
