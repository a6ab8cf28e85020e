#pragma once

#include "core/types.hpp"

#include <string>
#include <vector>

namespace privguard {

struct MergeResult {
    std::vector<Entity> entities;       // start-sorted, non-overlapping
    std::vector<std::string> notes;     // rejected spans and pattern conflicts
    size_t rejected = 0;
};

/**
 * @brief Reconciles pattern and inferred detections into one span set
 *
 * Pattern detections always win an overlap against inferred ones. Two
 * overlapping pattern detections keep the earlier-starting span. Malformed
 * spans are dropped and noted, never fatal.
 */
class SpanMerger {
public:
    [[nodiscard]] static MergeResult merge(
        const std::string& text,
        std::vector<Entity> pattern,
        std::vector<Entity> inferred);

    [[nodiscard]] static bool is_valid_span(const Entity& entity, size_t text_length);
};

} // namespace privguard
