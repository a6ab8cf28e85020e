#pragma once

#include "core/collaborators.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace privguard {

/**
 * @brief Static regulation reference table
 *
 * Serves two purposes:
 * - article lookup for justifications (kind-specific row, else the
 *   regulation's default article for the technique)
 * - ICitationSource: returns the general citation of a regulation plus the
 *   rows for the requested kinds
 *
 * Immutable after construction; safe to share between threads.
 */
class CitationCatalog : public ICitationSource {
public:
    CitationCatalog();

    [[nodiscard]] Result<std::vector<Citation>> fetch(
        Regulation regulation,
        const std::vector<EntityKind>& kinds) override;

    [[nodiscard]] std::string article_for(Regulation regulation,
                                          const EntityKind& kind,
                                          Technique technique) const;

    [[nodiscard]] static std::string rationale_for(Technique technique);

private:
    struct Entry {
        Regulation regulation;
        EntityKind kind;        // empty = applies to the whole regulation
        std::string article;
        std::string text;
    };

    std::vector<Entry> entries_;
};

} // namespace privguard
