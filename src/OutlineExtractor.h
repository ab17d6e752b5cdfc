#pragma once

#include <string>
#include <vector>

#include "DocumentSource.hpp"

namespace chapters {
    struct OutlineEntry {
        std::string title;
        int level = 1;
        OutlineDest dest;
    };

    // Pre-order walk of the outline tree with an explicit (node, level) stack.
    // Roots are level 1, children one deeper than their parent.
    std::vector<OutlineEntry> FlattenOutline(const std::vector<OutlineNode> &roots);

    struct OutlineResult {
        std::vector<Chapter> chapters;
        bool hasOutline = false;
    };

    // Turns a document's native outline (PDF bookmarks, EPUB nav/NCX) into
    // Native chapters with confidence 1.0. Each chapter starts and ends at its
    // destination unit; RangeResolver closes the ranges afterwards.
    class OutlineExtractor {
    public:
        explicit OutlineExtractor(const DocumentSource &source) : m_source(source) {
        }

        // requestedLevel <= 0 keeps every level. Never throws for a missing or
        // unreadable outline; hasOutline is false then.
        [[nodiscard]] OutlineResult Extract(int requestedLevel = 0) const;

    private:
        [[nodiscard]] bool ResolvePosition(const OutlineEntry &entry, Position &position) const;

        [[nodiscard]] std::string FallbackTitle(const Position &position) const;

        const DocumentSource &m_source;
    };
} // namespace chapters
