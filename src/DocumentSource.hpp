#pragma once

#include "Chapter.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace chapters {
    // ============================================================
    //  Native outline: tagged variant tree
    // ============================================================

    // Exactly one of the two fields is meaningful, depending on the source kind:
    // pageIndex (0-based) for paginated sources, href ("unit#fragment" with the
    // unit already resolved to an archive path) for archives.
    struct OutlineDest {
        int pageIndex = -1;
        std::string href;
    };

    struct OutlineLeaf {
        std::string title;
        OutlineDest dest;
    };

    struct OutlineSection;

    using OutlineNode = std::variant<OutlineLeaf, OutlineSection>;

    struct OutlineSection {
        std::string title;
        OutlineDest dest;
        std::vector<OutlineNode> children;
    };

    // ============================================================
    //  Source seams
    // ============================================================

    struct TextRun {
        std::string text; // UTF-8
        double fontSize = 0.0;
    };

    struct ManifestItem {
        std::string id;
        std::string path;      // archive-internal path
        std::string href;      // as written in the package document
        std::string mediaType;
        std::string properties;
    };

    class DocumentSource {
    public:
        virtual ~DocumentSource() = default;

        [[nodiscard]] virtual SourceKind Kind() const = 0;

        [[nodiscard]] virtual std::string FilePath() const = 0;

        // Total pages (paginated) or total spine units (archive).
        [[nodiscard]] virtual int TotalUnits() const = 0;

        // std::nullopt when the document exposes no outline or it cannot be read.
        [[nodiscard]] virtual std::optional<std::vector<OutlineNode> > ReadOutline() const = 0;
    };

    class PaginatedSource : public DocumentSource {
    public:
        [[nodiscard]] SourceKind Kind() const override { return SourceKind::Paginated; }

        // Text runs of one page in reading order. Throws on a page that cannot be loaded.
        [[nodiscard]] virtual std::vector<TextRun> PageTextRuns(int pageIndex) const = 0;
    };

    class ArchiveSource : public DocumentSource {
    public:
        [[nodiscard]] SourceKind Kind() const override { return SourceKind::Archive; }

        [[nodiscard]] int TotalUnits() const override {
            return static_cast<int>(SpineUnits().size());
        }

        // Archive paths of the content units in reading order.
        [[nodiscard]] virtual const std::vector<std::string> &SpineUnits() const = 0;

        [[nodiscard]] virtual std::optional<std::string> ReadItem(const std::string &path) const = 0;

        // Looks a reference up by archive path or by package-relative href.
        [[nodiscard]] virtual const ManifestItem *FindItem(const std::string &ref) const = 0;

        // 1-based spine position of a unit, 0 when the unit is not in the spine.
        [[nodiscard]] int SpineOrdinal(const std::string &path) const {
            const auto &spine = SpineUnits();
            for (std::size_t i = 0; i < spine.size(); ++i) {
                if (spine[i] == path)
                    return static_cast<int>(i) + 1;
            }
            return 0;
        }
    };
} // namespace chapters
