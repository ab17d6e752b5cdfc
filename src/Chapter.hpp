#pragma once

#include <optional>
#include <string>
#include <vector>

namespace chapters {
    enum class DetectionMethod {
        Native,
        Structural,
        Manifest,
        Fallback
    };

    enum class SourceKind {
        Paginated, // PDF: positions are 1-based page numbers
        Archive    // EPUB: positions are spine units (+ optional anchor)
    };

    inline const char *ToString(const DetectionMethod method) noexcept {
        switch (method) {
            case DetectionMethod::Native: return "native";
            case DetectionMethod::Structural: return "structural";
            case DetectionMethod::Manifest: return "manifest";
            case DetectionMethod::Fallback: return "fallback";
        }
        return "unknown";
    }

    // ============================================================
    //  Position: where a chapter lives in its source
    // ============================================================
    //
    // startUnit/endUnit are 1-based and inclusive. For paginated sources they
    // are page numbers; for archives they are spine ordinals, which gives
    // archive chapters a total order without page arithmetic.
    struct Position {
        int startUnit = 0;
        int endUnit = 0;
        std::string unitPath;                // archive-internal path, archives only
        std::optional<std::string> fragment; // in-unit anchor id, archives only

        [[nodiscard]] std::string Location() const {
            if (fragment)
                return unitPath + "#" + *fragment;
            return unitPath;
        }

        [[nodiscard]] bool SameAnchor(const Position &other) const {
            return unitPath == other.unitPath && fragment == other.fragment &&
                   startUnit == other.startUnit;
        }
    };

    struct Chapter {
        std::string title;
        Position position;
        int level = 1;
        DetectionMethod method = DetectionMethod::Native;
        double confidence = 1.0;

        [[nodiscard]] int UnitCount() const noexcept {
            return position.endUnit - position.startUnit + 1;
        }

        // Paginated alias kept for readability at call sites that deal in pages.
        [[nodiscard]] int PageCount() const noexcept { return UnitCount(); }
    };

    struct DetectionResult {
        std::vector<Chapter> chapters;
        std::string strategyUsed;
        int totalUnits = 0;
        bool hasNativeStructure = false;

        [[nodiscard]] int ChapterCount() const noexcept {
            return static_cast<int>(chapters.size());
        }

        [[nodiscard]] bool UsedFallback() const noexcept {
            return chapters.size() == 1 &&
                   chapters.front().method == DetectionMethod::Fallback;
        }

        // Fallback output or anything under 0.5 warrants a prompt before writing.
        [[nodiscard]] bool NeedsConfirmation() const noexcept {
            if (UsedFallback())
                return true;
            for (const auto &ch: chapters) {
                if (ch.confidence < 0.5)
                    return true;
            }
            return false;
        }

        [[nodiscard]] std::string Summary(const SourceKind kind) const {
            std::string out;
            out += "Detection Strategy: " + strategyUsed + "\n";
            out += kind == SourceKind::Paginated ? "Total Pages: " : "Total Content Files: ";
            out += std::to_string(totalUnits) + "\n";
            out += "Chapters Found: " + std::to_string(ChapterCount()) + "\n";
            out += kind == SourceKind::Paginated ? "Has Bookmarks: " : "Has TOC: ";
            out += hasNativeStructure ? "Yes" : "No";
            return out;
        }
    };
} // namespace chapters
