#pragma once

#include <optional>
#include <string>
#include <vector>

#include "DocumentSource.hpp"

namespace chapters {
    enum class Sensitivity {
        Low,
        Medium,
        High
    };

    struct SensitivityPreset {
        double fontSizeRatio;
        double minConfidence;
    };

    [[nodiscard]] SensitivityPreset PresetFor(Sensitivity sensitivity) noexcept;

    // Lenient lookup used by the analyzer: unknown names fall back to Medium.
    [[nodiscard]] Sensitivity SensitivityFromName(const std::string &name) noexcept;

    [[nodiscard]] const char *ToString(Sensitivity sensitivity) noexcept;

    // Anchored, case-insensitive match against the ordinal heading patterns
    // ("Chapter 3", "Part IV", "1. Introduction", "第三章").
    [[nodiscard]] bool MatchesHeadingPattern(const std::string &text);

    // Confidence of a candidate heading, clamped to [0, 1].
    [[nodiscard]] double ScoreHeading(bool patternMatch, double fontSize, int wordCount) noexcept;

    // Structural heading detection. Paginated sources are scanned for ordinal
    // patterns and oversized text runs; archives for h1..h3 elements.
    class HeuristicAnalyzer {
    public:
        explicit HeuristicAnalyzer(const Sensitivity sensitivity = Sensitivity::Medium)
            : m_sensitivity(sensitivity), m_preset(PresetFor(sensitivity)) {
        }

        [[nodiscard]] std::vector<Chapter> Analyze(const DocumentSource &source) const;

        [[nodiscard]] std::vector<Chapter> AnalyzePaginated(const PaginatedSource &source) const;

        [[nodiscard]] std::vector<Chapter> AnalyzeArchive(const ArchiveSource &source) const;

        // Heading candidate for one run of page `page` (1-based), or nullopt
        // when the run does not qualify or scores under the preset minimum.
        [[nodiscard]] std::optional<Chapter> EvaluateRun(const TextRun &run, double unitAverage, int page) const;

        [[nodiscard]] const SensitivityPreset &Preset() const noexcept { return m_preset; }

    private:
        [[nodiscard]] int MaxHeadingDepth() const noexcept;

        Sensitivity m_sensitivity;
        SensitivityPreset m_preset;
    };
} // namespace chapters
