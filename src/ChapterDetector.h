#pragma once

#include <functional>
#include <string>
#include <vector>

#include "DocumentSource.hpp"
#include "HeuristicAnalyzer.h"
#include "OutlineExtractor.h"

namespace chapters {
    enum class Strategy {
        Native,     // outline only
        Structural, // headings only
        Manifest,   // one chapter per content unit
        Hybrid      // outline, then headings, then manifest
    };

    [[nodiscard]] const char *ToString(Strategy strategy) noexcept;

    struct DetectorOptions {
        Strategy strategy = Strategy::Hybrid;
        Sensitivity sensitivity = Sensitivity::Medium;
        int level = 1; // outline level to keep, <= 0 keeps all
    };

    class ChapterDetector {
    public:
        using Attempt = std::function<std::vector<Chapter>(const DocumentSource &)>;

        struct Stage {
            std::string name;
            Attempt attempt;
        };

        explicit ChapterDetector(DetectorOptions options = {}) : m_options(options) {
        }

        // Opens the file, detects, and releases it before returning. Throws
        // MalformedSourceError for unreadable or unsupported input.
        [[nodiscard]] DetectionResult Detect(const std::string &path) const;

        // Never returns an empty chapter list: when no stage yields anything the
        // result is a single "Complete Document" chapter.
        [[nodiscard]] DetectionResult Detect(const DocumentSource &source) const;

        // The ordered stages the configured strategy runs. With outline given,
        // the native stage returns its chapters instead of reading the source.
        [[nodiscard]] std::vector<Stage> Stages(const OutlineResult *outline = nullptr) const;

        [[nodiscard]] const DetectorOptions &Options() const noexcept { return m_options; }

    private:
        [[nodiscard]] static Chapter WholeDocument(const DocumentSource &source);

        DetectorOptions m_options;
    };
} // namespace chapters
