#pragma once

#include <string>

#include <QString>

#include "ChapterDetector.h"
#include "ChapterMaterializer.h"
#include "FilenameGenerator.h"

namespace chapters {
    // Everything a split or preview run can be configured with. Built from
    // the defaults below, then an optional INI file, then command-line flags.
    struct SplitOptions {
        Strategy strategy = Strategy::Hybrid;
        Sensitivity sensitivity = Sensitivity::Medium;
        int level = 1; // 0 keeps every outline level
        std::string pattern = kDefaultFilenamePattern;
        bool preserveMetadata = true;
        OutputFormat format = OutputFormat::Same;
        std::string outputDir; // empty: <input dir>/<input stem>_chapters
        bool assumeYes = false;

        [[nodiscard]] DetectorOptions Detector() const {
            return {strategy, sensitivity, level};
        }

        [[nodiscard]] MaterializeOptions Materialize() const {
            return {preserveMetadata};
        }
    };

    // Strict parsers for user-supplied names; all throw std::invalid_argument.
    // ParseStrategy also accepts "bookmarks" (native) and "heuristic" (structural).
    Strategy ParseStrategy(const std::string &name);

    Sensitivity ParseSensitivity(const std::string &name);

    OutputFormat ParseOutputFormat(const std::string &name);

    // Overlays the keys present in an INI file onto options:
    //
    //   [detection]  strategy, sensitivity, level
    //   [output]     pattern, preserveMetadata, format, directory
    //
    // Throws std::invalid_argument when the file is missing, unreadable or
    // holds an invalid value.
    void LoadSettingsFile(const QString &path, SplitOptions &options);
} // namespace chapters
