#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <QObject>
#include <QString>

#include "DocumentSource.hpp"
#include "SplitOptions.h"

namespace chapters {
    struct WrittenChapter {
        int index = 0; // 1-based
        std::string title;
        std::string path;
        Position position;
    };

    // Outcome of one split job. On a write failure the job stops: written
    // lists what is on disk, failedIndex/error name the chapter that failed.
    struct SplitReport {
        bool success = true;
        std::string outputDir;
        std::vector<WrittenChapter> written;
        int failedIndex = 0;
        std::string error;
    };

    // Writes every detected chapter of an opened source, one at a time and in
    // order, into the output directory.
    class ChapterSplitter : public QObject {
        Q_OBJECT

    public:
        explicit ChapterSplitter(SplitOptions options, QObject *parent = nullptr);

        // Throws std::invalid_argument for a bad filename pattern or an
        // unsupported output format, before anything is written.
        SplitReport Split(const DocumentSource &source, const DetectionResult &detection);

        // Directory a split of inputPath writes to under these options.
        [[nodiscard]] QString OutputDirFor(const std::string &inputPath) const;

    signals:
        void log(const QString &line);

        void progress(int current, int total); // (idx, total)

    private:
        static void WriteFile(const QString &path, const std::vector<std::uint8_t> &bytes);

        SplitOptions m_options;
    };
} // namespace chapters
