#include "ChapterSplitter.h"

#include <QDir>
#include <QFileInfo>
#include <QSaveFile>

#include "ChapterMaterializer.h"
#include "FilenameGenerator.h"
#include "Logging.h"
#include "SplitErrors.hpp"
#include "filetype_utils.h"
#include "textutils.h"

namespace chapters {
    ChapterSplitter::ChapterSplitter(SplitOptions options, QObject *parent)
        : QObject(parent),
          m_options(std::move(options)) {
    }

    QString ChapterSplitter::OutputDirFor(const std::string &inputPath) const {
        if (!m_options.outputDir.empty())
            return QString::fromStdString(m_options.outputDir);
        return makeOutputDir(QString::fromStdString(inputPath));
    }

    SplitReport ChapterSplitter::Split(const DocumentSource &source, const DetectionResult &detection) {
        const auto materializer = CreateMaterializer(source, m_options.format, m_options.Materialize());
        FilenameGenerator names(m_options.pattern, source.Kind(), materializer->Extension(),
                                path_stem(source.FilePath()));

        SplitReport report;
        const QString outDir = OutputDirFor(source.FilePath());
        report.outputDir = outDir.toStdString();

        if (!QDir().mkpath(outDir)) {
            report.success = false;
            report.error = "Cannot create output directory " + report.outputDir;
            emit log(QString("❌ %1").arg(QString::fromStdString(report.error)));
            return report;
        }

        const int total = detection.ChapterCount();
        for (int i = 0; i < total; ++i) {
            const int idx = i + 1;
            const Chapter &chapter = detection.chapters[i];
            const QString outPath = QDir(outDir).filePath(QString::fromStdString(names.Generate(chapter, idx)));

            try {
                if (QFileInfo(outPath).absoluteFilePath() ==
                    QFileInfo(QString::fromStdString(source.FilePath())).absoluteFilePath())
                    throw OutputWriteError("Output path equals the source path: " + outPath.toStdString());

                WriteFile(outPath, materializer->Materialize(chapter));
            } catch (const SplitError &ex) {
                report.success = false;
                report.failedIndex = idx;
                report.error = ex.what();
                qCWarning(lcMaterialize) << "Stopping after chapter" << idx << "failed:" << ex.what();
                emit log(QString("%1: %2 -> ❌ %3")
                    .arg(idx)
                    .arg(outPath, QString::fromUtf8(ex.what())));
                emit progress(idx, total);
                return report;
            }

            report.written.push_back({idx, chapter.title, outPath.toStdString(), chapter.position});
            emit log(QString("%1: %2 -> ✅ Done.")
                .arg(idx)
                .arg(outPath));
            emit progress(idx, total);
        }

        qCInfo(lcMaterialize) << "Wrote" << report.written.size() << "chapter(s) to" << outDir;
        return report;
    }

    void ChapterSplitter::WriteFile(const QString &path, const std::vector<std::uint8_t> &bytes) {
        // The target only appears once commit() renames the finished temp file over it.
        QSaveFile outFile(path);
        if (!outFile.open(QIODevice::WriteOnly))
            throw OutputWriteError("Error opening " + path.toStdString() + " for write: " +
                                   outFile.errorString().toStdString());

        const auto size = static_cast<qint64>(bytes.size());
        if (outFile.write(reinterpret_cast<const char *>(bytes.data()), size) != size) {
            const std::string reason = outFile.errorString().toStdString();
            outFile.cancelWriting();
            throw OutputWriteError("Error writing " + path.toStdString() + ": " + reason);
        }

        if (!outFile.commit())
            throw OutputWriteError("Error saving " + path.toStdString() + ": " + outFile.errorString().toStdString());
    }
} // namespace chapters
