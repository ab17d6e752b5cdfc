#pragma once

#include <memory>
#include <string>

#include <QString>

#include "DocumentSource.hpp"

namespace chapters {
    enum class FileKind {
        Unknown,
        Pdf,
        Epub
    };

    bool isPdfExt(const QString &extLower);
    bool isEpubExt(const QString &extLower);

    // Magic bytes first ("%PDF-", a zip whose first entry is the EPUB
    // mimetype), then the extension.
    FileKind detectFileKind(const QString &path);

    // "<input dir>/<input stem>_chapters"
    QString makeOutputDir(const QString &inputPath);

    // Opens a PdfSource or an EpubArchive. Throws MalformedSourceError for
    // anything else or for a file that cannot be parsed.
    std::unique_ptr<DocumentSource> OpenSource(const std::string &path);
} // namespace chapters
