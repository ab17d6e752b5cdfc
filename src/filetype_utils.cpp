#include "filetype_utils.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <unordered_set>
#include <string>

#include "SplitErrors.hpp"
#include "../epub/EpubArchive.h"
#include "../pdfium/PdfSource.h"

namespace chapters {
    namespace {
        inline const std::unordered_set<std::string> PDF_EXTENSIONS = {"pdf"};

        inline const std::unordered_set<std::string> EPUB_EXTENSIONS = {"epub"};

        // Local file header: signature, 26 bytes of fields, then the name
        constexpr int kZipNameOffset = 30;

        FileKind sniff(const QByteArray &head) {
            if (head.startsWith("%PDF-"))
                return FileKind::Pdf;
            if (head.startsWith("PK\x03\x04") &&
                head.mid(kZipNameOffset, 8) == "mimetype" &&
                head.mid(kZipNameOffset + 8, 20) == "application/epub+zip")
                return FileKind::Epub;
            return FileKind::Unknown;
        }
    } // anonymous namespace

    bool isPdfExt(const QString &extLower) {
        return PDF_EXTENSIONS.count(extLower.toStdString()) != 0;
    }

    bool isEpubExt(const QString &extLower) {
        return EPUB_EXTENSIONS.count(extLower.toStdString()) != 0;
    }

    FileKind detectFileKind(const QString &path) {
        QFile file(path);
        if (file.open(QIODevice::ReadOnly)) {
            if (const FileKind kind = sniff(file.read(64)); kind != FileKind::Unknown)
                return kind;
        }

        const QString ext = QFileInfo(path).suffix().toLower();
        if (isPdfExt(ext))
            return FileKind::Pdf;
        if (isEpubExt(ext))
            return FileKind::Epub;
        return FileKind::Unknown;
    }

    QString makeOutputDir(const QString &inputPath) {
        const QFileInfo info(inputPath);
        return QDir(info.absolutePath()).filePath(info.completeBaseName() + "_chapters");
    }

    std::unique_ptr<DocumentSource> OpenSource(const std::string &path) {
        const QString qpath = QString::fromStdString(path);
        if (!QFileInfo::exists(qpath))
            throw MalformedSourceError(path, "file not found");

        switch (detectFileKind(qpath)) {
            case FileKind::Pdf:
                return std::make_unique<PdfSource>(path);
            case FileKind::Epub:
                return epub::EpubArchive::Open(path);
            case FileKind::Unknown:
                break;
        }
        throw MalformedSourceError(path, "unsupported file type (expected .pdf or .epub)");
    }
} // namespace chapters
