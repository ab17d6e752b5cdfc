#include "ManifestFallback.h"

#include <QDomDocument>
#include <QString>

#include "Logging.h"
#include "textutils.h"
#include "../epub/XhtmlText.h"

namespace chapters {
    std::string UnitTitle(const std::string &unitPath, const std::string &markup) {
        QDomDocument doc;
        QString error;
        if (epub::ParseMarkup(markup, doc, &error)) {
            for (const auto *tag: {"title", "h1", "h2"}) {
                if (const auto element = epub::FindFirst(doc, QString::fromLatin1(tag))) {
                    if (std::string text = epub::ElementText(*element); !text.empty())
                        return text;
                }
            }
        } else {
            qCWarning(lcDetect) << "Unit" << QString::fromStdString(unitPath) << "does not parse:" << error;
        }
        return title_from_stem(path_stem(unitPath));
    }

    std::vector<Chapter> DetectFromManifest(const DocumentSource &source) {
        std::vector<Chapter> chapters;
        if (source.Kind() != SourceKind::Archive)
            return chapters;

        const auto &archive = static_cast<const ArchiveSource &>(source);
        const auto &spine = archive.SpineUnits();

        for (size_t i = 0; i < spine.size(); ++i) {
            Chapter chapter;
            chapter.title = UnitTitle(spine[i], archive.ReadItem(spine[i]).value_or(std::string{}));
            chapter.position.startUnit = chapter.position.endUnit = static_cast<int>(i) + 1;
            chapter.position.unitPath = spine[i];
            chapter.level = 1;
            chapter.method = DetectionMethod::Manifest;
            chapter.confidence = 0.6;
            chapters.push_back(std::move(chapter));
        }
        return chapters;
    }
} // namespace chapters
