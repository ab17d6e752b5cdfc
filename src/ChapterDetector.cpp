#include "ChapterDetector.h"

#include <QString>

#include "Logging.h"
#include "ManifestFallback.h"
#include "RangeResolver.h"
#include "filetype_utils.h"

namespace chapters {
    const char *ToString(const Strategy strategy) noexcept {
        switch (strategy) {
            case Strategy::Native: return "native";
            case Strategy::Structural: return "structural";
            case Strategy::Manifest: return "manifest";
            case Strategy::Hybrid: return "hybrid";
        }
        return "hybrid";
    }

    std::vector<ChapterDetector::Stage> ChapterDetector::Stages(const OutlineResult *outline) const {
        const int level = m_options.level;
        const Sensitivity sensitivity = m_options.sensitivity;

        Stage native{
            "native", [level, outline](const DocumentSource &source) {
                if (outline)
                    return outline->chapters;
                return OutlineExtractor(source).Extract(level).chapters;
            }
        };
        Stage structural{
            "structural", [sensitivity](const DocumentSource &source) {
                return HeuristicAnalyzer(sensitivity).Analyze(source);
            }
        };
        Stage manifest{"manifest", &DetectFromManifest};

        switch (m_options.strategy) {
            case Strategy::Native: return {native};
            case Strategy::Structural: return {structural};
            case Strategy::Manifest: return {manifest};
            case Strategy::Hybrid: break;
        }
        return {native, structural, manifest};
    }

    DetectionResult ChapterDetector::Detect(const std::string &path) const {
        const auto source = OpenSource(path);
        return Detect(*source);
    }

    DetectionResult ChapterDetector::Detect(const DocumentSource &source) const {
        DetectionResult result;
        result.totalUnits = source.TotalUnits();
        // Read once: it reports the native structure and feeds the native stage
        const OutlineResult outline = OutlineExtractor(source).Extract(m_options.level);
        result.hasNativeStructure = outline.hasOutline;

        const auto stages = Stages(&outline);
        for (size_t i = 0; i < stages.size(); ++i) {
            std::vector<Chapter> found = stages[i].attempt(source);
            if (found.empty()) {
                qCDebug(lcDetect) << "Stage" << stages[i].name.c_str() << "found nothing";
                continue;
            }

            result.chapters = ResolveRanges(std::move(found), source.Kind(), result.totalUnits);
            if (result.chapters.empty())
                continue;

            result.strategyUsed = stages[i].name;
            if (i > 0)
                result.strategyUsed += " (fallback)";
            break;
        }

        if (result.chapters.empty()) {
            qCInfo(lcDetect) << "No chapters detected in" << QString::fromStdString(source.FilePath())
                    << "- using the whole document";
            result.chapters.push_back(WholeDocument(source));
            result.strategyUsed = "fallback";
        }

        qCInfo(lcDetect) << "Detected" << result.ChapterCount() << "chapter(s) with"
                << result.strategyUsed.c_str();
        return result;
    }

    Chapter ChapterDetector::WholeDocument(const DocumentSource &source) {
        Chapter chapter;
        chapter.title = "Complete Document";
        chapter.position.startUnit = 1;
        chapter.position.endUnit = source.TotalUnits();
        if (source.Kind() == SourceKind::Archive) {
            const auto &spine = static_cast<const ArchiveSource &>(source).SpineUnits();
            if (!spine.empty())
                chapter.position.unitPath = spine.front();
        }
        chapter.level = 1;
        chapter.method = DetectionMethod::Fallback;
        chapter.confidence = 1.0;
        return chapter;
    }
} // namespace chapters
