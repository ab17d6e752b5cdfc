#include "RangeResolver.h"

#include <set>
#include <string>
#include <utility>

#include <QString>

#include "Logging.h"

namespace chapters {
    namespace {
        // Ends come from the next start, so dropping one entry changes its
        // predecessor's end. Repeat until a pass drops nothing.
        std::vector<Chapter> ResolvePages(std::vector<Chapter> chapters, const int totalUnits) {
            bool dropped = true;
            while (dropped) {
                dropped = false;
                std::vector<Chapter> kept;
                kept.reserve(chapters.size());

                for (size_t i = 0; i < chapters.size(); ++i) {
                    Chapter &chapter = chapters[i];
                    chapter.position.endUnit = i + 1 < chapters.size()
                                                   ? chapters[i + 1].position.startUnit - 1
                                                   : totalUnits;

                    if (chapter.position.startUnit > chapter.position.endUnit) {
                        qCWarning(lcDetect) << "Dropping chapter" << QString::fromStdString(chapter.title)
                                << "with empty range" << chapter.position.startUnit << "-"
                                << chapter.position.endUnit;
                        dropped = true;
                        continue;
                    }
                    kept.push_back(std::move(chapter));
                }
                chapters = std::move(kept);
            }
            return chapters;
        }

        std::vector<Chapter> ResolveUnits(std::vector<Chapter> chapters) {
            std::vector<Chapter> kept;
            kept.reserve(chapters.size());
            std::set<std::pair<int, std::string> > seen;

            for (auto &chapter: chapters) {
                Position &pos = chapter.position;
                if (pos.endUnit < pos.startUnit)
                    pos.endUnit = pos.startUnit;

                if (!seen.emplace(pos.startUnit, pos.Location()).second) {
                    qCDebug(lcDetect) << "Dropping duplicate position" << QString::fromStdString(pos.Location());
                    continue;
                }

                // Anchors inside one unit share its ordinal; anything earlier, or
                // inside a previous multi-unit range, would reorder the output.
                if (!kept.empty()) {
                    const Position &prev = kept.back().position;
                    if (pos.startUnit < prev.startUnit ||
                        (prev.endUnit > prev.startUnit && pos.startUnit <= prev.endUnit)) {
                        qCWarning(lcDetect) << "Dropping chapter" << QString::fromStdString(chapter.title)
                                << "at" << QString::fromStdString(pos.Location())
                                << "which lies before the end of" << QString::fromStdString(kept.back().title);
                        continue;
                    }
                }
                kept.push_back(std::move(chapter));
            }
            return kept;
        }
    } // namespace

    std::vector<Chapter> ResolveRanges(std::vector<Chapter> chapters, const SourceKind kind, const int totalUnits) {
        if (kind == SourceKind::Paginated)
            return ResolvePages(std::move(chapters), totalUnits);
        return ResolveUnits(std::move(chapters));
    }
} // namespace chapters
