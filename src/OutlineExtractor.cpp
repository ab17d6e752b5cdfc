#include "OutlineExtractor.h"

#include <utility>

#include <QString>

#include "Logging.h"
#include "textutils.h"

namespace chapters {
    std::vector<OutlineEntry> FlattenOutline(const std::vector<OutlineNode> &roots) {
        std::vector<OutlineEntry> entries;
        std::vector<std::pair<const OutlineNode *, int> > stack;

        // Reverse pushes so that pops come out in document order
        for (auto it = roots.rbegin(); it != roots.rend(); ++it)
            stack.emplace_back(&*it, 1);

        while (!stack.empty()) {
            const auto [node, level] = stack.back();
            stack.pop_back();

            if (const auto *leaf = std::get_if<OutlineLeaf>(node)) {
                entries.push_back({leaf->title, level, leaf->dest});
                continue;
            }

            const auto &section = std::get<OutlineSection>(*node);
            entries.push_back({section.title, level, section.dest});
            for (auto it = section.children.rbegin(); it != section.children.rend(); ++it)
                stack.emplace_back(&*it, level + 1);
        }
        return entries;
    }

    OutlineResult OutlineExtractor::Extract(const int requestedLevel) const {
        OutlineResult result;

        std::optional<std::vector<OutlineNode> > outline;
        try {
            outline = m_source.ReadOutline();
        } catch (const std::exception &ex) {
            qCWarning(lcDetect) << "Could not read outline:" << ex.what();
            return result;
        }
        if (!outline || outline->empty())
            return result;

        result.hasOutline = true;

        for (const auto &entry: FlattenOutline(*outline)) {
            if (requestedLevel > 0 && entry.level != requestedLevel)
                continue;

            Chapter chapter;
            if (!ResolvePosition(entry, chapter.position))
                continue;

            chapter.title = trim_copy(entry.title);
            if (chapter.title.empty())
                chapter.title = FallbackTitle(chapter.position);
            chapter.level = entry.level;
            chapter.method = DetectionMethod::Native;
            chapter.confidence = 1.0;
            result.chapters.push_back(std::move(chapter));
        }

        qCDebug(lcDetect) << "Outline yielded" << result.chapters.size() << "chapter(s)";
        return result;
    }

    bool OutlineExtractor::ResolvePosition(const OutlineEntry &entry, Position &position) const {
        if (m_source.Kind() == SourceKind::Paginated) {
            const int index = entry.dest.pageIndex;
            if (index < 0 || index >= m_source.TotalUnits()) {
                qCWarning(lcDetect) << "Skipping outline entry" << QString::fromStdString(entry.title)
                        << "with unresolvable destination" << index;
                return false;
            }
            position.startUnit = position.endUnit = index + 1;
            return true;
        }

        const auto &archive = static_cast<const ArchiveSource &>(m_source);
        const std::string &href = entry.dest.href;
        const size_t hash = href.find('#');
        const std::string unit = href.substr(0, hash);

        const int ordinal = unit.empty() ? 0 : archive.SpineOrdinal(unit);
        if (ordinal == 0) {
            qCWarning(lcDetect) << "Skipping outline entry" << QString::fromStdString(entry.title)
                    << "pointing outside the spine:" << QString::fromStdString(href);
            return false;
        }

        position.startUnit = position.endUnit = ordinal;
        position.unitPath = unit;
        if (hash != std::string::npos && hash + 1 < href.size())
            position.fragment = href.substr(hash + 1);
        return true;
    }

    std::string OutlineExtractor::FallbackTitle(const Position &position) const {
        if (m_source.Kind() == SourceKind::Paginated)
            return path_stem(m_source.FilePath()) + " (page " + std::to_string(position.startUnit) + ")";
        return title_from_stem(path_stem(position.unitPath));
    }
} // namespace chapters
