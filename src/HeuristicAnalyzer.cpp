#include "HeuristicAnalyzer.h"

#include <algorithm>

#include <QDomDocument>
#include <QString>

#include "boost/regex.hpp"

#include "Logging.h"
#include "textutils.h"
#include "../epub/XhtmlText.h"

namespace chapters {
    namespace {
        const std::vector<boost::wregex> &HeadingPatterns() {
            static const std::vector<boost::wregex> patterns = {
                boost::wregex(LR"(^Chapter\s+(\d+|[IVXLCDM]+)\b[\s:.\-]*(.*?)$)", boost::regex::icase),
                boost::wregex(LR"(^Part\s+(\d+|[IVXLCDM]+)\b[\s:.\-]*(.*?)$)", boost::regex::icase),
                boost::wregex(LR"(^(\d+)\.\s+(.+)$)", boost::regex::icase),
                // 第三章, 第12回, 第一卷 ... but not 第三章分 / 第三章合
                boost::wregex(LR"(^第.{1,5}?[章节節部卷回](?![分合]))", boost::regex::icase),
            };
            return patterns;
        }

        double Mean(const std::vector<TextRun> &runs) {
            double sum = 0.0;
            int count = 0;
            for (const auto &run: runs) {
                if (run.fontSize > 0.0) {
                    sum += run.fontSize;
                    ++count;
                }
            }
            return count > 0 ? sum / count : 0.0;
        }

        double DepthConfidence(const int depth) {
            switch (depth) {
                case 1: return 1.0;
                case 2: return 0.7;
                default: return 0.5;
            }
        }
    } // namespace

    SensitivityPreset PresetFor(const Sensitivity sensitivity) noexcept {
        switch (sensitivity) {
            case Sensitivity::Low: return {1.5, 0.8};
            case Sensitivity::High: return {1.2, 0.4};
            case Sensitivity::Medium: break;
        }
        return {1.3, 0.6};
    }

    Sensitivity SensitivityFromName(const std::string &name) noexcept {
        const std::string lower = to_lower_ascii(trim_copy(name));
        if (lower == "low")
            return Sensitivity::Low;
        if (lower == "high")
            return Sensitivity::High;
        return Sensitivity::Medium;
    }

    const char *ToString(const Sensitivity sensitivity) noexcept {
        switch (sensitivity) {
            case Sensitivity::Low: return "low";
            case Sensitivity::Medium: return "medium";
            case Sensitivity::High: return "high";
        }
        return "medium";
    }

    bool MatchesHeadingPattern(const std::string &text) {
        const std::wstring wide = utf8_to_wstring(trim_copy(text));
        return std::any_of(HeadingPatterns().begin(), HeadingPatterns().end(),
                           [&](const boost::wregex &re) { return boost::regex_search(wide, re); });
    }

    double ScoreHeading(const bool patternMatch, const double fontSize, const int wordCount) noexcept {
        double confidence = 0.5;

        if (patternMatch)
            confidence += 0.4;

        if (fontSize >= 16.0)
            confidence += 0.1;
        else if (fontSize >= 14.0)
            confidence += 0.05;

        if (wordCount > 10)
            confidence -= 0.2;
        else if (wordCount > 6)
            confidence -= 0.1;

        return std::clamp(confidence, 0.0, 1.0);
    }

    std::vector<Chapter> HeuristicAnalyzer::Analyze(const DocumentSource &source) const {
        if (source.Kind() == SourceKind::Paginated)
            return AnalyzePaginated(static_cast<const PaginatedSource &>(source));
        return AnalyzeArchive(static_cast<const ArchiveSource &>(source));
    }

    std::optional<Chapter> HeuristicAnalyzer::EvaluateRun(const TextRun &run, const double unitAverage,
                                                          const int page) const {
        const std::string text = collapse_whitespace(run.text);
        if (text.empty())
            return std::nullopt;

        const bool pattern = MatchesHeadingPattern(text);
        const int words = count_words(text);

        if (!pattern) {
            const bool oversized = unitAverage > 0.0 && run.fontSize >= m_preset.fontSizeRatio * unitAverage;
            if (!oversized || words > 10)
                return std::nullopt;
        }

        const double confidence = ScoreHeading(pattern, run.fontSize, words);
        // Scores are sums of tenths; keep 0.5 + 0.1 from falling under a 0.6 threshold
        if (confidence + 1e-9 < m_preset.minConfidence)
            return std::nullopt;

        Chapter chapter;
        chapter.title = text;
        chapter.position.startUnit = chapter.position.endUnit = page;
        chapter.level = 1;
        chapter.method = DetectionMethod::Structural;
        chapter.confidence = confidence;
        return chapter;
    }

    std::vector<Chapter> HeuristicAnalyzer::AnalyzePaginated(const PaginatedSource &source) const {
        std::vector<Chapter> chapters;

        for (int pageIndex = 0; pageIndex < source.TotalUnits(); ++pageIndex) {
            std::vector<TextRun> runs;
            try {
                runs = source.PageTextRuns(pageIndex);
            } catch (const std::exception &ex) {
                qCWarning(lcDetect) << "Skipping page" << pageIndex + 1 << ":" << ex.what();
                continue;
            }

            const double average = Mean(runs);
            // A page is the smallest position: the first accepted run claims it
            for (const auto &run: runs) {
                if (auto chapter = EvaluateRun(run, average, pageIndex + 1)) {
                    chapters.push_back(std::move(*chapter));
                    break;
                }
            }
        }

        qCDebug(lcDetect) << "Heuristics found" << chapters.size() << "heading(s) at sensitivity"
                << ToString(m_sensitivity);
        return chapters;
    }

    std::vector<Chapter> HeuristicAnalyzer::AnalyzeArchive(const ArchiveSource &source) const {
        std::vector<Chapter> chapters;
        const int maxDepth = MaxHeadingDepth();
        const auto &spine = source.SpineUnits();

        for (size_t i = 0; i < spine.size(); ++i) {
            const std::string &unit = spine[i];
            const auto markup = source.ReadItem(unit);
            if (!markup) {
                qCWarning(lcDetect) << "Skipping missing unit" << QString::fromStdString(unit);
                continue;
            }

            QDomDocument doc;
            QString error;
            if (!epub::ParseMarkup(*markup, doc, &error)) {
                qCWarning(lcDetect) << "Skipping unparsable unit" << QString::fromStdString(unit) << error;
                continue;
            }

            // Document-order walk
            std::vector<QDomNode> stack{doc.documentElement()};
            while (!stack.empty()) {
                const QDomElement element = stack.back().toElement();
                stack.pop_back();

                const QString name = epub::LocalName(element);
                const int depth = name.size() == 2 && name.at(0) == QLatin1Char('h') ? name.at(1).digitValue() : 0;

                if (depth >= 1 && depth <= maxDepth) {
                    std::string title = epub::ElementText(element);
                    if (!title.empty()) {
                        Chapter chapter;
                        chapter.title = std::move(title);
                        chapter.position.startUnit = chapter.position.endUnit = static_cast<int>(i) + 1;
                        chapter.position.unitPath = unit;
                        if (const QString id = element.attribute(QStringLiteral("id")).trimmed(); !id.isEmpty())
                            chapter.position.fragment = id.toStdString();
                        chapter.level = depth;
                        chapter.method = DetectionMethod::Structural;
                        chapter.confidence = DepthConfidence(depth);
                        chapters.push_back(std::move(chapter));
                    }
                    continue;
                }

                for (QDomElement child = element.lastChildElement(); !child.isNull();
                     child = child.previousSiblingElement()) {
                    stack.push_back(child);
                }
            }
        }

        qCDebug(lcDetect) << "Structural scan found" << chapters.size() << "heading(s)";
        return chapters;
    }

    int HeuristicAnalyzer::MaxHeadingDepth() const noexcept {
        switch (m_sensitivity) {
            case Sensitivity::Low: return 1;
            case Sensitivity::High: return 3;
            case Sensitivity::Medium: break;
        }
        return 2;
    }
} // namespace chapters
