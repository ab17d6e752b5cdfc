#include "splitapp.h"

#include <stdexcept>

#include <QLoggingCategory>

#include "ChapterDetector.h"
#include "ChapterSplitter.h"
#include "Logging.h"
#include "SplitErrors.hpp"
#include "filetype_utils.h"

namespace chapters {
    namespace {
        QString elide(const QString &text, const int width) {
            if (text.size() <= width)
                return text;
            return text.left(width - 3) + "...";
        }

        QString rangeColumn(const DocumentSource &source, const Chapter &chapter) {
            if (source.Kind() == SourceKind::Paginated) {
                return QString("%1-%2 (%3 pages)")
                        .arg(chapter.position.startUnit)
                        .arg(chapter.position.endUnit)
                        .arg(chapter.PageCount());
            }
            if (chapter.UnitCount() > 1)
                return QString("%1 content files").arg(chapter.UnitCount());
            return QString::fromStdString(chapter.position.Location());
        }
    } // namespace

    SplitApp::SplitApp(QTextStream &out, QTextStream &err, QTextStream &in)
        : m_out(out),
          m_err(err),
          m_in(in),
          m_outputOpt(QStringList{"o", "output"}, "Output directory (default: <input>_chapters).", "dir"),
          m_strategyOpt("strategy", "Detection strategy: native, structural, manifest or hybrid "
                                    "(bookmarks and heuristic are accepted for PDF).", "strategy"),
          m_sensitivityOpt("sensitivity", "Heading detection sensitivity: low, medium or high.", "level"),
          m_levelOpt(QStringList{"level", "bookmark-level", "toc-level"},
                     "Only use outline entries of this level (default: 1, 0: all levels).", "n"),
          m_patternOpt("pattern", "Output filename pattern, e.g. {index:02d}_{title}.", "pattern"),
          m_formatOpt("format", "Output format: same, pdf or epub.", "format"),
          m_noMetadataOpt("no-metadata", "Do not carry the source metadata into the chapters."),
          m_yesOpt(QStringList{"y", "yes"}, "Do not ask before splitting low-confidence results."),
          m_configOpt("config", "INI file with default options.", "file"),
          m_verboseOpt(QStringList{"v", "verbose"}, "Print debug logging.") {
        setupParser();
    }

    void SplitApp::setupParser() {
        m_parser.setApplicationDescription("Split PDF and EPUB documents into one file per chapter.");
        m_parser.addHelpOption();
        m_parser.addPositionalArgument("command", "split or preview");
        m_parser.addPositionalArgument("file", "PDF or EPUB document");
        m_parser.addOptions({
            m_outputOpt, m_strategyOpt, m_sensitivityOpt, m_levelOpt, m_patternOpt,
            m_formatOpt, m_noMetadataOpt, m_yesOpt, m_configOpt, m_verboseOpt
        });
    }

    SplitOptions SplitApp::resolveOptions() const {
        SplitOptions options;

        if (m_parser.isSet(m_configOpt))
            LoadSettingsFile(m_parser.value(m_configOpt), options);

        if (m_parser.isSet(m_strategyOpt))
            options.strategy = ParseStrategy(m_parser.value(m_strategyOpt).toStdString());
        if (m_parser.isSet(m_sensitivityOpt))
            options.sensitivity = ParseSensitivity(m_parser.value(m_sensitivityOpt).toStdString());
        if (m_parser.isSet(m_levelOpt)) {
            bool ok = false;
            options.level = m_parser.value(m_levelOpt).toInt(&ok);
            if (!ok)
                throw std::invalid_argument("--level expects an integer, got '" +
                                            m_parser.value(m_levelOpt).toStdString() + "'");
        }
        if (m_parser.isSet(m_patternOpt))
            options.pattern = m_parser.value(m_patternOpt).toStdString();
        if (m_parser.isSet(m_formatOpt))
            options.format = ParseOutputFormat(m_parser.value(m_formatOpt).toStdString());
        if (m_parser.isSet(m_outputOpt))
            options.outputDir = m_parser.value(m_outputOpt).toStdString();
        if (m_parser.isSet(m_noMetadataOpt))
            options.preserveMetadata = false;
        if (m_parser.isSet(m_yesOpt))
            options.assumeYes = true;

        return options;
    }

    int SplitApp::run(const QStringList &arguments) {
        if (!m_parser.parse(arguments)) {
            m_err << "❌ " << m_parser.errorText() << "\n";
            m_err << m_parser.helpText();
            m_err.flush();
            return ExitUsage;
        }
        if (m_parser.isSet("help")) {
            m_out << m_parser.helpText();
            m_out.flush();
            return ExitSuccess;
        }

        const QStringList positional = m_parser.positionalArguments();
        const QString command = positional.value(0).toLower();
        if (positional.size() != 2 || (command != "split" && command != "preview")) {
            m_err << "❌ Usage: chaptersplitter split|preview <file> [options]\n";
            m_err.flush();
            return ExitUsage;
        }
        const std::string inputPath = positional.at(1).toStdString();

        if (m_parser.isSet(m_verboseOpt))
            QLoggingCategory::setFilterRules(QStringLiteral("chapters.*.debug=true"));

        SplitOptions options;
        try {
            options = resolveOptions();
        } catch (const std::invalid_argument &ex) {
            m_err << "❌ " << ex.what() << "\n";
            m_err.flush();
            return ExitUsage;
        }

        try {
            const auto source = OpenSource(inputPath);
            const DetectionResult result = ChapterDetector(options.Detector()).Detect(*source);
            printDetection(*source, result);

            if (command == "preview")
                return ExitSuccess;

            if (!options.assumeYes && result.NeedsConfirmation() && !confirmSplit(result)) {
                m_out << "Aborted. No files were written.\n";
                m_out.flush();
                return ExitAborted;
            }

            ChapterSplitter splitter(options);
            QObject::connect(&splitter, &ChapterSplitter::log, [this](const QString &line) {
                m_out << line << "\n";
                m_out.flush();
            });

            const SplitReport report = splitter.Split(*source, result);
            if (!report.success) {
                m_err << "❌ Split stopped";
                if (report.failedIndex > 0)
                    m_err << " at chapter " << report.failedIndex;
                m_err << ": " << QString::fromStdString(report.error) << "\n";
                m_err << report.written.size() << " file(s) were written to "
                        << QString::fromStdString(report.outputDir) << "\n";
                m_err.flush();
                return ExitFailure;
            }

            m_out << "✅ Wrote " << report.written.size() << " chapter file(s) to "
                    << QString::fromStdString(report.outputDir) << "\n";
            m_out.flush();
            return ExitSuccess;
        } catch (const std::invalid_argument &ex) {
            m_err << "❌ " << ex.what() << "\n";
            m_err.flush();
            return ExitUsage;
        } catch (const SplitError &ex) {
            m_err << "❌ " << ex.what() << "\n";
            m_err.flush();
            return ExitFailure;
        }
    }

    void SplitApp::printDetection(const DocumentSource &source, const DetectionResult &result) {
        m_out << QString::fromStdString(result.Summary(source.Kind())) << "\n\n";

        const QString rangeHeader = source.Kind() == SourceKind::Paginated ? "Pages" : "Location";
        m_out << QString("#").rightJustified(4) << "  "
                << QString("Title").leftJustified(50) << "  "
                << rangeHeader.leftJustified(28) << "  "
                << "Conf.  Method\n";

        int idx = 0;
        for (const auto &chapter: result.chapters) {
            const QString indent(2 * (chapter.level - 1), QLatin1Char(' '));
            m_out << QString::number(++idx).rightJustified(4) << "  "
                    << elide(indent + QString::fromStdString(chapter.title), 50).leftJustified(50) << "  "
                    << elide(rangeColumn(source, chapter), 28).leftJustified(28) << "  "
                    << QString::number(chapter.confidence, 'f', 2).leftJustified(5) << "  "
                    << ToString(chapter.method) << "\n";
        }
        m_out.flush();
    }

    bool SplitApp::confirmSplit(const DetectionResult &result) {
        if (result.UsedFallback())
            m_out << "⚠️ No chapters were detected; the whole document would be written as one file.\n";
        else
            m_out << "⚠️ Some chapters were detected with low confidence (< 0.5).\n";

        m_out << "Proceed with split? [y/N] ";
        m_out.flush();

        const QString answer = m_in.readLine().trimmed().toLower();
        return answer == "y" || answer == "yes";
    }
} // namespace chapters
