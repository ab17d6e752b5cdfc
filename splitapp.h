#pragma once

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QStringList>
#include <QTextStream>

#include "SplitOptions.h"

namespace chapters {
    enum ExitCode {
        ExitSuccess = 0,
        ExitFailure = 1,
        ExitUsage = 2,
        ExitAborted = 3
    };

    // The chaptersplitter command line: "split" and "preview" over one file.
    class SplitApp final {
    public:
        SplitApp(QTextStream &out, QTextStream &err, QTextStream &in);

        // arguments[0] is the program name. Returns an ExitCode.
        int run(const QStringList &arguments);

    private:
        void setupParser();

        // Defaults, then --config, then flags. Throws std::invalid_argument.
        [[nodiscard]] SplitOptions resolveOptions() const;

        void printDetection(const DocumentSource &source, const DetectionResult &result);

        bool confirmSplit(const DetectionResult &result);

        QTextStream &m_out;
        QTextStream &m_err;
        QTextStream &m_in;

        QCommandLineParser m_parser;
        QCommandLineOption m_outputOpt;
        QCommandLineOption m_strategyOpt;
        QCommandLineOption m_sensitivityOpt;
        QCommandLineOption m_levelOpt;
        QCommandLineOption m_patternOpt;
        QCommandLineOption m_formatOpt;
        QCommandLineOption m_noMetadataOpt;
        QCommandLineOption m_yesOpt;
        QCommandLineOption m_configOpt;
        QCommandLineOption m_verboseOpt;
    };
} // namespace chapters
