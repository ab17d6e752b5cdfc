#include "SplitOptions.h"

#include <stdexcept>

#include <QFileInfo>
#include <QSettings>

#include "Logging.h"
#include "textutils.h"

namespace chapters {
    Strategy ParseStrategy(const std::string &name) {
        const std::string lower = to_lower_ascii(trim_copy(name));
        if (lower == "native" || lower == "bookmarks")
            return Strategy::Native;
        if (lower == "structural" || lower == "heuristic")
            return Strategy::Structural;
        if (lower == "manifest")
            return Strategy::Manifest;
        if (lower == "hybrid")
            return Strategy::Hybrid;
        throw std::invalid_argument("Unknown strategy '" + name +
                                    "' (expected native, structural, manifest or hybrid)");
    }

    Sensitivity ParseSensitivity(const std::string &name) {
        const std::string lower = to_lower_ascii(trim_copy(name));
        if (lower == "low" || lower == "medium" || lower == "high")
            return SensitivityFromName(lower);
        throw std::invalid_argument("Unknown sensitivity '" + name + "' (expected low, medium or high)");
    }

    OutputFormat ParseOutputFormat(const std::string &name) {
        const std::string lower = to_lower_ascii(trim_copy(name));
        if (lower == "same")
            return OutputFormat::Same;
        if (lower == "pdf")
            return OutputFormat::Pdf;
        if (lower == "epub")
            return OutputFormat::Epub;
        throw std::invalid_argument("Unknown output format '" + name + "' (expected same, pdf or epub)");
    }

    void LoadSettingsFile(const QString &path, SplitOptions &options) {
        if (!QFileInfo::exists(path))
            throw std::invalid_argument("Config file not found: " + path.toStdString());

        QSettings settings(path, QSettings::IniFormat);
        if (settings.status() != QSettings::NoError)
            throw std::invalid_argument("Cannot read config file: " + path.toStdString());

        if (settings.contains("detection/strategy"))
            options.strategy = ParseStrategy(settings.value("detection/strategy").toString().toStdString());
        if (settings.contains("detection/sensitivity"))
            options.sensitivity = ParseSensitivity(settings.value("detection/sensitivity").toString().toStdString());
        if (settings.contains("detection/level")) {
            bool ok = false;
            const int level = settings.value("detection/level").toInt(&ok);
            if (!ok)
                throw std::invalid_argument("detection/level must be an integer");
            options.level = level;
        }

        if (settings.contains("output/pattern"))
            options.pattern = settings.value("output/pattern").toString().toStdString();
        if (settings.contains("output/preserveMetadata"))
            options.preserveMetadata = settings.value("output/preserveMetadata").toBool();
        if (settings.contains("output/format"))
            options.format = ParseOutputFormat(settings.value("output/format").toString().toStdString());
        if (settings.contains("output/directory"))
            options.outputDir = settings.value("output/directory").toString().toStdString();

        qCDebug(lcCli) << "Loaded settings from" << path;
    }
} // namespace chapters
