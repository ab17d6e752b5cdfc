#include "ChapterMaterializer.h"

#include <algorithm>
#include <map>
#include <mutex>
#include <stdexcept>
#include <unordered_set>

#include <QDomDocument>
#include <QString>

#include "Logging.h"
#include "ResourceResolver.h"
#include "SplitErrors.hpp"
#include "../epub/EpubArchive.h"
#include "../epub/EpubWriter.h"
#include "../epub/XhtmlText.h"
#include "../pdfium/PdfInfo.h"
#include "../pdfium/PdfSource.h"
#include "../pdfium/PdfTextFlow.h"

namespace chapters {
    namespace {
        OutputWriteError ChapterFailure(const Chapter &chapter, const std::string &reason) {
            return OutputWriteError("Chapter '" + chapter.title + "': " + reason);
        }

        // Spine units a chapter covers, clamped to the spine.
        std::vector<std::string> ChapterUnits(const ArchiveSource &source, const Chapter &chapter) {
            const auto &spine = source.SpineUnits();
            std::vector<std::string> units;
            const int first = std::max(chapter.position.startUnit, 1);
            const int last = std::min(chapter.position.endUnit, static_cast<int>(spine.size()));
            for (int i = first; i <= last; ++i)
                units.push_back(spine[i - 1]);
            return units;
        }

        // ============================================================
        //  PDF -> PDF
        // ============================================================
        class PdfPageCopier final : public ChapterMaterializer {
        public:
            PdfPageCopier(const PdfSource &source, const MaterializeOptions &options)
                : m_source(source), m_options(options) {
            }

            std::vector<std::uint8_t> Materialize(const Chapter &chapter) const override {
                const int start = chapter.position.startUnit;
                const int end = chapter.position.endUnit;
                if (start < 1 || end < start || end > m_source.TotalUnits())
                    throw ChapterFailure(chapter, "page range " + std::to_string(start) + "-" +
                                                  std::to_string(end) + " is outside the document");

                try {
                    pdfium::Document out;
                    out.CreateNew();

                    {
                        auto &lib = pdfium::PdfiumLibrary::Instance();
                        std::lock_guard lock(lib.Mutex());

                        // PDFium page ranges are 1-based: "3-7"
                        const std::string range = std::to_string(start) + "-" + std::to_string(end);
                        if (!FPDF_ImportPages(out.Get(), m_source.Doc().Get(), range.c_str(), 0))
                            throw std::runtime_error("FPDF_ImportPages failed for pages " + range);
                    }

                    std::vector<std::uint8_t> bytes = pdfium::SaveToBytes(out);

                    if (m_options.preserveMetadata) {
                        auto fields = m_source.Metadata();
                        fields["Title"] = chapter.title;
                        bytes = RewritePdfInfo(bytes, fields);
                    }

                    qCDebug(lcMaterialize) << "Copied pages" << start << "-" << end << "into"
                            << bytes.size() << "bytes";
                    return bytes;
                } catch (const SplitError &) {
                    throw;
                } catch (const std::exception &ex) {
                    throw ChapterFailure(chapter, ex.what());
                }
            }

            std::string Extension() const override { return ".pdf"; }

        private:
            const PdfSource &m_source;
            MaterializeOptions m_options;
        };

        // ============================================================
        //  EPUB -> EPUB
        // ============================================================
        class EpubRebuilder final : public ChapterMaterializer {
        public:
            EpubRebuilder(const epub::EpubArchive &source, const MaterializeOptions &options)
                : m_source(source), m_options(options) {
            }

            std::vector<std::uint8_t> Materialize(const Chapter &chapter) const override {
                epub::ChapterPackage package;
                package.title = chapter.title;
                package.preserveMetadata = m_options.preserveMetadata;
                package.tocTarget = chapter.position.Location();

                const ResourceResolver resolver(m_source);
                std::unordered_set<std::string> seenResources;

                const auto units = ChapterUnits(m_source, chapter);
                for (const auto &unit: units) {
                    const auto markup = m_source.ReadItem(unit);
                    if (!markup) {
                        qCWarning(lcMaterialize) << "Content unit" << QString::fromStdString(unit)
                                << "is missing from the archive";
                        continue;
                    }

                    epub::PackageItem item;
                    item.path = unit;
                    item.mediaType = epub::kXhtmlMediaType;
                    if (const ManifestItem *manifest = m_source.FindItem(unit)) {
                        item.id = manifest->id;
                        item.mediaType = manifest->mediaType;
                        item.properties = manifest->properties;
                    }

                    // An anchored chapter inside a single unit keeps only its element
                    const bool anchored = units.size() == 1 && chapter.position.fragment.has_value();
                    item.data = anchored ? ExtractFragment(chapter, *markup) : *markup;

                    for (auto &ref: resolver.Resolve(unit, item.data)) {
                        if (!seenResources.insert(ref.path).second)
                            continue;
                        const auto data = m_source.ReadItem(ref.path);
                        if (!data)
                            continue;
                        package.resources.push_back({ref.path, ref.id, ref.mediaType, {}, *data});
                    }

                    package.units.push_back(std::move(item));
                }

                if (package.units.empty())
                    throw ChapterFailure(chapter, "none of its content units could be read");
                if (package.tocTarget.empty())
                    package.tocTarget = package.units.front().path;

                try {
                    return epub::BuildChapterEpub(m_source, package);
                } catch (const std::exception &ex) {
                    throw ChapterFailure(chapter, ex.what());
                }
            }

            std::string Extension() const override { return ".epub"; }

        private:
            // The element whose id matches the chapter's fragment in a fresh
            // XHTML shell, or the unit unmodified when it cannot be located.
            static std::string ExtractFragment(const Chapter &chapter, const std::string &markup) {
                QDomDocument doc;
                QString error;
                if (!epub::ParseMarkup(markup, doc, &error)) {
                    qCWarning(lcMaterialize) << "Cannot parse" << QString::fromStdString(chapter.position.unitPath)
                            << "(" << error << "), keeping the whole unit";
                    return markup;
                }

                const auto element = epub::FindById(doc, QString::fromStdString(*chapter.position.fragment));
                if (!element) {
                    qCDebug(lcMaterialize) << "Anchor" << QString::fromStdString(*chapter.position.fragment)
                            << "not found, keeping the whole unit";
                    return markup;
                }
                return epub::BuildFragmentDocument(chapter.title, *element);
            }

            const epub::EpubArchive &m_source;
            MaterializeOptions m_options;
        };

        // ============================================================
        //  EPUB -> PDF (text only)
        // ============================================================
        class EpubTextFlow final : public ChapterMaterializer {
        public:
            EpubTextFlow(const epub::EpubArchive &source, const MaterializeOptions &options)
                : m_source(source), m_options(options) {
            }

            std::vector<std::uint8_t> Materialize(const Chapter &chapter) const override {
                std::string body;
                for (const auto &unit: ChapterUnits(m_source, chapter)) {
                    const auto markup = m_source.ReadItem(unit);
                    if (!markup) {
                        qCWarning(lcMaterialize) << "Content unit" << QString::fromStdString(unit)
                                << "is missing from the archive";
                        continue;
                    }
                    if (!body.empty())
                        body += '\n';
                    body += epub::ExtractPlainText(*markup);
                }

                try {
                    std::vector<std::uint8_t> bytes = RenderTextPdf(chapter.title, body);

                    std::map<std::string, std::string> fields{{"Title", chapter.title}};
                    if (m_options.preserveMetadata) {
                        for (const auto &element: m_source.Metadata()) {
                            if (element.IsDc("creator") && !fields.count("Author"))
                                fields["Author"] = element.text.trimmed().toStdString();
                        }
                    }
                    return RewritePdfInfo(bytes, fields);
                } catch (const std::exception &ex) {
                    throw ChapterFailure(chapter, ex.what());
                }
            }

            std::string Extension() const override { return ".pdf"; }

        private:
            const epub::EpubArchive &m_source;
            MaterializeOptions m_options;
        };
    } // namespace

    const char *ToString(const OutputFormat format) noexcept {
        switch (format) {
            case OutputFormat::Same: return "same";
            case OutputFormat::Pdf: return "pdf";
            case OutputFormat::Epub: return "epub";
        }
        return "same";
    }

    std::unique_ptr<ChapterMaterializer> CreateMaterializer(const DocumentSource &source, const OutputFormat format,
                                                            const MaterializeOptions &options) {
        if (const auto *pdf = dynamic_cast<const PdfSource *>(&source)) {
            if (format == OutputFormat::Epub)
                throw std::invalid_argument("PDF sources can only be split into PDF files");
            return std::make_unique<PdfPageCopier>(*pdf, options);
        }

        if (const auto *archive = dynamic_cast<const epub::EpubArchive *>(&source)) {
            if (format == OutputFormat::Pdf)
                return std::make_unique<EpubTextFlow>(*archive, options);
            return std::make_unique<EpubRebuilder>(*archive, options);
        }

        throw std::invalid_argument("No materializer for " + source.FilePath());
    }
} // namespace chapters
