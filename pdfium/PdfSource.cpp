// PdfSource.cpp

#include "PdfSource.h"

#include <cmath>
#include <set>

#include <QString>

#include "../src/Logging.h"
#include "../src/SplitErrors.hpp"
#include "../src/textutils.h"

namespace chapters {
    namespace {
        std::string BookmarkTitle(FPDF_BOOKMARK bookmark) {
            return pdfium::detail::ReadUtf16Text([&](char16_t *buf, const unsigned long len) {
                return FPDFBookmark_GetTitle(bookmark, buf, len);
            });
        }

        // Explicit destination first, then a GoTo action. -1 when neither resolves.
        int BookmarkPageIndex(FPDF_DOCUMENT doc, FPDF_BOOKMARK bookmark) {
            FPDF_DEST dest = FPDFBookmark_GetDest(doc, bookmark);
            if (!dest) {
                FPDF_ACTION action = FPDFBookmark_GetAction(bookmark);
                if (action && FPDFAction_GetType(action) == PDFACTION_GOTO)
                    dest = FPDFAction_GetDest(doc, action);
            }
            return dest ? FPDFDest_GetDestPageIndex(doc, dest) : -1;
        }

        // Siblings are walked in a loop; recursion only descends into children.
        // A bookmark seen twice means the tree loops back on itself.
        std::vector<OutlineNode> ReadBookmarkLevel(FPDF_DOCUMENT doc,
                                                   FPDF_BOOKMARK first,
                                                   std::set<FPDF_BOOKMARK> &visited) {
            std::vector<OutlineNode> nodes;

            for (FPDF_BOOKMARK bookmark = first; bookmark;
                 bookmark = FPDFBookmark_GetNextSibling(doc, bookmark)) {
                if (!visited.insert(bookmark).second) {
                    qCWarning(lcPdf) << "Bookmark tree contains a cycle, remaining entries ignored";
                    break;
                }

                OutlineDest dest;
                dest.pageIndex = BookmarkPageIndex(doc, bookmark);
                std::string title = BookmarkTitle(bookmark);

                if (FPDF_BOOKMARK child = FPDFBookmark_GetFirstChild(doc, bookmark)) {
                    OutlineSection section;
                    section.title = std::move(title);
                    section.dest = dest;
                    section.children = ReadBookmarkLevel(doc, child, visited);
                    nodes.emplace_back(std::move(section));
                } else {
                    nodes.emplace_back(OutlineLeaf{std::move(title), dest});
                }
            }
            return nodes;
        }

        bool IsSpaceChar(const unsigned int uc) {
            return uc == ' ' || uc == '\t' || uc == 0xA0 || uc == 0x3000;
        }
    } // namespace

    PdfSource::PdfSource(std::string path)
        : m_path(std::move(path)) {
        try {
            m_doc.Open(m_path);
        } catch (const std::runtime_error &ex) {
            throw MalformedSourceError(m_path, ex.what());
        }

        m_pageCount = m_doc.GetPageCount();
        if (m_pageCount <= 0)
            throw MalformedSourceError(m_path, "document has no pages");

        qCDebug(lcPdf) << "Opened" << QString::fromStdString(m_path) << "pages:" << m_pageCount;
    }

    std::optional<std::vector<OutlineNode> > PdfSource::ReadOutline() const {
        auto &lib = pdfium::PdfiumLibrary::Instance();
        std::lock_guard lock(lib.Mutex());

        FPDF_BOOKMARK first = FPDFBookmark_GetFirstChild(m_doc.Get(), nullptr);
        if (!first)
            return std::nullopt;

        std::set<FPDF_BOOKMARK> visited;
        auto roots = ReadBookmarkLevel(m_doc.Get(), first, visited);
        if (roots.empty())
            return std::nullopt;
        return roots;
    }

    std::vector<TextRun> PdfSource::PageTextRuns(const int pageIndex) const {
        const pdfium::Page page(m_doc.Get(), pageIndex);
        const pdfium::TextPage textPage(page.Get());

        std::vector<TextRun> runs;
        std::u16string current;
        double sizeSum = 0.0;
        int sizeCount = 0;
        double lastSize = -1.0;

        auto flush = [&] {
            if (!current.empty()) {
                std::string text = trim_copy(pdfium::detail::utf16le_to_utf8(current));
                if (!text.empty())
                    runs.push_back({std::move(text), sizeCount > 0 ? sizeSum / sizeCount : 0.0});
            }
            current.clear();
            sizeSum = 0.0;
            sizeCount = 0;
            lastSize = -1.0;
        };

        {
            auto &lib = pdfium::PdfiumLibrary::Instance();
            std::lock_guard lock(lib.Mutex());

            const int nChars = FPDFText_CountChars(textPage.Get());
            for (int i = 0; i < nChars; ++i) {
                const unsigned int uc = FPDFText_GetUnicode(textPage.Get(), i);
                if (uc == '\r' || uc == '\n') {
                    flush();
                    continue;
                }
                if (uc == 0)
                    continue;

                // Spaces (often generated by PDFium with no font) never split a run
                if (IsSpaceChar(uc)) {
                    if (!current.empty())
                        current.push_back(u' ');
                    continue;
                }

                const double size = FPDFText_GetFontSize(textPage.Get(), i);
                if (sizeCount > 0 && std::fabs(size - lastSize) > 0.01)
                    flush();

                if (uc > 0xFFFF) {
                    current.push_back(static_cast<char16_t>(0xD800 + ((uc - 0x10000) >> 10)));
                    current.push_back(static_cast<char16_t>(0xDC00 + ((uc - 0x10000) & 0x3FF)));
                } else {
                    current.push_back(static_cast<char16_t>(uc));
                }
                sizeSum += size;
                ++sizeCount;
                lastSize = size;
            }
            flush();
        }

        return runs;
    }

    std::map<std::string, std::string> PdfSource::Metadata() const {
        std::map<std::string, std::string> info;
        for (const auto &key: PdfInfoKeys()) {
            if (std::string value = pdfium::GetMetaText(m_doc, key); !value.empty())
                info.emplace(key, std::move(value));
        }
        return info;
    }
} // namespace chapters
