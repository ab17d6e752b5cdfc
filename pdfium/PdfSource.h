// PdfSource.h
#pragma once

#include <map>
#include <string>
#include <vector>

#include "PdfiumHelper.hpp"
#include "../src/DocumentSource.hpp"

namespace chapters {
    // Info dictionary keys carried over to chapter outputs, in write order.
    inline const std::vector<std::string> &PdfInfoKeys() {
        static const std::vector<std::string> keys = {
            "Title", "Author", "Subject", "Keywords",
            "Creator", "Producer", "CreationDate", "ModDate"
        };
        return keys;
    }

    // A PDF opened through PDFium for one detect or split call.
    class PdfSource final : public PaginatedSource {
    public:
        // Throws MalformedSourceError when the file cannot be loaded or has no pages.
        explicit PdfSource(std::string path);

        [[nodiscard]] std::string FilePath() const override { return m_path; }

        [[nodiscard]] int TotalUnits() const override { return m_pageCount; }

        [[nodiscard]] std::optional<std::vector<OutlineNode> > ReadOutline() const override;

        [[nodiscard]] std::vector<TextRun> PageTextRuns(int pageIndex) const override;

        // Non-empty Info entries among PdfInfoKeys().
        [[nodiscard]] std::map<std::string, std::string> Metadata() const;

        [[nodiscard]] const pdfium::Document &Doc() const noexcept { return m_doc; }

    private:
        std::string m_path;
        pdfium::Document m_doc;
        int m_pageCount = 0;
    };
} // namespace chapters
