// PdfTextFlow.h
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace chapters {
    // Fixed page geometry for text-only PDF output, in points.
    struct TextFlowLayout {
        double pageWidth = 612.0;  // US Letter
        double pageHeight = 792.0;
        double margin = 72.0;
        double fontSize = 11.0;
        double lineHeight = 14.0;
        double titleFontSize = 16.0;
        int wrapChars = 90;
    };

    // Greedy word wrap by code point count. Words longer than wrapChars are
    // broken. An empty or blank paragraph yields one empty line.
    std::vector<std::string> WrapParagraph(const std::string &paragraph, int wrapChars);

    // Lays title and body (paragraphs separated by '\n') onto as many pages as
    // needed with the standard Helvetica font and returns the saved PDF.
    // Throws std::runtime_error on PDFium failures.
    std::vector<std::uint8_t> RenderTextPdf(const std::string &title,
                                            const std::string &body,
                                            const TextFlowLayout &layout = {});
} // namespace chapters
