// PdfTextFlow.cpp

#include "PdfTextFlow.h"

#include <stdexcept>

#include "PdfiumHelper.hpp"
#include "../src/Logging.h"
#include "../src/textutils.h"

namespace chapters {
    namespace {
        std::vector<std::string> SplitWords(const std::string &text) {
            std::vector<std::string> words;
            std::string current;
            for (const char c: text) {
                if (c == ' ' || c == '\t') {
                    if (!current.empty())
                        words.push_back(std::move(current));
                    current.clear();
                } else {
                    current.push_back(c);
                }
            }
            if (!current.empty())
                words.push_back(std::move(current));
            return words;
        }

        class PageWriter {
        public:
            PageWriter(const pdfium::Document &doc, const TextFlowLayout &layout)
                : doc_(doc), layout_(layout) {
                auto &lib = pdfium::PdfiumLibrary::Instance();
                std::lock_guard lock(lib.Mutex());
                font_ = FPDFText_LoadStandardFont(doc_.Get(), "Helvetica");
                if (!font_)
                    throw std::runtime_error("FPDFText_LoadStandardFont(Helvetica) failed");
            }

            ~PageWriter() {
                // Pages must be finished before the font goes away
                FinishPage();
                auto &lib = pdfium::PdfiumLibrary::Instance();
                std::lock_guard<std::mutex> lock(lib.Mutex());
                FPDFFont_Close(font_);
            }

            PageWriter(const PageWriter &) = delete;

            PageWriter &operator=(const PageWriter &) = delete;

            // Moves down by `advance` and draws one line there, breaking to a
            // new page first when the line would cross the bottom margin.
            void Line(const std::string &text, const double fontSize, const double advance) {
                if (!page_.IsValid() || cursorY_ - advance < layout_.margin)
                    NewPage();
                cursorY_ -= advance;
                if (!text.empty())
                    Draw(text, fontSize);
            }

            void FinishPage() noexcept {
                if (!page_.IsValid())
                    return;
                {
                    auto &lib = pdfium::PdfiumLibrary::Instance();
                    std::lock_guard<std::mutex> lock(lib.Mutex());
                    if (!FPDFPage_GenerateContent(page_.Get()))
                        qCWarning(lcPdf) << "FPDFPage_GenerateContent failed on page" << pageCount_;
                }
                page_.Reset();
            }

            [[nodiscard]] int PageCount() const noexcept { return pageCount_; }

        private:
            void NewPage() {
                FinishPage();
                page_.Create(doc_.Get(), pageCount_, layout_.pageWidth, layout_.pageHeight);
                ++pageCount_;
                cursorY_ = layout_.pageHeight - layout_.margin;
            }

            void Draw(const std::string &text, const double fontSize) {
                const std::u16string wide = pdfium::detail::utf8_to_utf16le(text);

                auto &lib = pdfium::PdfiumLibrary::Instance();
                std::lock_guard lock(lib.Mutex());

                FPDF_PAGEOBJECT obj = FPDFPageObj_CreateTextObj(doc_.Get(), font_, static_cast<float>(fontSize));
                if (!obj)
                    throw std::runtime_error("FPDFPageObj_CreateTextObj failed");

                if (!FPDFText_SetText(obj, reinterpret_cast<FPDF_WIDESTRING>(wide.c_str()))) {
                    FPDFPageObj_Destroy(obj);
                    throw std::runtime_error("FPDFText_SetText failed");
                }

                FPDFPageObj_Transform(obj, 1, 0, 0, 1, layout_.margin, cursorY_);
                FPDFPage_InsertObject(page_.Get(), obj); // page takes ownership
            }

            const pdfium::Document &doc_;
            const TextFlowLayout &layout_;
            FPDF_FONT font_ = nullptr;
            pdfium::Page page_;
            int pageCount_ = 0;
            double cursorY_ = 0.0;
        };
    } // namespace

    std::vector<std::string> WrapParagraph(const std::string &paragraph, const int wrapChars) {
        const size_t budget = wrapChars > 0 ? static_cast<size_t>(wrapChars) : 1;

        std::vector<std::string> lines;
        std::string line;
        size_t lineLen = 0;

        for (std::string word: SplitWords(paragraph)) {
            // Hard-break words that cannot fit on any line
            while (count_code_points(word) > budget) {
                if (!line.empty()) {
                    lines.push_back(std::move(line));
                    line.clear();
                    lineLen = 0;
                }
                const size_t cut = find_max_utf8_prefix(word, budget);
                lines.push_back(word.substr(0, cut));
                word.erase(0, cut);
            }
            if (word.empty())
                continue;

            const size_t wordLen = count_code_points(word);
            if (!line.empty() && lineLen + 1 + wordLen > budget) {
                lines.push_back(std::move(line));
                line.clear();
                lineLen = 0;
            }
            if (!line.empty()) {
                line.push_back(' ');
                ++lineLen;
            }
            line += word;
            lineLen += wordLen;
        }

        if (!line.empty() || lines.empty())
            lines.push_back(std::move(line));
        return lines;
    }

    std::vector<std::uint8_t> RenderTextPdf(const std::string &title,
                                            const std::string &body,
                                            const TextFlowLayout &layout) {
        pdfium::Document doc;
        doc.CreateNew();

        int pages = 0;
        {
            PageWriter writer(doc, layout);

            if (!title.empty()) {
                writer.Line(title, layout.titleFontSize, layout.titleFontSize);
                writer.Line({}, layout.fontSize, layout.lineHeight);
            }

            size_t start = 0;
            while (start <= body.size()) {
                size_t nl = body.find('\n', start);
                if (nl == std::string::npos)
                    nl = body.size();
                for (const auto &line: WrapParagraph(body.substr(start, nl - start), layout.wrapChars))
                    writer.Line(line, layout.fontSize, layout.lineHeight);
                start = nl + 1;
            }

            writer.FinishPage();
            pages = writer.PageCount();
        }

        qCDebug(lcPdf) << "Text flowed onto" << pages << "page(s)";
        return pdfium::SaveToBytes(doc);
    }
} // namespace chapters
