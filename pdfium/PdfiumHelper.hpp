#pragma once

#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "fpdfview.h"
#include "fpdf_doc.h"
#include "fpdf_edit.h"
#include "fpdf_save.h"
#include "fpdf_text.h"

namespace pdfium {
    // ============================================================
    //  PdfiumLibrary (process-wide RAII + global mutex)
    // ============================================================
    class PdfiumLibrary {
    public:
        PdfiumLibrary(const PdfiumLibrary &) = delete;

        PdfiumLibrary &operator=(const PdfiumLibrary &) = delete;

        static PdfiumLibrary &Instance() {
            static PdfiumLibrary instance;
            return instance;
        }

        std::mutex &Mutex() noexcept { return mutex_; }

    private:
        PdfiumLibrary() {
            FPDF_InitLibrary();
        }

        ~PdfiumLibrary() {
            FPDF_DestroyLibrary();
        }

        std::mutex mutex_;
    };

    // ============================================================
    //  RAII wrappers: Document, Page & TextPage
    // ============================================================
    class Document {
    public:
        Document() = default;

        explicit Document(const std::string &path) {
            Open(path);
        }

        ~Document() {
            Reset();
        }

        Document(const Document &) = delete;

        Document &operator=(const Document &) = delete;

        Document(Document &&other) noexcept
            : handle_(other.handle_) {
            other.handle_ = nullptr;
        }

        Document &operator=(Document &&other) noexcept {
            if (this != &other) {
                Reset();
                handle_ = other.handle_;
                other.handle_ = nullptr;
            }
            return *this;
        }

        // Encrypted documents are rejected: no password is ever supplied.
        void Open(const std::string &path) {
            Reset();

            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard lock(lib.Mutex());

            handle_ = FPDF_LoadDocument(path.c_str(), nullptr);

            if (!handle_) {
                const unsigned long err = FPDF_GetLastError();
                throw std::runtime_error("FPDF_LoadDocument failed, error = " +
                                         std::to_string(err));
            }
        }

        // Empty document to import pages into or to draw on.
        void CreateNew() {
            Reset();

            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard lock(lib.Mutex());

            handle_ = FPDF_CreateNewDocument();
            if (!handle_)
                throw std::runtime_error("FPDF_CreateNewDocument failed");
        }

        void Reset() noexcept {
            if (handle_) {
                auto &lib = PdfiumLibrary::Instance();
                std::lock_guard<std::mutex> lock(lib.Mutex());
                FPDF_CloseDocument(handle_);
                handle_ = nullptr;
            }
        }

        [[nodiscard]] bool IsValid() const noexcept { return handle_ != nullptr; }

        [[nodiscard]] FPDF_DOCUMENT Get() const noexcept { return handle_; }

        [[nodiscard]] int GetPageCount() const {
            if (!handle_)
                return 0;
            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard<std::mutex> lock(lib.Mutex());
            return FPDF_GetPageCount(handle_);
        }

    private:
        FPDF_DOCUMENT handle_ = nullptr;
    };

    class Page {
    public:
        Page() = default;

        Page(FPDF_DOCUMENT doc, const int index) {
            Open(doc, index);
        }

        ~Page() {
            Reset();
        }

        Page(const Page &) = delete;

        Page &operator=(const Page &) = delete;

        Page(Page &&other) noexcept
            : handle_(other.handle_) {
            other.handle_ = nullptr;
        }

        Page &operator=(Page &&other) noexcept {
            if (this != &other) {
                Reset();
                handle_ = other.handle_;
                other.handle_ = nullptr;
            }
            return *this;
        }

        void Open(FPDF_DOCUMENT doc, const int index) {
            Reset();
            if (!doc)
                throw std::runtime_error("Page::Open: null document handle");

            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard lock(lib.Mutex());

            handle_ = FPDF_LoadPage(doc, index);
            if (!handle_)
                throw std::runtime_error("FPDF_LoadPage failed at index " +
                                         std::to_string(index));
        }

        // Appends a blank page of the given size (points) at index.
        void Create(FPDF_DOCUMENT doc, const int index, const double width, const double height) {
            Reset();
            if (!doc)
                throw std::runtime_error("Page::Create: null document handle");

            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard lock(lib.Mutex());

            handle_ = FPDFPage_New(doc, index, width, height);
            if (!handle_)
                throw std::runtime_error("FPDFPage_New failed at index " +
                                         std::to_string(index));
        }

        void Reset() noexcept {
            if (handle_) {
                auto &lib = PdfiumLibrary::Instance();
                std::lock_guard<std::mutex> lock(lib.Mutex());
                FPDF_ClosePage(handle_);
                handle_ = nullptr;
            }
        }

        [[nodiscard]] bool IsValid() const noexcept { return handle_ != nullptr; }

        [[nodiscard]] FPDF_PAGE Get() const noexcept { return handle_; }

    private:
        FPDF_PAGE handle_ = nullptr;
    };

    class TextPage {
    public:
        explicit TextPage(FPDF_PAGE page) {
            if (!page)
                throw std::runtime_error("TextPage: null page handle");

            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard lock(lib.Mutex());

            // Pdfium handles must never be const: the C API mutates them internally.
            handle_ = FPDFText_LoadPage(page);
            if (!handle_)
                throw std::runtime_error("FPDFText_LoadPage failed");
        }

        ~TextPage() {
            if (handle_) {
                auto &lib = PdfiumLibrary::Instance();
                std::lock_guard<std::mutex> lock(lib.Mutex());
                FPDFText_ClosePage(handle_);
            }
        }

        TextPage(const TextPage &) = delete;

        TextPage &operator=(const TextPage &) = delete;

        [[nodiscard]] FPDF_TEXTPAGE Get() const noexcept { return handle_; }

    private:
        FPDF_TEXTPAGE handle_ = nullptr;
    };

    // ============================================================
    //  Internal helpers: UTF-16LE <-> UTF-8, save to memory
    // ============================================================

    namespace detail {
        inline void append_utf8_codepoint(std::string &out, const std::uint32_t cp) {
            if (cp <= 0x7F) {
                out.push_back(static_cast<char>(cp));
            } else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        inline std::string utf16le_to_utf8(const std::u16string &src) {
            std::string out;
            out.reserve(src.size() * 3); // rough estimate

            for (std::size_t i = 0; i < src.size(); ++i) {
                if (const std::uint32_t ch = src[i]; ch >= 0xD800 && ch <= 0xDBFF) {
                    // High surrogate
                    if (i + 1 < src.size()) {
                        if (const std::uint32_t low = src[i + 1]; low >= 0xDC00 && low <= 0xDFFF) {
                            const std::uint32_t cp =
                                    0x10000 +
                                    (((ch - 0xD800) << 10) | (low - 0xDC00));
                            append_utf8_codepoint(out, cp);
                            ++i; // consumed low surrogate
                            continue;
                        }
                    }
                    // Malformed surrogate: fall back to replacement char
                    append_utf8_codepoint(out, 0xFFFD);
                } else if (ch >= 0xDC00 && ch <= 0xDFFF) {
                    // Lone low surrogate
                    append_utf8_codepoint(out, 0xFFFD);
                } else {
                    append_utf8_codepoint(out, ch);
                }
            }

            return out;
        }

        // NUL-terminated UTF-16LE for FPDF_WIDESTRING parameters.
        inline std::u16string utf8_to_utf16le(const std::string &src) {
            std::u16string out;
            out.reserve(src.size() + 1);

            for (std::size_t i = 0; i < src.size();) {
                const auto c = static_cast<unsigned char>(src[i]);
                std::uint32_t cp = 0xFFFD;
                std::size_t len = 1;

                if (c < 0x80) {
                    cp = c;
                } else if ((c & 0xE0) == 0xC0 && i + 1 < src.size()) {
                    cp = ((c & 0x1Fu) << 6) | (static_cast<unsigned char>(src[i + 1]) & 0x3Fu);
                    len = 2;
                } else if ((c & 0xF0) == 0xE0 && i + 2 < src.size()) {
                    cp = ((c & 0x0Fu) << 12) |
                         ((static_cast<unsigned char>(src[i + 1]) & 0x3Fu) << 6) |
                         (static_cast<unsigned char>(src[i + 2]) & 0x3Fu);
                    len = 3;
                } else if ((c & 0xF8) == 0xF0 && i + 3 < src.size()) {
                    cp = ((c & 0x07u) << 18) |
                         ((static_cast<unsigned char>(src[i + 1]) & 0x3Fu) << 12) |
                         ((static_cast<unsigned char>(src[i + 2]) & 0x3Fu) << 6) |
                         (static_cast<unsigned char>(src[i + 3]) & 0x3Fu);
                    len = 4;
                }
                i += len;

                if (cp >= 0x10000) {
                    cp -= 0x10000;
                    out.push_back(static_cast<char16_t>(0xD800 + (cp >> 10)));
                    out.push_back(static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
                } else {
                    out.push_back(static_cast<char16_t>(cp));
                }
            }

            out.push_back(u'\0');
            return out;
        }

        // Reads one of the "length-query, then fill" UTF-16LE getters. The
        // callback receives (buffer, bufferBytes) and returns the byte length
        // including the terminating NUL pair.
        template<typename Getter>
        std::string ReadUtf16Text(Getter &&getter) {
            const unsigned long bytes = getter(nullptr, 0);
            if (bytes <= 2)
                return {};

            std::u16string buffer(bytes / 2, u'\0');
            getter(buffer.data(), bytes);

            while (!buffer.empty() && buffer.back() == u'\0')
                buffer.pop_back();
            return utf16le_to_utf8(buffer);
        }

        struct ByteSink : FPDF_FILEWRITE {
            std::vector<std::uint8_t> *out = nullptr;
        };

        inline int WriteBlockThunk(FPDF_FILEWRITE *self, const void *data, const unsigned long size) {
            auto *sink = static_cast<ByteSink *>(self);
            const auto *bytes = static_cast<const std::uint8_t *>(data);
            sink->out->insert(sink->out->end(), bytes, bytes + size);
            return 1;
        }
    } // namespace detail

    // Serialize the whole document (non-incremental) into a byte buffer.
    inline std::vector<std::uint8_t> SaveToBytes(const Document &doc) {
        if (!doc.IsValid())
            throw std::runtime_error("SaveToBytes: invalid document");

        std::vector<std::uint8_t> out;
        detail::ByteSink sink{};
        sink.version = 1;
        sink.WriteBlock = &detail::WriteBlockThunk;
        sink.out = &out;

        auto &lib = PdfiumLibrary::Instance();
        std::lock_guard lock(lib.Mutex());

        if (!FPDF_SaveAsCopy(doc.Get(), &sink, FPDF_NO_INCREMENTAL))
            throw std::runtime_error("FPDF_SaveAsCopy failed");
        return out;
    }

    // Info dictionary entry ("Title", "Author", ...) as UTF-8; empty when absent.
    inline std::string GetMetaText(const Document &doc, const std::string &tag) {
        if (!doc.IsValid())
            return {};

        auto &lib = PdfiumLibrary::Instance();
        std::lock_guard lock(lib.Mutex());

        return detail::ReadUtf16Text([&](char16_t *buf, const unsigned long len) {
            return FPDF_GetMetaText(doc.Get(), tag.c_str(), buf, len);
        });
    }
} // namespace pdfium
