#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "DocumentSource.hpp"

namespace chapters {
    enum class OutputFormat {
        Same, // the source's own format
        Pdf,
        Epub
    };

    [[nodiscard]] const char *ToString(OutputFormat format) noexcept;

    struct MaterializeOptions {
        bool preserveMetadata = true;
    };

    // Turns one resolved chapter into a standalone output document. The
    // source is only read; every call builds its own output in memory.
    class ChapterMaterializer {
    public:
        virtual ~ChapterMaterializer() = default;

        // Throws OutputWriteError when the chapter cannot be produced.
        [[nodiscard]] virtual std::vector<std::uint8_t> Materialize(const Chapter &chapter) const = 0;

        // Target extension including the dot.
        [[nodiscard]] virtual std::string Extension() const = 0;
    };

    // PDF -> PDF page copy, EPUB -> EPUB rebuild or EPUB -> PDF text flow.
    // Throws std::invalid_argument for PDF -> EPUB and for sources that are not
    // a PdfSource or an EpubArchive.
    std::unique_ptr<ChapterMaterializer> CreateMaterializer(const DocumentSource &source, OutputFormat format,
                                                            const MaterializeOptions &options = {});
} // namespace chapters
