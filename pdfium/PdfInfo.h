// PdfInfo.h
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace chapters {
    // Rewrites the trailer /Info dictionary of a serialized PDF. Keys are
    // written without the leading slash ("Title", "Author", ...); existing
    // entries not named in fields are left alone.
    //
    // Throws std::runtime_error (qpdf's exceptions derive from it) when the
    // buffer is not a readable PDF.
    std::vector<std::uint8_t> RewritePdfInfo(const std::vector<std::uint8_t> &pdf,
                                             const std::map<std::string, std::string> &fields);
} // namespace chapters
