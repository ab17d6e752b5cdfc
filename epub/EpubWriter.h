#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "EpubArchive.h"

namespace chapters::epub {
    struct PackageItem {
        std::string path; // archive path, kept from the source
        std::string id;   // source manifest id, may be empty
        std::string mediaType;
        std::string properties;
        std::string data;
    };

    // Everything one chapter package needs besides the source's metadata.
    struct ChapterPackage {
        std::string title;
        std::vector<PackageItem> units;     // spine order
        std::vector<PackageItem> resources; // stylesheets, images, fonts
        std::string tocTarget;              // archive path (+ "#fragment") nav and NCX link to
        bool preserveMetadata = true;
    };

    std::string BuildContainerXml(const std::string &opfPath);

    // Serializes the whole chapter container: mimetype (stored, first),
    // META-INF/container.xml, the package document at the source's OPF path,
    // every unit and resource, plus a generated EPUB 3 nav and EPUB 2 NCX.
    // Throws std::runtime_error when the zip cannot be written.
    std::vector<std::uint8_t> BuildChapterEpub(const EpubArchive &source, const ChapterPackage &chapter);
} // namespace chapters::epub
