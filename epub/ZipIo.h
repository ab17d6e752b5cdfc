#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace chapters::epub {
    struct ZipEntry {
        std::string name;
        bool isDir = false;
        std::vector<std::uint8_t> data;
    };

    // Reads every entry of an in-memory zip. Unsafe names are skipped.
    // Throws std::runtime_error (with the minizip rc) when the buffer is not a
    // readable archive.
    std::vector<ZipEntry> ReadZip(const std::vector<std::uint8_t> &zipBytes);

    // Builds an in-memory zip. An entry named "mimetype" is written first and
    // stored uncompressed; everything else is deflated. Directory entries are
    // not emitted. Throws std::runtime_error on any minizip failure.
    std::vector<std::uint8_t> WriteZip(const std::vector<ZipEntry> &entries);

    // Whole file as bytes. Throws std::runtime_error when it cannot be opened.
    std::vector<std::uint8_t> ReadFileBytes(const std::string &path);
} // namespace chapters::epub
