#include "ZipIo.h"

// minizip-ng
#include <minizip-ng/mz.h>
#include <minizip-ng/mz_zip.h>
#include <minizip-ng/mz_zip_rw.h>
#include <minizip-ng/mz_strm.h>
#include <minizip-ng/mz_strm_mem.h>

#include <algorithm>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include <QString>

#include "../src/Logging.h"
#include "../src/ZipPathUtils.hpp"

namespace chapters::epub {
    namespace {
        // Owns one memory stream plus the reader or writer opened on it, and
        // tears them down in the right order on every exit path.
        struct MemStream {
            void *stream = nullptr;

            MemStream() : stream(mz_stream_mem_create()) {
                if (!stream)
                    throw std::runtime_error("minizip: failed to create memory stream");
            }

            ~MemStream() {
                mz_stream_close(stream);
                mz_stream_mem_delete(&stream);
            }

            MemStream(const MemStream &) = delete;

            MemStream &operator=(const MemStream &) = delete;
        };

        struct Reader {
            void *handle = nullptr;
            bool opened = false;

            Reader() : handle(mz_zip_reader_create()) {
                if (!handle)
                    throw std::runtime_error("minizip: failed to create zip reader");
            }

            ~Reader() {
                if (opened)
                    mz_zip_reader_close(handle);
                mz_zip_reader_delete(&handle);
            }

            Reader(const Reader &) = delete;

            Reader &operator=(const Reader &) = delete;
        };

        struct Writer {
            void *handle = nullptr;

            Writer() : handle(mz_zip_writer_create()) {
                if (!handle)
                    throw std::runtime_error("minizip: failed to create zip writer");
            }

            ~Writer() {
                mz_zip_writer_delete(&handle);
            }

            Writer(const Writer &) = delete;

            Writer &operator=(const Writer &) = delete;
        };

        std::string rcMessage(const char *what, const int32_t rc) {
            return std::string("minizip: ") + what + " failed rc=" + std::to_string(rc);
        }

        void addBuffer(void *writer, const ZipEntry &entry, const bool store) {
            mz_zip_file file_info = {};
            file_info.filename = entry.name.c_str();
            file_info.flag |= MZ_ZIP_FLAG_UTF8;
            file_info.modified_date = std::time(nullptr);
            file_info.uncompressed_size = static_cast<int64_t>(entry.data.size());
            file_info.compression_method = store ? MZ_COMPRESS_METHOD_STORE : MZ_COMPRESS_METHOD_DEFLATE;

            mz_zip_writer_set_compress_method(writer, file_info.compression_method);
            mz_zip_writer_set_compress_level(writer, store ? 0 : MZ_COMPRESS_LEVEL_DEFAULT);

            const int32_t rc_add = mz_zip_writer_add_buffer(writer,
                                                            entry.data.empty()
                                                                ? nullptr
                                                                : const_cast<uint8_t *>(entry.data.data()),
                                                            static_cast<int32_t>(entry.data.size()),
                                                            &file_info);
            if (rc_add != MZ_OK)
                throw std::runtime_error(rcMessage(("add_buffer(" + entry.name + ")").c_str(), rc_add));
        }
    } // namespace

    std::vector<ZipEntry> ReadZip(const std::vector<std::uint8_t> &zipBytes) {
        if (zipBytes.empty())
            throw std::runtime_error("input ZIP buffer is empty");

        MemStream in;
        mz_stream_mem_set_buffer(in.stream,
                                 const_cast<uint8_t *>(zipBytes.data()),
                                 static_cast<int32_t>(zipBytes.size()));

        if (const int32_t rc = mz_stream_open(in.stream, nullptr, MZ_OPEN_MODE_READ); rc != MZ_OK)
            throw std::runtime_error(rcMessage("stream_open(READ)", rc));
        mz_stream_seek(in.stream, 0, MZ_SEEK_SET);

        Reader reader;
        if (const int32_t rc = mz_zip_reader_open(reader.handle, in.stream); rc != MZ_OK)
            throw std::runtime_error(rcMessage("zip_reader_open", rc));
        reader.opened = true;

        std::vector<ZipEntry> entries;
        entries.reserve(256);

        if (const int32_t rc = mz_zip_reader_goto_first_entry(reader.handle); rc != MZ_OK)
            throw std::runtime_error("ZIP has no readable entries (rc=" + std::to_string(rc) + ")");

        do {
            mz_zip_file *file_info = nullptr;
            mz_zip_reader_entry_get_info(reader.handle, &file_info);
            if (!file_info || !file_info->filename)
                continue;

            ZipEntry e;
            e.name = file_info->filename;
            std::replace(e.name.begin(), e.name.end(), '\\', '/');

            if (!zip::is_safe_entry_name(e.name)) {
                qCWarning(lcEpub) << "Skipping unsafe zip entry" << QString::fromStdString(e.name);
                continue;
            }

            e.isDir = (mz_zip_reader_entry_is_dir(reader.handle) == MZ_OK) ||
                      (!e.name.empty() && e.name.back() == '/');

            if (e.isDir) {
                entries.push_back(std::move(e));
                continue;
            }

            const auto usize64 = file_info->uncompressed_size;

            if (constexpr int64_t MAX_ENTRY = 256LL * 1024LL * 1024LL; usize64 < 0 || usize64 > MAX_ENTRY) {
                qCWarning(lcEpub) << "Skipping entry of unreasonable size" << QString::fromStdString(e.name)
                        << usize64;
                continue;
            }

            e.data.resize(static_cast<size_t>(usize64));

            if (const int32_t rc = mz_zip_reader_entry_open(reader.handle); rc != MZ_OK) {
                qCWarning(lcEpub) << "entry_open failed" << QString::fromStdString(e.name) << "rc=" << rc;
                continue;
            }

            int32_t rc_save = MZ_OK;
            if (!e.data.empty()) {
                rc_save = mz_zip_reader_entry_save_buffer(reader.handle,
                                                          e.data.data(),
                                                          static_cast<int32_t>(e.data.size()));
            }
            mz_zip_reader_entry_close(reader.handle);

            if (rc_save != MZ_OK) {
                qCWarning(lcEpub) << "save_buffer failed" << QString::fromStdString(e.name) << "rc=" << rc_save;
                continue;
            }

            entries.push_back(std::move(e));
        } while (mz_zip_reader_goto_next_entry(reader.handle) == MZ_OK);

        return entries;
    }

    std::vector<std::uint8_t> WriteZip(const std::vector<ZipEntry> &entries) {
        MemStream out;
        mz_stream_mem_set_grow_size(out.stream, 64 * 1024);

        if (const int32_t rc = mz_stream_open(out.stream, nullptr, MZ_OPEN_MODE_CREATE); rc != MZ_OK)
            throw std::runtime_error(rcMessage("stream_open(CREATE)", rc));
        mz_stream_seek(out.stream, 0, MZ_SEEK_SET);

        {
            Writer writer;
            if (const int32_t rc = mz_zip_writer_open(writer.handle, out.stream, 0); rc != MZ_OK)
                throw std::runtime_error(rcMessage("writer_open", rc));

            // EPUB: mimetype first, stored (no compression)
            const auto mime = std::find_if(entries.begin(), entries.end(), [](const ZipEntry &e) {
                return !e.isDir && e.name == "mimetype";
            });
            if (mime != entries.end())
                addBuffer(writer.handle, *mime, true);

            for (const auto &entry: entries) {
                if (entry.isDir || entry.name == "mimetype")
                    continue;
                if (!zip::is_safe_entry_name(entry.name))
                    throw std::runtime_error("refusing to write unsafe entry name " + entry.name);
                addBuffer(writer.handle, entry, false);
            }

            if (const int32_t rc = mz_zip_writer_close(writer.handle); rc != MZ_OK)
                throw std::runtime_error(rcMessage("writer_close", rc));
        }

        const void *out_buf = nullptr;
        mz_stream_mem_get_buffer(out.stream, &out_buf);

        int32_t out_len = 0;
        mz_stream_mem_get_buffer_length(out.stream, &out_len);

        if (!out_buf || out_len <= 0)
            throw std::runtime_error("output ZIP buffer is empty");

        // Copy while the stream is still alive
        std::vector<std::uint8_t> bytes(static_cast<size_t>(out_len));
        std::memcpy(bytes.data(), out_buf, bytes.size());
        return bytes;
    }

    std::vector<std::uint8_t> ReadFileBytes(const std::string &path) {
        std::ifstream in(path, std::ios::binary);
        if (!in)
            throw std::runtime_error("cannot open file");

        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }
} // namespace chapters::epub
