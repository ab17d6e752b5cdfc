// PdfInfo.cpp

#include "PdfInfo.h"

#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFWriter.hh>

#include "../src/Logging.h"

namespace chapters {
    std::vector<std::uint8_t> RewritePdfInfo(const std::vector<std::uint8_t> &pdf,
                                             const std::map<std::string, std::string> &fields) {
        if (fields.empty())
            return pdf;

        QPDF qpdf;
        qpdf.processMemoryFile("chapter.pdf",
                               reinterpret_cast<const char *>(pdf.data()),
                               pdf.size());

        // Get or create /Info dictionary
        auto trailer = qpdf.getTrailer();
        QPDFObjectHandle info;
        if (trailer.hasKey("/Info") && trailer.getKey("/Info").isDictionary()) {
            info = trailer.getKey("/Info");
        } else {
            info = qpdf.makeIndirectObject(QPDFObjectHandle::newDictionary());
            trailer.replaceKey("/Info", info);
        }

        for (const auto &[key, value]: fields)
            info.replaceKey("/" + key, QPDFObjectHandle::newUnicodeString(value));

        QPDFWriter writer(qpdf);
        writer.setOutputMemory();
        writer.write();

        const std::shared_ptr<Buffer> buffer = writer.getBufferSharedPointer();
        const auto *begin = buffer->getBuffer();
        std::vector<std::uint8_t> out(begin, begin + buffer->getSize());

        qCDebug(lcPdf) << "Info dictionary rewritten with" << fields.size() << "field(s)";
        return out;
    }
} // namespace chapters
