#pragma once

#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <QDomElement>
#include <QString>

#include "ZipIo.h"
#include "../src/DocumentSource.hpp"

namespace chapters::epub {
    inline constexpr auto kOpfNamespace = "http://www.idpf.org/2007/opf";
    inline constexpr auto kDcNamespace = "http://purl.org/dc/elements/1.1/";
    inline constexpr auto kXhtmlMediaType = "application/xhtml+xml";
    inline constexpr auto kNcxMediaType = "application/x-dtbncx+xml";

    struct MetadataAttribute {
        QString qualifiedName; // "id", "opf:role", "xml:lang"
        QString value;
    };

    // One child element of the package <metadata>, kept as written so it can be
    // re-emitted into a chapter package.
    struct MetadataElement {
        QString qualifiedName; // "dc:creator", "meta"
        QString localName;     // "creator", "meta"
        QString text;
        std::vector<MetadataAttribute> attributes;

        [[nodiscard]] QString Attribute(const QString &name) const {
            for (const auto &a: attributes) {
                if (a.qualifiedName == name)
                    return a.value;
            }
            return {};
        }

        [[nodiscard]] bool IsDc(const char *name) const {
            return qualifiedName.startsWith(QLatin1String("dc:")) && localName == QLatin1String(name);
        }
    };

    // An EPUB container parsed into memory: zip entries, package document,
    // manifest, spine and navigation. The instance owns every byte; readers get
    // copies or const references valid for its lifetime.
    class EpubArchive final : public ArchiveSource {
    public:
        // All three throw MalformedSourceError when the input is not a usable EPUB
        // (unreadable zip, no package document, empty spine).
        static std::unique_ptr<EpubArchive> Open(const std::string &path);

        static std::unique_ptr<EpubArchive> FromBytes(const std::vector<std::uint8_t> &bytes, std::string path);

        static std::unique_ptr<EpubArchive> FromEntries(std::vector<ZipEntry> entries, std::string path);

        [[nodiscard]] std::string FilePath() const override { return path_; }

        [[nodiscard]] std::optional<std::vector<OutlineNode> > ReadOutline() const override;

        [[nodiscard]] const std::vector<std::string> &SpineUnits() const override { return spine_; }

        [[nodiscard]] std::optional<std::string> ReadItem(const std::string &path) const override;

        [[nodiscard]] const ManifestItem *FindItem(const std::string &ref) const override;

        [[nodiscard]] const std::string &PackagePath() const noexcept { return opfPath_; }

        [[nodiscard]] std::string PackageDir() const;

        [[nodiscard]] const std::string &Version() const noexcept { return version_; }

        [[nodiscard]] const std::string &Title() const noexcept { return title_; }

        [[nodiscard]] const std::string &UniqueIdentifierId() const noexcept { return uniqueIdentifierId_; }

        [[nodiscard]] const std::vector<ManifestItem> &Manifest() const noexcept { return manifest_; }

        [[nodiscard]] const std::vector<MetadataElement> &Metadata() const noexcept { return metadata_; }

        // prefix -> namespace URI for every prefix used inside <metadata>
        [[nodiscard]] const std::map<QString, QString> &MetadataNamespaces() const noexcept {
            return metadataNamespaces_;
        }

        [[nodiscard]] const std::string &NavPath() const noexcept { return navPath_; }

        [[nodiscard]] const std::string &NcxPath() const noexcept { return ncxPath_; }

    private:
        EpubArchive(std::vector<ZipEntry> entries, std::string path);

        void LocatePackage();

        void ParsePackage();

        void ParseMetadata(const QDomElement &metadata);

        [[nodiscard]] std::optional<std::vector<OutlineNode> > ReadNav() const;

        [[nodiscard]] std::optional<std::vector<OutlineNode> > ReadNcx() const;

        std::string path_;
        std::vector<ZipEntry> entries_;
        std::unordered_map<std::string, size_t> entryIndex_;

        std::string opfPath_;
        std::string version_;
        std::string title_;
        std::string uniqueIdentifierId_;
        std::vector<ManifestItem> manifest_;
        std::unordered_map<std::string, size_t> manifestByPath_;
        std::unordered_map<std::string, size_t> manifestByHref_;
        std::vector<MetadataElement> metadata_;
        std::map<QString, QString> metadataNamespaces_;
        std::vector<std::string> spine_;
        std::string navPath_;
        std::string ncxPath_;
    };
} // namespace chapters::epub
