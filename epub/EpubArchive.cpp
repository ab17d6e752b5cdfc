#include "EpubArchive.h"

#include <QByteArray>
#include <QDomDocument>
#include <QDomNamedNodeMap>
#include <QStringList>

#include "XhtmlText.h"
#include "../src/Logging.h"
#include "../src/SplitErrors.hpp"
#include "../src/ZipPathUtils.hpp"
#include "../src/textutils.h"

namespace chapters::epub {
    namespace {
        std::vector<QDomElement> ChildElements(const QDomElement &parent, const QString &name) {
            std::vector<QDomElement> out;
            for (QDomElement child = parent.firstChildElement(); !child.isNull();
                 child = child.nextSiblingElement()) {
                if (LocalName(child) == name)
                    out.push_back(child);
            }
            return out;
        }

        QDomElement FirstChild(const QDomElement &parent, const QString &name) {
            for (QDomElement child = parent.firstChildElement(); !child.isNull();
                 child = child.nextSiblingElement()) {
                if (LocalName(child) == name)
                    return child;
            }
            return {};
        }

        std::string Attr(const QDomElement &element, const char *name) {
            return element.attribute(QString::fromLatin1(name)).trimmed().toStdString();
        }

        // "text/ch1.xhtml#sec" written inside baseDir -> "OEBPS/text/ch1.xhtml#sec".
        // Empty when the reference has no unit part.
        std::string ResolveHref(const std::string &baseDir, const std::string &href) {
            const size_t hash = href.find('#');
            const std::string unit = href.substr(0, hash);
            if (unit.empty())
                return {};

            std::string path = zip::resolve(baseDir, unit);
            if (path.empty())
                return {};
            if (hash != std::string::npos && hash + 1 < href.size())
                path += href.substr(hash);
            return path;
        }

        bool HasToken(const QString &list, const QString &token) {
            return list.split(QLatin1Char(' '), Qt::SkipEmptyParts).contains(token);
        }

        std::vector<OutlineNode> ReadNavList(const QDomElement &ol, const std::string &baseDir) {
            std::vector<OutlineNode> nodes;
            for (const auto &li: ChildElements(ol, QStringLiteral("li"))) {
                QDomElement label = FirstChild(li, QStringLiteral("a"));
                if (label.isNull())
                    label = FirstChild(li, QStringLiteral("span"));
                const QDomElement nested = FirstChild(li, QStringLiteral("ol"));
                if (label.isNull() && nested.isNull())
                    continue;

                OutlineDest dest;
                std::string title;
                if (!label.isNull()) {
                    title = ElementText(label);
                    dest.href = ResolveHref(baseDir, Attr(label, "href"));
                }

                if (!nested.isNull()) {
                    OutlineSection section;
                    section.title = std::move(title);
                    section.dest = std::move(dest);
                    section.children = ReadNavList(nested, baseDir);
                    nodes.emplace_back(std::move(section));
                } else {
                    nodes.emplace_back(OutlineLeaf{std::move(title), std::move(dest)});
                }
            }
            return nodes;
        }

        std::vector<OutlineNode> ReadNavPoints(const QDomElement &parent, const std::string &baseDir) {
            std::vector<OutlineNode> nodes;
            for (const auto &point: ChildElements(parent, QStringLiteral("navpoint"))) {
                std::string title;
                if (const auto text = FindFirst(FirstChild(point, QStringLiteral("navlabel")), QStringLiteral("text")))
                    title = ElementText(*text);

                OutlineDest dest;
                dest.href = ResolveHref(baseDir, Attr(FirstChild(point, QStringLiteral("content")), "src"));

                auto children = ReadNavPoints(point, baseDir);
                if (!children.empty()) {
                    OutlineSection section;
                    section.title = std::move(title);
                    section.dest = std::move(dest);
                    section.children = std::move(children);
                    nodes.emplace_back(std::move(section));
                } else {
                    nodes.emplace_back(OutlineLeaf{std::move(title), std::move(dest)});
                }
            }
            return nodes;
        }

        bool ParseNamespaced(const std::string &xml, QDomDocument &doc, QString &error) {
            int line = 0;
            int column = 0;
            if (doc.setContent(QByteArray::fromStdString(xml), true, &error, &line, &column))
                return true;
            error = QStringLiteral("%1 (line %2, column %3)").arg(error).arg(line).arg(column);
            return false;
        }
    } // namespace

    std::unique_ptr<EpubArchive> EpubArchive::Open(const std::string &path) {
        std::vector<std::uint8_t> bytes;
        try {
            bytes = ReadFileBytes(path);
        } catch (const std::runtime_error &ex) {
            throw MalformedSourceError(path, ex.what());
        }
        return FromBytes(bytes, path);
    }

    std::unique_ptr<EpubArchive> EpubArchive::FromBytes(const std::vector<std::uint8_t> &bytes, std::string path) {
        std::vector<ZipEntry> entries;
        try {
            entries = ReadZip(bytes);
        } catch (const std::runtime_error &ex) {
            throw MalformedSourceError(path, ex.what());
        }
        return FromEntries(std::move(entries), std::move(path));
    }

    std::unique_ptr<EpubArchive> EpubArchive::FromEntries(std::vector<ZipEntry> entries, std::string path) {
        return std::unique_ptr<EpubArchive>(new EpubArchive(std::move(entries), std::move(path)));
    }

    EpubArchive::EpubArchive(std::vector<ZipEntry> entries, std::string path)
        : path_(std::move(path)), entries_(std::move(entries)) {
        for (size_t i = 0; i < entries_.size(); ++i) {
            if (!entries_[i].isDir)
                entryIndex_.emplace(entries_[i].name, i);
        }

        if (const auto mimetype = ReadItem("mimetype");
            mimetype && trim_copy(*mimetype) != "application/epub+zip") {
            qCWarning(lcEpub) << "Unexpected mimetype" << QString::fromStdString(*mimetype);
        }

        LocatePackage();
        ParsePackage();

        qCDebug(lcEpub) << "Opened" << QString::fromStdString(path_) << "package"
                << QString::fromStdString(opfPath_) << "spine units:" << spine_.size();
    }

    void EpubArchive::LocatePackage() {
        if (const auto container = ReadItem("META-INF/container.xml")) {
            QDomDocument doc;
            QString error;
            if (ParseNamespaced(*container, doc, error)) {
                if (const auto rootfile = FindFirst(doc, QStringLiteral("rootfile")))
                    opfPath_ = zip::normalize(Attr(*rootfile, "full-path"));
            } else {
                qCWarning(lcEpub) << "META-INF/container.xml:" << error;
            }
        }

        if (opfPath_.empty()) {
            for (const auto &entry: entries_) {
                if (!entry.isDir && ends_with_icase(entry.name, ".opf")) {
                    qCWarning(lcEpub) << "No usable container.xml, using" << QString::fromStdString(entry.name);
                    opfPath_ = entry.name;
                    break;
                }
            }
        }

        if (opfPath_.empty() || entryIndex_.count(opfPath_) == 0)
            throw MalformedSourceError(path_, "no package document found");
    }

    void EpubArchive::ParsePackage() {
        QDomDocument doc;
        QString error;
        if (!ParseNamespaced(*ReadItem(opfPath_), doc, error))
            throw MalformedSourceError(path_, "package document " + opfPath_ + ": " + error.toStdString());

        const QDomElement package = doc.documentElement();
        version_ = Attr(package, "version");
        uniqueIdentifierId_ = Attr(package, "unique-identifier");

        ParseMetadata(FirstChild(package, QStringLiteral("metadata")));

        const std::string baseDir = PackageDir();
        std::unordered_map<std::string, size_t> byId;

        for (const auto &item: ChildElements(FirstChild(package, QStringLiteral("manifest")), QStringLiteral("item"))) {
            ManifestItem m;
            m.id = Attr(item, "id");
            m.href = Attr(item, "href");
            m.mediaType = Attr(item, "media-type");
            m.properties = Attr(item, "properties");
            m.path = zip::resolve(baseDir, m.href);
            if (m.path.empty()) {
                qCWarning(lcEpub) << "Manifest item" << QString::fromStdString(m.id) << "points outside the archive";
                continue;
            }

            const size_t index = manifest_.size();
            byId.emplace(m.id, index);
            manifestByPath_.emplace(m.path, index);
            manifestByHref_.emplace(m.href, index);

            if (navPath_.empty() && HasToken(QString::fromStdString(m.properties), QStringLiteral("nav")))
                navPath_ = m.path;
            manifest_.push_back(std::move(m));
        }

        const QDomElement spine = FirstChild(package, QStringLiteral("spine"));
        for (const auto &itemref: ChildElements(spine, QStringLiteral("itemref"))) {
            const std::string idref = Attr(itemref, "idref");
            const auto it = byId.find(idref);
            if (it == byId.end()) {
                qCWarning(lcEpub) << "Spine references unknown item" << QString::fromStdString(idref);
                continue;
            }
            spine_.push_back(manifest_[it->second].path);
        }

        if (const auto toc = byId.find(Attr(spine, "toc")); toc != byId.end())
            ncxPath_ = manifest_[toc->second].path;
        if (ncxPath_.empty()) {
            for (const auto &m: manifest_) {
                if (m.mediaType == kNcxMediaType) {
                    ncxPath_ = m.path;
                    break;
                }
            }
        }

        if (spine_.empty())
            throw MalformedSourceError(path_, "package has an empty spine");
    }

    void EpubArchive::ParseMetadata(const QDomElement &metadata) {
        for (QDomElement el = metadata.firstChildElement(); !el.isNull(); el = el.nextSiblingElement()) {
            MetadataElement m;
            const QString prefix = el.prefix();
            m.localName = el.localName().isEmpty() ? LocalName(el) : el.localName();
            m.qualifiedName = prefix.isEmpty() ? m.localName : prefix + QLatin1Char(':') + m.localName;
            m.text = el.text();
            if (!prefix.isEmpty() && prefix != QLatin1String("xml"))
                metadataNamespaces_[prefix] = el.namespaceURI();

            const QDomNamedNodeMap attrs = el.attributes();
            for (int i = 0; i < attrs.count(); ++i) {
                const QDomAttr a = attrs.item(i).toAttr();
                QString name = a.name();
                if (name.startsWith(QLatin1String("xmlns")))
                    continue;
                if (!a.prefix().isEmpty() && !name.contains(QLatin1Char(':')))
                    name = a.prefix() + QLatin1Char(':') + a.localName();
                if (!a.prefix().isEmpty() && a.prefix() != QLatin1String("xml"))
                    metadataNamespaces_[a.prefix()] = a.namespaceURI();
                m.attributes.push_back({name, a.value()});
            }

            if (title_.empty() && m.IsDc("title"))
                title_ = collapse_whitespace(m.text.toStdString());
            metadata_.push_back(std::move(m));
        }
    }

    std::string EpubArchive::PackageDir() const {
        return zip::parent_dir(opfPath_);
    }

    std::optional<std::string> EpubArchive::ReadItem(const std::string &path) const {
        const auto it = entryIndex_.find(path);
        if (it == entryIndex_.end())
            return std::nullopt;
        const auto &data = entries_[it->second].data;
        return std::string(data.begin(), data.end());
    }

    const ManifestItem *EpubArchive::FindItem(const std::string &ref) const {
        if (const auto it = manifestByPath_.find(ref); it != manifestByPath_.end())
            return &manifest_[it->second];
        if (const auto it = manifestByHref_.find(ref); it != manifestByHref_.end())
            return &manifest_[it->second];
        if (const auto it = manifestByPath_.find(zip::resolve(PackageDir(), ref)); it != manifestByPath_.end())
            return &manifest_[it->second];
        return nullptr;
    }

    std::optional<std::vector<OutlineNode> > EpubArchive::ReadOutline() const {
        if (auto nav = ReadNav(); nav && !nav->empty())
            return nav;
        if (auto ncx = ReadNcx(); ncx && !ncx->empty())
            return ncx;
        return std::nullopt;
    }

    std::optional<std::vector<OutlineNode> > EpubArchive::ReadNav() const {
        if (navPath_.empty())
            return std::nullopt;
        const auto markup = ReadItem(navPath_);
        if (!markup)
            return std::nullopt;

        QDomDocument doc;
        QString error;
        if (!ParseMarkup(*markup, doc, &error)) {
            qCWarning(lcEpub) << "Navigation document" << QString::fromStdString(navPath_) << error;
            return std::nullopt;
        }

        // The toc nav wins over landmarks and page-list navs
        std::optional<QDomElement> tocNav;
        std::vector<QDomNode> stack{doc};
        while (!stack.empty() && !tocNav) {
            const QDomNode node = stack.back();
            stack.pop_back();
            if (node.isElement() && LocalName(node.toElement()) == QLatin1String("nav") &&
                HasToken(node.toElement().attribute(QStringLiteral("epub:type")), QStringLiteral("toc"))) {
                tocNav = node.toElement();
            }
            for (QDomNode child = node.lastChild(); !child.isNull(); child = child.previousSibling()) {
                if (child.isElement())
                    stack.push_back(child);
            }
        }
        if (!tocNav)
            tocNav = FindFirst(doc, QStringLiteral("nav"));
        if (!tocNav)
            return std::nullopt;

        const auto ol = FindFirst(*tocNav, QStringLiteral("ol"));
        if (!ol)
            return std::nullopt;
        return ReadNavList(*ol, zip::parent_dir(navPath_));
    }

    std::optional<std::vector<OutlineNode> > EpubArchive::ReadNcx() const {
        if (ncxPath_.empty())
            return std::nullopt;
        const auto xml = ReadItem(ncxPath_);
        if (!xml)
            return std::nullopt;

        QDomDocument doc;
        QString error;
        if (!ParseNamespaced(NormalizeEntities(*xml), doc, error)) {
            qCWarning(lcEpub) << "NCX" << QString::fromStdString(ncxPath_) << error;
            return std::nullopt;
        }

        const auto navMap = FindFirst(doc, QStringLiteral("navmap"));
        if (!navMap)
            return std::nullopt;
        return ReadNavPoints(*navMap, zip::parent_dir(ncxPath_));
    }
} // namespace chapters::epub
