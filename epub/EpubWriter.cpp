#include "EpubWriter.h"

#include <set>

#include <QByteArray>
#include <QDateTime>
#include <QUuid>
#include <QXmlStreamWriter>

#include "../src/Logging.h"
#include "../src/ZipPathUtils.hpp"

namespace chapters::epub {
    namespace {
        constexpr auto kXhtmlNamespace = "http://www.w3.org/1999/xhtml";
        constexpr auto kOpsNamespace = "http://www.idpf.org/2007/ops";
        constexpr auto kNcxNamespace = "http://www.daisy.org/z3986/2005/ncx/";

        QString Q(const std::string &s) {
            return QString::fromStdString(s);
        }

        // First candidate not yet in `used`, trying base, then base-1, base-2...
        // with the suffix placed before the extension.
        std::string Unique(const std::string &candidate, std::set<std::string> &used) {
            std::string name = candidate;
            const size_t dot = candidate.find_last_of('.');
            const size_t slash = candidate.find_last_of('/');
            const bool hasExt = dot != std::string::npos && (slash == std::string::npos || dot > slash);

            for (int n = 1; used.count(name) != 0; ++n) {
                name = hasExt
                           ? candidate.substr(0, dot) + "-" + std::to_string(n) + candidate.substr(dot)
                           : candidate + "-" + std::to_string(n);
            }
            used.insert(name);
            return name;
        }

        std::string JoinPath(const std::string &dir, const std::string &name) {
            return dir.empty() ? name : dir + "/" + name;
        }

        // Relative link from a document in fromDir to "path#fragment".
        std::string RelativeLink(const std::string &fromDir, const std::string &target) {
            const size_t hash = target.find('#');
            std::string link = zip::relative_to(fromDir, target.substr(0, hash));
            if (hash != std::string::npos)
                link += target.substr(hash);
            return link;
        }

        bool IsModifiedMeta(const MetadataElement &m) {
            return m.localName == QLatin1String("meta") &&
                   m.Attribute(QStringLiteral("property")) == QLatin1String("dcterms:modified");
        }

        struct ResolvedIdentity {
            QString uidElementId; // id of the identifier named by unique-identifier
            QString uidValue;
            bool writeIdentifier = true;
            QString language;
            bool writeLanguage = true;
        };

        ResolvedIdentity ResolveIdentity(const EpubArchive &source, const bool preserve) {
            ResolvedIdentity id;
            const QString sourceUid = Q(source.UniqueIdentifierId());

            for (const auto &m: source.Metadata()) {
                if (m.IsDc("identifier")) {
                    if (id.uidValue.isEmpty())
                        id.uidValue = m.text.trimmed();
                    if (preserve && !sourceUid.isEmpty() && m.Attribute(QStringLiteral("id")) == sourceUid) {
                        id.uidElementId = sourceUid;
                        id.uidValue = m.text.trimmed();
                        id.writeIdentifier = false;
                    }
                } else if (m.IsDc("language")) {
                    if (id.language.isEmpty())
                        id.language = m.text.trimmed();
                    if (preserve)
                        id.writeLanguage = false;
                }
            }

            if (id.uidValue.isEmpty())
                id.uidValue = QStringLiteral("urn:uuid:") + QUuid::createUuid().toString(QUuid::WithoutBraces);
            if (id.uidElementId.isEmpty())
                id.uidElementId = QStringLiteral("bookid");
            if (id.language.isEmpty()) {
                id.language = QStringLiteral("en");
                id.writeLanguage = true;
            }
            return id;
        }

        void WriteMetadata(QXmlStreamWriter &w, const EpubArchive &source, const ChapterPackage &chapter,
                           const ResolvedIdentity &identity, const bool epub3) {
            w.writeStartElement(QStringLiteral("metadata"));
            w.writeAttribute(QStringLiteral("xmlns:dc"), QString::fromLatin1(kDcNamespace));
            w.writeAttribute(QStringLiteral("xmlns:opf"), QString::fromLatin1(kOpfNamespace));
            if (chapter.preserveMetadata) {
                for (const auto &[prefix, uri]: source.MetadataNamespaces()) {
                    if (prefix != QLatin1String("dc") && prefix != QLatin1String("opf"))
                        w.writeAttribute(QStringLiteral("xmlns:") + prefix, uri);
                }
            }

            w.writeTextElement(QStringLiteral("dc:title"), Q(chapter.title));

            if (identity.writeIdentifier) {
                w.writeStartElement(QStringLiteral("dc:identifier"));
                w.writeAttribute(QStringLiteral("id"), identity.uidElementId);
                w.writeCharacters(identity.uidValue);
                w.writeEndElement();
            }
            if (identity.writeLanguage)
                w.writeTextElement(QStringLiteral("dc:language"), identity.language);

            if (chapter.preserveMetadata) {
                for (const auto &m: source.Metadata()) {
                    if (m.IsDc("title") || IsModifiedMeta(m))
                        continue;
                    // EPUB 3 refinements of the replaced title would dangle
                    if (m.localName == QLatin1String("meta") && m.Attribute(QStringLiteral("refines")).startsWith('#')) {
                        const QString target = m.Attribute(QStringLiteral("refines")).mid(1);
                        bool refinesTitle = false;
                        for (const auto &t: source.Metadata()) {
                            if (t.IsDc("title") && t.Attribute(QStringLiteral("id")) == target)
                                refinesTitle = true;
                        }
                        if (refinesTitle)
                            continue;
                    }

                    w.writeStartElement(m.qualifiedName);
                    for (const auto &a: m.attributes)
                        w.writeAttribute(a.qualifiedName, a.value);
                    if (!m.text.isEmpty())
                        w.writeCharacters(m.text);
                    w.writeEndElement();
                }
            }

            if (epub3) {
                w.writeStartElement(QStringLiteral("meta"));
                w.writeAttribute(QStringLiteral("property"), QStringLiteral("dcterms:modified"));
                w.writeCharacters(QDateTime::currentDateTimeUtc().toString(Qt::ISODate));
                w.writeEndElement();
            }

            w.writeEndElement(); // metadata
        }

        std::string BuildNav(const std::string &title, const std::string &link) {
            QByteArray out;
            QXmlStreamWriter w(&out);
            w.setAutoFormatting(true);
            w.writeStartDocument();
            w.writeDTD(QStringLiteral("<!DOCTYPE html>"));
            w.writeStartElement(QStringLiteral("html"));
            w.writeAttribute(QStringLiteral("xmlns"), QString::fromLatin1(kXhtmlNamespace));
            w.writeAttribute(QStringLiteral("xmlns:epub"), QString::fromLatin1(kOpsNamespace));

            w.writeStartElement(QStringLiteral("head"));
            w.writeTextElement(QStringLiteral("title"), Q(title));
            w.writeEndElement();

            w.writeStartElement(QStringLiteral("body"));
            w.writeStartElement(QStringLiteral("nav"));
            w.writeAttribute(QStringLiteral("epub:type"), QStringLiteral("toc"));
            w.writeAttribute(QStringLiteral("id"), QStringLiteral("toc"));
            w.writeTextElement(QStringLiteral("h1"), Q(title));
            w.writeStartElement(QStringLiteral("ol"));
            w.writeStartElement(QStringLiteral("li"));
            w.writeStartElement(QStringLiteral("a"));
            w.writeAttribute(QStringLiteral("href"), Q(link));
            w.writeCharacters(Q(title));
            w.writeEndElement(); // a
            w.writeEndElement(); // li
            w.writeEndElement(); // ol
            w.writeEndElement(); // nav
            w.writeEndElement(); // body
            w.writeEndElement(); // html
            w.writeEndDocument();
            return out.toStdString();
        }

        std::string BuildNcx(const std::string &title, const QString &uid, const std::string &link) {
            QByteArray out;
            QXmlStreamWriter w(&out);
            w.setAutoFormatting(true);
            w.writeStartDocument();
            w.writeStartElement(QStringLiteral("ncx"));
            w.writeAttribute(QStringLiteral("xmlns"), QString::fromLatin1(kNcxNamespace));
            w.writeAttribute(QStringLiteral("version"), QStringLiteral("2005-1"));

            w.writeStartElement(QStringLiteral("head"));
            const std::pair<const char *, QString> metas[] = {
                {"dtb:uid", uid},
                {"dtb:depth", QStringLiteral("1")},
                {"dtb:totalPageCount", QStringLiteral("0")},
                {"dtb:maxPageNumber", QStringLiteral("0")},
            };
            for (const auto &[name, content]: metas) {
                w.writeEmptyElement(QStringLiteral("meta"));
                w.writeAttribute(QStringLiteral("name"), QString::fromLatin1(name));
                w.writeAttribute(QStringLiteral("content"), content);
            }
            w.writeEndElement(); // head

            w.writeStartElement(QStringLiteral("docTitle"));
            w.writeTextElement(QStringLiteral("text"), Q(title));
            w.writeEndElement();

            w.writeStartElement(QStringLiteral("navMap"));
            w.writeStartElement(QStringLiteral("navPoint"));
            w.writeAttribute(QStringLiteral("id"), QStringLiteral("navPoint-1"));
            w.writeAttribute(QStringLiteral("playOrder"), QStringLiteral("1"));
            w.writeStartElement(QStringLiteral("navLabel"));
            w.writeTextElement(QStringLiteral("text"), Q(title));
            w.writeEndElement();
            w.writeEmptyElement(QStringLiteral("content"));
            w.writeAttribute(QStringLiteral("src"), Q(link));
            w.writeEndElement(); // navPoint
            w.writeEndElement(); // navMap

            w.writeEndElement(); // ncx
            w.writeEndDocument();
            return out.toStdString();
        }

        // Only the generated navigation document may carry "nav".
        std::string WithoutNav(const std::string &properties) {
            std::string out;
            size_t start = 0;
            while (start < properties.size()) {
                size_t end = properties.find(' ', start);
                if (end == std::string::npos)
                    end = properties.size();
                const std::string token = properties.substr(start, end - start);
                if (!token.empty() && token != "nav")
                    out += (out.empty() ? "" : " ") + token;
                start = end + 1;
            }
            return out;
        }

        ZipEntry Entry(const std::string &name, const std::string &data) {
            return {name, false, std::vector<std::uint8_t>(data.begin(), data.end())};
        }
    } // namespace

    std::string BuildContainerXml(const std::string &opfPath) {
        QByteArray out;
        QXmlStreamWriter w(&out);
        w.setAutoFormatting(true);
        w.writeStartDocument();
        w.writeStartElement(QStringLiteral("container"));
        w.writeAttribute(QStringLiteral("version"), QStringLiteral("1.0"));
        w.writeAttribute(QStringLiteral("xmlns"), QStringLiteral("urn:oasis:names:tc:opendocument:xmlns:container"));
        w.writeStartElement(QStringLiteral("rootfiles"));
        w.writeEmptyElement(QStringLiteral("rootfile"));
        w.writeAttribute(QStringLiteral("full-path"), Q(opfPath));
        w.writeAttribute(QStringLiteral("media-type"), QStringLiteral("application/oebps-package+xml"));
        w.writeEndElement(); // rootfiles
        w.writeEndElement(); // container
        w.writeEndDocument();
        return out.toStdString();
    }

    std::vector<std::uint8_t> BuildChapterEpub(const EpubArchive &source, const ChapterPackage &chapter) {
        const std::string opfPath = source.PackagePath();
        const std::string opfDir = zip::parent_dir(opfPath);

        std::set<std::string> usedPaths = {"mimetype", "META-INF/container.xml", opfPath};
        std::set<std::string> usedIds;
        for (const auto &item: chapter.units)
            usedPaths.insert(item.path);
        for (const auto &item: chapter.resources)
            usedPaths.insert(item.path);

        const std::string navPath = Unique(JoinPath(opfDir, "nav.xhtml"), usedPaths);
        const std::string ncxPath = Unique(JoinPath(opfDir, "toc.ncx"), usedPaths);

        const std::string version = source.Version().empty() ? "3.0" : source.Version();
        const bool epub3 = version.front() >= '3';
        const ResolvedIdentity identity = ResolveIdentity(source, chapter.preserveMetadata);

        // ---- package document ----
        QByteArray opf;
        {
            QXmlStreamWriter w(&opf);
            w.setAutoFormatting(true);
            w.writeStartDocument();
            w.writeStartElement(QStringLiteral("package"));
            w.writeAttribute(QStringLiteral("xmlns"), QString::fromLatin1(kOpfNamespace));
            w.writeAttribute(QStringLiteral("version"), Q(version));
            w.writeAttribute(QStringLiteral("unique-identifier"), identity.uidElementId);

            WriteMetadata(w, source, chapter, identity, epub3);

            std::vector<std::string> spineIds;
            w.writeStartElement(QStringLiteral("manifest"));
            auto writeItem = [&](const std::string &id, const std::string &path, const std::string &mediaType,
                                 const std::string &properties) {
                w.writeEmptyElement(QStringLiteral("item"));
                w.writeAttribute(QStringLiteral("id"), Q(id));
                w.writeAttribute(QStringLiteral("href"), Q(zip::relative_to(opfDir, path)));
                w.writeAttribute(QStringLiteral("media-type"), Q(mediaType));
                if (!properties.empty())
                    w.writeAttribute(QStringLiteral("properties"), Q(properties));
            };

            int counter = 0;
            for (const auto &unit: chapter.units) {
                const std::string id = Unique(unit.id.empty() ? "unit-" + std::to_string(++counter) : unit.id, usedIds);
                spineIds.push_back(id);
                writeItem(id, unit.path, unit.mediaType.empty() ? kXhtmlMediaType : unit.mediaType, WithoutNav(unit.properties));
            }
            for (const auto &res: chapter.resources) {
                const std::string id = Unique(res.id.empty() ? "res-" + std::to_string(++counter) : res.id, usedIds);
                writeItem(id, res.path, res.mediaType, WithoutNav(res.properties));
            }
            const std::string navId = Unique("nav", usedIds);
            const std::string ncxId = Unique("ncx", usedIds);
            writeItem(navId, navPath, kXhtmlMediaType, "nav");
            writeItem(ncxId, ncxPath, kNcxMediaType, {});
            w.writeEndElement(); // manifest

            w.writeStartElement(QStringLiteral("spine"));
            w.writeAttribute(QStringLiteral("toc"), Q(ncxId));
            for (const auto &id: spineIds) {
                w.writeEmptyElement(QStringLiteral("itemref"));
                w.writeAttribute(QStringLiteral("idref"), Q(id));
            }
            w.writeEndElement(); // spine

            w.writeEndElement(); // package
            w.writeEndDocument();
        }

        std::vector<ZipEntry> entries;
        entries.push_back(Entry("mimetype", "application/epub+zip"));
        entries.push_back(Entry("META-INF/container.xml", BuildContainerXml(opfPath)));
        entries.push_back(Entry(opfPath, opf.toStdString()));
        for (const auto &unit: chapter.units)
            entries.push_back(Entry(unit.path, unit.data));
        for (const auto &res: chapter.resources)
            entries.push_back(Entry(res.path, res.data));
        entries.push_back(Entry(navPath, BuildNav(chapter.title, RelativeLink(zip::parent_dir(navPath), chapter.tocTarget))));
        entries.push_back(Entry(ncxPath, BuildNcx(chapter.title, identity.uidValue,
                                                  RelativeLink(zip::parent_dir(ncxPath), chapter.tocTarget))));

        qCDebug(lcEpub) << "Packaging" << chapter.units.size() << "unit(s)," << chapter.resources.size()
                << "resource(s) for" << Q(chapter.title);
        return WriteZip(entries);
    }
} // namespace chapters::epub
