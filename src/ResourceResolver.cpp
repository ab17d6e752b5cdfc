#include "ResourceResolver.h"

#include <deque>
#include <unordered_set>

#include <QString>

#include "boost/regex.hpp"

#include "Logging.h"
#include "ZipPathUtils.hpp"
#include "textutils.h"
#include "../epub/XhtmlText.h"

namespace chapters {
    namespace {
        struct PendingRef {
            std::string baseDir;
            std::string ref;
        };

        std::string GuessMediaType(const std::string &path) {
            static const std::pair<const char *, const char *> types[] = {
                {".css", "text/css"}, {".png", "image/png"}, {".jpg", "image/jpeg"},
                {".jpeg", "image/jpeg"}, {".gif", "image/gif"}, {".svg", "image/svg+xml"},
                {".webp", "image/webp"}, {".ttf", "font/ttf"}, {".otf", "font/otf"},
                {".woff", "font/woff"}, {".woff2", "font/woff2"},
            };
            for (const auto &[ext, type]: types) {
                if (ends_with_icase(path, ext))
                    return type;
            }
            return "application/octet-stream";
        }

        bool IsStylesheet(const ResourceReference &ref) {
            return ref.mediaType == "text/css" || ends_with_icase(ref.path, ".css");
        }

        // "img/a.png?v=2#frag" -> "img/a.png"
        std::string StripSuffixes(const std::string &ref) {
            return trim_copy(ref.substr(0, ref.find_first_of("?#")));
        }
    } // namespace

    bool ResourceResolver::IsExternal(const std::string &ref) {
        static const boost::regex scheme(R"(^[A-Za-z][A-Za-z0-9+.\-]*:)");
        return boost::regex_search(ref, scheme);
    }

    std::vector<std::string> ResourceResolver::ScanCss(const std::string &css) {
        static const boost::regex refs(R"(url\(\s*['"]?([^'")\s]+)['"]?\s*\)|@import\s+['"]([^'"]+)['"])",
                                       boost::regex::icase);

        std::vector<std::string> out;
        for (boost::sregex_iterator it(css.begin(), css.end(), refs), end; it != end; ++it) {
            const auto &m = *it;
            out.push_back(m[1].matched ? m[1].str() : m[2].str());
        }
        return out;
    }

    std::vector<std::string> ResourceResolver::ScanMarkup(const QDomDocument &doc) {
        std::vector<std::string> out;

        std::vector<QDomNode> stack{doc.documentElement()};
        while (!stack.empty()) {
            const QDomElement element = stack.back().toElement();
            stack.pop_back();

            const QString name = epub::LocalName(element);
            if (name == QLatin1String("link")) {
                const QStringList rel = element.attribute(QStringLiteral("rel")).toLower()
                        .split(QLatin1Char(' '), Qt::SkipEmptyParts);
                if (rel.contains(QStringLiteral("stylesheet")))
                    out.push_back(element.attribute(QStringLiteral("href")).toStdString());
            } else if (name == QLatin1String("img")) {
                out.push_back(element.attribute(QStringLiteral("src")).toStdString());
            } else if (name == QLatin1String("image")) {
                QString href = element.attribute(QStringLiteral("href"));
                if (href.isEmpty())
                    href = element.attribute(QStringLiteral("xlink:href"));
                out.push_back(href.toStdString());
            } else if (name == QLatin1String("style")) {
                for (auto &ref: ScanCss(element.text().toStdString()))
                    out.push_back(std::move(ref));
            }

            for (QDomElement child = element.lastChildElement(); !child.isNull();
                 child = child.previousSiblingElement()) {
                stack.push_back(child);
            }
        }
        return out;
    }

    bool ResourceResolver::Lookup(const std::string &baseDir, const std::string &ref, ResourceReference &out) const {
        if (const ManifestItem *item = m_source.FindItem(ref)) {
            out = {item->path, item->mediaType, item->id};
            return true;
        }

        const std::string resolved = zip::resolve(baseDir, ref);
        if (resolved.empty())
            return false;

        if (const ManifestItem *item = m_source.FindItem(resolved)) {
            out = {item->path, item->mediaType, item->id};
            return true;
        }

        // Present in the container but missing from the manifest
        if (m_source.ReadItem(resolved)) {
            out = {resolved, GuessMediaType(resolved), {}};
            return true;
        }
        return false;
    }

    std::vector<ResourceReference> ResourceResolver::Resolve(const std::string &unitPath,
                                                             const std::string &markup) const {
        std::vector<ResourceReference> resources;

        QDomDocument doc;
        QString error;
        if (!epub::ParseMarkup(markup, doc, &error)) {
            qCWarning(lcMaterialize) << "Cannot scan" << QString::fromStdString(unitPath) << "for resources:" << error;
            return resources;
        }

        std::deque<PendingRef> pending;
        for (auto &ref: ScanMarkup(doc))
            pending.push_back({zip::parent_dir(unitPath), std::move(ref)});

        std::unordered_set<std::string> seen{unitPath};

        while (!pending.empty()) {
            const PendingRef next = std::move(pending.front());
            pending.pop_front();

            const std::string ref = StripSuffixes(next.ref);
            if (ref.empty() || IsExternal(ref))
                continue;

            ResourceReference resolved;
            if (!Lookup(next.baseDir, ref, resolved)) {
                qCDebug(lcMaterialize) << "Unresolved reference" << QString::fromStdString(next.ref)
                        << "in" << QString::fromStdString(next.baseDir);
                continue;
            }
            if (!seen.insert(resolved.path).second)
                continue;

            if (IsStylesheet(resolved)) {
                if (const auto css = m_source.ReadItem(resolved.path)) {
                    for (auto &ref2: ScanCss(*css))
                        pending.push_back({zip::parent_dir(resolved.path), std::move(ref2)});
                }
            }
            resources.push_back(std::move(resolved));
        }

        return resources;
    }
} // namespace chapters
