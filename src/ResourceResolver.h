#pragma once

#include <string>
#include <vector>

#include <QDomDocument>

#include "DocumentSource.hpp"

namespace chapters {
    // A read-only view of one archive item a chapter depends on.
    struct ResourceReference {
        std::string path; // archive path
        std::string mediaType;
        std::string id;   // manifest id, empty for items outside the manifest
    };

    // Collects the stylesheets, images and fonts a content unit needs in order
    // to stand on its own.
    class ResourceResolver {
    public:
        explicit ResourceResolver(const ArchiveSource &source) : m_source(source) {
        }

        // Transitive, deduplicated (first-seen order) resources of one unit.
        // Stylesheets are followed through url(...) and @import. Markup that
        // does not parse yields an empty set.
        [[nodiscard]] std::vector<ResourceReference> Resolve(const std::string &unitPath,
                                                             const std::string &markup) const;

        // Raw reference strings of a parsed document, in document order:
        // link[rel~=stylesheet]@href, img@src, svg image@href|xlink:href and
        // url(...) inside <style>.
        static std::vector<std::string> ScanMarkup(const QDomDocument &doc);

        // url(...) and @import targets of a stylesheet, in source order.
        static std::vector<std::string> ScanCss(const std::string &css);

        // True for "http://...", "data:...", "mailto:..." and friends.
        static bool IsExternal(const std::string &ref);

    private:
        [[nodiscard]] bool Lookup(const std::string &baseDir, const std::string &ref, ResourceReference &out) const;

        const ArchiveSource &m_source;
    };
} // namespace chapters
