#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <QDomDocument>
#include <QDomElement>

namespace chapters::epub {
    // Code point of an HTML named entity (without '&' and ';'), 0 if unknown.
    // The five XML built-ins are included.
    char32_t LookupHtmlEntity(std::string_view name);

    // Rewrites HTML named entities the XML parser would reject (&nbsp;, &mdash;
    // ...) into numeric character references. XML built-ins are kept as is.
    std::string NormalizeEntities(std::string_view markup);

    // Decodes named and numeric entities to UTF-8.
    std::string DecodeEntities(std::string_view text);

    // Parses XHTML (or any content document) without namespace processing, so
    // tag names read as written ("h1", "svg:image").
    bool ParseMarkup(const std::string &markup, QDomDocument &doc, QString *error = nullptr);

    // Tag name without prefix, lower-cased.
    QString LocalName(const QDomElement &element);

    // Element text with whitespace runs collapsed to single spaces.
    std::string ElementText(const QDomElement &element);

    // First element in document order whose local name is `name`.
    std::optional<QDomElement> FindFirst(const QDomNode &root, const QString &name);

    // First element in document order with id="id".
    std::optional<QDomElement> FindById(const QDomNode &root, const QString &id);

    // Readable text of a content document: one line per block element, script,
    // style and head dropped, empty lines removed. Falls back to
    // StripTagsLossy when the markup does not parse.
    std::string ExtractPlainText(const std::string &markup);

    // Regex tag strip for markup the XML parser refuses.
    std::string StripTagsLossy(const std::string &markup);

    // Serialized XHTML document whose body holds a deep copy of element.
    std::string BuildFragmentDocument(const std::string &title, const QDomElement &element);
} // namespace chapters::epub
