#include "XhtmlText.h"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <vector>

#include <QByteArray>
#include <QSet>
#include <QString>

#include "boost/regex.hpp"

#include "../src/textutils.h"

namespace chapters::epub {
    namespace {
        struct HtmlEntity {
            std::string_view name;
            char32_t codePoint;
        };

        // Sorted by name for binary search. Covers the entities commonly found in EPUBs.
        constexpr HtmlEntity kEntities[] = {
            {"Aacute", 0x00C1},   {"Agrave", 0x00C0},   {"Auml", 0x00C4},     {"Ccedil", 0x00C7},
            {"Dagger", 0x2021},   {"Eacute", 0x00C9},   {"OElig", 0x0152},    {"Ouml", 0x00D6},
            {"Prime", 0x2033},    {"Uuml", 0x00DC},     {"aacute", 0x00E1},   {"acirc", 0x00E2},
            {"agrave", 0x00E0},   {"amp", 0x0026},      {"apos", 0x0027},     {"auml", 0x00E4},
            {"bdquo", 0x201E},    {"bull", 0x2022},     {"ccedil", 0x00E7},   {"cent", 0x00A2},
            {"copy", 0x00A9},     {"dagger", 0x2020},   {"deg", 0x00B0},      {"divide", 0x00F7},
            {"eacute", 0x00E9},   {"ecirc", 0x00EA},    {"egrave", 0x00E8},   {"emsp", 0x2003},
            {"ensp", 0x2002},     {"euml", 0x00EB},     {"euro", 0x20AC},     {"frac12", 0x00BD},
            {"gt", 0x003E},       {"hellip", 0x2026},   {"iacute", 0x00ED},   {"iexcl", 0x00A1},
            {"iquest", 0x00BF},   {"iuml", 0x00EF},     {"laquo", 0x00AB},    {"larr", 0x2190},
            {"ldquo", 0x201C},    {"lsaquo", 0x2039},   {"lsquo", 0x2018},    {"lt", 0x003C},
            {"mdash", 0x2014},    {"middot", 0x00B7},   {"nbsp", 0x00A0},     {"ndash", 0x2013},
            {"ntilde", 0x00F1},   {"oacute", 0x00F3},   {"ocirc", 0x00F4},    {"oelig", 0x0153},
            {"ouml", 0x00F6},     {"plusmn", 0x00B1},   {"pound", 0x00A3},    {"prime", 0x2032},
            {"quot", 0x0022},     {"raquo", 0x00BB},    {"rarr", 0x2192},     {"rdquo", 0x201D},
            {"reg", 0x00AE},      {"rsaquo", 0x203A},   {"rsquo", 0x2019},    {"sbquo", 0x201A},
            {"sect", 0x00A7},     {"szlig", 0x00DF},    {"thinsp", 0x2009},   {"times", 0x00D7},
            {"trade", 0x2122},    {"uacute", 0x00FA},   {"uuml", 0x00FC},     {"yen", 0x00A5},
            {"zwj", 0x200D},      {"zwnj", 0x200C},
        };

        bool IsXmlBuiltin(const std::string_view name) {
            return name == "amp" || name == "lt" || name == "gt" || name == "quot" || name == "apos";
        }

        bool IsNameChar(const char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
        }

        // Length of "&name;" starting at pos (name being [#x]?alnum), 0 if none.
        size_t EntityLength(const std::string_view text, const size_t pos) {
            size_t i = pos + 1;
            if (i < text.size() && text[i] == '#')
                ++i;
            const size_t nameStart = i;
            while (i < text.size() && i - pos < 32 && IsNameChar(text[i]))
                ++i;
            if (i == nameStart || i >= text.size() || text[i] != ';')
                return 0;
            return i - pos + 1;
        }

        std::string Utf8(const char32_t cp) {
            return QString::fromUcs4(&cp, 1).toStdString();
        }

        char32_t NumericEntity(const std::string_view body) {
            // body is "#123" or "#x1F"
            try {
                if (body.size() > 2 && (body[1] == 'x' || body[1] == 'X'))
                    return static_cast<char32_t>(std::stoul(std::string(body.substr(2)), nullptr, 16));
                return static_cast<char32_t>(std::stoul(std::string(body.substr(1)), nullptr, 10));
            } catch (const std::logic_error &) {
                return 0;
            }
        }

        const QSet<QString> &BlockTags() {
            static const QSet<QString> tags = {
                "p", "div", "h1", "h2", "h3", "h4", "h5", "h6", "li", "dt", "dd",
                "blockquote", "pre", "section", "article", "aside", "header", "footer",
                "figcaption", "tr", "table", "ul", "ol", "hr"
            };
            return tags;
        }

        const QSet<QString> &SkippedTags() {
            static const QSet<QString> tags = {"head", "script", "style", "title"};
            return tags;
        }

        void FlushLine(std::string &line, std::vector<std::string> &lines) {
            std::string text = collapse_whitespace(line);
            if (!text.empty())
                lines.push_back(std::move(text));
            line.clear();
        }

        void CollectText(const QDomNode &node, std::string &line, std::vector<std::string> &lines) {
            for (QDomNode child = node.firstChild(); !child.isNull(); child = child.nextSibling()) {
                if (child.isText() || child.isCDATASection()) {
                    line += child.nodeValue().toStdString();
                    continue;
                }
                if (!child.isElement())
                    continue;

                const QString name = LocalName(child.toElement());
                if (SkippedTags().contains(name))
                    continue;
                if (name == "br") {
                    FlushLine(line, lines);
                    continue;
                }

                const bool block = BlockTags().contains(name);
                if (block)
                    FlushLine(line, lines);
                CollectText(child, line, lines);
                if (block)
                    FlushLine(line, lines);
            }
        }

        std::string JoinLines(const std::vector<std::string> &lines) {
            std::string out;
            for (const auto &l: lines) {
                if (!out.empty())
                    out.push_back('\n');
                out += l;
            }
            return out;
        }
    } // namespace

    char32_t LookupHtmlEntity(const std::string_view name) {
        const auto it = std::lower_bound(std::begin(kEntities), std::end(kEntities), name,
                                         [](const HtmlEntity &e, const std::string_view n) {
                                             return e.name < n;
                                         });
        if (it != std::end(kEntities) && it->name == name)
            return it->codePoint;
        return 0;
    }

    std::string NormalizeEntities(const std::string_view markup) {
        std::string out;
        out.reserve(markup.size());

        for (size_t i = 0; i < markup.size(); ++i) {
            if (markup[i] != '&') {
                out.push_back(markup[i]);
                continue;
            }

            const size_t len = EntityLength(markup, i);
            const std::string_view name = len ? markup.substr(i + 1, len - 2) : std::string_view{};
            if (len && name.front() != '#' && !IsXmlBuiltin(name)) {
                if (const char32_t cp = LookupHtmlEntity(name)) {
                    out += "&#" + std::to_string(static_cast<unsigned long>(cp)) + ";";
                    i += len - 1;
                    continue;
                }
            }
            out.push_back('&');
        }
        return out;
    }

    std::string DecodeEntities(const std::string_view text) {
        std::string out;
        out.reserve(text.size());

        for (size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '&') {
                if (const size_t len = EntityLength(text, i)) {
                    const std::string_view name = text.substr(i + 1, len - 2);
                    const char32_t cp = name.front() == '#' ? NumericEntity(name) : LookupHtmlEntity(name);
                    if (cp != 0) {
                        out += Utf8(cp);
                        i += len - 1;
                        continue;
                    }
                }
            }
            out.push_back(text[i]);
        }
        return out;
    }

    bool ParseMarkup(const std::string &markup, QDomDocument &doc, QString *error) {
        const QByteArray bytes = QByteArray::fromStdString(NormalizeEntities(markup));

        QString message;
        int line = 0;
        int column = 0;
        if (!doc.setContent(bytes, false, &message, &line, &column)) {
            if (error)
                *error = QStringLiteral("%1 (line %2, column %3)").arg(message).arg(line).arg(column);
            return false;
        }
        return true;
    }

    QString LocalName(const QDomElement &element) {
        const QString tag = element.tagName();
        return tag.mid(tag.lastIndexOf(QLatin1Char(':')) + 1).toLower();
    }

    std::string ElementText(const QDomElement &element) {
        return collapse_whitespace(element.text().toStdString());
    }

    std::optional<QDomElement> FindFirst(const QDomNode &root, const QString &name) {
        std::vector<QDomNode> stack{root};
        while (!stack.empty()) {
            const QDomNode node = stack.back();
            stack.pop_back();

            if (node.isElement() && LocalName(node.toElement()) == name)
                return node.toElement();

            // Push children in reverse so the first child is visited first
            for (QDomNode child = node.lastChild(); !child.isNull(); child = child.previousSibling()) {
                if (child.isElement() || child.isDocument())
                    stack.push_back(child);
            }
        }
        return std::nullopt;
    }

    std::optional<QDomElement> FindById(const QDomNode &root, const QString &id) {
        std::vector<QDomNode> stack{root};
        while (!stack.empty()) {
            const QDomNode node = stack.back();
            stack.pop_back();

            if (node.isElement() && node.toElement().attribute(QStringLiteral("id")) == id)
                return node.toElement();

            for (QDomNode child = node.lastChild(); !child.isNull(); child = child.previousSibling()) {
                if (child.isElement())
                    stack.push_back(child);
            }
        }
        return std::nullopt;
    }

    std::string ExtractPlainText(const std::string &markup) {
        QDomDocument doc;
        if (!ParseMarkup(markup, doc))
            return StripTagsLossy(markup);

        QDomNode root = doc.documentElement();
        if (const auto body = FindFirst(doc, QStringLiteral("body")))
            root = *body;

        std::string line;
        std::vector<std::string> lines;
        CollectText(root, line, lines);
        FlushLine(line, lines);
        return JoinLines(lines);
    }

    std::string StripTagsLossy(const std::string &markup) {
        static const boost::regex dropped(R"(<(script|style|head)\b[^>]*>[\s\S]*?</\1\s*>)", boost::regex::icase);
        static const boost::regex blocks(R"(</?(p|div|h[1-6]|li|dt|dd|br|tr|blockquote|pre|section|article)\b[^>]*>)",
                                         boost::regex::icase);
        static const boost::regex tags(R"(<[^>]*>)");

        std::string text = boost::regex_replace(markup, dropped, " ");
        text = boost::regex_replace(text, blocks, "\n");
        text = boost::regex_replace(text, tags, "");
        text = DecodeEntities(text);

        std::vector<std::string> lines;
        size_t start = 0;
        while (start <= text.size()) {
            size_t nl = text.find('\n', start);
            if (nl == std::string::npos)
                nl = text.size();
            std::string line = text.substr(start, nl - start);
            FlushLine(line, lines);
            start = nl + 1;
        }
        return JoinLines(lines);
    }

    std::string BuildFragmentDocument(const std::string &title, const QDomElement &element) {
        QDomDocument out;
        out.appendChild(out.createProcessingInstruction(QStringLiteral("xml"),
                                                        QStringLiteral("version=\"1.0\" encoding=\"utf-8\"")));

        QDomElement html = out.createElement(QStringLiteral("html"));
        html.setAttribute(QStringLiteral("xmlns"), QStringLiteral("http://www.w3.org/1999/xhtml"));
        html.setAttribute(QStringLiteral("xmlns:epub"), QStringLiteral("http://www.idpf.org/2007/ops"));
        out.appendChild(html);

        QDomElement head = out.createElement(QStringLiteral("head"));
        QDomElement titleElement = out.createElement(QStringLiteral("title"));
        titleElement.appendChild(out.createTextNode(QString::fromStdString(title)));
        head.appendChild(titleElement);
        html.appendChild(head);

        QDomElement body = out.createElement(QStringLiteral("body"));
        body.appendChild(out.importNode(element, true));
        html.appendChild(body);

        return out.toString(-1).toStdString();
    }
} // namespace chapters::epub
