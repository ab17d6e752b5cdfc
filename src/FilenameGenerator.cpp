#include "FilenameGenerator.h"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "boost/regex.hpp"

#include "textutils.h"

namespace chapters {
    namespace {
        constexpr int kMaxFieldWidth = 255;

        bool IsIntegerField(const std::string &name) {
            return name == "index" || name == "start" || name == "end" || name == "pages";
        }

        bool IsKnownField(const std::string &name, const SourceKind kind) {
            if (name == "index" || name == "title")
                return true;
            if (kind == SourceKind::Paginated)
                return name == "start" || name == "end" || name == "pages";
            return name == "file";
        }

        std::string TrimUnderscores(const std::wstring &s) {
            const size_t first = s.find_first_not_of(L'_');
            if (first == std::wstring::npos)
                return {};
            const size_t last = s.find_last_not_of(L'_');
            return wstring_to_utf8(s.substr(first, last - first + 1));
        }
    } // namespace

    std::string SanitizeFilename(const std::string &title, const size_t maxLength) {
        static const boost::wregex invalid(LR"([<>:"/\\|?*])");
        static const boost::wregex runs(LR"([\s_]+)");

        std::wstring wide = utf8_to_wstring(title);
        wide = boost::regex_replace(wide, invalid, L"_");
        wide = boost::regex_replace(wide, runs, L"_");

        std::string out = TrimUnderscores(wide);

        if (count_code_points(out) > maxLength)
            out = TrimUnderscores(utf8_to_wstring(out.substr(0, find_max_utf8_prefix(out, maxLength))));

        if (out.empty())
            out = "untitled";
        return out;
    }

    std::string EnforceExtension(const std::string &name, const std::string &extension) {
        for (const char *known: {".pdf", ".epub"}) {
            if (ends_with_icase(name, known))
                return name.substr(0, name.size() - std::char_traits<char>::length(known)) + extension;
        }
        return name + extension;
    }

    FilenameGenerator::FilenameGenerator(const std::string &pattern, const SourceKind kind, std::string extension,
                                         std::string sourceStem)
        : m_kind(kind), m_extension(std::move(extension)), m_sourceStem(std::move(sourceStem)) {
        std::string literal;
        auto flush = [&] {
            if (!literal.empty()) {
                m_tokens.push_back({true, literal});
                literal.clear();
            }
        };

        for (size_t i = 0; i < pattern.size(); ++i) {
            const char c = pattern[i];
            if (c == '}') {
                if (i + 1 < pattern.size() && pattern[i + 1] == '}') {
                    literal.push_back('}');
                    ++i;
                    continue;
                }
                throw std::invalid_argument("Single '}' in filename pattern: " + pattern);
            }
            if (c != '{') {
                literal.push_back(c);
                continue;
            }
            if (i + 1 < pattern.size() && pattern[i + 1] == '{') {
                literal.push_back('{');
                ++i;
                continue;
            }

            const size_t close = pattern.find('}', i + 1);
            if (close == std::string::npos)
                throw std::invalid_argument("Unclosed '{' in filename pattern: " + pattern);

            const std::string field = pattern.substr(i + 1, close - i - 1);
            const size_t colon = field.find(':');

            Token token;
            token.literal = false;
            token.text = field.substr(0, colon);
            if (!IsKnownField(token.text, kind))
                throw std::invalid_argument("Unknown placeholder {" + token.text + "} in filename pattern");
            if (colon != std::string::npos) {
                if (!IsIntegerField(token.text))
                    throw std::invalid_argument("Placeholder {" + token.text + "} does not take a format spec");
                ParseSpec(field.substr(colon + 1), token);
            }

            flush();
            m_tokens.push_back(std::move(token));
            i = close;
        }
        flush();

        if (m_tokens.empty())
            throw std::invalid_argument("Filename pattern is empty");
    }

    void FilenameGenerator::ParseSpec(const std::string &spec, Token &token) {
        static const boost::regex integerSpec(R"((0?)(\d*)d)");
        boost::smatch m;
        if (!boost::regex_match(spec, m, integerSpec))
            throw std::invalid_argument("Unsupported format spec '" + spec + "' (expected d, Nd or 0Nd)");
        token.zeroPad = m[1].length() > 0;
        token.width = 0;
        for (const char digit: m[2].str()) {
            token.width = token.width * 10 + (digit - '0');
            if (token.width > kMaxFieldWidth)
                throw std::invalid_argument("Field width in '" + spec + "' exceeds " +
                                            std::to_string(kMaxFieldWidth));
        }
    }

    std::string FilenameGenerator::Expand(const Chapter &chapter, const int index) const {
        std::string out;
        for (const auto &token: m_tokens) {
            if (token.literal) {
                out += token.text;
                continue;
            }

            if (token.text == "title") {
                out += SanitizeFilename(chapter.title);
                continue;
            }
            if (token.text == "file") {
                const bool whole = chapter.method == DetectionMethod::Fallback || chapter.position.unitPath.empty();
                out += whole ? m_sourceStem : path_stem(chapter.position.unitPath);
                continue;
            }

            int value = index;
            if (token.text == "start")
                value = chapter.position.startUnit;
            else if (token.text == "end")
                value = chapter.position.endUnit;
            else if (token.text == "pages")
                value = chapter.PageCount();

            std::ostringstream ss;
            if (token.width > 0)
                ss << std::setw(token.width) << std::setfill(token.zeroPad ? '0' : ' ');
            ss << value;
            out += ss.str();
        }
        return out;
    }

    std::string FilenameGenerator::Generate(const Chapter &chapter, const int index) {
        const std::string name = EnforceExtension(Expand(chapter, index), m_extension);
        if (m_used.emplace(name, 1).second)
            return name;

        const std::string stem = name.substr(0, name.size() - m_extension.size());
        int &counter = m_used[name];
        std::string candidate;
        do {
            candidate = stem + "_" + std::to_string(++counter) + m_extension;
        } while (m_used.count(candidate) != 0);

        m_used.emplace(candidate, 1);
        return candidate;
    }
} // namespace chapters
