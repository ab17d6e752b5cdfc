#include "textutils.h"

#include <algorithm>
#include <cctype>

#include "boost/nowide/convert.hpp"

namespace chapters {
    namespace {
        bool is_ascii_space(const unsigned char c) {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }

        // U+00A0 (C2 A0) and U+3000 (E3 80 80) show up in real headings often enough
        // to treat them as whitespace too. Returns the sequence length or 0.
        size_t unicode_space_len(const std::string_view sv, const size_t i) {
            const auto c = static_cast<unsigned char>(sv[i]);
            if (is_ascii_space(c))
                return 1;
            if (c == 0xC2 && i + 1 < sv.size() && static_cast<unsigned char>(sv[i + 1]) == 0xA0)
                return 2;
            if (c == 0xE3 && i + 2 < sv.size() &&
                static_cast<unsigned char>(sv[i + 1]) == 0x80 &&
                static_cast<unsigned char>(sv[i + 2]) == 0x80)
                return 3;
            return 0;
        }
    } // namespace

    std::wstring utf8_to_wstring(const std::string &utf8_text) {
        return boost::nowide::widen(utf8_text);
    }

    std::string wstring_to_utf8(const std::wstring &wide_text) {
        return boost::nowide::narrow(wide_text);
    }

    size_t find_max_utf8_prefix(const std::string_view sv, const size_t max_code_points) {
        size_t seen = 0;
        for (size_t i = 0; i < sv.size(); ++i) {
            // Continuation bytes belong to the code point already counted
            if ((sv[i] & 0b11000000) == 0b10000000)
                continue;
            if (seen == max_code_points)
                return i;
            ++seen;
        }
        return sv.size();
    }

    size_t count_code_points(const std::string_view sv) {
        return static_cast<size_t>(std::count_if(sv.begin(), sv.end(), [](const char c) {
            return (c & 0b11000000) != 0b10000000;
        }));
    }

    std::string trim_copy(const std::string_view sv) {
        size_t start = 0;
        size_t end = sv.size();

        while (start < end) {
            const size_t n = unicode_space_len(sv, start);
            if (n == 0) break;
            start += n;
        }
        while (end > start) {
            if (is_ascii_space(static_cast<unsigned char>(sv[end - 1]))) {
                --end;
            } else if (end - start >= 2 && unicode_space_len(sv, end - 2) == 2) {
                end -= 2;
            } else if (end - start >= 3 && unicode_space_len(sv, end - 3) == 3) {
                end -= 3;
            } else {
                break;
            }
        }

        return std::string(sv.substr(start, end - start));
    }

    std::string collapse_whitespace(const std::string_view sv) {
        std::string out;
        out.reserve(sv.size());

        bool pending_space = false;
        for (size_t i = 0; i < sv.size();) {
            if (const size_t n = unicode_space_len(sv, i); n > 0) {
                pending_space = true;
                i += n;
                continue;
            }
            if (pending_space && !out.empty())
                out.push_back(' ');
            pending_space = false;
            out.push_back(sv[i]);
            ++i;
        }
        return out;
    }

    int count_words(const std::string_view sv) {
        int words = 0;
        bool in_word = false;
        for (size_t i = 0; i < sv.size();) {
            if (const size_t n = unicode_space_len(sv, i); n > 0) {
                in_word = false;
                i += n;
                continue;
            }
            if (!in_word) {
                ++words;
                in_word = true;
            }
            ++i;
        }
        return words;
    }

    std::string to_lower_ascii(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    bool ends_with_icase(const std::string_view s, const std::string_view suffix) {
        if (s.size() < suffix.size())
            return false;
        return to_lower_ascii(std::string(s.substr(s.size() - suffix.size()))) ==
               to_lower_ascii(std::string(suffix));
    }

    std::string title_from_stem(const std::string_view stem) {
        std::string spaced(stem);
        std::replace(spaced.begin(), spaced.end(), '_', ' ');
        std::replace(spaced.begin(), spaced.end(), '-', ' ');
        spaced = collapse_whitespace(trim_copy(spaced));

        // ASCII letters are upper-cased after a non-letter, lower-cased otherwise
        bool at_word_start = true;
        for (char &c: spaced) {
            const auto uc = static_cast<unsigned char>(c);
            if (std::isalpha(uc)) {
                c = static_cast<char>(at_word_start ? std::toupper(uc) : std::tolower(uc));
                at_word_start = false;
            } else {
                at_word_start = uc < 0x80;
            }
        }
        return spaced;
    }

    std::string path_stem(const std::string_view path) {
        std::string_view name = path;
        if (const size_t slash = name.find_last_of('/'); slash != std::string_view::npos)
            name.remove_prefix(slash + 1);
        if (const size_t dot = name.find_last_of('.'); dot != std::string_view::npos && dot > 0)
            name = name.substr(0, dot);
        return std::string(name);
    }
} // namespace chapters
