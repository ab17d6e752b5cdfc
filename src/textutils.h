//
// Small UTF-8 text helpers shared by the detectors and the filename generator.
//
#ifndef CHAPTERS_TEXTUTILS_H
#define CHAPTERS_TEXTUTILS_H

#include <string>
#include <string_view>

namespace chapters {
    std::wstring utf8_to_wstring(const std::string &utf8_text);

    std::string wstring_to_utf8(const std::wstring &wide_text);

    // Byte length of the longest prefix of sv that holds at most max_code_points
    // code points and does not split a UTF-8 sequence.
    size_t find_max_utf8_prefix(std::string_view sv, size_t max_code_points);

    size_t count_code_points(std::string_view sv);

    std::string trim_copy(std::string_view sv);

    // Every run of whitespace becomes one ASCII space; result is trimmed.
    std::string collapse_whitespace(std::string_view sv);

    int count_words(std::string_view sv);

    std::string to_lower_ascii(std::string s);

    bool ends_with_icase(std::string_view s, std::string_view suffix);

    // "chapter_one-intro" -> "Chapter One Intro"
    std::string title_from_stem(std::string_view stem);

    // File name without directory and extension: "OEBPS/text/ch01.xhtml" -> "ch01"
    std::string path_stem(std::string_view path);
} // namespace chapters

#endif // CHAPTERS_TEXTUTILS_H
