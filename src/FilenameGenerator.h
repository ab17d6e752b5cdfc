#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "Chapter.hpp"

namespace chapters {
    inline constexpr auto kDefaultFilenamePattern = "{index:02d}_{title}";

    // Replaces < > : " / \ | ? * with '_', folds whitespace and underscore runs
    // into one '_', trims '_', truncates to maxLength code points and never
    // returns an empty string ("untitled"). Applying it twice changes nothing.
    std::string SanitizeFilename(const std::string &title, size_t maxLength = 100);

    // A trailing .pdf or .epub (any case) is replaced by extension, anything
    // else gets extension appended. extension includes the dot.
    std::string EnforceExtension(const std::string &name, const std::string &extension);

    // Expands a filename pattern for each chapter of one split.
    //
    // Syntax: literal text, {name} or {name:spec}, with {{ and }} for literal
    // braces. Integer placeholders take the specs d, Nd and 0Nd.
    //
    //   index, title              always
    //   start, end, pages         paginated sources
    //   file                      archives (stem of the chapter's unit)
    class FilenameGenerator {
    public:
        // Throws std::invalid_argument for malformed patterns, unknown
        // placeholders or ones that do not exist for kind.
        FilenameGenerator(const std::string &pattern, SourceKind kind, std::string extension,
                          std::string sourceStem = {});

        // index is 1-based. Names already handed out by this generator get a
        // _2, _3 ... suffix before the extension.
        [[nodiscard]] std::string Generate(const Chapter &chapter, int index);

    private:
        struct Token {
            bool literal = true;
            std::string text; // literal text or placeholder name
            int width = 0;
            bool zeroPad = false;
        };

        [[nodiscard]] std::string Expand(const Chapter &chapter, int index) const;

        static void ParseSpec(const std::string &spec, Token &token);

        SourceKind m_kind;
        std::string m_extension;
        std::string m_sourceStem;
        std::vector<Token> m_tokens;
        std::unordered_map<std::string, int> m_used;
    };
} // namespace chapters
