#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace chapters::zip
{
    namespace fs = std::filesystem;

    /// Minimal gate for entry names taken from an untrusted archive.
    [[nodiscard]] inline bool is_safe_entry_name(const std::string& name) noexcept
    {
        if (name.empty()) return false;
        if (name.front() == '/' || name.front() == '\\') return false;
        if (name.find('\0') != std::string::npos) return false;
        if (name.find('\\') != std::string::npos) return false;
        if (name.find("../") != std::string::npos) return false;
        if (name.find("/..") != std::string::npos) return false;
        return true;
    }

    /// Decode %XX escapes used in package hrefs ("My%20Chapter.xhtml").
    [[nodiscard]] inline std::string percent_decode(std::string_view s)
    {
        auto hex = [](const char c) -> int
        {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        };

        std::string out;
        out.reserve(s.size());
        for (size_t i = 0; i < s.size(); ++i)
        {
            if (s[i] == '%' && i + 2 < s.size())
            {
                const int hi = hex(s[i + 1]);
                const int lo = hex(s[i + 2]);
                if (hi >= 0 && lo >= 0)
                {
                    out.push_back(static_cast<char>((hi << 4) | lo));
                    i += 2;
                    continue;
                }
            }
            out.push_back(s[i]);
        }
        return out;
    }

    /// Collapse "." and ".." segments of an archive path. Returns an empty string
    /// when the path climbs above the archive root.
    [[nodiscard]] inline std::string normalize(std::string_view path)
    {
        std::vector<std::string_view> parts;
        size_t start = 0;
        while (start <= path.size())
        {
            size_t slash = path.find('/', start);
            if (slash == std::string_view::npos) slash = path.size();
            const std::string_view seg = path.substr(start, slash - start);
            start = slash + 1;

            if (seg.empty() || seg == ".") continue;
            if (seg == "..")
            {
                if (parts.empty()) return {};
                parts.pop_back();
                continue;
            }
            parts.push_back(seg);
        }

        std::string out;
        for (const auto& seg : parts)
        {
            if (!out.empty()) out.push_back('/');
            out.append(seg);
        }
        return out;
    }

    /// "OEBPS/text/ch1.xhtml" -> "OEBPS/text"; "ch1.xhtml" -> ""
    [[nodiscard]] inline std::string parent_dir(std::string_view path)
    {
        const size_t slash = path.find_last_of('/');
        if (slash == std::string_view::npos) return {};
        return std::string(path.substr(0, slash));
    }

    /// Resolve a reference written inside baseDir into an archive path.
    [[nodiscard]] inline std::string resolve(std::string_view baseDir, std::string_view ref)
    {
        const std::string decoded = percent_decode(ref);
        if (!decoded.empty() && decoded.front() == '/')
            return normalize(decoded);
        if (baseDir.empty())
            return normalize(decoded);
        return normalize(std::string(baseDir) + "/" + decoded);
    }

    /// Path of target expressed relative to fromDir, both archive paths.
    [[nodiscard]] inline std::string relative_to(std::string_view fromDir, std::string_view target)
    {
        if (fromDir.empty()) return std::string(target);
        const fs::path rel = fs::path(std::string(target)).lexically_relative(fs::path(std::string(fromDir)));
        if (rel.empty()) return std::string(target);
        return rel.generic_string();
    }
} // namespace chapters::zip
