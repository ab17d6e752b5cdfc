#pragma once

#include <stdexcept>
#include <string>

namespace chapters {
    class SplitError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // The input cannot be opened or parsed at all. Aborts the whole operation.
    class MalformedSourceError final : public SplitError {
    public:
        MalformedSourceError(const std::string &path, const std::string &reason)
            : SplitError("Cannot read " + path + ": " + reason) {
        }
    };

    // One chapter's output could not be produced or saved.
    class OutputWriteError final : public SplitError {
    public:
        using SplitError::SplitError;
    };
} // namespace chapters
