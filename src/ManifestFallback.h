#pragma once

#include <string>
#include <vector>

#include "DocumentSource.hpp"

namespace chapters {
    // Title for one content unit: <title>, else the first h1, else the first h2,
    // else the file stem title-cased. Unparsable markup goes straight to the stem.
    std::string UnitTitle(const std::string &unitPath, const std::string &markup);

    // One Manifest chapter (confidence 0.6, level 1) per spine unit in reading
    // order. Paginated sources have no manifest and yield nothing.
    std::vector<Chapter> DetectFromManifest(const DocumentSource &source);
} // namespace chapters
