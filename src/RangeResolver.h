#pragma once

#include <vector>

#include "Chapter.hpp"

namespace chapters {
    // Closes start-only chapters into inclusive, non-overlapping ranges.
    //
    // Paginated: each chapter ends one page before the next one starts, the last
    // at totalUnits; a chapter left with start > end (a later entry pointing to
    // an earlier page) is dropped with a warning.
    //
    // Archive: a chapter covers its own unit and multi-unit chapters keep their
    // range. Entries repeating a kept position, or starting before the previous
    // kept chapter, are dropped so the result stays in reading order.
    std::vector<Chapter> ResolveRanges(std::vector<Chapter> chapters, SourceKind kind, int totalUnits);
} // namespace chapters
