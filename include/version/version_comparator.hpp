#pragma once

#include "version/pattern.hpp"

namespace updock {

enum class Classification {
    NoChange,
    Compatible,
    Breaking,
};

const char* ToString(Classification c);

class VersionComparator {
public:
    // Lexicographic, most significant slot first. Returns <0, 0 or >0.
    static int Compare(const ExtractedVersion& lhs, const ExtractedVersion& rhs);

    // Classified by the leftmost slot that differs. A candidate that is lower
    // at that slot is not an update.
    static Classification Classify(const Pattern& pattern,
                                   const ExtractedVersion& current,
                                   const ExtractedVersion& candidate);
};

} // namespace updock
