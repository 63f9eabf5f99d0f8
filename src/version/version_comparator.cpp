#include "version/version_comparator.hpp"

#include <algorithm>

namespace updock {

const char* ToString(Classification c) {
    switch (c) {
        case Classification::NoChange:   return "no change";
        case Classification::Compatible: return "compatible";
        case Classification::Breaking:   return "breaking";
    }
    return "unknown";
}

int VersionComparator::Compare(const ExtractedVersion& lhs, const ExtractedVersion& rhs) {
    const std::size_t n = std::min(lhs.size(), rhs.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (lhs[i] > rhs[i])
            return 1;
        if (lhs[i] < rhs[i])
            return -1;
    }
    if (lhs.size() == rhs.size())
        return 0;
    return lhs.size() > rhs.size() ? 1 : -1;
}

Classification VersionComparator::Classify(const Pattern& pattern,
                                           const ExtractedVersion& current,
                                           const ExtractedVersion& candidate) {
    const std::size_t n = std::min({current.size(), candidate.size(), pattern.SlotCount()});
    for (std::size_t i = 0; i < n; ++i) {
        if (candidate[i] == current[i])
            continue;
        if (candidate[i] < current[i])
            return Classification::NoChange;
        return pattern.IsBreakingSlot(i) ? Classification::Breaking : Classification::Compatible;
    }
    return Classification::NoChange;
}

} // namespace updock
