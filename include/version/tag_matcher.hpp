#pragma once

#include "version/pattern.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace updock {

class TagMatcher {
public:
    // Walks the segments left to right. Slots consume the longest run of
    // digits at the cursor, so "<><>" can never match. The whole tag must be
    // consumed. Returns nullopt when the tag does not fit the pattern.
    static std::optional<ExtractedVersion> Match(const Pattern& pattern, std::string_view tag);

    // Tags that match, in input order.
    static std::vector<std::string> Filter(const Pattern& pattern,
                                           const std::vector<std::string>& tags);
};

} // namespace updock
