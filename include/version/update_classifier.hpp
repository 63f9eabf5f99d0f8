#pragma once

#include "util/result.hpp"
#include "version/pattern.hpp"

#include <cstddef>
#include <expected>
#include <string>
#include <vector>

namespace updock {

struct UpdateSet {
    // Newest first; one tag per distinct version.
    std::vector<std::string> breaking;
    std::vector<std::string> compatible;
    // Candidates that did not fit the pattern.
    std::size_t unmatched = 0;

    bool HasUpdates() const { return !breaking.empty() || !compatible.empty(); }
};

class UpdateClassifier {
public:
    // Fails with CurrentTagMismatch when current_tag does not fit the pattern.
    static std::expected<UpdateSet, Error> Classify(const Pattern& pattern,
                                                    const std::string& current_tag,
                                                    const std::vector<std::string>& candidates);
};

} // namespace updock
