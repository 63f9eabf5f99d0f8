#include "version/update_classifier.hpp"

#include "util/logger.hpp"
#include "version/tag_matcher.hpp"
#include "version/version_comparator.hpp"

#include <algorithm>
#include <utility>

namespace updock {

namespace {

struct Candidate {
    std::string tag;
    ExtractedVersion version;
};

void AddUnique(std::vector<Candidate>& bucket, const std::string& tag, ExtractedVersion version) {
    const bool seen = std::any_of(bucket.begin(), bucket.end(), [&](const Candidate& c) {
        return c.version == version;
    });
    if (!seen)
        bucket.push_back({tag, std::move(version)});
}

std::vector<std::string> SortedTags(std::vector<Candidate>& bucket) {
    std::stable_sort(bucket.begin(), bucket.end(), [](const Candidate& a, const Candidate& b) {
        return VersionComparator::Compare(a.version, b.version) > 0;
    });
    std::vector<std::string> out;
    out.reserve(bucket.size());
    for (auto& c : bucket) out.push_back(std::move(c.tag));
    return out;
}

} // namespace

std::expected<UpdateSet, Error> UpdateClassifier::Classify(
    const Pattern& pattern,
    const std::string& current_tag,
    const std::vector<std::string>& candidates) {
    const auto current = TagMatcher::Match(pattern, current_tag);
    if (!current) {
        return std::unexpected(Error::Make(
            ErrorKind::CurrentTagMismatch,
            "current tag '" + current_tag + "' does not match pattern '" + pattern.Source() + "'"));
    }

    UpdateSet out;
    std::vector<Candidate> breaking;
    std::vector<Candidate> compatible;

    for (const auto& tag : candidates) {
        auto version = TagMatcher::Match(pattern, tag);
        if (!version) {
            ++out.unmatched;
            continue;
        }

        const Classification c = VersionComparator::Classify(pattern, *current, *version);
        LogDebug("%s -> %s: %s", current_tag.c_str(), tag.c_str(), ToString(c));
        switch (c) {
            case Classification::Breaking:
                AddUnique(breaking, tag, std::move(*version));
                break;
            case Classification::Compatible:
                AddUnique(compatible, tag, std::move(*version));
                break;
            case Classification::NoChange:
                break;
        }
    }

    out.breaking = SortedTags(breaking);
    out.compatible = SortedTags(compatible);

    LogDebug("classified %zu candidates against '%s' (%s): %zu breaking, %zu compatible, %zu unmatched",
             candidates.size(), current_tag.c_str(), pattern.Source().c_str(),
             out.breaking.size(), out.compatible.size(), out.unmatched);
    return out;
}

} // namespace updock
