#pragma once

#include "docker/image.hpp"
#include "registry/tag_fetcher.hpp"
#include "util/result.hpp"
#include "version/update_classifier.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace updock {

struct CheckTarget {
    // Where the reference came from, e.g. "line 3" or a compose service name.
    std::string label;
    std::expected<ImageReference, Error> image;
};

struct ImageReport {
    std::string label;
    std::optional<ImageReference> image;
    std::expected<UpdateSet, Error> result;
};

// FROM lines of a Dockerfile. References without a directive take
// default_pattern, or are skipped when there is none. Fails only when the file
// cannot be read.
std::expected<std::vector<CheckTarget>, Error> CollectDockerfileTargets(
    const std::filesystem::path& dockerfile,
    const std::optional<std::string>& default_pattern);

// Every service of a compose file; build folders are resolved against the
// compose file's directory.
std::expected<std::vector<CheckTarget>, Error> CollectComposeTargets(
    const std::filesystem::path& compose_file,
    const std::optional<std::string>& default_pattern);

class Checker {
public:
    struct Options {
        std::size_t jobs = 4;
        std::size_t max_tags = 1000;
    };

    explicit Checker(const ITagFetcher& fetcher) : Checker(fetcher, Options{}) {}
    Checker(const ITagFetcher& fetcher, Options opt);

    ImageReport CheckOne(const CheckTarget& target) const;

    // Reports are in target order. One failing image never affects another.
    std::vector<ImageReport> CheckAll(const std::vector<CheckTarget>& targets) const;

private:
    const ITagFetcher& fetcher_;
    Options opt_;
};

} // namespace updock
