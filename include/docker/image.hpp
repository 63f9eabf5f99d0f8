#pragma once

#include "util/result.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace updock {

struct ImageName {
    std::optional<std::string> user;
    std::string name;

    // "[user/]name"; parts are [A-Za-z0-9._-]+.
    static std::expected<ImageName, Error> Parse(std::string_view s);

    // Docker Hub keeps official images under "library".
    std::string RepositoryPath() const;
    std::string ToString() const;

    bool operator==(const ImageName&) const = default;
};

inline constexpr const char* kDefaultTag = "latest";

struct ImageReference {
    ImageName name;
    std::string tag = kDefaultTag;
    std::optional<std::string> pattern;
    // 1-based line of the reference in its source file, 0 if unknown.
    std::size_t line = 0;

    // "name[:tag]"; a missing tag means "latest".
    static std::expected<ImageReference, Error> Parse(std::string_view s);

    std::string ToString() const;
};

} // namespace updock
