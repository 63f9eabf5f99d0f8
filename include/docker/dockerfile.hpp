#pragma once

#include "docker/image.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace updock {

inline constexpr const char* kDirectiveMarker = "updock";

// Parses `# updock --pattern "<pattern>"`. Returns nullopt for lines that are
// not an updock directive, an error for directives that are malformed.
std::expected<std::optional<std::string>, Error> ParsePatternDirective(std::string_view line);

struct ScannedImage {
    std::size_t line = 0;
    std::string text;
    // A directive line preceded the FROM.
    bool has_directive = false;
    std::expected<ImageReference, Error> image;
};

class DockerfileScanner {
public:
    // One entry per FROM that names a registry image. scratch, earlier build
    // stages, digests and ARG-substituted references are skipped.
    static std::vector<ScannedImage> Scan(std::string_view input);
};

} // namespace updock
