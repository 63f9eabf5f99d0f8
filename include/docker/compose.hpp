#pragma once

#include "docker/image.hpp"
#include "util/result.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace updock {

// A service is either built from a folder holding a Dockerfile or pulls an image.
using BuildContext = std::variant<ImageReference, std::filesystem::path>;

struct ComposeService {
    std::string name;
    // Raw `image:` value; empty for services built from a folder.
    std::string image;
    // A directive line preceded `image:`.
    bool has_directive = false;
    std::expected<BuildContext, Error> context;
};

class ComposeParser {
public:
    // Services in document order. Fails as a whole when the input is not YAML
    // or has no services mapping; problems with one service are kept on that
    // service.
    static std::expected<std::vector<ComposeService>, Error> Parse(std::string_view input);
};

} // namespace updock
