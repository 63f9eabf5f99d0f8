#include "docker/compose.hpp"

#include "docker/dockerfile.hpp"
#include "util/logger.hpp"

#include <sstream>
#include <yaml-cpp/yaml.h>

namespace updock {

namespace {

Error ManifestError(std::string msg) {
    return Error::Make(ErrorKind::Manifest, std::move(msg));
}

std::vector<std::string> SplitLines(std::string_view input) {
    std::vector<std::string> lines;
    std::istringstream is{std::string(input)};
    std::string line;
    while (std::getline(is, line)) lines.push_back(line);
    return lines;
}

ComposeService ParseService(const std::string& name,
                            const YAML::Node& node,
                            const std::vector<std::string>& lines) {
    ComposeService service{.name = name,
                           .context = std::unexpected(ManifestError(
                               "no build context was found for service '" + name +
                               "' (only the 'build' and 'image' fields containing strings are supported)"))};

    const YAML::Node build = node["build"];
    if (build && build.IsScalar()) {
        service.context = std::filesystem::path(build.as<std::string>());
        return service;
    }

    const YAML::Node image = node["image"];
    if (build || !image || !image.IsScalar())
        return service;

    service.image = image.as<std::string>();
    const int line = image.Mark().line;

    std::expected<std::optional<std::string>, Error> directive = std::optional<std::string>{};
    if (line > 0 && static_cast<std::size_t>(line) <= lines.size())
        directive = ParsePatternDirective(lines[static_cast<std::size_t>(line) - 1]);
    service.has_directive = !directive || directive->has_value();

    auto ref = ImageReference::Parse(service.image);
    if (!ref) {
        service.context = std::unexpected(ref.error());
        return service;
    }
    if (!directive) {
        service.context = std::unexpected(directive.error());
        return service;
    }
    if (line >= 0)
        ref->line = static_cast<std::size_t>(line) + 1;
    ref->pattern = std::move(*directive);
    service.context = std::move(*ref);
    return service;
}

} // namespace

std::expected<std::vector<ComposeService>, Error> ComposeParser::Parse(std::string_view input) {
    const auto lines = SplitLines(input);
    try {
        const YAML::Node root = YAML::Load(std::string(input));
        if (!root.IsMap())
            return std::unexpected(ManifestError("the compose file seems to be invalid"));

        const YAML::Node services = root["services"];
        if (!services)
            return std::unexpected(ManifestError("failed to find 'services'"));
        if (!services.IsMap())
            return std::unexpected(ManifestError("the compose file seems to be invalid"));

        std::vector<ComposeService> out;
        for (const auto& kv : services) {
            const auto name = kv.first.as<std::string>();
            if (!kv.second.IsMap())
                return std::unexpected(ManifestError("the compose file seems to be invalid"));

            out.push_back(ParseService(name, kv.second, lines));
            LogDebug("compose service '%s'%s", name.c_str(),
                     out.back().context ? "" : " (unsupported)");
        }
        return out;
    } catch (const YAML::Exception& e) {
        return std::unexpected(ManifestError(std::string("failed to parse compose file: ") + e.what()));
    }
}

} // namespace updock
