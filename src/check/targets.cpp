#include "check/checker.hpp"

#include "docker/compose.hpp"
#include "docker/dockerfile.hpp"
#include "util/logger.hpp"

#include <fstream>
#include <sstream>

namespace updock {

namespace {

std::expected<std::string, Error> ReadFile(const std::filesystem::path& path) {
    std::ifstream is(path);
    if (!is.good())
        return std::unexpected(Error::Make(ErrorKind::Config, "failed to read file '" + path.string() + "'"));
    std::ostringstream ss;
    ss << is.rdbuf();
    return ss.str();
}

// Fills in the default pattern; false if the reference has no pattern at all.
bool ResolvePattern(ImageReference& ref, const std::optional<std::string>& default_pattern) {
    if (!ref.pattern)
        ref.pattern = default_pattern;
    if (!ref.pattern) {
        LogInfo("line %zu: %s has no pattern, skipping", ref.line, ref.ToString().c_str());
        return false;
    }
    return true;
}

void AppendDockerfileTargets(std::string_view input,
                             const std::string& service,
                             const std::optional<std::string>& default_pattern,
                             std::vector<CheckTarget>& out) {
    for (auto& scanned : DockerfileScanner::Scan(input)) {
        const std::string line = "line " + std::to_string(scanned.line);
        std::string label = service.empty() ? line : service + " (" + line + ")";
        if (scanned.image && !ResolvePattern(*scanned.image, default_pattern))
            continue;
        if (!scanned.image && !scanned.has_directive && !default_pattern) {
            LogInfo("%s: ignoring '%s': %s", line.c_str(), scanned.text.c_str(),
                    scanned.image.error().msg.c_str());
            continue;
        }
        out.push_back({.label = std::move(label), .image = std::move(scanned.image)});
    }
}

} // namespace

std::expected<std::vector<CheckTarget>, Error> CollectDockerfileTargets(
    const std::filesystem::path& dockerfile,
    const std::optional<std::string>& default_pattern) {
    auto input = ReadFile(dockerfile);
    if (!input)
        return std::unexpected(input.error());

    std::vector<CheckTarget> out;
    AppendDockerfileTargets(*input, "", default_pattern, out);
    return out;
}

std::expected<std::vector<CheckTarget>, Error> CollectComposeTargets(
    const std::filesystem::path& compose_file,
    const std::optional<std::string>& default_pattern) {
    auto input = ReadFile(compose_file);
    if (!input)
        return std::unexpected(input.error());

    auto services = ComposeParser::Parse(*input);
    if (!services)
        return std::unexpected(services.error());

    const auto base_dir = compose_file.parent_path();
    std::vector<CheckTarget> out;
    for (auto& service : *services) {
        if (!service.context) {
            if (!service.image.empty() && !service.has_directive && !default_pattern) {
                LogInfo("%s: ignoring '%s': %s", service.name.c_str(), service.image.c_str(),
                        service.context.error().msg.c_str());
                continue;
            }
            out.push_back({.label = service.name, .image = std::unexpected(service.context.error())});
            continue;
        }

        if (auto* ref = std::get_if<ImageReference>(&*service.context)) {
            if (ResolvePattern(*ref, default_pattern))
                out.push_back({.label = service.name, .image = std::move(*ref)});
            continue;
        }

        const auto dockerfile = base_dir / std::get<std::filesystem::path>(*service.context) / "Dockerfile";
        auto nested = ReadFile(dockerfile);
        if (!nested) {
            auto err = nested.error();
            err.kind = ErrorKind::Manifest;
            out.push_back({.label = service.name, .image = std::unexpected(std::move(err))});
            continue;
        }
        AppendDockerfileTargets(*nested, service.name, default_pattern, out);
    }
    return out;
}

} // namespace updock
