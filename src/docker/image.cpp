#include "docker/image.hpp"

#include <algorithm>

namespace updock {

namespace {

bool IsNameChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '-' || c == '.';
}

bool IsValidPart(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), IsNameChar);
}

// [A-Za-z0-9_][A-Za-z0-9_.-]{0,127}
bool IsValidTag(std::string_view s) {
    return !s.empty() && s.size() <= 128 && s.front() != '.' && s.front() != '-' &&
           std::all_of(s.begin(), s.end(), IsNameChar);
}

Error InvalidImage(std::string_view s) {
    return Error::Make(ErrorKind::Manifest,
                       "the image definition '" + std::string(s) + "' is invalid");
}

} // namespace

std::expected<ImageName, Error> ImageName::Parse(std::string_view s) {
    const auto slash = s.find('/');
    if (slash == std::string_view::npos) {
        if (!IsValidPart(s))
            return std::unexpected(InvalidImage(s));
        return ImageName{.user = std::nullopt, .name = std::string(s)};
    }

    const auto user = s.substr(0, slash);
    const auto name = s.substr(slash + 1);
    if (!IsValidPart(user) || !IsValidPart(name))
        return std::unexpected(InvalidImage(s));
    return ImageName{.user = std::string(user), .name = std::string(name)};
}

std::string ImageName::RepositoryPath() const {
    return user.value_or("library") + "/" + name;
}

std::string ImageName::ToString() const {
    return user ? *user + "/" + name : name;
}

std::expected<ImageReference, Error> ImageReference::Parse(std::string_view s) {
    ImageReference ref;
    std::string_view name_part = s;

    const auto colon = s.rfind(':');
    const auto slash = s.rfind('/');
    if (colon != std::string_view::npos && (slash == std::string_view::npos || colon > slash)) {
        name_part = s.substr(0, colon);
        const auto tag = s.substr(colon + 1);
        if (!IsValidTag(tag))
            return std::unexpected(InvalidImage(s));
        ref.tag = std::string(tag);
    }

    auto name = ImageName::Parse(name_part);
    if (!name)
        return std::unexpected(InvalidImage(s));
    ref.name = std::move(*name);
    return ref;
}

std::string ImageReference::ToString() const {
    return name.ToString() + ":" + tag;
}

} // namespace updock
