#include "version/tag_matcher.hpp"

#include <charconv>
#include <cstdint>

namespace updock {

namespace {

bool IsDigit(char c) {
    return c >= '0' && c <= '9';
}

} // namespace

std::optional<ExtractedVersion> TagMatcher::Match(const Pattern& pattern, std::string_view tag) {
    ExtractedVersion version;
    version.reserve(pattern.SlotCount());

    std::size_t cursor = 0;
    for (const auto& seg : pattern.Segments()) {
        if (const auto* lit = std::get_if<Literal>(&seg)) {
            if (tag.substr(cursor, lit->text.size()) != lit->text)
                return std::nullopt;
            cursor += lit->text.size();
            continue;
        }

        std::size_t end = cursor;
        while (end < tag.size() && IsDigit(tag[end])) ++end;
        if (end == cursor)
            return std::nullopt;

        std::uint64_t value = 0;
        const auto [ptr, ec] = std::from_chars(tag.data() + cursor, tag.data() + end, value);
        if (ec != std::errc{} || ptr != tag.data() + end)
            return std::nullopt; // overflow
        version.push_back(value);
        cursor = end;
    }

    if (cursor != tag.size())
        return std::nullopt;

    return version;
}

std::vector<std::string> TagMatcher::Filter(const Pattern& pattern,
                                            const std::vector<std::string>& tags) {
    std::vector<std::string> out;
    for (const auto& tag : tags) {
        if (Match(pattern, tag))
            out.push_back(tag);
    }
    return out;
}

} // namespace updock
