#include "version/pattern.hpp"

#include <utility>

namespace updock {

namespace {

constexpr std::string_view kCompatibleMarker = "<>";
constexpr std::string_view kBreakingMarker = "<!>";

Error SyntaxError(std::string_view source, std::string what) {
    return Error::Make(ErrorKind::PatternSyntax,
                       "invalid pattern '" + std::string(source) + "': " + what);
}

} // namespace

Pattern::Pattern(std::string source, std::vector<Segment> segments)
    : source_(std::move(source)), segments_(std::move(segments)) {
    for (const auto& seg : segments_) {
        if (const auto* slot = std::get_if<Slot>(&seg)) {
            breaking_.push_back(slot->breaking);
        }
    }
}

std::expected<Pattern, Error> PatternCompiler::Compile(std::string_view source) {
    std::vector<Segment> segments;
    std::string literal;
    std::size_t slots = 0;

    auto flush_literal = [&] {
        if (!literal.empty()) {
            segments.emplace_back(Literal{std::move(literal)});
            literal.clear();
        }
    };

    std::size_t pos = 0;
    while (pos < source.size()) {
        const char c = source[pos];
        if (c != '<') {
            literal.push_back(c);
            ++pos;
            continue;
        }

        const std::string_view rest = source.substr(pos);
        if (rest.starts_with(kCompatibleMarker)) {
            flush_literal();
            segments.emplace_back(Slot{.breaking = false});
            pos += kCompatibleMarker.size();
            ++slots;
        } else if (rest.starts_with(kBreakingMarker)) {
            flush_literal();
            segments.emplace_back(Slot{.breaking = true});
            pos += kBreakingMarker.size();
            ++slots;
        } else {
            const auto close = rest.find('>');
            if (close == std::string_view::npos) {
                return std::unexpected(
                    SyntaxError(source, "unterminated '<' at offset " + std::to_string(pos)));
            }
            return std::unexpected(SyntaxError(
                source,
                "unknown marker '" + std::string(rest.substr(0, close + 1)) + "' at offset " +
                    std::to_string(pos) + " (expected '<>' or '<!>')"));
        }
    }
    flush_literal();

    if (slots == 0) {
        return std::unexpected(
            SyntaxError(source, "no version slot ('<>' or '<!>'), it can never detect an update"));
    }

    return Pattern(std::string(source), std::move(segments));
}

} // namespace updock
