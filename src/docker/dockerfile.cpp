#include "docker/dockerfile.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

namespace updock {

namespace {

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view Trim(std::string_view s) {
    while (!s.empty() && IsSpace(s.front())) s.remove_prefix(1);
    while (!s.empty() && IsSpace(s.back())) s.remove_suffix(1);
    return s;
}

std::string Lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

// Pops the next whitespace-delimited word.
std::string_view NextWord(std::string_view& s) {
    s = Trim(s);
    std::size_t end = 0;
    while (end < s.size() && !IsSpace(s[end])) ++end;
    auto word = s.substr(0, end);
    s.remove_prefix(end);
    return word;
}

std::vector<std::string_view> Words(std::string_view s) {
    std::vector<std::string_view> out;
    for (auto w = NextWord(s); !w.empty(); w = NextWord(s)) out.push_back(w);
    return out;
}

Error MalformedDirective(std::string_view line, const std::string& what) {
    return Error::Make(ErrorKind::PatternSyntax,
                       "malformed directive '" + std::string(Trim(line)) + "': " + what);
}

} // namespace

std::expected<std::optional<std::string>, Error> ParsePatternDirective(std::string_view line) {
    std::string_view s = Trim(line);
    if (!s.starts_with('#'))
        return std::nullopt;
    s.remove_prefix(1);

    if (NextWord(s) != kDirectiveMarker)
        return std::nullopt;

    if (NextWord(s) != "--pattern")
        return std::unexpected(MalformedDirective(line, "expected --pattern"));

    s = Trim(s);
    if (s.empty() || (s.front() != '"' && s.front() != '\''))
        return std::unexpected(MalformedDirective(line, "pattern must be quoted"));

    const char quote = s.front();
    const auto close = s.find(quote, 1);
    if (close == std::string_view::npos)
        return std::unexpected(MalformedDirective(line, "unterminated quote"));
    if (!Trim(s.substr(close + 1)).empty())
        return std::unexpected(MalformedDirective(line, "trailing text after pattern"));

    return std::string(s.substr(1, close - 1));
}

std::vector<ScannedImage> DockerfileScanner::Scan(std::string_view input) {
    std::vector<ScannedImage> out;
    std::set<std::string> stages;
    std::optional<std::expected<std::optional<std::string>, Error>> pending;

    std::istringstream is{std::string(input)};
    std::string raw;
    std::size_t line_no = 0;
    while (std::getline(is, raw)) {
        ++line_no;
        if (!raw.empty() && raw.back() == '\r') raw.pop_back();

        auto directive = ParsePatternDirective(raw);
        if (!directive || directive->has_value()) {
            pending = std::move(directive);
            continue;
        }

        auto previous = std::move(pending);
        pending.reset();

        const auto words = Words(raw);
        if (words.empty() || Lower(words[0]) != "from")
            continue;

        std::size_t i = 1;
        while (i < words.size() && words[i].starts_with("--")) ++i;

        ScannedImage entry{.line = line_no,
                           .text = std::string(Trim(raw)),
                           .has_directive = previous.has_value(),
                           .image = {}};
        if (i >= words.size()) {
            entry.image = std::unexpected(
                Error::Make(ErrorKind::Manifest, "FROM without image on line " + std::to_string(line_no)));
            out.push_back(std::move(entry));
            continue;
        }

        const std::string_view image = words[i];
        const bool earlier_stage = stages.count(Lower(image)) > 0;
        if (i + 2 < words.size() && Lower(words[i + 1]) == "as") {
            stages.insert(Lower(words[i + 2]));
        }

        if (earlier_stage || Lower(image) == "scratch") {
            LogDebug("line %zu: skipping non-registry base '%.*s'", line_no,
                     static_cast<int>(image.size()), image.data());
            continue;
        }
        if (image.find('@') != std::string_view::npos || image.find('$') != std::string_view::npos) {
            LogInfo("line %zu: skipping '%.*s' (digest or build argument)", line_no,
                    static_cast<int>(image.size()), image.data());
            continue;
        }

        auto ref = ImageReference::Parse(image);
        if (!ref) {
            entry.image = std::unexpected(ref.error());
        } else {
            ref->line = line_no;
            if (previous) {
                if (!*previous) {
                    entry.image = std::unexpected(previous->error());
                    out.push_back(std::move(entry));
                    continue;
                }
                ref->pattern = std::move(**previous);
            }
            entry.image = std::move(*ref);
        }
        out.push_back(std::move(entry));
    }

    return out;
}

} // namespace updock
