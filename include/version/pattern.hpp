#pragma once

#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace updock {

// Text that must appear verbatim in a tag.
struct Literal {
    std::string text;
    bool operator==(const Literal&) const = default;
};

// One or more decimal digits, captured as an unsigned integer.
struct Slot {
    bool breaking = false;
    bool operator==(const Slot&) const = default;
};

using Segment = std::variant<Literal, Slot>;

// One integer per slot, in pattern order (leftmost = most significant).
using ExtractedVersion = std::vector<std::uint64_t>;

class Pattern {
public:
    Pattern(std::string source, std::vector<Segment> segments);

    const std::string& Source() const { return source_; }
    const std::vector<Segment>& Segments() const { return segments_; }
    std::size_t SlotCount() const { return breaking_.size(); }
    bool IsBreakingSlot(std::size_t slot) const { return breaking_.at(slot); }

private:
    std::string source_;
    std::vector<Segment> segments_;
    std::vector<bool> breaking_;
};

// Pattern syntax: "<>" is a compatible slot, "<!>" a breaking slot, anything
// else is literal. A '<' that does not open one of those markers is an error,
// as is a pattern without slots.
class PatternCompiler {
public:
    static std::expected<Pattern, Error> Compile(std::string_view source);
};

} // namespace updock
