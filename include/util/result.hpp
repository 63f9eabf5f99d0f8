#pragma once
#include <string>
#include <utility>

namespace updock {

enum class ErrorKind : int {
    None = 0,
    PatternSyntax,
    CurrentTagMismatch,
    Registry,
    Manifest,
    Config,
    Cancelled,
};

const char* ToString(ErrorKind kind);

struct Error {
    ErrorKind kind{ErrorKind::None};
    std::string msg;

    static Error Make(ErrorKind k, std::string m) { return {.kind = k, .msg = std::move(m)}; }
};

struct Result {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorKind k, std::string m) {
        return {.ok = false, .kind = k, .msg = std::move(m)};
    }
};

} // namespace updock
