#include "util/result.hpp"

namespace updock {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:               return "none";
        case ErrorKind::PatternSyntax:      return "pattern syntax error";
        case ErrorKind::CurrentTagMismatch: return "current tag mismatch";
        case ErrorKind::Registry:           return "registry error";
        case ErrorKind::Manifest:           return "manifest error";
        case ErrorKind::Config:             return "configuration error";
        case ErrorKind::Cancelled:          return "cancelled";
    }
    return "unknown error";
}

} // namespace updock
