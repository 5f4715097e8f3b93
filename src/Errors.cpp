/**
 * Errors.cpp - Error kind names for diagnostics
 */

#include "shlama/Errors.hpp"

namespace shlama {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Usage: return "usage";
        case ErrorKind::ServerUnavailable: return "server-unavailable";
        case ErrorKind::Inference: return "inference";
        case ErrorKind::EmptySuggestion: return "empty-suggestion";
        case ErrorKind::Execution: return "execution";
        case ErrorKind::ConfigWrite: return "config-write";
    }
    return "unknown";
}

} // namespace shlama
