/**
 * Errors.hpp - Error kinds reported by the request and model-selection flows
 */

#pragma once

namespace shlama {

enum class ErrorKind {
    None,
    Usage,              // Empty request
    ServerUnavailable,  // Server unreachable and could not be started
    Inference,          // Transport, HTTP status or timeout during generation
    EmptySuggestion,    // Generation succeeded but nothing usable came back
    Execution,          // The confirmed command failed when run
    ConfigWrite         // Persisting the model choice failed
};

const char* errorKindName(ErrorKind kind);

} // namespace shlama
