#pragma once

#include <string>
#include <utility>

namespace voxpipe {

// Error taxonomy shared by every stage of the pipeline
enum class ErrorKind {
    None,
    Device,      // no input device, unsupported format, stream failure
    State,       // start while recording, stop while idle
    Processing,  // resampler construction/processing failure
    Encode,      // compressed encode failure (recovered locally)
    Dispatch,    // transcription or post-processing failure
    System       // anything else (shutdown, internal misuse)
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Device: return "device";
        case ErrorKind::State: return "state";
        case ErrorKind::Processing: return "processing";
        case ErrorKind::Encode: return "encode";
        case ErrorKind::Dispatch: return "dispatch";
        case ErrorKind::System: return "system";
        default: return "unknown";
    }
}

struct Status {
    bool success = true;
    ErrorKind kind = ErrorKind::None;
    std::string error;

    static Status ok() { return Status{}; }

    static Status failure(ErrorKind kind, std::string message) {
        Status status;
        status.success = false;
        status.kind = kind;
        status.error = std::move(message);
        return status;
    }
};

// Canonical state-error messages
inline constexpr const char* ERR_ALREADY_ACTIVE = "Recording already active";
inline constexpr const char* ERR_NOT_STARTED = "Recording not started";

} // namespace voxpipe
