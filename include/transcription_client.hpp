#pragma once

#include "audio_types.hpp"
#include "error.hpp"

#include <cstdint>
#include <string>

namespace voxpipe {

struct TranscriptionResult {
    Status status;
    std::string text;
    int64_t duration_ms = 0;
    float confidence = 0.0f;  // 0.0 - 1.0 when the engine reports it
};

// Speech-to-text capability. May block for arbitrary latency and must be
// safe to call concurrently up to the dispatcher's permit count.
class TranscriptionClient {
public:
    virtual ~TranscriptionClient() = default;

    virtual TranscriptionResult transcribe(const EncodedAudio& audio,
                                           const std::string& language_hint) = 0;
};

} // namespace voxpipe
