#pragma once

#include "audio_types.hpp"
#include "encoder.hpp"
#include "error.hpp"
#include "signal_processor.hpp"

#include <cstdint>
#include <vector>

namespace voxpipe {

struct CaptureResult {
    Status status;
    EncodedAudio audio;
    int64_t duration_ms = 0;      // length of the raw capture
    bool used_fallback = false;   // WAV instead of FLAC
};

// Capability the recording session drives. Implementations own the OS
// stream (or stand in for it) and run the stop path themselves.
class AudioBackend {
public:
    virtual ~AudioBackend() = default;

    // Fails if already recording or no usable device exists
    virtual Status start_recording() = 0;

    // Fails if not recording; otherwise returns the encoded capture
    virtual CaptureResult stop_recording() = 0;

    // Non-blocking, side-effect free
    virtual bool is_recording() const = 0;
};

// Stop path shared by every backend: SignalProcessor -> Encoder.
// A processing failure aborts the encode; an encode failure falls back to WAV.
CaptureResult finalize_capture(const std::vector<int16_t>& samples, int sample_rate, int channels,
                               const SignalProcessor& processor, const Encoder& encoder);

} // namespace voxpipe
