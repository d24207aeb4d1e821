#include "audio_backend.hpp"

#include <iostream>
#include <utility>

namespace voxpipe {

CaptureResult finalize_capture(const std::vector<int16_t>& samples, int sample_rate, int channels,
                               const SignalProcessor& processor, const Encoder& encoder) {
    CaptureResult result;

    if (sample_rate > 0 && channels > 0) {
        result.duration_ms = static_cast<int64_t>(samples.size() / static_cast<size_t>(channels)) * 1000
                             / sample_rate;
    }

    ProcessResult processed = processor.process(samples.data(), samples.size(), sample_rate, channels);
    if (!processed.status.success) {
        std::cerr << "Audio processing failed: " << processed.status.error << std::endl;
        result.status = processed.status;
        return result;
    }

    EncodeResult encoded = encoder.encode(processed.audio);
    result.audio = std::move(encoded.audio);
    result.used_fallback = encoded.used_fallback;

    std::cout << "Encoded " << processed.audio.frame_count() << " frames @ "
              << processed.audio.sample_rate << "Hz as " << result.audio.mime_type
              << " (" << result.audio.bytes.size() << " bytes)" << std::endl;

    return result;
}

} // namespace voxpipe
