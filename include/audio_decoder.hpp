#pragma once

#include "audio_types.hpp"
#include "error.hpp"

#include <cstdint>
#include <vector>

namespace voxpipe {

struct DecodedAudio {
    Status status;
    std::vector<int16_t> samples;  // interleaved
    int sample_rate = 0;
    int channels = 0;
};

// Reads back the containers produced by Encoder
DecodedAudio decode_wav(const std::vector<uint8_t>& bytes);
DecodedAudio decode_flac(const std::vector<uint8_t>& bytes);

// Dispatches on mime type
DecodedAudio decode_audio(const EncodedAudio& audio);

} // namespace voxpipe
