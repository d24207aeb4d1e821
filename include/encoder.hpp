#pragma once

#include "audio_types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace voxpipe {

inline constexpr size_t WAV_HEADER_SIZE = 44;

struct EncoderConfig {
    bool prefer_flac = true;
    int flac_compression_level = 5;  // 0 (fastest) .. 8 (smallest)
    std::string base_name = "audio";
};

struct EncodeResult {
    EncodedAudio audio;
    bool used_fallback = false;
    std::string warning;  // why the FLAC path was abandoned, empty otherwise
};

// Canonical 44-byte RIFF/WAVE header for integer PCM
std::vector<uint8_t> create_wav_header(uint32_t data_len, uint32_t sample_rate,
                                       uint16_t channels, uint16_t bits_per_sample);

// Turns processed 16-bit PCM into a transportable blob.
// FLAC first; any FLAC failure falls back to WAV with a warning.
class Encoder {
public:
    Encoder() = default;
    explicit Encoder(const EncoderConfig& config) : config_(config) {}

    // Never fails for valid PCM, including zero samples
    EncodeResult encode(const ProcessedAudio& audio) const;

    // Lossless path. Returns false and fills error on failure.
    bool encode_flac(const int16_t* samples, size_t count, int sample_rate, int channels,
                     std::vector<uint8_t>& out, std::string& error) const;

    // Uncompressed container
    static std::vector<uint8_t> encode_wav(const int16_t* samples, size_t count,
                                           int sample_rate, int channels);

    const EncoderConfig& get_config() const { return config_; }

private:
    EncoderConfig config_;
};

} // namespace voxpipe
