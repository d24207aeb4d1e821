#include "encoder.hpp"

#include <FLAC++/encoder.h>

#include <algorithm>
#include <iostream>
#include <utility>

namespace voxpipe {

namespace {

void put_u16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xff));
}

void put_tag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

// Collects the encoder's output in memory
class MemoryFlacEncoder : public FLAC::Encoder::Stream {
public:
    explicit MemoryFlacEncoder(std::vector<uint8_t>& sink) : sink_(sink) {}

protected:
    ::FLAC__StreamEncoderWriteStatus write_callback(const FLAC__byte buffer[], size_t bytes,
                                                    uint32_t samples, uint32_t current_frame) override {
        (void)samples;
        (void)current_frame;
        sink_.insert(sink_.end(), buffer, buffer + bytes);
        return FLAC__STREAM_ENCODER_WRITE_STATUS_OK;
    }

private:
    std::vector<uint8_t>& sink_;
};

} // namespace

std::vector<uint8_t> create_wav_header(uint32_t data_len, uint32_t sample_rate,
                                       uint16_t channels, uint16_t bits_per_sample) {
    const uint16_t block_align = static_cast<uint16_t>(channels * (bits_per_sample / 8));
    const uint32_t byte_rate = sample_rate * block_align;

    std::vector<uint8_t> header;
    header.reserve(WAV_HEADER_SIZE);

    put_tag(header, "RIFF");
    put_u32(header, 36 + data_len);
    put_tag(header, "WAVE");

    put_tag(header, "fmt ");
    put_u32(header, 16);           // fmt chunk size
    put_u16(header, 1);            // PCM
    put_u16(header, channels);
    put_u32(header, sample_rate);
    put_u32(header, byte_rate);
    put_u16(header, block_align);
    put_u16(header, bits_per_sample);

    put_tag(header, "data");
    put_u32(header, data_len);

    return header;
}

std::vector<uint8_t> Encoder::encode_wav(const int16_t* samples, size_t count,
                                         int sample_rate, int channels) {
    const uint32_t data_len = static_cast<uint32_t>(count * sizeof(int16_t));

    std::vector<uint8_t> out = create_wav_header(data_len, static_cast<uint32_t>(sample_rate),
                                                 static_cast<uint16_t>(channels), 16);
    out.reserve(WAV_HEADER_SIZE + data_len);

    for (size_t i = 0; i < count; ++i) {
        put_u16(out, static_cast<uint16_t>(samples[i]));
    }
    return out;
}

bool Encoder::encode_flac(const int16_t* samples, size_t count, int sample_rate, int channels,
                          std::vector<uint8_t>& out, std::string& error) const {
    if (channels < 1 || sample_rate <= 0) {
        error = "invalid stream format";
        return false;
    }

    std::vector<uint8_t> bytes;
    MemoryFlacEncoder encoder(bytes);

    const size_t frames = count / static_cast<size_t>(channels);

    bool ok = encoder.set_verify(true);
    ok &= encoder.set_compression_level(static_cast<uint32_t>(config_.flac_compression_level));
    ok &= encoder.set_channels(static_cast<uint32_t>(channels));
    ok &= encoder.set_bits_per_sample(16);
    ok &= encoder.set_sample_rate(static_cast<uint32_t>(sample_rate));
    ok &= encoder.set_total_samples_estimate(frames);
    if (!ok) {
        error = "encoder configuration rejected";
        return false;
    }

    ::FLAC__StreamEncoderInitStatus init_status = encoder.init();
    if (init_status != FLAC__STREAM_ENCODER_INIT_STATUS_OK) {
        error = std::string("init failed: ") + FLAC__StreamEncoderInitStatusString[init_status];
        return false;
    }

    // libFLAC takes 32-bit samples; feed in bounded chunks
    constexpr size_t CHUNK_FRAMES = 4096;
    std::vector<FLAC__int32> chunk;
    chunk.reserve(CHUNK_FRAMES * static_cast<size_t>(channels));

    for (size_t frame = 0; frame < frames; frame += CHUNK_FRAMES) {
        const size_t n = std::min(CHUNK_FRAMES, frames - frame);
        chunk.assign(samples + frame * channels, samples + (frame + n) * channels);
        if (!encoder.process_interleaved(chunk.data(), static_cast<uint32_t>(n))) {
            error = std::string("encode failed: ") + encoder.get_state().as_cstring();
            return false;
        }
    }

    if (!encoder.finish()) {
        error = std::string("finish failed: ") + encoder.get_state().as_cstring();
        return false;
    }

    out = std::move(bytes);
    return true;
}

EncodeResult Encoder::encode(const ProcessedAudio& audio) const {
    EncodeResult result;
    const int16_t* samples = audio.samples.data();
    const size_t count = audio.samples.size();

    if (config_.prefer_flac) {
        std::string error;
        if (encode_flac(samples, count, audio.sample_rate, audio.channels, result.audio.bytes, error)) {
            result.audio.mime_type = MIME_FLAC;
            result.audio.file_name = config_.base_name + ".flac";
            return result;
        }

        result.used_fallback = true;
        result.warning = error;
        std::cerr << "Warning: FLAC encode failed (" << error << "), falling back to WAV" << std::endl;
    }

    result.audio.bytes = encode_wav(samples, count, audio.sample_rate, audio.channels);
    result.audio.mime_type = MIME_WAV;
    result.audio.file_name = config_.base_name + ".wav";
    return result;
}

} // namespace voxpipe
