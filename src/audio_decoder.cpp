#include "audio_decoder.hpp"

#include <FLAC++/decoder.h>

#include <algorithm>
#include <cstring>
#include <string>

namespace voxpipe {

namespace {

uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

class MemoryFlacDecoder : public FLAC::Decoder::Stream {
public:
    MemoryFlacDecoder(const std::vector<uint8_t>& source, DecodedAudio& out)
        : source_(source), out_(out) {}

    bool had_error() const { return had_error_; }
    const std::string& error() const { return error_; }

protected:
    ::FLAC__StreamDecoderReadStatus read_callback(FLAC__byte buffer[], size_t* bytes) override {
        if (pos_ >= source_.size()) {
            *bytes = 0;
            return FLAC__STREAM_DECODER_READ_STATUS_END_OF_STREAM;
        }
        size_t n = std::min(*bytes, source_.size() - pos_);
        std::memcpy(buffer, source_.data() + pos_, n);
        pos_ += n;
        *bytes = n;
        return FLAC__STREAM_DECODER_READ_STATUS_CONTINUE;
    }

    ::FLAC__StreamDecoderWriteStatus write_callback(const ::FLAC__Frame* frame,
                                                    const FLAC__int32* const buffer[]) override {
        const uint32_t channels = frame->header.channels;
        const uint32_t bps = frame->header.bits_per_sample;
        const uint32_t blocksize = frame->header.blocksize;

        if (out_.channels == 0) out_.channels = static_cast<int>(channels);
        if (out_.sample_rate == 0) out_.sample_rate = static_cast<int>(frame->header.sample_rate);

        for (uint32_t i = 0; i < blocksize; ++i) {
            for (uint32_t c = 0; c < channels; ++c) {
                FLAC__int32 s = buffer[c][i];
                if (bps > 16) s >>= (bps - 16);
                else if (bps < 16) s <<= (16 - bps);
                out_.samples.push_back(static_cast<int16_t>(s));
            }
        }
        return FLAC__STREAM_DECODER_WRITE_STATUS_CONTINUE;
    }

    void metadata_callback(const ::FLAC__StreamMetadata* metadata) override {
        if (metadata->type == FLAC__METADATA_TYPE_STREAMINFO) {
            out_.sample_rate = static_cast<int>(metadata->data.stream_info.sample_rate);
            out_.channels = static_cast<int>(metadata->data.stream_info.channels);
            out_.samples.reserve(static_cast<size_t>(metadata->data.stream_info.total_samples) *
                                 metadata->data.stream_info.channels);
        }
    }

    void error_callback(::FLAC__StreamDecoderErrorStatus status) override {
        had_error_ = true;
        error_ = FLAC__StreamDecoderErrorStatusString[status];
    }

private:
    const std::vector<uint8_t>& source_;
    DecodedAudio& out_;
    size_t pos_ = 0;
    bool had_error_ = false;
    std::string error_;
};

} // namespace

DecodedAudio decode_wav(const std::vector<uint8_t>& bytes) {
    DecodedAudio result;

    if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        result.status = Status::failure(ErrorKind::Dispatch, "Not a RIFF/WAVE container");
        return result;
    }

    uint16_t format = 0;
    uint16_t bits = 0;
    bool have_fmt = false;
    size_t pos = 12;

    while (pos + 8 <= bytes.size()) {
        const uint8_t* chunk = bytes.data() + pos;
        const uint32_t chunk_len = read_u32(chunk + 4);
        const size_t body = pos + 8;

        if (std::memcmp(chunk, "fmt ", 4) == 0 && chunk_len >= 16 && body + 16 <= bytes.size()) {
            format = read_u16(bytes.data() + body);
            result.channels = read_u16(bytes.data() + body + 2);
            result.sample_rate = static_cast<int>(read_u32(bytes.data() + body + 4));
            bits = read_u16(bytes.data() + body + 14);
            have_fmt = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            if (!have_fmt || format != 1 || bits != 16) {
                result.status = Status::failure(ErrorKind::Dispatch, "Unsupported WAV format");
                return result;
            }
            const size_t available = std::min<size_t>(chunk_len, bytes.size() - body);
            result.samples.resize(available / 2);
            for (size_t i = 0; i < result.samples.size(); ++i) {
                result.samples[i] = static_cast<int16_t>(read_u16(bytes.data() + body + i * 2));
            }
            return result;
        }

        // Chunks are word aligned
        pos = body + chunk_len + (chunk_len & 1);
    }

    result.status = Status::failure(ErrorKind::Dispatch, "WAV container has no data chunk");
    return result;
}

DecodedAudio decode_flac(const std::vector<uint8_t>& bytes) {
    DecodedAudio result;
    MemoryFlacDecoder decoder(bytes, result);

    ::FLAC__StreamDecoderInitStatus init_status = decoder.init();
    if (init_status != FLAC__STREAM_DECODER_INIT_STATUS_OK) {
        result.status = Status::failure(ErrorKind::Dispatch,
            std::string("FLAC decoder init failed: ") + FLAC__StreamDecoderInitStatusString[init_status]);
        return result;
    }

    if (!decoder.process_until_end_of_stream() || decoder.had_error()) {
        std::string reason = decoder.had_error() ? decoder.error() : decoder.get_state().as_cstring();
        result.status = Status::failure(ErrorKind::Dispatch, "FLAC decode failed: " + reason);
        return result;
    }

    if (!decoder.finish()) {
        result.status = Status::failure(ErrorKind::Dispatch, "FLAC decoder finish failed");
        return result;
    }

    if (result.sample_rate == 0 || result.channels == 0) {
        result.status = Status::failure(ErrorKind::Dispatch, "FLAC stream has no STREAMINFO");
    }
    return result;
}

DecodedAudio decode_audio(const EncodedAudio& audio) {
    if (audio.is_flac()) return decode_flac(audio.bytes);
    if (audio.is_wav()) return decode_wav(audio.bytes);

    DecodedAudio result;
    result.status = Status::failure(ErrorKind::Dispatch, "Unsupported audio type: " + audio.mime_type);
    return result;
}

} // namespace voxpipe
