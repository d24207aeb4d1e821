#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace voxpipe {

inline constexpr const char* MIME_FLAC = "audio/flac";
inline constexpr const char* MIME_WAV = "audio/wav";

// Terminal artifact of the capture pipeline
struct EncodedAudio {
    std::vector<uint8_t> bytes;
    std::string mime_type;
    std::string file_name;

    bool is_flac() const { return mime_type == MIME_FLAC; }
    bool is_wav() const { return mime_type == MIME_WAV; }
};

// 16-bit interleaved PCM that either borrows the caller's samples
// (no transformation was needed) or owns a newly materialized sequence.
// A borrowed buffer must not outlive the samples it points at.
class PcmBuffer {
public:
    PcmBuffer() = default;

    static PcmBuffer borrow(const int16_t* data, size_t size) {
        PcmBuffer buf;
        buf.borrowed_ = data;
        buf.size_ = size;
        return buf;
    }

    static PcmBuffer borrow(const std::vector<int16_t>& samples) {
        return borrow(samples.data(), samples.size());
    }

    static PcmBuffer own(std::vector<int16_t> samples) {
        PcmBuffer buf;
        buf.owned_ = true;
        buf.size_ = samples.size();
        buf.storage_ = std::move(samples);
        return buf;
    }

    const int16_t* data() const { return owned_ ? storage_.data() : borrowed_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    bool is_owned() const { return owned_; }

    int16_t operator[](size_t i) const { return data()[i]; }

    const int16_t* begin() const { return data(); }
    const int16_t* end() const { return data() + size_; }

    std::vector<int16_t> to_vector() const {
        return std::vector<int16_t>(begin(), end());
    }

private:
    std::vector<int16_t> storage_;
    const int16_t* borrowed_ = nullptr;
    size_t size_ = 0;
    bool owned_ = false;
};

// Output of the signal processing chain
struct ProcessedAudio {
    PcmBuffer samples;
    int sample_rate = 0;
    int channels = 1;

    size_t frame_count() const {
        return channels > 0 ? samples.size() / static_cast<size_t>(channels) : 0;
    }
};

} // namespace voxpipe
