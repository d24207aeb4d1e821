#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace voxpipe {

// Lock-guarded sample buffer shared between the OS audio callback (the only
// writer while open) and the stop path (the only reader once closed).
class CaptureBuffer {
public:
    CaptureBuffer() = default;

    CaptureBuffer(const CaptureBuffer&) = delete;
    CaptureBuffer& operator=(const CaptureBuffer&) = delete;

    // Clear and pre-size for sample_rate * channels * max_seconds, then accept
    // writes up to that many samples
    void open(int sample_rate, int channels, int max_seconds);

    // Stop accepting writes; further appends are dropped
    void close() { open_.store(false); }
    bool is_open() const { return open_.load(); }

    // Producer side, called from the audio callback. Samples past the limit
    // are dropped and counted.
    void append(const int16_t* samples, size_t count);
    void append_float(const float* samples, size_t count);

    // Consumer side: take ownership of everything captured, leaving the buffer empty
    std::vector<int16_t> take();

    size_t size() const;
    size_t capacity() const;
    size_t limit() const;
    size_t dropped() const;
    int sample_rate() const { return sample_rate_; }
    int channels() const { return channels_; }

    static int16_t float_to_i16(float sample);

private:
    std::vector<int16_t> samples_;
    mutable std::mutex mutex_;
    std::atomic<bool> open_{false};
    size_t limit_ = 0;
    size_t dropped_ = 0;
    int sample_rate_ = 0;
    int channels_ = 0;
};

} // namespace voxpipe
