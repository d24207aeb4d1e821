#include "capture_buffer.hpp"

#include <algorithm>
#include <utility>

namespace voxpipe {

void CaptureBuffer::open(int sample_rate, int channels, int max_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    sample_rate_ = sample_rate;
    channels_ = channels;
    samples_.clear();
    dropped_ = 0;
    limit_ = static_cast<size_t>(std::max(sample_rate, 0)) * static_cast<size_t>(std::max(channels, 0)) *
             static_cast<size_t>(std::max(max_seconds, 0));
    // Reserve the whole session up front so the callback never reallocates
    samples_.reserve(limit_);
    open_.store(true);
}

void CaptureBuffer::append(const int16_t* samples, size_t count) {
    if (!open_.load() || samples == nullptr) return;

    std::lock_guard<std::mutex> lock(mutex_);
    const size_t room = limit_ - std::min(limit_, samples_.size());
    const size_t kept = std::min(room, count);
    samples_.insert(samples_.end(), samples, samples + kept);
    dropped_ += count - kept;
}

void CaptureBuffer::append_float(const float* samples, size_t count) {
    if (!open_.load() || samples == nullptr) return;

    std::lock_guard<std::mutex> lock(mutex_);
    const size_t room = limit_ - std::min(limit_, samples_.size());
    const size_t kept = std::min(room, count);
    for (size_t i = 0; i < kept; ++i) {
        samples_.push_back(float_to_i16(samples[i]));
    }
    dropped_ += count - kept;
}

std::vector<int16_t> CaptureBuffer::take() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int16_t> out;
    out.swap(samples_);
    return out;
}

size_t CaptureBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.size();
}

size_t CaptureBuffer::capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.capacity();
}

size_t CaptureBuffer::limit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return limit_;
}

size_t CaptureBuffer::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

int16_t CaptureBuffer::float_to_i16(float sample) {
    float clamped = std::max(-1.0f, std::min(1.0f, sample));
    return static_cast<int16_t>(clamped * 32767.0f);
}

} // namespace voxpipe
