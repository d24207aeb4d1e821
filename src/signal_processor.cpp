#include "signal_processor.hpp"

#include <samplerate.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <vector>

namespace voxpipe {

namespace {

// Average absolute value over one interleaved frame
inline int frame_magnitude(const int16_t* frame, int channels) {
    int32_t sum = 0;
    for (int c = 0; c < channels; ++c) {
        sum += std::abs(static_cast<int32_t>(frame[c]));
    }
    return static_cast<int>(sum / channels);
}

inline int16_t clamp_to_i16(int32_t value) {
    return static_cast<int16_t>(std::max<int32_t>(-32768, std::min<int32_t>(32767, value)));
}

// frames / NOISE_FLOOR_FRACTION of the quietest frames form the noise floor
constexpr size_t NOISE_FLOOR_FRACTION = 100;

inline size_t ms_to_frames(int ms, int sample_rate) {
    int64_t frames = static_cast<int64_t>(ms) * sample_rate / 1000;
    return frames < 1 ? 1 : static_cast<size_t>(frames);
}

} // namespace

ProcessResult SignalProcessor::process(const int16_t* samples, size_t count,
                                       int sample_rate, int channels) const {
    ProcessResult result;

    if (channels < 1 || sample_rate <= 0) {
        result.status = Status::failure(ErrorKind::Processing,
            "Invalid stream format: " + std::to_string(sample_rate) + "Hz, "
            + std::to_string(channels) + " channels");
        return result;
    }

    PcmBuffer audio = PcmBuffer::borrow(samples, count);

    if (config_.trim_silence) {
        audio = trim_silence(audio, sample_rate, channels);
    }

    audio = downmix(audio, channels);

    result = resample(audio, sample_rate);
    return result;
}

int SignalProcessor::compute_threshold(const PcmBuffer& audio, int sample_rate, int channels) const {
    const size_t frames = audio.size() / static_cast<size_t>(channels);
    if (frames == 0) return config_.min_threshold;

    std::vector<int> magnitudes(frames);
    int peak = 0;
    for (size_t i = 0; i < frames; ++i) {
        magnitudes[i] = frame_magnitude(audio.data() + i * channels, channels);
        if (magnitudes[i] > peak) peak = magnitudes[i];
    }

    // Noise floor: mean of the quietest frames, at most one analysis window's worth
    const size_t window = ms_to_frames(config_.analysis_window_ms, sample_rate);
    const size_t quiet = std::max<size_t>(1, std::min(window, frames / NOISE_FLOOR_FRACTION));
    if (quiet < frames) {
        std::nth_element(magnitudes.begin(), magnitudes.begin() + quiet, magnitudes.end());
    }

    int64_t floor_sum = 0;
    for (size_t i = 0; i < quiet; ++i) floor_sum += magnitudes[i];

    float noise_floor = static_cast<float>(floor_sum) / static_cast<float>(quiet);
    float threshold = noise_floor * config_.threshold_multiplier;
    threshold = std::min(threshold, static_cast<float>(peak) * config_.max_threshold_ratio);

    return std::max(config_.min_threshold, static_cast<int>(threshold));
}

PcmBuffer SignalProcessor::trim_silence(const PcmBuffer& audio, int sample_rate, int channels) const {
    // Repeat until nothing more comes off, so trimmed output is a fixed point.
    // Every pass returns a view into the caller's samples.
    PcmBuffer current = PcmBuffer::borrow(audio.data(), audio.size());
    for (;;) {
        PcmBuffer next = trim_edges(current, sample_rate, channels);
        if (next.size() == current.size()) break;
        current = next;
    }
    return current.size() == audio.size() ? audio : current;
}

PcmBuffer SignalProcessor::trim_edges(const PcmBuffer& audio, int sample_rate, int channels) const {
    if (channels < 1) return audio;

    const size_t frames = audio.size() / static_cast<size_t>(channels);
    if (frames == 0) return audio;

    const int threshold = compute_threshold(audio, sample_rate, channels);
    const size_t min_run = ms_to_frames(config_.min_silence_ms, sample_rate);
    const int16_t* data = audio.data();

    size_t lead = 0;
    while (lead < frames && frame_magnitude(data + lead * channels, channels) < threshold) {
        ++lead;
    }

    if (lead == frames) {
        // Nothing above threshold
        if (frames < min_run) return audio;
        return PcmBuffer::borrow(data, static_cast<size_t>(channels));
    }

    size_t trail = 0;
    while (trail < frames - lead &&
           frame_magnitude(data + (frames - 1 - trail) * channels, channels) < threshold) {
        ++trail;
    }

    size_t start = lead >= min_run ? lead : 0;
    size_t end = trail >= min_run ? frames - trail : frames;

    if (start == 0 && end == frames) return audio;

    size_t sample_start = start * static_cast<size_t>(channels);
    size_t sample_end = end == frames ? audio.size() : end * static_cast<size_t>(channels);

    return PcmBuffer::borrow(data + sample_start, sample_end - sample_start);
}

PcmBuffer SignalProcessor::downmix(const PcmBuffer& audio, int channels) {
    if (channels <= 1) return audio;

    const size_t frames = audio.size() / static_cast<size_t>(channels);
    const size_t remainder = audio.size() % static_cast<size_t>(channels);
    const int16_t* data = audio.data();

    std::vector<int16_t> mono;
    mono.reserve(frames + (remainder > 0 ? 1 : 0));

    for (size_t i = 0; i < frames; ++i) {
        int32_t sum = 0;
        for (int c = 0; c < channels; ++c) {
            sum += data[i * channels + c];
        }
        mono.push_back(clamp_to_i16(sum / channels));
    }

    // Trailing partial frame becomes one last sample
    if (remainder > 0) {
        int32_t sum = 0;
        for (size_t j = frames * channels; j < audio.size(); ++j) {
            sum += data[j];
        }
        mono.push_back(clamp_to_i16(sum / static_cast<int32_t>(remainder)));
    }

    return PcmBuffer::own(std::move(mono));
}

ProcessResult SignalProcessor::resample(const PcmBuffer& mono, int sample_rate) const {
    ProcessResult result;
    result.audio.channels = 1;

    const int target = config_.target_sample_rate;

    if (sample_rate == target || mono.empty() || mono.size() < config_.min_resample_frames) {
        result.audio.samples = mono;
        result.audio.sample_rate = sample_rate;
        return result;
    }

    if (sample_rate <= 0 || target <= 0) {
        result.status = Status::failure(ErrorKind::Processing,
            "Invalid resample rates: " + std::to_string(sample_rate) + " -> " + std::to_string(target));
        return result;
    }

    const double ratio = static_cast<double>(target) / static_cast<double>(sample_rate);
    if (!src_is_valid_ratio(ratio)) {
        result.status = Status::failure(ErrorKind::Processing,
            "Unsupported resample ratio " + std::to_string(sample_rate) + " -> " + std::to_string(target));
        return result;
    }

    const size_t in_frames = mono.size();
    const size_t out_frames = static_cast<size_t>(
        (static_cast<uint64_t>(in_frames) * target + sample_rate - 1) / sample_rate);

    std::vector<float> input(in_frames);
    for (size_t i = 0; i < in_frames; ++i) {
        input[i] = static_cast<float>(mono[i]) / 32768.0f;
    }

    // Headroom for the converter's rounding at end of input
    std::vector<float> output(out_frames + 64, 0.0f);

    SRC_DATA src_data;
    src_data.data_in = input.data();
    src_data.input_frames = static_cast<long>(in_frames);
    src_data.data_out = output.data();
    src_data.output_frames = static_cast<long>(output.size());
    src_data.src_ratio = ratio;
    src_data.end_of_input = 1;
    src_data.input_frames_used = 0;
    src_data.output_frames_gen = 0;

    int err = src_simple(&src_data, SRC_SINC_MEDIUM_QUALITY, 1);
    if (err != 0) {
        std::cerr << "Resampler failed: " << src_strerror(err) << std::endl;
        result.status = Status::failure(ErrorKind::Processing,
            std::string("Resampler failed: ") + src_strerror(err));
        return result;
    }

    // Output length is fixed at ceil(in * ratio); the converter may produce a
    // frame more or less depending on filter delay
    std::vector<int16_t> converted(out_frames, 0);
    const size_t produced = std::min(out_frames, static_cast<size_t>(src_data.output_frames_gen));
    for (size_t i = 0; i < produced; ++i) {
        converted[i] = clamp_to_i16(static_cast<int32_t>(std::lround(output[i] * 32768.0f)));
    }

    result.audio.samples = PcmBuffer::own(std::move(converted));
    result.audio.sample_rate = target;
    return result;
}

} // namespace voxpipe
