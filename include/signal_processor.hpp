#pragma once

#include "audio_types.hpp"
#include "error.hpp"

#include <cstddef>
#include <cstdint>

namespace voxpipe {

// Signal processing configuration
struct SignalProcessorConfig {
    // Dynamic silence trimming
    bool trim_silence = true;
    int analysis_window_ms = 200;       // noise floor averages at most this much of the quietest audio
    float threshold_multiplier = 3.0f;  // threshold = noise floor * multiplier
    int min_threshold = 300;            // absolute floor, 16-bit units (~-40dBFS)
    float max_threshold_ratio = 0.5f;   // threshold never exceeds this share of the loudest frame
    int min_silence_ms = 50;            // shorter leading/trailing runs are kept

    // Sample-rate conversion
    int target_sample_rate = 16000;
    size_t min_resample_frames = 64;    // inputs shorter than this are passed through
};

struct ProcessResult {
    Status status;
    ProcessedAudio audio;
};

// Pure transforms over captured 16-bit interleaved PCM.
//
// Every stage either returns its input untouched (as a borrowed view) or a
// newly materialized buffer. Views borrowed from the caller's samples stay
// valid only as long as those samples do.
class SignalProcessor {
public:
    using Config = SignalProcessorConfig;

    SignalProcessor() = default;
    explicit SignalProcessor(const Config& config) : config_(config) {}

    // trim -> downmix -> resample
    ProcessResult process(const int16_t* samples, size_t count,
                          int sample_rate, int channels) const;

    // Individual stages (for testing)
    PcmBuffer trim_silence(const PcmBuffer& audio, int sample_rate, int channels) const;
    static PcmBuffer downmix(const PcmBuffer& audio, int channels);
    ProcessResult resample(const PcmBuffer& mono, int sample_rate) const;

    // Silence cutoff derived from the signal's own noise floor
    int compute_threshold(const PcmBuffer& audio, int sample_rate, int channels) const;

    void set_config(const Config& config) { config_ = config; }
    const Config& get_config() const { return config_; }

private:
    // One pass over the leading and trailing runs
    PcmBuffer trim_edges(const PcmBuffer& audio, int sample_rate, int channels) const;

    Config config_;
};

} // namespace voxpipe
