#pragma once

#include "audio_backend.hpp"
#include "capture_buffer.hpp"
#include "encoder.hpp"
#include "signal_processor.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <vector>
#include <portaudio.h>

namespace voxpipe {

struct AudioCaptureConfig {
    int frames_per_buffer = 512;
    int max_recording_seconds = 30;    // sizes the capture buffer
    int max_channels = 2;              // never open more than this many input channels
    std::vector<std::string> device_priority;  // exact device names, most preferred first
};

// PortAudio input stream feeding a CaptureBuffer
class AudioCapture : public AudioBackend {
public:
    AudioCapture();
    AudioCapture(const AudioCaptureConfig& config,
                 const SignalProcessorConfig& processing,
                 const EncoderConfig& encoding);
    ~AudioCapture() override;

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    bool initialize();
    void shutdown();

    Status start_recording() override;
    CaptureResult stop_recording() override;
    bool is_recording() const override { return recording_.load(); }

    // Names of every device with at least one input channel
    std::vector<std::string> list_input_devices() const;

    // Device chosen for the current/last session
    const std::string& device_name() const { return device_name_; }

private:
    static int pa_callback(const void* input, void* output,
                          unsigned long frame_count,
                          const PaStreamCallbackTimeInfo* time_info,
                          PaStreamCallbackFlags status_flags,
                          void* user_data);

    PaDeviceIndex select_input_device();
    void close_stream();

    AudioCaptureConfig config_;
    SignalProcessor processor_;
    Encoder encoder_;

    PaStream* stream_ = nullptr;
    std::atomic<bool> recording_{false};
    std::atomic<bool> initialized_{false};

    CaptureBuffer buffer_;
    int sample_rate_ = 0;
    int channels_ = 0;
    std::string device_name_;
};

} // namespace voxpipe
