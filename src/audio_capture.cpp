#include "audio_capture.hpp"
#include <algorithm>
#include <iostream>

namespace voxpipe {

AudioCapture::AudioCapture()
    : AudioCapture(AudioCaptureConfig{}, SignalProcessorConfig{}, EncoderConfig{}) {
}

AudioCapture::AudioCapture(const AudioCaptureConfig& config,
                           const SignalProcessorConfig& processing,
                           const EncoderConfig& encoding)
    : config_(config)
    , processor_(processing)
    , encoder_(encoding) {
}

AudioCapture::~AudioCapture() {
    shutdown();
}

bool AudioCapture::initialize() {
    if (initialized_.load()) return true;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::cerr << "PortAudio init failed: " << Pa_GetErrorText(err) << std::endl;
        return false;
    }

    initialized_.store(true);
    return true;
}

void AudioCapture::shutdown() {
    if (!initialized_.load()) return;

    if (recording_.load()) {
        buffer_.close();
        recording_.store(false);
    }
    close_stream();

    Pa_Terminate();
    initialized_.store(false);
}

std::vector<std::string> AudioCapture::list_input_devices() const {
    std::vector<std::string> names;
    if (!initialized_.load()) return names;

    int count = Pa_GetDeviceCount();
    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->maxInputChannels > 0) {
            names.emplace_back(info->name);
        }
    }
    return names;
}

PaDeviceIndex AudioCapture::select_input_device() {
    int count = Pa_GetDeviceCount();
    if (count < 0) {
        std::cerr << "Failed to enumerate devices: " << Pa_GetErrorText(count) << std::endl;
        return Pa_GetDefaultInputDevice();
    }

    // Preference list wins over the OS default
    for (const auto& wanted : config_.device_priority) {
        for (PaDeviceIndex i = 0; i < count; ++i) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (info && info->maxInputChannels > 0 && wanted == info->name) {
                std::cout << "Selected preferred input device: " << info->name << std::endl;
                return i;
            }
        }
    }

    if (!config_.device_priority.empty()) {
        std::cout << "No preferred input device found, using default" << std::endl;
    }
    return Pa_GetDefaultInputDevice();
}

Status AudioCapture::start_recording() {
    if (recording_.load()) {
        return Status::failure(ErrorKind::State, ERR_ALREADY_ACTIVE);
    }
    if (!initialize()) {
        return Status::failure(ErrorKind::Device, "PortAudio not available");
    }

    PaDeviceIndex device = select_input_device();
    if (device == paNoDevice) {
        return Status::failure(ErrorKind::Device, "No input device available");
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(device);
    if (!info || info->maxInputChannels < 1) {
        return Status::failure(ErrorKind::Device, "Selected device has no input channels");
    }

    PaStreamParameters input_params;
    input_params.device = device;
    input_params.channelCount = std::min(info->maxInputChannels, std::max(1, config_.max_channels));
    input_params.sampleFormat = paFloat32;
    input_params.suggestedLatency = info->defaultLowInputLatency;
    input_params.hostApiSpecificStreamInfo = nullptr;

    const double rate = info->defaultSampleRate;

    PaError err = Pa_IsFormatSupported(&input_params, nullptr, rate);
    if (err != paFormatIsSupported) {
        return Status::failure(ErrorKind::Device,
            std::string("Unsupported input format: ") + Pa_GetErrorText(err));
    }

    sample_rate_ = static_cast<int>(rate);
    channels_ = input_params.channelCount;
    device_name_ = info->name;

    buffer_.open(sample_rate_, channels_, config_.max_recording_seconds);

    err = Pa_OpenStream(&stream_,
                        &input_params,
                        nullptr,  // No output
                        rate,
                        config_.frames_per_buffer,
                        paClipOff,
                        pa_callback,
                        this);
    if (err != paNoError) {
        buffer_.close();
        stream_ = nullptr;
        return Status::failure(ErrorKind::Device,
            std::string("Failed to open stream: ") + Pa_GetErrorText(err));
    }

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        buffer_.close();
        close_stream();
        return Status::failure(ErrorKind::Device,
            std::string("Failed to start stream: ") + Pa_GetErrorText(err));
    }

    recording_.store(true);
    std::cout << "Capturing from " << device_name_ << " (" << sample_rate_ << "Hz, "
              << channels_ << "ch)" << std::endl;
    return Status::ok();
}

CaptureResult AudioCapture::stop_recording() {
    CaptureResult result;
    if (!recording_.load()) {
        result.status = Status::failure(ErrorKind::State, ERR_NOT_STARTED);
        return result;
    }

    buffer_.close();
    recording_.store(false);

    // Tear the stream down before reading, so no callback can race the read
    close_stream();

    if (buffer_.dropped() > 0) {
        std::cerr << "Warning: capture limit reached, dropped " << buffer_.dropped()
                  << " samples" << std::endl;
    }

    std::vector<int16_t> samples = buffer_.take();
    return finalize_capture(samples, sample_rate_, channels_, processor_, encoder_);
}

void AudioCapture::close_stream() {
    if (!stream_) return;

    PaError err = Pa_StopStream(stream_);
    if (err != paNoError) {
        std::cerr << "Failed to stop stream: " << Pa_GetErrorText(err) << std::endl;
    }
    err = Pa_CloseStream(stream_);
    if (err != paNoError) {
        std::cerr << "Failed to close stream: " << Pa_GetErrorText(err) << std::endl;
    }
    stream_ = nullptr;
}

int AudioCapture::pa_callback(const void* input, void* output,
                              unsigned long frame_count,
                              const PaStreamCallbackTimeInfo* time_info,
                              PaStreamCallbackFlags status_flags,
                              void* user_data) {
    (void)output;
    (void)time_info;
    (void)status_flags;

    auto* capture = static_cast<AudioCapture*>(user_data);
    if (!capture->buffer_.is_open() || input == nullptr) return paContinue;

    const float* in = static_cast<const float*>(input);
    capture->buffer_.append_float(in, frame_count * static_cast<unsigned long>(capture->channels_));

    return paContinue;
}

} // namespace voxpipe
