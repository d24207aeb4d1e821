#pragma once

#include "audio_capture.hpp"
#include "encoder.hpp"
#include "recording_session.hpp"
#include "signal_processor.hpp"
#include "transcriber.hpp"
#include "transcription_dispatcher.hpp"

#include <chrono>
#include <cstdlib>
#include <string>
#include <vector>

namespace voxpipe {

// Comma-separated device names, whitespace trimmed, empty items dropped
inline std::vector<std::string> parse_device_priority(const char* value) {
    std::vector<std::string> devices;
    if (!value) return devices;

    std::string list(value);
    size_t pos = 0;
    while (pos <= list.size()) {
        size_t comma = list.find(',', pos);
        if (comma == std::string::npos) comma = list.size();

        std::string item = list.substr(pos, comma - pos);
        size_t start = item.find_first_not_of(" \t");
        size_t end = item.find_last_not_of(" \t");
        if (start != std::string::npos) {
            devices.push_back(item.substr(start, end - start + 1));
        }
        pos = comma + 1;
    }
    return devices;
}

struct WhisperConfig {
    std::string model_dir = "models";
    ModelQuality model_quality = ModelQuality::Balanced;
    int n_threads = 4;              // CPU threads per transcription
    bool use_gpu = false;
    std::string initial_prompt;     // vocabulary hints for the decoder

    std::string get_model_path() const {
        return model_dir + "/" + get_model_filename(model_quality);
    }
};

struct Config {
    // Audio settings
    AudioCaptureConfig capture;
    SignalProcessorConfig processing;
    EncoderConfig encoding;

    // Recording lifecycle
    int max_recording_seconds = 30;

    // Transcription
    DispatcherConfig dispatch;
    WhisperConfig whisper;

    SessionConfig session_config() const {
        SessionConfig session;
        session.max_duration = std::chrono::seconds(max_recording_seconds);
        return session;
    }

    AudioCaptureConfig capture_config() const {
        AudioCaptureConfig audio = capture;
        audio.max_recording_seconds = max_recording_seconds;
        return audio;
    }

    // INPUT_DEVICE_PRIORITY overrides the device preference list when set
    void apply_environment() {
        auto devices = parse_device_priority(std::getenv("INPUT_DEVICE_PRIORITY"));
        if (!devices.empty()) {
            capture.device_priority = devices;
        }
    }
};

} // namespace voxpipe
