// Smoke tests for the PortAudio capture backend
// Set VOXPIPE_AUDIO_DEVICE_TEST=1 to record from a real input device.

#include "audio_capture.hpp"
#include <iostream>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <thread>

using namespace voxpipe;

bool device_tests_enabled() {
    const char* flag = std::getenv("VOXPIPE_AUDIO_DEVICE_TEST");
    return flag && std::strcmp(flag, "1") == 0;
}

void test_stop_without_start() {
    std::cout << "Testing stop without start..." << std::endl;

    AudioCapture capture;
    assert(!capture.is_recording());
    assert(capture.list_input_devices().empty() && "Nothing listed before initialize");

    CaptureResult result = capture.stop_recording();
    assert(!result.status.success);
    assert(result.status.kind == ErrorKind::State);
    assert(result.status.error == ERR_NOT_STARTED);

    std::cout << "  PASS" << std::endl;
}

void test_record_from_device() {
    std::cout << "Testing capture from the default device..." << std::endl;

    AudioCaptureConfig config;
    config.max_recording_seconds = 2;
    AudioCapture capture(config, SignalProcessorConfig{}, EncoderConfig{});
    assert(capture.initialize());

    auto devices = capture.list_input_devices();
    std::cout << "  " << devices.size() << " input device(s)" << std::endl;
    assert(!devices.empty());

    Status started = capture.start_recording();
    if (!started.success) {
        std::cerr << "  start failed: " << started.error << std::endl;
    }
    assert(started.success);
    assert(capture.is_recording());
    std::cout << "  Device: " << capture.device_name() << std::endl;

    Status again = capture.start_recording();
    assert(!again.success && again.error == ERR_ALREADY_ACTIVE);

    std::this_thread::sleep_for(std::chrono::milliseconds(500));

    CaptureResult result = capture.stop_recording();
    assert(result.status.success);
    assert(!capture.is_recording());
    assert(result.audio.is_flac() || result.audio.is_wav());
    assert(!result.audio.bytes.empty());
    assert(result.duration_ms >= 300 && result.duration_ms <= 2000);

    capture.shutdown();
    std::cout << "  PASS: " << result.duration_ms << "ms -> " << result.audio.bytes.size()
              << " bytes " << result.audio.mime_type << std::endl;
}

int main() {
    std::cout << "\n=== Audio Capture Test Suite ===" << std::endl << std::endl;

    test_stop_without_start();

    if (device_tests_enabled()) {
        test_record_from_device();
    } else {
        std::cout << "Skipping device capture (set VOXPIPE_AUDIO_DEVICE_TEST=1)" << std::endl;
    }

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
