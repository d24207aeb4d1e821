// Automated tests for RecordingSession

#include "audio_decoder.hpp"
#include "recording_session.hpp"
#include <iostream>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace voxpipe;
using namespace std::chrono_literals;

// Stands in for the device: hands back preset samples through the real stop path
class FakeBackend : public AudioBackend {
public:
    std::vector<int16_t> samples;
    int sample_rate = 16000;
    int channels = 1;
    bool fail_start = false;
    bool fail_stop = false;
    std::atomic<int> starts{0};
    std::atomic<int> stops{0};

    Status start_recording() override {
        if (fail_start) return Status::failure(ErrorKind::Device, "No input device available");
        if (recording_.exchange(true)) return Status::failure(ErrorKind::State, ERR_ALREADY_ACTIVE);
        ++starts;
        return Status::ok();
    }

    CaptureResult stop_recording() override {
        CaptureResult result;
        if (!recording_.exchange(false)) {
            result.status = Status::failure(ErrorKind::State, ERR_NOT_STARTED);
            return result;
        }
        ++stops;
        if (fail_stop) {
            result.status = Status::failure(ErrorKind::Device, "stream stop failed");
            return result;
        }
        return finalize_capture(samples, sample_rate, channels, processor_, encoder_);
    }

    bool is_recording() const override { return recording_.load(); }

private:
    std::atomic<bool> recording_{false};
    SignalProcessor processor_;
    Encoder encoder_;
};

// Collects what the auto-stop path delivers
struct AutoStopLog {
    std::mutex mutex;
    std::vector<StopResult> results;

    void add(StopResult r) {
        std::lock_guard<std::mutex> lock(mutex);
        results.push_back(std::move(r));
    }
    size_t count() {
        std::lock_guard<std::mutex> lock(mutex);
        return results.size();
    }
};

std::vector<int16_t> generate_sine(int samples, float freq, float amplitude, int sample_rate = 16000) {
    std::vector<int16_t> audio(samples);
    for (int i = 0; i < samples; ++i) {
        audio[i] = static_cast<int16_t>(amplitude * std::sin(2.0 * M_PI * freq * i / sample_rate));
    }
    return audio;
}

bool wait_for(const std::function<bool()>& pred, std::chrono::milliseconds limit) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

void test_start_stop() {
    std::cout << "Testing start/stop cycle..." << std::endl;

    FakeBackend backend;
    backend.samples = generate_sine(16000, 440.0f, 8000.0f);
    RecordingSession session(backend);

    assert(!session.is_recording());
    assert(session.state() == RecordingState::idle());

    StartResult started = session.start(RecordingOptions{});
    assert(started.status.success);
    assert(started.session_id == 1);
    assert(session.state() == RecordingState::recording(1));

    StopResult stopped = session.stop();
    assert(stopped.status.success);
    assert(stopped.session_id == 1);
    assert(stopped.audio.is_flac());
    assert(!stopped.audio.bytes.empty());
    assert(!stopped.auto_stopped);
    assert(stopped.duration_ms >= 0);
    assert(session.state() == RecordingState::idle());

    std::cout << "  PASS: " << stopped.audio.bytes.size() << " bytes " << stopped.audio.mime_type << std::endl;
}

void test_state_errors() {
    std::cout << "Testing state errors..." << std::endl;

    FakeBackend backend;
    RecordingSession session(backend);

    StopResult early = session.stop();
    assert(!early.status.success);
    assert(early.status.kind == ErrorKind::State);
    assert(early.status.error == ERR_NOT_STARTED);

    assert(session.start(RecordingOptions{}).status.success);
    StartResult again = session.start(RecordingOptions{});
    assert(!again.status.success);
    assert(again.status.error == ERR_ALREADY_ACTIVE);
    assert(backend.starts.load() == 1 && "Second start must not reach the backend");
    assert(session.state() == RecordingState::recording(1) && "Active session untouched");

    assert(session.stop().status.success);
    StopResult twice = session.stop();
    assert(twice.status.error == ERR_NOT_STARTED);

    assert(!session.set_music_was_playing(true).success && "Idle session has no context");

    std::cout << "  PASS: Already active / not started reported" << std::endl;
}

void test_session_ids() {
    std::cout << "Testing session ids..." << std::endl;

    FakeBackend backend;
    RecordingSession session(backend);

    uint64_t last = 0;
    for (int i = 0; i < 3; ++i) {
        StartResult r = session.start(RecordingOptions{});
        assert(r.status.success);
        assert(r.session_id > last && "Ids increase monotonically");
        last = r.session_id;
        assert(session.stop().session_id == last);
    }

    backend.fail_start = true;
    StartResult failed = session.start(RecordingOptions{});
    assert(!failed.status.success);
    assert(failed.status.kind == ErrorKind::Device);
    assert(!session.is_recording());

    backend.fail_start = false;
    StartResult next = session.start(RecordingOptions{});
    assert(next.session_id == last + 1 && "A failed start consumes no id");
    assert(session.stop().status.success);

    std::cout << "  PASS: Ids 1.." << next.session_id << std::endl;
}

void test_context_snapshot() {
    std::cout << "Testing context snapshot..." << std::endl;

    FakeBackend backend;
    RecordingSession session(backend);

    RecordingOptions options;
    options.prompt = "meeting notes";
    options.paste = true;
    assert(session.start(options).status.success);
    assert(session.set_music_was_playing(true).success);

    StopResult r = session.stop();
    assert(r.status.success);
    assert(r.prompt && *r.prompt == "meeting notes");
    assert(r.paste);
    assert(r.music_was_playing);

    // The next session starts from a clean context
    assert(session.start(RecordingOptions{}).status.success);
    StopResult clean = session.stop();
    assert(!clean.prompt);
    assert(!clean.paste);
    assert(!clean.music_was_playing);

    std::cout << "  PASS: Metadata returned then cleared" << std::endl;
}

void test_auto_stop() {
    std::cout << "Testing auto-stop..." << std::endl;

    FakeBackend backend;
    backend.samples = generate_sine(8000, 440.0f, 8000.0f);
    SessionConfig config;
    config.max_duration = 100ms;
    RecordingSession session(backend, config);

    AutoStopLog log;
    session.set_auto_stop_handler([&log](StopResult r) { log.add(std::move(r)); });

    RecordingOptions options;
    options.paste = true;
    auto begin = std::chrono::steady_clock::now();
    StartResult started = session.start(options);
    assert(started.status.success);

    assert(wait_for([&log]() { return log.count() == 1; }, 2000ms));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - begin);
    assert(elapsed >= 100ms && "Timer must not fire before the configured duration");
    assert(elapsed <= 600ms && "Timer fires close to the configured duration");
    std::this_thread::sleep_for(200ms);
    assert(log.count() == 1 && "Timer fires exactly once");

    {
        std::lock_guard<std::mutex> lock(log.mutex);
        const StopResult& r = log.results[0];
        assert(r.status.success);
        assert(r.auto_stopped);
        assert(r.session_id == started.session_id);
        assert(r.paste);
        assert(r.audio.is_flac());
        assert(r.duration_ms >= 100);
    }

    assert(!session.is_recording());
    assert(backend.stops.load() == 1);

    StopResult late = session.stop();
    assert(late.status.error == ERR_NOT_STARTED && "Manual stop after auto-stop is rejected");

    std::cout << "  PASS: Session closed by timer after " << elapsed.count() << "ms" << std::endl;
}

void test_manual_stop_cancels_timer() {
    std::cout << "Testing manual stop before timeout..." << std::endl;

    FakeBackend backend;
    SessionConfig config;
    config.max_duration = 150ms;
    RecordingSession session(backend, config);

    AutoStopLog log;
    session.set_auto_stop_handler([&log](StopResult r) { log.add(std::move(r)); });

    // Old timer must not close the next session
    assert(session.start(RecordingOptions{}).status.success);
    std::this_thread::sleep_for(100ms);
    assert(session.stop().status.success);
    StartResult second = session.start(RecordingOptions{});
    assert(second.status.success);

    std::this_thread::sleep_for(80ms);
    assert(session.state() == RecordingState::recording(second.session_id));
    assert(log.count() == 0);

    // The second session's own timer does fire
    assert(wait_for([&log]() { return log.count() == 1; }, 2000ms));
    {
        std::lock_guard<std::mutex> lock(log.mutex);
        assert(log.results[0].session_id == second.session_id);
    }

    // Stop immediately after start, then wait well past the timeout
    assert(session.start(RecordingOptions{}).status.success);
    assert(session.stop().status.success);
    std::this_thread::sleep_for(300ms);
    assert(log.count() == 1 && "Cancelled timers never fire");
    assert(backend.stops.load() == 3);

    std::cout << "  PASS: Only the current session's timer acts" << std::endl;
}

// Tearing down the session waits for a handler that is still running
void test_destroy_waits_for_handler() {
    std::cout << "Testing teardown during auto-stop handler..." << std::endl;

    struct Sink {
        std::atomic<int> delivered{0};
    };

    FakeBackend backend;
    SessionConfig config;
    config.max_duration = 50ms;

    auto sink = std::make_unique<Sink>();
    std::atomic<bool> entered{false};
    {
        RecordingSession session(backend, config);
        Sink* target = sink.get();
        session.set_auto_stop_handler([target, &entered](StopResult) {
            entered = true;
            std::this_thread::sleep_for(200ms);
            ++target->delivered;
        });

        assert(session.start(RecordingOptions{}).status.success);
        assert(wait_for([&entered]() { return entered.load(); }, 2000ms));
    }
    assert(sink->delivered.load() == 1 && "Session outlived its running handler");
    sink.reset();

    // Explicit wait before owners go away
    Sink second;
    entered = false;
    RecordingSession session(backend, config);
    session.set_auto_stop_handler([&second, &entered](StopResult) {
        entered = true;
        std::this_thread::sleep_for(100ms);
        ++second.delivered;
    });
    assert(session.start(RecordingOptions{}).status.success);
    assert(wait_for([&entered]() { return entered.load(); }, 2000ms));
    session.wait_auto_stop_idle();
    assert(second.delivered.load() == 1);

    // Nothing running: returns at once
    session.wait_auto_stop_idle();

    std::cout << "  PASS: Handlers finish before teardown" << std::endl;
}

void test_backend_stop_failure() {
    std::cout << "Testing backend stop failure..." << std::endl;

    FakeBackend backend;
    RecordingSession session(backend);

    assert(session.start(RecordingOptions{}).status.success);
    backend.fail_stop = true;
    StopResult r = session.stop();

    assert(!r.status.success);
    assert(r.status.kind == ErrorKind::Device);
    assert(!session.is_recording() && "Session returns to Idle even when the backend fails");

    backend.fail_stop = false;
    assert(session.start(RecordingOptions{}).status.success);
    assert(session.stop().status.success);

    std::cout << "  PASS: " << r.status.error << std::endl;
}

void test_concurrent_start() {
    std::cout << "Testing concurrent start..." << std::endl;

    FakeBackend backend;
    RecordingSession session(backend);

    std::atomic<int> wins{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            if (session.start(RecordingOptions{}).status.success) ++wins;
        });
    }
    for (auto& t : threads) t.join();

    assert(wins.load() == 1 && "Exactly one start succeeds");
    assert(backend.starts.load() == 1);
    assert(session.stop().status.success);

    std::cout << "  PASS: One winner out of 8" << std::endl;
}

// 3s of silence, 1s of tone, 1s of silence comes back as FLAC with the padding gone
void test_silence_then_tone() {
    std::cout << "Testing silence-padded capture..." << std::endl;

    FakeBackend backend;
    backend.samples = std::vector<int16_t>(48000, 0);
    auto tone = generate_sine(16000, 440.0f, 8000.0f);
    backend.samples.insert(backend.samples.end(), tone.begin(), tone.end());
    backend.samples.insert(backend.samples.end(), 16000, 0);

    RecordingSession session(backend);
    assert(session.start(RecordingOptions{}).status.success);
    StopResult r = session.stop();

    assert(r.status.success);
    assert(r.audio.mime_type == MIME_FLAC);

    DecodedAudio decoded = decode_audio(r.audio);
    assert(decoded.status.success);
    assert(decoded.sample_rate == 16000);
    assert(decoded.channels == 1);
    assert(decoded.samples.size() >= 15900 && decoded.samples.size() <= 16000 &&
           "Silence should be trimmed from both ends");
    assert(decoded.samples.front() != 0 && "Leading padding gone");
    assert(decoded.samples.back() != 0 && "Trailing padding gone");

    std::cout << "  PASS: " << backend.samples.size() << " samples -> " << decoded.samples.size() << std::endl;
}

void test_empty_capture() {
    std::cout << "Testing empty capture..." << std::endl;

    FakeBackend backend;
    RecordingSession session(backend);
    assert(session.start(RecordingOptions{}).status.success);
    StopResult r = session.stop();

    assert(r.status.success);
    assert(!r.audio.bytes.empty() && "Empty capture still encodes a container");
    DecodedAudio decoded = decode_audio(r.audio);
    assert(decoded.status.success);
    assert(decoded.samples.empty());

    std::cout << "  PASS: " << r.audio.bytes.size() << " byte container" << std::endl;
}

int main() {
    std::cout << "\n=== Recording Session Test Suite ===" << std::endl << std::endl;

    test_start_stop();
    test_state_errors();
    test_session_ids();
    test_context_snapshot();
    test_auto_stop();
    test_manual_stop_cancels_timer();
    test_destroy_waits_for_handler();
    test_backend_stop_failure();
    test_concurrent_start();
    test_silence_then_tone();
    test_empty_capture();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
