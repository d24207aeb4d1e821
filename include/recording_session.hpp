#pragma once

#include "audio_backend.hpp"
#include "auto_stop_timer.hpp"
#include "error.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace voxpipe {

struct RecordingState {
    enum class Kind { Idle, Recording };

    Kind kind = Kind::Idle;
    uint64_t session_id = 0;  // meaningful only while Recording

    static RecordingState idle() { return RecordingState{}; }
    static RecordingState recording(uint64_t id) { return RecordingState{Kind::Recording, id}; }

    bool is_recording() const { return kind == Kind::Recording; }

    bool operator==(const RecordingState& other) const {
        return kind == other.kind && (kind == Kind::Idle || session_id == other.session_id);
    }
    bool operator!=(const RecordingState& other) const { return !(*this == other); }
};

struct RecordingOptions {
    std::optional<std::string> prompt;  // selected text or caller-supplied prompt
    bool paste = false;                 // downstream should inject the text
    bool music_was_playing = false;     // media playback was paused for this session
};

// Mutable session metadata, reset on every stop
struct RecordingContext {
    RecordingState state;
    std::unique_ptr<AutoStopTimer> cancel;
    bool music_was_playing = false;
    std::optional<std::string> start_prompt;
    bool paste = false;
    std::chrono::steady_clock::time_point started_at;
};

struct SessionConfig {
    std::chrono::milliseconds max_duration{30000};
};

struct StartResult {
    Status status;
    uint64_t session_id = 0;
};

struct StopResult {
    Status status;
    uint64_t session_id = 0;
    EncodedAudio audio;
    int64_t duration_ms = 0;
    bool used_fallback = false;
    bool auto_stopped = false;

    // Snapshot of the context taken before it was reset
    std::optional<std::string> prompt;
    bool paste = false;
    bool music_was_playing = false;
};

// Tracks the single recording lifecycle (Idle <-> Recording) over one backend.
//
// All context mutations happen under one mutex. Each successful start arms an
// auto-stop timer; if it expires before a manual stop it runs the same stop
// sequence and hands the result to the auto-stop handler. A timer that fires
// for a session which is no longer current is ignored. Destruction waits for
// a running auto-stop handler to return.
class RecordingSession {
public:
    using AutoStopHandler = std::function<void(StopResult)>;

    explicit RecordingSession(AudioBackend& backend, SessionConfig config = SessionConfig{});
    ~RecordingSession();

    RecordingSession(const RecordingSession&) = delete;
    RecordingSession& operator=(const RecordingSession&) = delete;

    StartResult start(const RecordingOptions& options);
    StopResult stop();

    bool is_recording() const;
    RecordingState state() const;

    // Set when media playback was paused after the session started
    Status set_music_was_playing(bool was_playing);

    // Receives recordings closed by the timer
    void set_auto_stop_handler(AutoStopHandler handler);

    // Blocks until no auto-stop handler is running
    void wait_auto_stop_idle();

    uint64_t last_session_id() const;
    const SessionConfig& config() const { return config_; }

private:
    void on_timer_expired(uint64_t session_id);

    // Requires mutex_ held; moves the timer into retired so it is joined after unlock
    StopResult stop_locked(std::unique_ptr<AutoStopTimer>& retired);

    AudioBackend& backend_;
    SessionConfig config_;

    mutable std::mutex mutex_;
    RecordingContext context_;
    uint64_t session_counter_ = 0;
    AutoStopHandler auto_stop_handler_;
    int running_handlers_ = 0;
    std::condition_variable handlers_done_;
};

} // namespace voxpipe
