#include "recording_session.hpp"

#include <iostream>
#include <utility>

namespace voxpipe {

RecordingSession::RecordingSession(AudioBackend& backend, SessionConfig config)
    : backend_(backend)
    , config_(config) {
}

RecordingSession::~RecordingSession() {
    std::unique_ptr<AutoStopTimer> retired;
    std::unique_lock<std::mutex> lock(mutex_);
    retired = std::move(context_.cancel);
    if (retired) retired->cancel();
    // A timer already past its sleep must find nothing to stop
    context_ = RecordingContext{};
    handlers_done_.wait(lock, [this] { return running_handlers_ == 0; });
}

StartResult RecordingSession::start(const RecordingOptions& options) {
    StartResult result;
    std::lock_guard<std::mutex> lock(mutex_);

    if (context_.state.is_recording()) {
        result.status = Status::failure(ErrorKind::State, ERR_ALREADY_ACTIVE);
        return result;
    }

    Status started = backend_.start_recording();
    if (!started.success) {
        std::cerr << "Failed to start recording (" << error_kind_name(started.kind) << "): "
                  << started.error << std::endl;
        result.status = started;
        return result;
    }

    const uint64_t session_id = ++session_counter_;

    context_.start_prompt = options.prompt;
    context_.paste = options.paste;
    context_.music_was_playing = options.music_was_playing;
    context_.started_at = std::chrono::steady_clock::now();
    context_.state = RecordingState::recording(session_id);

    context_.cancel = std::make_unique<AutoStopTimer>(
        config_.max_duration,
        [this, session_id]() { on_timer_expired(session_id); });

    std::cout << "Recording session " << session_id << " started (auto-stop in "
              << config_.max_duration.count() << "ms)" << std::endl;

    result.session_id = session_id;
    return result;
}

StopResult RecordingSession::stop() {
    // Declared before the lock so the timer is joined after the mutex is released
    std::unique_ptr<AutoStopTimer> retired;
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_locked(retired);
}

StopResult RecordingSession::stop_locked(std::unique_ptr<AutoStopTimer>& retired) {
    StopResult result;

    if (!context_.state.is_recording()) {
        result.status = Status::failure(ErrorKind::State, ERR_NOT_STARTED);
        return result;
    }

    retired = std::move(context_.cancel);
    if (retired) retired->cancel();

    result.session_id = context_.state.session_id;
    result.prompt = context_.start_prompt;
    result.paste = context_.paste;
    result.music_was_playing = context_.music_was_playing;
    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - context_.started_at).count();

    CaptureResult capture = backend_.stop_recording();

    // The backend has released its stream either way
    context_ = RecordingContext{};

    if (!capture.status.success) {
        std::cerr << "Recording session " << result.session_id << " failed: "
                  << capture.status.error << std::endl;
        result.status = capture.status;
        return result;
    }

    result.audio = std::move(capture.audio);
    result.used_fallback = capture.used_fallback;

    std::cout << "Recording session " << result.session_id << " stopped after "
              << result.duration_ms << "ms" << std::endl;
    return result;
}

void RecordingSession::on_timer_expired(uint64_t session_id) {
    StopResult result;
    AutoStopHandler handler;
    {
        std::unique_ptr<AutoStopTimer> retired;
        std::lock_guard<std::mutex> lock(mutex_);

        // Manually stopped (or superseded) while the timer was waking up
        if (context_.state != RecordingState::recording(session_id)) {
            return;
        }

        std::cout << "Auto-stop: session " << session_id << " reached "
                  << config_.max_duration.count() << "ms" << std::endl;
        result = stop_locked(retired);
        result.auto_stopped = true;
        handler = auto_stop_handler_;
        ++running_handlers_;
    }

    if (handler) {
        handler(std::move(result));
    } else if (result.status.success) {
        std::cerr << "Auto-stopped session " << session_id << " has no handler, recording dropped" << std::endl;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    --running_handlers_;
    handlers_done_.notify_all();
}

bool RecordingSession::is_recording() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_.state.is_recording();
}

RecordingState RecordingSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_.state;
}

Status RecordingSession::set_music_was_playing(bool was_playing) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!context_.state.is_recording()) {
        return Status::failure(ErrorKind::State, ERR_NOT_STARTED);
    }
    context_.music_was_playing = was_playing;
    return Status::ok();
}

void RecordingSession::set_auto_stop_handler(AutoStopHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto_stop_handler_ = std::move(handler);
}

void RecordingSession::wait_auto_stop_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    handlers_done_.wait(lock, [this] { return running_handlers_ == 0; });
}

uint64_t RecordingSession::last_session_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_counter_;
}

} // namespace voxpipe
