#include "auto_stop_timer.hpp"

#include <utility>

namespace voxpipe {

AutoStopTimer::AutoStopTimer(std::chrono::milliseconds timeout, ExpireCallback on_expire)
    : state_(std::make_shared<State>()) {
    // The thread keeps its own reference so the state outlives a detached timer
    std::shared_ptr<State> state = state_;
    thread_ = std::thread([state, timeout, on_expire = std::move(on_expire)]() {
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            if (state->cv.wait_for(lock, timeout, [&state] { return state->cancelled; })) {
                return;
            }
            state->fired.store(true);
        }
        if (on_expire) on_expire();
    });
}

AutoStopTimer::~AutoStopTimer() {
    cancel();
    if (!thread_.joinable()) return;

    // Destroyed from inside on_expire: the thread is already on its way out
    if (thread_.get_id() == std::this_thread::get_id()) {
        thread_.detach();
    } else {
        thread_.join();
    }
}

void AutoStopTimer::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool AutoStopTimer::cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

} // namespace voxpipe
