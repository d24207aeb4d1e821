#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace voxpipe {

// One-shot timer racing a fixed sleep against cancellation.
//
// Exactly one of two things happens: the sleep elapses first and on_expire
// runs once on the timer thread, or cancel() (or destruction) wins and the
// thread exits without side effects. Cancellation is fire-and-forget.
class AutoStopTimer {
public:
    using ExpireCallback = std::function<void()>;

    AutoStopTimer(std::chrono::milliseconds timeout, ExpireCallback on_expire);
    ~AutoStopTimer();

    AutoStopTimer(const AutoStopTimer&) = delete;
    AutoStopTimer& operator=(const AutoStopTimer&) = delete;

    void cancel();

    bool cancelled() const;
    bool fired() const { return state_->fired.load(); }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
        std::atomic<bool> fired{false};
    };

    std::shared_ptr<State> state_;
    std::thread thread_;
};

} // namespace voxpipe
