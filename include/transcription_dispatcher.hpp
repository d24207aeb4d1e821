#pragma once

#include "audio_types.hpp"
#include "dictionary.hpp"
#include "error.hpp"
#include "permit_pool.hpp"
#include "transcription_client.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace voxpipe {

struct DispatcherConfig {
    size_t max_concurrent = 2;   // simultaneous transcribe calls
    std::string language = "ja";  // hint passed to the client
};

// A completed recording plus the metadata needed to route its text
struct TranscriptionJob {
    EncodedAudio audio;
    uint64_t session_id = 0;
    bool paste = false;
    bool resume_music = false;
};

enum class JobStage {
    Queued,
    PermitAcquired,
    Transcribing,
    PostProcessing,
    Delivered,
    Failed
};

const char* job_stage_name(JobStage stage);

struct TranscriptionOutcome {
    Status status;
    JobStage stage = JobStage::Queued;  // Delivered, or the stage that failed
    uint64_t session_id = 0;
    std::string text;      // after dictionary substitution
    std::string raw_text;  // as returned by the client
    int64_t duration_ms = 0;
    bool paste = false;
    bool resume_music = false;
};

// Bounded-concurrency transcription queue.
//
// submit() never blocks. A dispatch thread pulls jobs in arrival order,
// waits for a permit, and runs each unit (transcribe, then dictionary pass)
// on its own worker thread. The permit is held for the whole unit and
// released on every path. Completion order is not FIFO.
class TranscriptionDispatcher {
public:
    using TextConsumer = std::function<void(const TranscriptionOutcome&)>;

    TranscriptionDispatcher(TranscriptionClient& client, DictRepository& dictionary,
                            DispatcherConfig config = DispatcherConfig{});
    ~TranscriptionDispatcher();

    TranscriptionDispatcher(const TranscriptionDispatcher&) = delete;
    TranscriptionDispatcher& operator=(const TranscriptionDispatcher&) = delete;

    void start();

    // Stop accepting, finish everything already queued, join workers
    void shutdown();

    std::future<TranscriptionOutcome> submit(TranscriptionJob job);

    // Receives every delivered outcome (called on the worker thread)
    void set_text_consumer(TextConsumer consumer);

    size_t available_permits() const { return permits_.available(); }
    size_t max_concurrent() const { return permits_.total(); }
    size_t queued() const;
    bool is_running() const { return running_.load(); }

private:
    struct Pending {
        TranscriptionJob job;
        std::promise<TranscriptionOutcome> promise;
    };

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void dispatch_loop();
    void run_unit(Pending pending, PermitPool::Permit permit);
    TranscriptionOutcome process(const TranscriptionJob& job);
    Status apply_dictionary(const std::string& text, std::string& out);
    void reap_workers(bool wait_all);

    TranscriptionClient& client_;
    DictRepository& dictionary_;
    DispatcherConfig config_;
    PermitPool permits_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Pending> queue_;
    bool stopping_ = false;

    std::mutex dict_mutex_;  // serializes load/apply/save of hit counts
    std::mutex consumer_mutex_;
    TextConsumer consumer_;

    std::thread dispatch_thread_;
    std::list<Worker> workers_;  // touched only by the dispatch thread
    std::atomic<bool> running_{false};
};

} // namespace voxpipe
