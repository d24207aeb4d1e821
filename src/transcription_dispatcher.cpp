#include "transcription_dispatcher.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>
#include <vector>

namespace voxpipe {

const char* job_stage_name(JobStage stage) {
    switch (stage) {
        case JobStage::Queued: return "queued";
        case JobStage::PermitAcquired: return "permit-acquired";
        case JobStage::Transcribing: return "transcribing";
        case JobStage::PostProcessing: return "post-processing";
        case JobStage::Delivered: return "delivered";
        case JobStage::Failed: return "failed";
        default: return "unknown";
    }
}

TranscriptionDispatcher::TranscriptionDispatcher(TranscriptionClient& client,
                                                 DictRepository& dictionary,
                                                 DispatcherConfig config)
    : client_(client)
    , dictionary_(dictionary)
    , config_(std::move(config))
    , permits_(config_.max_concurrent) {
}

TranscriptionDispatcher::~TranscriptionDispatcher() {
    shutdown();
}

void TranscriptionDispatcher::start() {
    if (running_.exchange(true)) return;

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = false;
    }
    dispatch_thread_ = std::thread([this]() { dispatch_loop(); });
}

void TranscriptionDispatcher::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();

    if (dispatch_thread_.joinable()) {
        dispatch_thread_.join();
    }
    running_.store(false);

    // Never started: nothing will serve what is left
    std::deque<Pending> orphaned;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        orphaned.swap(queue_);
    }
    for (auto& pending : orphaned) {
        TranscriptionOutcome outcome;
        outcome.status = Status::failure(ErrorKind::Dispatch, "Dispatcher shut down before job ran");
        outcome.stage = JobStage::Failed;
        outcome.session_id = pending.job.session_id;
        pending.promise.set_value(std::move(outcome));
    }
}

std::future<TranscriptionOutcome> TranscriptionDispatcher::submit(TranscriptionJob job) {
    Pending pending;
    pending.job = std::move(job);
    std::future<TranscriptionOutcome> future = pending.promise.get_future();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!stopping_) {
            queue_.push_back(std::move(pending));
            queue_cv_.notify_one();
            return future;
        }
    }

    TranscriptionOutcome outcome;
    outcome.status = Status::failure(ErrorKind::Dispatch, "Dispatcher is shut down");
    outcome.stage = JobStage::Failed;
    outcome.session_id = pending.job.session_id;
    pending.promise.set_value(std::move(outcome));
    return future;
}

void TranscriptionDispatcher::set_text_consumer(TextConsumer consumer) {
    std::lock_guard<std::mutex> lock(consumer_mutex_);
    consumer_ = std::move(consumer);
}

size_t TranscriptionDispatcher::queued() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void TranscriptionDispatcher::dispatch_loop() {
    while (true) {
        Pending pending;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            // Drain before honoring a shutdown
            if (queue_.empty()) break;
            pending = std::move(queue_.front());
            queue_.pop_front();
        }

        reap_workers(false);

        // Blocks this job only; submit() keeps queueing meanwhile
        PermitPool::Permit permit = permits_.acquire();

        auto done = std::make_shared<std::atomic<bool>>(false);
        Worker worker;
        worker.done = done;
        worker.thread = std::thread(
            [this, done, pending = std::move(pending), permit = std::move(permit)]() mutable {
                run_unit(std::move(pending), std::move(permit));
                done->store(true);
            });
        workers_.push_back(std::move(worker));
    }

    reap_workers(true);
}

void TranscriptionDispatcher::reap_workers(bool wait_all) {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (wait_all || it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void TranscriptionDispatcher::run_unit(Pending pending, PermitPool::Permit permit) {
    TranscriptionOutcome outcome = process(pending.job);

    // Unit of work is over whatever happened
    permit.release();

    if (outcome.status.success) {
        TextConsumer consumer;
        {
            std::lock_guard<std::mutex> lock(consumer_mutex_);
            consumer = consumer_;
        }
        if (consumer) {
            try {
                consumer(outcome);
            } catch (const std::exception& e) {
                std::cerr << "Text consumer failed for session " << outcome.session_id
                          << ": " << e.what() << std::endl;
            }
        }
    } else {
        std::cerr << "Transcription of session " << outcome.session_id << " failed at "
                  << job_stage_name(outcome.stage) << ": " << outcome.status.error << std::endl;
    }

    pending.promise.set_value(std::move(outcome));
}

TranscriptionOutcome TranscriptionDispatcher::process(const TranscriptionJob& job) {
    TranscriptionOutcome outcome;
    outcome.session_id = job.session_id;
    outcome.paste = job.paste;
    outcome.resume_music = job.resume_music;
    outcome.stage = JobStage::PermitAcquired;

    auto start_time = std::chrono::steady_clock::now();
    auto fail = [&outcome](JobStage stage, std::string message) {
        outcome.status = Status::failure(ErrorKind::Dispatch, std::move(message));
        outcome.stage = stage;
    };

    TranscriptionResult result;
    try {
        outcome.stage = JobStage::Transcribing;
        result = client_.transcribe(job.audio, config_.language);
    } catch (const std::exception& e) {
        fail(JobStage::Transcribing, std::string("Transcription client threw: ") + e.what());
        return outcome;
    }

    if (!result.status.success) {
        fail(JobStage::Transcribing, "Transcription failed: " + result.status.error);
        return outcome;
    }
    outcome.raw_text = result.text;

    outcome.stage = JobStage::PostProcessing;
    Status dict_status;
    try {
        dict_status = apply_dictionary(result.text, outcome.text);
    } catch (const std::exception& e) {
        dict_status = Status::failure(ErrorKind::Dispatch, e.what());
    }
    if (!dict_status.success) {
        fail(JobStage::PostProcessing, "Dictionary pass failed: " + dict_status.error);
        return outcome;
    }

    outcome.stage = JobStage::Delivered;
    outcome.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();

    std::cout << "Session " << job.session_id << " transcribed in " << outcome.duration_ms
              << "ms: \"" << outcome.text << "\"" << std::endl;
    return outcome;
}

Status TranscriptionDispatcher::apply_dictionary(const std::string& text, std::string& out) {
    std::lock_guard<std::mutex> lock(dict_mutex_);

    std::vector<WordEntry> entries;
    Status status = dictionary_.load(entries);
    if (!status.success) return status;

    std::vector<uint32_t> before;
    before.reserve(entries.size());
    for (const auto& e : entries) before.push_back(e.hit);

    out = apply_replacements(text, entries);

    for (size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].hit != before[i]) {
            return dictionary_.save(entries);
        }
    }
    return Status::ok();
}

} // namespace voxpipe
