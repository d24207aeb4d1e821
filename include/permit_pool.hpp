#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace voxpipe {

// Fixed-size pool of concurrency permits. A Permit returns itself to the
// pool when destroyed, so every exit path of a unit of work releases it.
class PermitPool {
public:
    class Permit {
    public:
        Permit() = default;
        ~Permit() { release(); }

        Permit(Permit&& other) noexcept : pool_(other.pool_) { other.pool_ = nullptr; }
        Permit& operator=(Permit&& other) noexcept {
            if (this != &other) {
                release();
                pool_ = other.pool_;
                other.pool_ = nullptr;
            }
            return *this;
        }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        bool valid() const { return pool_ != nullptr; }

        void release() {
            if (pool_) {
                pool_->release_one();
                pool_ = nullptr;
            }
        }

    private:
        friend class PermitPool;
        explicit Permit(PermitPool* pool) : pool_(pool) {}

        PermitPool* pool_ = nullptr;
    };

    explicit PermitPool(size_t total);

    PermitPool(const PermitPool&) = delete;
    PermitPool& operator=(const PermitPool&) = delete;

    // Blocks until a permit is free
    Permit acquire();

    size_t available() const;
    size_t total() const { return total_; }

private:
    void release_one();

    const size_t total_;
    size_t available_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace voxpipe
