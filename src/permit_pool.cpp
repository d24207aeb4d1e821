#include "permit_pool.hpp"

#include <algorithm>

namespace voxpipe {

PermitPool::PermitPool(size_t total)
    : total_(std::max<size_t>(1, total))
    , available_(total_) {
}

PermitPool::Permit PermitPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return available_ > 0; });
    --available_;
    return Permit(this);
}

size_t PermitPool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
}

void PermitPool::release_one() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++available_;
    }
    cv_.notify_one();
}

} // namespace voxpipe
