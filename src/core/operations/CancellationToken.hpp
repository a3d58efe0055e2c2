#pragma once

#include <atomic>
#include <memory>

namespace srt {

// Shared cancel flag, one per operation. Copies share the same flag.
// Relaxed ordering: the worker only needs to see the flag eventually.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true, std::memory_order_relaxed); }
    bool isCancelled() const { return flag_->load(std::memory_order_relaxed); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace srt
