#pragma once

#include <atomic>
#include <memory>

namespace voxlink {

/**
 * @brief Cooperative cancellation flag shared between a Session and one pipeline.
 *
 * Set once, never cleared. Long-running collaborators (HTTP transfer, Piper
 * process) poll it and abort early.
 */
class CancelToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }

    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;

} // namespace voxlink
