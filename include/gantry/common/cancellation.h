// gantry/common/cancellation.h
#ifndef GANTRY_COMMON_CANCELLATION_H
#define GANTRY_COMMON_CANCELLATION_H

#include <atomic>
#include <chrono>

namespace gantry {

// Shared abort signal for one run. request_cancel() only touches a lock-free
// atomic so it can be called from a signal handler.
class CancellationToken {
public:
    explicit CancellationToken(std::chrono::milliseconds grace_period = std::chrono::seconds(10))
        : grace_period_(grace_period) {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void request_cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    // Time a job gets between the abort signal and forced termination
    std::chrono::milliseconds grace_period() const noexcept { return grace_period_; }
    void set_grace_period(std::chrono::milliseconds grace) noexcept { grace_period_ = grace; }

private:
    std::atomic<bool> cancelled_{false};
    std::chrono::milliseconds grace_period_;
};

} // namespace gantry

#endif // GANTRY_COMMON_CANCELLATION_H
