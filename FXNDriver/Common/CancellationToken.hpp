#pragma once

#include <atomic>
#include <memory>

namespace FXN {

// Shared cancellation flag. Copies observe the same state; cancelling is
// one-way and idempotent.
class CancellationToken {
public:
    CancellationToken()
        : state_(std::make_shared<std::atomic<bool>>(false)) {}

    void Cancel() noexcept { state_->store(true, std::memory_order_release); }

    [[nodiscard]] bool IsCancelled() const noexcept {
        return state_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> state_;
};

} // namespace FXN
