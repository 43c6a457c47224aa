#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "../Common/CancellationToken.hpp"

namespace FXN::Bacnet {

/// Timeout + cancellation around one transport request.
///
/// Exactly one of three things settles a guard:
/// - Resolve(): the transport answered in time; the continuation is posted to
///   the io_context.
/// - timer expiry: onTimeout runs on the io_context; a late transport answer
///   is dropped (the request is abandoned, not cancelled on the wire).
/// - Cancel(): the owner went away; nothing runs.
///
/// Resolve() may be called from any thread.
class RequestGuard : public std::enable_shared_from_this<RequestGuard> {
public:
    static std::shared_ptr<RequestGuard> Start(boost::asio::io_context& io,
                                               std::chrono::milliseconds timeout,
                                               std::function<void()> onTimeout);

    RequestGuard(const RequestGuard&) = delete;
    RequestGuard& operator=(const RequestGuard&) = delete;

    /// @return false if the guard had already timed out or been cancelled
    bool Resolve(std::function<void()> continuation);

    void Cancel();

    [[nodiscard]] bool IsSettled() const noexcept { return settled_.load(std::memory_order_acquire); }
    [[nodiscard]] CancellationToken Token() const { return token_; }

private:
    RequestGuard(boost::asio::io_context& io, std::function<void()> onTimeout);

    void Arm(std::chrono::milliseconds timeout);
    bool TrySettle() noexcept { return !settled_.exchange(true, std::memory_order_acq_rel); }

    boost::asio::io_context& io_;
    boost::asio::steady_timer timer_;
    std::function<void()> onTimeout_;
    std::atomic<bool> settled_{false};
    CancellationToken token_;
};

} // namespace FXN::Bacnet
