#include "RequestGuard.hpp"

#include <utility>

#include <boost/asio/post.hpp>

namespace FXN::Bacnet {

RequestGuard::RequestGuard(boost::asio::io_context& io, std::function<void()> onTimeout)
    : io_(io)
    , timer_(io)
    , onTimeout_(std::move(onTimeout)) {}

std::shared_ptr<RequestGuard> RequestGuard::Start(boost::asio::io_context& io,
                                                  std::chrono::milliseconds timeout,
                                                  std::function<void()> onTimeout) {
    std::shared_ptr<RequestGuard> guard(new RequestGuard(io, std::move(onTimeout)));
    guard->Arm(timeout);
    return guard;
}

void RequestGuard::Arm(std::chrono::milliseconds timeout) {
    timer_.expires_after(timeout);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec || !self->TrySettle()) {
            return;
        }
        self->token_.Cancel();
        auto onTimeout = std::move(self->onTimeout_);
        if (onTimeout) {
            onTimeout();
        }
    });
}

bool RequestGuard::Resolve(std::function<void()> continuation) {
    if (token_.IsCancelled() || !TrySettle()) {
        return false;
    }
    // Timer state is only touched on the io_context
    boost::asio::post(io_, [self = shared_from_this(), continuation = std::move(continuation)] {
        self->timer_.cancel();
        self->onTimeout_ = nullptr;
        if (!self->token_.IsCancelled() && continuation) {
            continuation();
        }
    });
    return true;
}

void RequestGuard::Cancel() {
    token_.Cancel();
    settled_.store(true, std::memory_order_release);
    boost::asio::post(io_, [self = shared_from_this()] {
        self->timer_.cancel();
        self->onTimeout_ = nullptr;
    });
}

} // namespace FXN::Bacnet
