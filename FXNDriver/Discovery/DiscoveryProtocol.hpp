#pragma once

#include <functional>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include "DiscoveryTypes.hpp"
#include "NetworkInterfaces.hpp"

namespace FXN::Discovery {

// Receive errors worth another async_receive_from: signal interruption,
// spurious wakeups and momentary buffer exhaustion. Anything else ends the
// receive side of the session.
[[nodiscard]] bool IsTransientReceiveError(const boost::system::error_code& ec);

// Multicast discover exchange.
//
// Each Discover() call runs an independent session: bind the reply socket on
// kReplyPort and join kReplyGroup on every candidate interface, bind the send
// socket on kRequestPort (TTL 1, loopback off), burst the request on every
// interface, collect replies until the window closes, deduplicate by
// normalized serial (last reply wins). Both sockets are closed on every exit.
class DiscoveryProtocol : public IDiscoveryService {
public:
    using InterfaceProvider = std::function<std::vector<NetworkInterface>()>;

    explicit DiscoveryProtocol(boost::asio::io_context& io,
                               InterfaceProvider interfaces = &ListIPv4Interfaces);
    ~DiscoveryProtocol() override = default;

    DiscoveryProtocol(const DiscoveryProtocol&) = delete;
    DiscoveryProtocol& operator=(const DiscoveryProtocol&) = delete;

    void Discover(const DiscoveryOptions& options, DiscoveryCompletion completion) override;

private:
    boost::asio::io_context& io_;
    InterfaceProvider interfaces_;
};

} // namespace FXN::Discovery
