#include "DiscoveryProtocol.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <map>
#include <memory>
#include <span>
#include <utility>

#include <boost/asio/error.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <fmt/format.h>

#include "DiscoveryRequest.hpp"
#include "ReplyParser.hpp"
#include "UnitModel.hpp"
#include "../Logging/Logging.hpp"

namespace FXN::Discovery {

namespace {

namespace asio = boost::asio;
using boost::asio::ip::udp;
using Clock = std::chrono::steady_clock;

constexpr size_t kReceiveBufferSize = 2048;

class DiscoverySession : public std::enable_shared_from_this<DiscoverySession> {
public:
    DiscoverySession(asio::io_context& io,
                     DiscoveryOptions options,
                     std::vector<NetworkInterface> interfaces,
                     DiscoveryCompletion completion)
        : io_(io)
        , options_(std::move(options))
        , interfaces_(std::move(interfaces))
        , completion_(std::move(completion))
        , rx_(io)
        , tx_(io)
        , timer_(io) {}

    void Start() {
        auto request = BuildDiscoverRequest();
        if (!request) {
            Finish(std::unexpected(request.error()));
            return;
        }
        request_ = std::move(*request);

        if (auto opened = OpenSockets(); !opened) {
            Finish(std::unexpected(opened.error()));
            return;
        }

        start_ = Clock::now();
        FXN_LOG_V1(Discovery, "Discovery started on {} interface(s): window={}ms bursts={} interval={}ms",
                   interfaces_.size(), options_.timeout.count(), options_.burstCount,
                   options_.burstInterval.count());

        ArmReceive();
        SendBurst();
    }

private:
    // ------------------------------------------------------------------------
    // Socket setup
    // ------------------------------------------------------------------------

    Result<void> OpenSockets() {
        boost::system::error_code ec;
        const auto replyGroup = asio::ip::make_address_v4(kReplyGroup);

        rx_.open(udp::v4(), ec);
        if (!ec) rx_.set_option(udp::socket::reuse_address(true), ec);
        if (!ec) rx_.bind(udp::endpoint(asio::ip::address_v4::any(), kReplyPort), ec);
        if (ec) {
            return FXN_ERROR_SOCKET(fmt::format("reply socket bind on {} failed: {}", kReplyPort, ec.message()));
        }

        for (const auto& nic : interfaces_) {
            boost::system::error_code joinEc;
            const auto local = asio::ip::make_address_v4(nic.address, joinEc);
            if (!joinEc) {
                rx_.set_option(asio::ip::multicast::join_group(replyGroup, local), joinEc);
            }
            if (joinEc) {
                // Virtual interfaces often lack multicast support
                FXN_LOG_V2(Discovery, "Join {} on {} ({}) failed: {}",
                           kReplyGroup, nic.name, nic.address, joinEc.message());
            }
        }

        tx_.open(udp::v4(), ec);
        if (!ec) tx_.set_option(udp::socket::reuse_address(true), ec);
        if (!ec) tx_.bind(udp::endpoint(asio::ip::address_v4::any(), kRequestPort), ec);
        if (!ec) tx_.set_option(asio::ip::multicast::hops(1), ec);
        if (!ec) tx_.set_option(asio::ip::multicast::enable_loopback(false), ec);
        if (!ec) tx_.non_blocking(true, ec);
        if (ec) {
            return FXN_ERROR_SOCKET(fmt::format("request socket setup on {} failed: {}", kRequestPort, ec.message()));
        }
        return {};
    }

    // ------------------------------------------------------------------------
    // Receive path
    // ------------------------------------------------------------------------

    void ArmReceive() {
        rx_.async_receive_from(
            asio::buffer(rxBuffer_), sender_,
            [self = shared_from_this()](const boost::system::error_code& ec, size_t bytes) {
                self->OnReceive(ec, bytes);
            });
    }

    void OnReceive(const boost::system::error_code& ec, size_t bytes) {
        if (finished_ || ec == asio::error::operation_aborted) {
            return;
        }
        if (ec) {
            if (IsTransientReceiveError(ec)) {
                FXN_LOG_V2(Discovery, "Reply receive interrupted: {}", ec.message());
                ArmReceive();
                return;
            }
            // Replies are lost from here on; the window timer still completes the session
            FXN_LOG_WARNING(Discovery, "Reply receive failed, no further replies collected: {}", ec.message());
            return;
        }

        const std::string senderAddress = sender_.address().to_string();
        FXN_LOG_V4(Discovery, "Reply {} bytes from {}", bytes, senderAddress);

        auto parsed = ReplyParser::Parse(std::span<const uint8_t>(rxBuffer_.data(), bytes), senderAddress);
        if (parsed) {
            const auto model = ModelFromSerial(parsed->serialNormalized);
            FXN_LOG_V1(Discovery, "Found '{}' serial={} at {}:{} model={}",
                       parsed->name, parsed->serial, parsed->ip, parsed->port,
                       model.value_or("unknown"));
            found_[parsed->serialNormalized] = std::move(*parsed);
        }
        ArmReceive();
    }

    // ------------------------------------------------------------------------
    // Burst path
    // ------------------------------------------------------------------------

    void SendBurst() {
        if (finished_) {
            return;
        }

        if (burstsSent_ < options_.burstCount) {
            const udp::endpoint target(asio::ip::make_address_v4(kRequestGroup), kRequestPort);
            for (const auto& nic : interfaces_) {
                boost::system::error_code ec;
                const auto local = asio::ip::make_address_v4(nic.address, ec);
                if (!ec) tx_.set_option(asio::ip::multicast::outbound_interface(local), ec);
                if (!ec) tx_.send_to(asio::buffer(request_), target, 0, ec);
                if (ec) {
                    FXN_LOG_V2(Discovery, "Send on {} ({}) failed: {}", nic.name, nic.address, ec.message());
                }
            }
            ++burstsSent_;
        }

        const auto now = Clock::now();
        if (burstsSent_ < options_.burstCount) {
            timer_.expires_at(now + options_.burstInterval);
            timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
                if (!ec) self->SendBurst();
            });
            return;
        }

        // Last burst out: sleep one interval, then wait out the rest of the window
        const Clock::duration tail = options_.burstCount ? Clock::duration(options_.burstInterval)
                                                         : Clock::duration::zero();
        const auto deadline = std::max(now + tail, start_ + options_.timeout);
        timer_.expires_at(deadline);
        timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
            if (!ec) self->Collect();
        });
    }

    void Collect() {
        std::vector<DiscoveredUnit> units;
        units.reserve(found_.size());
        for (auto& [serial, unit] : found_) {
            units.push_back(std::move(unit));
        }
        FXN_LOG_V1(Discovery, "Discovery finished: {} unit(s)", units.size());
        Finish(std::move(units));
    }

    void Finish(Result<std::vector<DiscoveredUnit>> result) {
        if (finished_) {
            return;
        }
        finished_ = true;
        timer_.cancel();
        CloseSocket(rx_, "reply");
        CloseSocket(tx_, "request");

        if (!result) {
            result.error().Log();
        }
        asio::post(io_, [completion = std::move(completion_), result = std::move(result)]() mutable {
            completion(std::move(result));
        });
    }

    static void CloseSocket(udp::socket& socket, const char* role) {
        if (!socket.is_open()) {
            return;
        }
        boost::system::error_code ec;
        socket.close(ec);
        if (ec) {
            FXN_LOG_DEBUG(Discovery, "Closing {} socket: {}", role, ec.message());
        }
    }

    asio::io_context& io_;
    DiscoveryOptions options_;
    std::vector<NetworkInterface> interfaces_;
    DiscoveryCompletion completion_;

    udp::socket rx_;
    udp::socket tx_;
    asio::steady_timer timer_;

    std::vector<uint8_t> request_;
    std::array<uint8_t, kReceiveBufferSize> rxBuffer_{};
    udp::endpoint sender_;

    std::map<std::string, DiscoveredUnit> found_;
    uint32_t burstsSent_{0};
    Clock::time_point start_{};
    bool finished_{false};
};

} // namespace

bool IsTransientReceiveError(const boost::system::error_code& ec) {
    return ec == asio::error::interrupted
        || ec == asio::error::try_again
        || ec == asio::error::would_block
        || ec == asio::error::no_buffer_space;
}

DiscoveryProtocol::DiscoveryProtocol(boost::asio::io_context& io, InterfaceProvider interfaces)
    : io_(io)
    , interfaces_(std::move(interfaces)) {}

void DiscoveryProtocol::Discover(const DiscoveryOptions& options, DiscoveryCompletion completion) {
    auto candidates = SelectInterfaces(interfaces_(), options.interfaceAddress);
    if (candidates.empty()) {
        FXN_LOG_WARNING(Discovery, "No IPv4 interface matches '{}', nothing to discover",
                        options.interfaceAddress.empty() ? "auto" : options.interfaceAddress);
        asio::post(io_, [completion = std::move(completion)] {
            completion(std::vector<DiscoveredUnit>{});
        });
        return;
    }

    auto session = std::make_shared<DiscoverySession>(io_, options, std::move(candidates), std::move(completion));
    session->Start();
}

} // namespace FXN::Discovery
