#include "UnitRegistry.hpp"

#include <span>
#include <utility>

#include <boost/asio/post.hpp>
#include <fmt/format.h>

#include "../Bacnet/RequestGuard.hpp"
#include "../Logging/Logging.hpp"

namespace FXN::Registry {

namespace {

Error ReplyError(const Bacnet::TransportReply& reply, std::string_view what) {
    const std::string message = reply.message.empty()
        ? fmt::format("{} failed ({})", what, Bacnet::ToString(reply.status))
        : reply.message;
    if (reply.status == Bacnet::TransportStatus::kTimeout) {
        return FXN_ERROR_TIMEOUT(message).error();
    }
    return FXN_ERROR_TRANSPORT(message).error();
}

} // namespace

// ============================================================================
// Batched read
// ============================================================================

void UnitRegistry::ReadPoints(const UnitPtr& unit, std::vector<ObjectRef> refs, ReadDone done) {
    auto transport = transports_.Get(unit->port);
    if (!transport) {
        boost::asio::post(io_, [done = std::move(done), error = transport.error()] {
            done(std::unexpected(error));
        });
        return;
    }

    const std::string unitId = unit->unitId;
    auto guard = Bacnet::RequestGuard::Start(io_, config_.rpcTimeout,
        [done, unitId, timeout = config_.rpcTimeout] {
            FXN_LOG_V2(Transport, "{}: read timed out after {}ms", unitId, timeout.count());
            done(FXN_ERROR_TIMEOUT(fmt::format("read timed out after {}ms", timeout.count())));
        });
    unit->Track(guard);

    const auto handle = (*transport)->ReadPropertyMultiple(unit->ip, refs,
        [guard, done](const Bacnet::TransportReply& reply, std::span<const Bacnet::PointReading> readings) {
            std::vector<Bacnet::PointReading> copy(readings.begin(), readings.end());
            guard->Resolve([done, reply, copy = std::move(copy)]() mutable {
                if (reply.status != Bacnet::TransportStatus::kOk) {
                    done(std::unexpected(ReplyError(reply, "read")));
                    return;
                }
                done(std::move(copy));
            });
        });

    if (!handle.IsValid()) {
        guard->Resolve([done] {
            done(FXN_ERROR_TRANSPORT("read request was not submitted"));
        });
    }
}

// ============================================================================
// Single write
// ============================================================================

void UnitRegistry::WritePoint(const UnitPtr& unit, const ObjectRef& ref, Bacnet::TypedValue value,
                              const Bacnet::WriteOptions& options, WriteDone done) {
    auto transport = transports_.Get(unit->port);
    if (!transport) {
        boost::asio::post(io_, [done = std::move(done), error = transport.error()] {
            done(std::unexpected(error));
        });
        return;
    }

    const std::string unitId = unit->unitId;
    auto guard = Bacnet::RequestGuard::Start(io_, config_.rpcTimeout,
        [done, unitId, ref, timeout = config_.rpcTimeout] {
            FXN_LOG_V0(Registry, "{}: timeout writing {}", unitId, ref);
            done(FXN_ERROR_TIMEOUT(fmt::format("write {} timed out after {}ms", ref, timeout.count())));
        });
    unit->Track(guard);

    const Bacnet::TypedValue values[] = {value};
    const auto handle = (*transport)->WriteProperty(unit->ip, ref, Bacnet::kPropertyPresentValue,
        values, options,
        [guard, done](const Bacnet::TransportReply& reply) {
            guard->Resolve([done, reply] {
                if (reply.status != Bacnet::TransportStatus::kOk) {
                    done(std::unexpected(ReplyError(reply, "write")));
                    return;
                }
                done({});
            });
        });

    if (!handle.IsValid()) {
        guard->Resolve([done] {
            done(FXN_ERROR_TRANSPORT("write request was not submitted"));
        });
    }
}

} // namespace FXN::Registry
