#pragma once

#include "../../FXNDriver/Bacnet/IBacnetTransport.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace FXN::Bacnet::Fakes {

/**
 * @brief BACnet client with a programmable point table.
 *
 * Reads answer from the table; points that are not loaded come back without
 * a value. Successful writes update the table so the next poll sees them,
 * the way a real controller does for a relinquishable present value.
 *
 * Failure injection:
 * - FailReads(status, message): every read answers with that status
 * - HoldRequests(true): requests are accepted but never answered
 * - FailWrite(ref, message): writes to one point answer kError with message
 */
class FakeBacnetTransport : public IBacnetTransport {
public:
    struct WriteRecord {
        std::string address;
        ObjectRef ref;
        uint32_t propertyId;
        TypedValue value;
        std::optional<uint8_t> priority;
    };

    explicit FakeBacnetTransport(uint16_t localPort = 47808)
        : localPort_(localPort) {}

    // -------------------------------------------------------------------------
    // Programming
    // -------------------------------------------------------------------------

    void SetValue(const ObjectRef& ref, double value) { values_[ref] = value; }
    void ClearValue(const ObjectRef& ref) { values_.erase(ref); }

    void FailReads(TransportStatus status, std::string message = {}) {
        readFailure_ = TransportReply{status, std::move(message)};
    }
    void RestoreReads() { readFailure_.reset(); }

    void HoldRequests(bool hold) { hold_ = hold; }

    void FailWrite(const ObjectRef& ref, std::string message) { writeFailures_[ref] = std::move(message); }
    void RestoreWrite(const ObjectRef& ref) { writeFailures_.erase(ref); }

    // Successful writes leave the table untouched (device applies later).
    void SetApplyWrites(bool apply) { applyWrites_ = apply; }

    // -------------------------------------------------------------------------
    // Inspection
    // -------------------------------------------------------------------------

    [[nodiscard]] const std::vector<WriteRecord>& Writes() const { return writes_; }
    [[nodiscard]] size_t ReadCount() const { return reads_; }
    [[nodiscard]] const std::string& LastReadAddress() const { return lastReadAddress_; }
    [[nodiscard]] std::optional<double> Value(const ObjectRef& ref) const {
        if (auto it = values_.find(ref); it != values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    void ClearWrites() { writes_.clear(); }

    // -------------------------------------------------------------------------
    // IBacnetTransport
    // -------------------------------------------------------------------------

    TransportHandle ReadPropertyMultiple(const std::string& address,
                                         std::span<const ObjectRef> points,
                                         ReadCompletion completion) override {
        ++reads_;
        lastReadAddress_ = address;
        if (hold_) {
            return TransportHandle{nextHandle_++};
        }
        if (readFailure_) {
            completion(*readFailure_, {});
            return TransportHandle{nextHandle_++};
        }

        std::vector<PointReading> readings;
        readings.reserve(points.size());
        for (const auto& ref : points) {
            readings.push_back(PointReading{ref, Value(ref)});
        }
        completion(TransportReply{}, readings);
        return TransportHandle{nextHandle_++};
    }

    TransportHandle WriteProperty(const std::string& address,
                                  const ObjectRef& ref,
                                  uint32_t propertyId,
                                  std::span<const TypedValue> values,
                                  const WriteOptions& options,
                                  WriteCompletion completion) override {
        const TypedValue value = values.empty() ? TypedValue{} : values.front();
        writes_.push_back(WriteRecord{address, ref, propertyId, value, options.priority});

        if (hold_) {
            return TransportHandle{nextHandle_++};
        }
        if (auto it = writeFailures_.find(ref); it != writeFailures_.end()) {
            completion(TransportReply{TransportStatus::kError, it->second});
            return TransportHandle{nextHandle_++};
        }
        if (applyWrites_) {
            values_[ref] = value.value;
        }
        completion(TransportReply{});
        return TransportHandle{nextHandle_++};
    }

    uint16_t LocalPort() const override { return localPort_; }

private:
    uint16_t localPort_;
    uint32_t nextHandle_{1};
    std::map<ObjectRef, double> values_;
    std::map<ObjectRef, std::string> writeFailures_;
    std::optional<TransportReply> readFailure_;
    std::vector<WriteRecord> writes_;
    std::string lastReadAddress_;
    size_t reads_{0};
    bool hold_{false};
    bool applyWrites_{true};
};

} // namespace FXN::Bacnet::Fakes
