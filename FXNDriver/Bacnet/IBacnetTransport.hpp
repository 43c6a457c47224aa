#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>

#include "../Common/ObjectRef.hpp"

namespace FXN::Bacnet {

// ============================================================================
// Protocol constants
// ============================================================================

inline constexpr uint32_t kPropertyPresentValue = 85;

inline constexpr uint8_t kMaxSegmentsNone = 0;      // MaxSegmentsAccepted SEGMENTS_0
inline constexpr uint8_t kMaxApdu1476 = 5;          // MaxApduLengthAccepted OCTETS_1476

inline constexpr uint8_t kPriorityDefault = 13;     // standard writes
inline constexpr uint8_t kPriorityVendorApp = 16;   // filter and fan profile writes, matches the vendor app

enum class ApplicationTag : uint8_t {
    kUnsignedInt = 2,
    kReal = 4,
    kEnumerated = 9,
};

struct TypedValue {
    ApplicationTag tag{ApplicationTag::kReal};
    double value{0.0};
};

struct WriteOptions {
    uint8_t maxSegments{kMaxSegmentsNone};
    uint8_t maxApdu{kMaxApdu1476};
    // Absent: the request carries no priority (relinquish-style trigger clears)
    std::optional<uint8_t> priority{kPriorityDefault};
};

// ============================================================================
// Completion types
// ============================================================================

enum class TransportStatus : uint8_t {
    kOk = 0,
    kTimeout,       ///< Client-side APDU timeout
    kError,         ///< Device error/reject/abort; message carries "Code:<n>"
};

[[nodiscard]] constexpr const char* ToString(TransportStatus status) noexcept {
    switch (status) {
        case TransportStatus::kOk:      return "ok";
        case TransportStatus::kTimeout: return "timeout";
        case TransportStatus::kError:   return "error";
    }
    return "unknown";
}

struct TransportReply {
    TransportStatus status{TransportStatus::kOk};
    std::string message;
};

// Present value of one point from a batched read. Non-numeric or errored
// entries have no value.
struct PointReading {
    ObjectRef ref;
    std::optional<double> value;
};

struct TransportHandle {
    uint32_t value{0};

    bool IsValid() const { return value != 0; }
};

using ReadCompletion = std::function<void(const TransportReply& reply, std::span<const PointReading> readings)>;
using WriteCompletion = std::function<void(const TransportReply& reply)>;

// ============================================================================
// Transport interface
// ============================================================================

// One BACnet/IP client bound to a local UDP port, shared by every unit that
// talks through that port. Completions may run on any thread.
class IBacnetTransport {
public:
    virtual ~IBacnetTransport() = default;

    // Batched ReadPropertyMultiple of Present Value for every point.
    virtual TransportHandle ReadPropertyMultiple(const std::string& address,
                                                 std::span<const ObjectRef> points,
                                                 ReadCompletion completion) = 0;

    virtual TransportHandle WriteProperty(const std::string& address,
                                          const ObjectRef& ref,
                                          uint32_t propertyId,
                                          std::span<const TypedValue> values,
                                          const WriteOptions& options,
                                          WriteCompletion completion) = 0;

    [[nodiscard]] virtual uint16_t LocalPort() const = 0;
};

} // namespace FXN::Bacnet
