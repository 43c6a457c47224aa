#include "DiscoveryRequest.hpp"

#include <array>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/format.h>

namespace FXN::Discovery {

namespace {

constexpr std::array<uint8_t, 4> kHeader = {0x80, 0x01, 0x00, 0x04};
constexpr std::array<uint8_t, 4> kCommandLength = {0x00, 0x00, 0x00, 0x08};
constexpr std::string_view kCommand = "discover";
constexpr std::array<uint8_t, 4> kReserved = {0x00, 0x00, 0x00, 0x00};
constexpr std::array<uint8_t, 4> kMarkerA = {0x0C, 0x00, 0x01, 0x0B};
constexpr std::array<uint8_t, 6> kMarkerB = {0x00, 0x01, 0x00, 0x00, 0x00, 0x00};
constexpr std::array<uint8_t, 2> kSuffix = {0x00, 0x00};

template <size_t N>
void Append(std::vector<uint8_t>& out, const std::array<uint8_t, N>& bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

void Append(std::vector<uint8_t>& out, std::string_view ascii) {
    out.insert(out.end(), ascii.begin(), ascii.end());
}

void AppendTlv(std::vector<uint8_t>& out, uint8_t tag, std::string_view payload) {
    const std::array<uint8_t, 7> header = {
        kTlvMarker, 0x00, tag, 0x00, 0x00, 0x00, static_cast<uint8_t>(payload.size() & 0xFF)};
    Append(out, header);
    Append(out, payload);
}

} // namespace

std::string MakeClientUuid() {
    static thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

Result<std::vector<uint8_t>> BuildDiscoverRequest(std::string_view clientUuid) {
    const std::string client = fmt::format("{}{}", kClientPrefix, clientUuid);

    std::vector<uint8_t> request;
    request.reserve(kDiscoverRequestSize);
    Append(request, kHeader);
    Append(request, kCommandLength);
    Append(request, kCommand);
    Append(request, kReserved);
    Append(request, kMarkerA);
    Append(request, kMarkerB);
    AppendTlv(request, kTlvTagClient, client);
    AppendTlv(request, kTlvTagQuery, kDevicesQuery);
    Append(request, kSuffix);

    if (request.size() != kDiscoverRequestSize) {
        return FXN_ERROR_INTERNAL(fmt::format("Discover payload wrong length: {} (expected {})",
                                              request.size(), kDiscoverRequestSize));
    }
    return request;
}

Result<std::vector<uint8_t>> BuildDiscoverRequest() {
    return BuildDiscoverRequest(MakeClientUuid());
}

} // namespace FXN::Discovery
