#include "ReplyParser.hpp"

#include <array>
#include <charconv>
#include <regex>
#include <sstream>
#include <vector>

#include "../Logging/Logging.hpp"

namespace FXN::Discovery {

namespace {

constexpr std::array<std::string_view, 3> kNordicSerialPrefixes = {"8001", "8002", "8003"};
constexpr const char* kFallbackName = "Flexit Unit";

const std::regex& SerialPattern() {
    static const std::regex re(R"(\b\d{6}-\d{6}\b)");
    return re;
}

const std::regex& EndpointPattern() {
    static const std::regex re(R"(\b(\d{1,3}(?:\.\d{1,3}){3}):(\d{2,5})\b)");
    return re;
}

const std::regex& MacPattern() {
    static const std::regex re(R"(\b(?:[0-9A-Fa-f]{2}:){5}[0-9A-Fa-f]{2}\b)");
    return re;
}

const std::regex& FirmwarePattern() {
    static const std::regex re(R"(\bFW[:=]?[A-Za-z0-9._-]+\b)", std::regex::icase);
    return re;
}

const std::regex& IdentifierPattern() {
    static const std::regex re(R"(^[A-Za-z][A-Za-z0-9_]{3,}$)");
    return re;
}

std::optional<std::string> FirstMatch(const std::string& text, const std::regex& re) {
    std::smatch m;
    if (!std::regex_search(text, m, re)) {
        return std::nullopt;
    }
    return m.str(0);
}

bool Contains(std::string_view token, char c) {
    return token.find(c) != std::string_view::npos;
}

} // namespace

std::string ReplyParser::ToPrintable(std::span<const uint8_t> payload) {
    std::string out;
    out.reserve(payload.size());
    bool inGap = false;
    for (uint8_t byte : payload) {
        if (byte >= 0x20 && byte <= 0x7E) {
            out.push_back(static_cast<char>(byte));
            inGap = false;
        } else if (!inGap) {
            out.push_back(' ');
            inGap = true;
        }
    }

    const auto first = out.find_first_not_of(' ');
    if (first == std::string::npos) {
        return {};
    }
    const auto last = out.find_last_not_of(' ');
    return out.substr(first, last - first + 1);
}

std::string ReplyParser::NormalizeSerial(std::string_view serial) {
    std::string digits;
    digits.reserve(serial.size());
    for (char c : serial) {
        if (c >= '0' && c <= '9') {
            digits.push_back(c);
        }
    }
    return digits;
}

bool ReplyParser::IsNordicSerial(std::string_view serialNormalized) {
    for (auto prefix : kNordicSerialPrefixes) {
        if (serialNormalized.starts_with(prefix)) {
            return true;
        }
    }
    return false;
}

std::string ReplyParser::PickName(std::string_view text) {
    std::vector<std::string> tokens;
    std::istringstream stream{std::string(text)};
    for (std::string token; stream >> token;) {
        tokens.push_back(std::move(token));
    }

    // Device names look like "HvacFnct21y_A"
    for (const auto& token : tokens) {
        if (Contains(token, '_') && !Contains(token, '.') && !Contains(token, ':') && token.size() >= 4) {
            return token;
        }
    }
    for (const auto& token : tokens) {
        if (std::regex_match(token, IdentifierPattern())) {
            return token;
        }
    }
    return kFallbackName;
}

std::optional<DiscoveredUnit> ReplyParser::Parse(std::span<const uint8_t> payload,
                                                 std::string_view senderAddress) {
    const std::string text = ToPrintable(payload);

    auto serial = FirstMatch(text, SerialPattern());
    if (!serial) {
        FXN_LOG_V3(Discovery, "Reply from {} has no serial", senderAddress);
        return std::nullopt;
    }

    DiscoveredUnit unit;
    unit.serial = *serial;
    unit.serialNormalized = NormalizeSerial(unit.serial);
    if (!IsNordicSerial(unit.serialNormalized)) {
        FXN_LOG_V2(Discovery, "Ignoring reply from {} with non-Nordic serial {}", senderAddress, unit.serial);
        return std::nullopt;
    }

    unit.ip = std::string(senderAddress);
    unit.port = kDefaultBacnetPort;

    std::smatch endpoint;
    if (std::regex_search(text, endpoint, EndpointPattern())) {
        const std::string portText = endpoint.str(2);
        unsigned port = 0;
        auto [ptr, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
        if (ec == std::errc{} && port <= 0xFFFF) {
            unit.ip = endpoint.str(1);
            unit.port = static_cast<uint16_t>(port);
        } else {
            FXN_LOG_V2(Discovery, "Reply endpoint port '{}' out of range, using sender {}", portText, senderAddress);
        }
    }

    unit.mac = FirstMatch(text, MacPattern());
    unit.firmware = FirstMatch(text, FirmwarePattern());
    unit.name = PickName(text);
    return unit;
}

} // namespace FXN::Discovery
