#include "UnitModel.hpp"

#include <array>
#include <cstdint>

#include "ReplyParser.hpp"

namespace FXN::Discovery {

namespace {

struct ModelEntry {
    uint32_t prefix;
    const char* name;
};

constexpr std::array<ModelEntry, 14> kNordicModels = {{
    {800111, "S2 REL"},
    {800121, "S3 REL"},
    {800110, "S2 RER"},
    {800120, "S3 RER"},
    {800221, "CL4 REL"},
    {800220, "CL4 RER"},
    {800130, "S4 RER"},
    {800131, "S4 REL"},
    {800210, "CL2 RER"},
    {800211, "CL2 REL"},
    {800200, "CL3 RER"},
    {800201, "CL3 REL"},
    {800300, "KS3 RER"},
    {800301, "KS3 REL"},
}};

} // namespace

std::optional<std::string> ModelFromSerial(std::string_view serial) {
    const std::string digits = ReplyParser::NormalizeSerial(serial);
    if (digits.size() < 6) {
        return std::nullopt;
    }

    uint32_t prefix = 0;
    for (size_t i = 0; i < 6; ++i) {
        prefix = prefix * 10 + static_cast<uint32_t>(digits[i] - '0');
    }

    for (const auto& entry : kNordicModels) {
        if (entry.prefix == prefix) {
            return std::string(entry.name);
        }
    }
    return std::nullopt;
}

} // namespace FXN::Discovery
