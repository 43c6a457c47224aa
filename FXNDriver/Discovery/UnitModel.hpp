#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace FXN::Discovery {

// Nordic model name ("S4 REL", "CL3 RER", ...) from the first six serial
// digits. Dashes and other separators in the serial are ignored.
[[nodiscard]] std::optional<std::string> ModelFromSerial(std::string_view serial);

} // namespace FXN::Discovery
