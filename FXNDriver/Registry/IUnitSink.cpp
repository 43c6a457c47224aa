#include "IUnitSink.hpp"

#include <charconv>
#include <cmath>
#include <string_view>

#include <fmt/format.h>

namespace FXN::Registry {

namespace {

std::string_view Trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

std::optional<double> SettingAsNumber(const std::optional<SettingValue>& value) {
    if (!value) {
        return std::nullopt;
    }
    if (const auto* number = std::get_if<double>(&*value)) {
        return std::isfinite(*number) ? std::optional<double>(*number) : std::nullopt;
    }
    if (const auto* text = std::get_if<std::string>(&*value)) {
        const auto trimmed = Trim(*text);
        double parsed = 0;
        const auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), parsed);
        if (trimmed.empty() || ec != std::errc() || ptr != trimmed.data() + trimmed.size() || !std::isfinite(parsed)) {
            return std::nullopt;
        }
        return parsed;
    }
    return std::nullopt;
}

std::string SettingAsString(const std::optional<SettingValue>& value) {
    if (!value) {
        return {};
    }
    if (const auto* text = std::get_if<std::string>(&*value)) {
        return std::string(Trim(*text));
    }
    if (const auto* number = std::get_if<double>(&*value)) {
        return fmt::format("{}", *number);
    }
    return std::get<bool>(*value) ? "true" : "false";
}

} // namespace FXN::Registry
