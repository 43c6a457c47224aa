#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>

#include "../Core/Error.hpp"

namespace FXN::Registry {

using SettingValue = std::variant<double, bool, std::string>;
using CapabilityValue = std::variant<double, bool, std::string>;
using SettingsBatch = std::map<std::string, SettingValue>;

struct SinkData {
    std::string unitId;
};

/// Hub-side device record for one unit. The registry pushes readings and
/// settings into it and reads its persisted connection settings.
///
/// Sinks are registered by reference and must outlive their registration.
class IUnitSink {
public:
    virtual ~IUnitSink() = default;

    [[nodiscard]] virtual std::optional<SettingValue> GetSetting(const std::string& key) const = 0;
    [[nodiscard]] virtual SinkData GetData() const = 0;

    virtual Result<void> SetCapabilityValue(const std::string& capability, const CapabilityValue& value) = 0;
    virtual Result<void> SetSettings(const SettingsBatch& settings) = 0;

    virtual void SetAvailable() = 0;
    virtual void SetUnavailable(const std::string& reason) = 0;

    virtual void Log(const std::string& message) = 0;
    virtual void Error(const std::string& message) = 0;
};

// Numeric view of a setting; numeric strings are accepted, bools are not.
[[nodiscard]] std::optional<double> SettingAsNumber(const std::optional<SettingValue>& value);

// Trimmed string view of a setting; numbers are formatted.
[[nodiscard]] std::string SettingAsString(const std::optional<SettingValue>& value);

} // namespace FXN::Registry
