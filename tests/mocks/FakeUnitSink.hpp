#pragma once

#include "../../FXNDriver/Registry/IUnitSink.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace FXN::Registry::Fakes {

/**
 * @brief In-memory hub device record.
 *
 * Settings live in a map and SetSettings merges into it, so the registry's
 * settings sync sees its own earlier pushes. Every call is recorded for
 * inspection.
 */
class FakeUnitSink : public IUnitSink {
public:
    explicit FakeUnitSink(std::string unitId)
        : unitId_(std::move(unitId)) {}

    void Set(const std::string& key, SettingValue value) { settings_[key] = std::move(value); }

    // Hooks run after the call is recorded; used to detach from inside a callback.
    void OnUnavailable(std::function<void()> hook) { onUnavailable_ = std::move(hook); }
    void OnCapability(std::function<void(const std::string&)> hook) { onCapability_ = std::move(hook); }

    // -------------------------------------------------------------------------
    // Inspection
    // -------------------------------------------------------------------------

    [[nodiscard]] std::optional<double> Number(const std::string& key) const {
        return SettingAsNumber(GetSetting(key));
    }

    [[nodiscard]] std::optional<CapabilityValue> Capability(const std::string& capability) const {
        if (auto it = capabilities_.find(capability); it != capabilities_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<double> CapabilityNumber(const std::string& capability) const {
        const auto value = Capability(capability);
        if (value && std::holds_alternative<double>(*value)) {
            return std::get<double>(*value);
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<std::string> CapabilityText(const std::string& capability) const {
        const auto value = Capability(capability);
        if (value && std::holds_alternative<std::string>(*value)) {
            return std::get<std::string>(*value);
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<bool> CapabilityFlag(const std::string& capability) const {
        const auto value = Capability(capability);
        if (value && std::holds_alternative<bool>(*value)) {
            return std::get<bool>(*value);
        }
        return std::nullopt;
    }

    [[nodiscard]] const std::vector<SettingsBatch>& SettingsBatches() const { return batches_; }
    [[nodiscard]] const std::vector<std::string>& UnavailableReasons() const { return unavailable_; }
    [[nodiscard]] int AvailableCalls() const { return availableCalls_; }
    [[nodiscard]] int CapabilityCalls() const { return capabilityCalls_; }

    // -------------------------------------------------------------------------
    // IUnitSink
    // -------------------------------------------------------------------------

    std::optional<SettingValue> GetSetting(const std::string& key) const override {
        if (auto it = settings_.find(key); it != settings_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    SinkData GetData() const override { return SinkData{unitId_}; }

    Result<void> SetCapabilityValue(const std::string& capability, const CapabilityValue& value) override {
        capabilities_[capability] = value;
        ++capabilityCalls_;
        if (onCapability_) {
            onCapability_(capability);
        }
        return {};
    }

    Result<void> SetSettings(const SettingsBatch& settings) override {
        batches_.push_back(settings);
        for (const auto& [key, value] : settings) {
            settings_[key] = value;
        }
        return {};
    }

    void SetAvailable() override { ++availableCalls_; }
    void SetUnavailable(const std::string& reason) override {
        unavailable_.push_back(reason);
        if (onUnavailable_) {
            onUnavailable_();
        }
    }

    void Log(const std::string& message) override { log_.push_back(message); }
    void Error(const std::string& message) override { log_.push_back(message); }

private:
    std::string unitId_;
    std::map<std::string, SettingValue> settings_;
    std::map<std::string, CapabilityValue> capabilities_;
    std::vector<SettingsBatch> batches_;
    std::vector<std::string> unavailable_;
    std::vector<std::string> log_;
    int availableCalls_{0};
    int capabilityCalls_{0};
    std::function<void()> onUnavailable_;
    std::function<void(const std::string&)> onCapability_;
};

} // namespace FXN::Registry::Fakes
