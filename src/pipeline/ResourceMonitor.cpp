// SPDX-License-Identifier: Apache-2.0
#include "ResourceMonitor.hpp"

#include <core/Log.hpp>

namespace narrator
{

auto deviceClassToString(DeviceClass deviceClass) -> std::string_view
{
    switch (deviceClass)
    {
        case DeviceClass::Weak: return "weak";
        case DeviceClass::Medium: return "medium";
        case DeviceClass::Strong: return "strong";
    }
    return "unknown";
}

auto parseDeviceClass(std::string_view name) -> std::optional<DeviceClass>
{
    if (name == "weak")
        return DeviceClass::Weak;
    if (name == "medium")
        return DeviceClass::Medium;
    if (name == "strong")
        return DeviceClass::Strong;
    return std::nullopt;
}

ResourceMonitor::ResourceMonitor(HostInfo& host, ResourceThresholds thresholds):
    _host(host), _thresholds(thresholds)
{
}

auto ResourceMonitor::classifyDevice() const -> DeviceClass
{
    if (_thresholds.deviceClassOverride)
        return *_thresholds.deviceClassOverride;

    auto const mobile = _host.isMobile().value_or(false);
    auto const memory = _host.totalMemoryGb();

    if (mobile || (memory && *memory <= _thresholds.weakMemoryGb))
        return DeviceClass::Weak;
    if (memory && *memory >= _thresholds.strongMemoryGb)
        return DeviceClass::Strong;
    return DeviceClass::Medium;
}

auto ResourceMonitor::targetTier() const -> int
{
    switch (classifyDevice())
    {
        case DeviceClass::Weak: return 1;
        case DeviceClass::Medium: return 2;
        case DeviceClass::Strong: return 3;
    }
    return 1;
}

auto ResourceMonitor::canRunUpgradeNow() const -> bool
{
    if (auto const memory = _host.totalMemoryGb(); memory && *memory <= _thresholds.memoryFloorGb)
    {
        log::debug("Upgrade blocked: {:.1f} GB installed memory", *memory);
        return false;
    }

    if (auto const battery = _host.battery(); battery && *battery)
    {
        auto const& status = **battery;
        if (!status.charging && status.level < _thresholds.lowBatteryLevel)
        {
            log::debug("Upgrade blocked: battery at {:.0f}% and discharging", status.level * 100.0);
            return false;
        }
    }
    else if (!battery)
        log::trace("Battery reading unavailable: {}", battery.error().message);

    if (auto const utilization = _host.memoryUtilization();
        utilization && *utilization > _thresholds.maxMemoryUtilization)
    {
        log::debug("Upgrade blocked: memory utilization {:.0f}%", *utilization * 100.0);
        return false;
    }

    return true;
}

} // namespace narrator
