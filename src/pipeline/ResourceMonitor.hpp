// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <pipeline/HostInfo.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace narrator
{

/// @brief Coarse capability class of the host.
enum class DeviceClass : std::uint8_t
{
    Weak,
    Medium,
    Strong,
};

[[nodiscard]] auto deviceClassToString(DeviceClass deviceClass) -> std::string_view;
[[nodiscard]] auto parseDeviceClass(std::string_view name) -> std::optional<DeviceClass>;

/// @brief Limits applied by ResourceMonitor.
struct ResourceThresholds
{
    double weakMemoryGb = 4.0;         ///< At or below: weak.
    double strongMemoryGb = 8.0;       ///< At or above: strong.
    double memoryFloorGb = 2.0;        ///< At or below: no background upgrades.
    double lowBatteryLevel = 0.2;      ///< Below while discharging: no background upgrades.
    double maxMemoryUtilization = 0.8; ///< Above: no background upgrades.
    std::optional<DeviceClass> deviceClassOverride;
};

/// @brief Classifies the host and decides when background work is affordable.
class ResourceMonitor
{
  public:
    explicit ResourceMonitor(HostInfo& host, ResourceThresholds thresholds = {});

    /// @brief Weak if mobile or at most 4 GB, strong if at least 8 GB, medium otherwise.
    [[nodiscard]] auto classifyDevice() const -> DeviceClass;

    /// @brief Tier of the fast first pass. Always 0.
    [[nodiscard]] auto startingTier() const -> int { return 0; }

    /// @brief Upgrade ceiling: 1, 2 or 3 for weak, medium or strong hosts.
    [[nodiscard]] auto targetTier() const -> int;

    /// @brief Re-reads the host and returns false under memory or battery pressure.
    ///
    /// A failing host reading counts as no pressure.
    [[nodiscard]] auto canRunUpgradeNow() const -> bool;

  private:
    HostInfo& _host;
    ResourceThresholds _thresholds;
};

} // namespace narrator
