// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <filesystem>
#include <optional>

namespace narrator
{

/// @brief State of the host battery.
struct BatteryStatus
{
    double level = 1.0; ///< Charge in [0, 1].
    bool charging = false;
};

/// @brief Source of host resource readings.
///
/// Every reading is fallible; callers decide how to treat an unavailable host.
class HostInfo
{
  public:
    virtual ~HostInfo() = default;

    /// @brief Returns the installed memory in GiB.
    [[nodiscard]] virtual auto totalMemoryGb() -> Result<double> = 0;

    /// @brief Returns the fraction of memory in use, in [0, 1].
    [[nodiscard]] virtual auto memoryUtilization() -> Result<double> = 0;

    /// @brief Returns the battery state, or std::nullopt on hosts without a battery.
    [[nodiscard]] virtual auto battery() -> Result<std::optional<BatteryStatus>> = 0;

    /// @brief Returns true on handheld or tablet class hardware.
    [[nodiscard]] virtual auto isMobile() -> Result<bool> = 0;
};

/// @brief Reads resource information from procfs and sysfs.
class LinuxHostInfo final: public HostInfo
{
  public:
    /// @param procRoot Mount point of procfs (tests pass a fixture directory).
    /// @param sysRoot Mount point of sysfs.
    explicit LinuxHostInfo(std::filesystem::path procRoot = "/proc", std::filesystem::path sysRoot = "/sys");

    [[nodiscard]] auto totalMemoryGb() -> Result<double> override;
    [[nodiscard]] auto memoryUtilization() -> Result<double> override;
    [[nodiscard]] auto battery() -> Result<std::optional<BatteryStatus>> override;
    [[nodiscard]] auto isMobile() -> Result<bool> override;

  private:
    std::filesystem::path _procRoot;
    std::filesystem::path _sysRoot;
};

} // namespace narrator
