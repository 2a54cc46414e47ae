// SPDX-License-Identifier: Apache-2.0
#include "HostInfo.hpp"

#include <charconv>
#include <format>
#include <fstream>
#include <map>
#include <string>
#include <string_view>
#include <system_error>

namespace narrator
{

namespace
{

    constexpr auto KibPerGib = 1024.0 * 1024.0;

    auto readFirstLine(const std::filesystem::path& path) -> std::optional<std::string>
    {
        auto file = std::ifstream(path);
        if (!file.is_open())
            return std::nullopt;
        auto line = std::string {};
        std::getline(file, line);
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r' || line.back() == ' '))
            line.pop_back();
        return line;
    }

    auto parseNumber(std::string_view text) -> std::optional<long long>
    {
        auto value = 0LL;
        auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc {} || ptr == text.data())
            return std::nullopt;
        return value;
    }

    /// @brief Parses "Key:   1234 kB" lines of /proc/meminfo into kB values.
    auto readMeminfo(const std::filesystem::path& path) -> Result<std::map<std::string, long long>>
    {
        auto file = std::ifstream(path);
        if (!file.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot open {}", path.string()));

        auto values = std::map<std::string, long long> {};
        auto line = std::string {};
        while (std::getline(file, line))
        {
            auto const colon = line.find(':');
            if (colon == std::string::npos)
                continue;
            auto const rest = std::string_view(line).substr(colon + 1);
            auto const digits = rest.find_first_not_of(' ');
            if (digits == std::string_view::npos)
                continue;
            if (auto const value = parseNumber(rest.substr(digits)))
                values.emplace(line.substr(0, colon), *value);
        }
        return values;
    }

} // namespace

LinuxHostInfo::LinuxHostInfo(std::filesystem::path procRoot, std::filesystem::path sysRoot):
    _procRoot(std::move(procRoot)), _sysRoot(std::move(sysRoot))
{
}

auto LinuxHostInfo::totalMemoryGb() -> Result<double>
{
    return readMeminfo(_procRoot / "meminfo").and_then([](const auto& values) -> Result<double> {
        auto const it = values.find("MemTotal");
        if (it == values.end())
            return makeError(ErrorCode::NotFound, "MemTotal missing from meminfo");
        return static_cast<double>(it->second) / KibPerGib;
    });
}

auto LinuxHostInfo::memoryUtilization() -> Result<double>
{
    return readMeminfo(_procRoot / "meminfo").and_then([](const auto& values) -> Result<double> {
        auto const total = values.find("MemTotal");
        auto const available = values.find("MemAvailable");
        if (total == values.end() || available == values.end() || total->second <= 0)
            return makeError(ErrorCode::NotFound, "MemTotal/MemAvailable missing from meminfo");
        return 1.0 - static_cast<double>(available->second) / static_cast<double>(total->second);
    });
}

auto LinuxHostInfo::battery() -> Result<std::optional<BatteryStatus>>
{
    auto const supplies = _sysRoot / "class" / "power_supply";
    auto ec = std::error_code {};
    auto it = std::filesystem::directory_iterator(supplies, ec);
    if (ec)
        return std::optional<BatteryStatus> {};

    for (auto const& entry: it)
    {
        if (readFirstLine(entry.path() / "type") != "Battery")
            continue;

        auto const capacity = readFirstLine(entry.path() / "capacity");
        auto const percent = capacity ? parseNumber(*capacity) : std::nullopt;
        if (!percent)
            return makeError(ErrorCode::IoError, std::format("Unreadable battery capacity in {}", entry.path().string()));

        auto const status = readFirstLine(entry.path() / "status").value_or("Unknown");
        return std::optional<BatteryStatus> { BatteryStatus {
            .level = static_cast<double>(*percent) / 100.0,
            .charging = status == "Charging" || status == "Full",
        } };
    }
    return std::optional<BatteryStatus> {};
}

auto LinuxHostInfo::isMobile() -> Result<bool>
{
    // SMBIOS chassis types: 11 hand held, 30 tablet, 31 convertible, 32 detachable.
    auto const chassis = readFirstLine(_sysRoot / "class" / "dmi" / "id" / "chassis_type");
    if (!chassis)
        return false;
    auto const type = parseNumber(*chassis);
    if (!type)
        return makeError(ErrorCode::IoError, std::format("Unexpected chassis type '{}'", *chassis));
    return *type == 11 || *type == 30 || *type == 31 || *type == 32;
}

} // namespace narrator
