// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <print>

namespace narrator::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto sinkMutex = std::mutex {};
    auto const startTime = std::chrono::steady_clock::now();
} // namespace

void setLevel(Level level)
{
    globalLevel.store(level, std::memory_order_relaxed);
}

auto getLevel() -> Level
{
    return globalLevel.load(std::memory_order_relaxed);
}

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    if (name == "error")
        return Level::Error;
    if (name == "warning" || name == "warn")
        return Level::Warning;
    if (name == "info")
        return Level::Info;
    if (name == "debug")
        return Level::Debug;
    if (name == "trace")
        return Level::Trace;
    return std::nullopt;
}

void write(Level level, std::string_view message)
{
    if (level > getLevel())
        return;

    constexpr auto levelPrefix = [](Level l) -> std::string_view {
        switch (l)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    };

    auto const elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
    auto lock = std::lock_guard(sinkMutex);
    std::println(stderr, "{:9.3f} [{}] {}", elapsed, levelPrefix(level), message);
}

} // namespace narrator::log
