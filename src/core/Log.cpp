// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <print>
#include <string>

namespace mcprunner::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalMutex = std::mutex {};
    auto globalCallback = LogCallback {};
    auto globalFile = std::ofstream {};

    constexpr auto levelPrefix(Level l) -> std::string_view
    {
        switch (l)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    }
} // namespace

void setCallback(LogCallback callback)
{
    auto const lock = std::lock_guard(globalMutex);
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel = level;
}

auto getLevel() -> Level
{
    return globalLevel;
}

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    auto lower = std::string(name);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lower == "error" || lower == "critical")
        return Level::Error;
    if (lower == "warning" || lower == "warn")
        return Level::Warning;
    if (lower == "info")
        return Level::Info;
    if (lower == "debug")
        return Level::Debug;
    if (lower == "trace")
        return Level::Trace;
    return std::nullopt;
}

auto openLogFile(std::string_view path) -> VoidResult
{
    auto const lock = std::lock_guard(globalMutex);

    if (globalFile.is_open())
        globalFile.close();

    if (path.empty())
        return {};

    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(ErrorCode::IoError,
                             std::format("Failed to create log directory '{}': {}", dir.string(), ec.message()));
    }

    globalFile.open(std::string(path), std::ios::app);
    if (!globalFile.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open log file: {}", path));

    return {};
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel)
        return;

    auto const lock = std::lock_guard(globalMutex);

    if (globalFile.is_open())
    {
        auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
        globalFile << std::format("{:%FT%T}Z [{}] {}\n", now, levelPrefix(level), message);
        globalFile.flush();
    }

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    std::println(stderr, "[{}] {}", levelPrefix(level), message);
}

} // namespace mcprunner::log
