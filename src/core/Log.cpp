// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <chrono>
#include <cstdio>
#include <mutex>
#include <print>

namespace clockr::log
{

namespace
{
    auto globalLevel = Level::Info;
    auto globalCallback = LogCallback {};
    std::FILE* globalFile = nullptr;
    std::mutex globalFileMutex;

    void writeToFile(Level level, std::string_view message)
    {
        auto const now = std::chrono::zoned_time { std::chrono::current_zone(),
                                                   std::chrono::floor<std::chrono::seconds>(
                                                       std::chrono::system_clock::now()) };
        std::println(globalFile, "{:%FT%T} [{}] {}", now, levelPrefix(level), message);
        std::fflush(globalFile);
    }
} // namespace

void setCallback(LogCallback callback)
{
    globalCallback = std::move(callback);
}

auto setLogFile(std::filesystem::path const& path) -> VoidResult
{
    auto ec = std::error_code {};
    if (path.has_parent_path())
        std::filesystem::create_directories(path.parent_path(), ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to create log directory '{}': {}",
                                     path.parent_path().string(),
                                     ec.message()));

    auto* file = std::fopen(path.c_str(), "a");
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Cannot open log file: {}", path.string()));

    auto const lock = std::lock_guard { globalFileMutex };
    if (globalFile)
        std::fclose(globalFile);
    globalFile = file;
    return {};
}

void closeLogFile()
{
    auto const lock = std::lock_guard { globalFileMutex };
    if (globalFile)
    {
        std::fclose(globalFile);
        globalFile = nullptr;
    }
}

void setLevel(Level level)
{
    globalLevel = level;
}

auto getLevel() -> Level
{
    return globalLevel;
}

auto levelPrefix(Level level) noexcept -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "ERROR";
        case Level::Warning: return "WARN ";
        case Level::Info: return "INFO ";
        case Level::Debug: return "DEBUG";
        case Level::Trace: return "TRACE";
    }
    return "?????";
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel)
        return;

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    {
        auto const lock = std::lock_guard { globalFileMutex };
        if (globalFile)
        {
            writeToFile(level, message);
            return;
        }
    }

    std::println(stderr, "[{}] {}", levelPrefix(level), message);
}

} // namespace clockr::log
