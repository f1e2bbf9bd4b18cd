// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <clockify/ClockifyClient.hpp>
#include <core/Error.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace clockr
{

/// @brief Clockify account section.
struct ClockifyConfig
{
    std::string apiKey;
    std::string workspaceId; ///< Empty selects the user's default workspace.
    std::string baseUrl = std::string(clockify::DefaultBaseUrl);
};

/// @brief Working hours and the logging interval.
struct ScheduleConfig
{
    int intervalMinutes = 60;
    std::string workStart = "09:00";
    std::string workEnd = "17:00";
    std::vector<int> workDays { 1, 2, 3, 4, 5 }; ///< ISO weekday numbers, Monday = 1.
};

/// @brief AI backend section.
struct AiConfig
{
    std::string provider = "claude-cli";
    std::string model = "sonnet";
    std::string executable = "claude";
};

/// @brief Local entry storage.
struct StorageConfig
{
    std::string path; ///< Empty selects defaultStoragePath().
};

/// @brief Top-level application configuration.
struct AppConfig
{
    ClockifyConfig clockify;
    ScheduleConfig schedule;
    AiConfig ai;
    StorageConfig storage;

    /// @brief The entry file to use, falling back to the default location.
    [[nodiscard]] auto storagePath() const -> std::string;
};

/// @brief Looks up an environment variable; returns null when unset.
using EnvironmentLookup = std::function<char const*(char const*)>;

/// @brief Loads the configuration from the default config path.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the configuration from @p path and applies environment overrides.
///
/// A missing file yields the defaults. An unreadable or malformed file is a ConfigError.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Parses a configuration document. Unknown keys are ignored.
[[nodiscard]] auto parseConfig(std::string_view content) -> Result<AppConfig>;

/// @brief Applies CLOCKIFY_API_KEY, CLOCKIFY_WORKSPACE_ID, CLOCKIFY_BASE_URL and CLOCKR_AI_MODEL.
void applyEnvironmentOverrides(AppConfig& config, EnvironmentLookup const& lookup);

/// @brief Saves the configuration to a file, creating its directory.
[[nodiscard]] auto saveConfigToFile(std::string_view path, AppConfig const& config) -> VoidResult;

/// @brief $XDG_CONFIG_HOME/clockr or ~/.config/clockr
[[nodiscard]] auto defaultConfigDir() -> std::string;

[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief $XDG_DATA_HOME/clockr or ~/.local/share/clockr
[[nodiscard]] auto defaultDataDir() -> std::string;

[[nodiscard]] auto defaultStoragePath() -> std::string;

/// @brief Log file used while the interactive screen is active.
[[nodiscard]] auto defaultLogPath() -> std::string;

} // namespace clockr
