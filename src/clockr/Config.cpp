// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace clockr
{

namespace
{
    auto systemEnvironment(char const* name) -> char const*
    {
        return std::getenv(name);
    }

    void overrideFrom(EnvironmentLookup const& lookup, char const* name, std::string& target)
    {
        auto const* const value = lookup(name);
        if (value && *value)
            target = value;
    }
} // namespace

auto AppConfig::storagePath() const -> std::string
{
    return storage.path.empty() ? defaultStoragePath() : storage.path;
}

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/clockr";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/clockr";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto defaultDataDir() -> std::string
{
    auto const* const xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData && *xdgData)
        return std::string(xdgData) + "/clockr";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.local/share/clockr";
    return ".";
}

auto defaultStoragePath() -> std::string
{
    return defaultDataDir() + "/entries.json";
}

auto defaultLogPath() -> std::string
{
    return defaultDataDir() + "/clockr.log";
}

auto parseConfig(std::string_view content) -> Result<AppConfig>
{
    auto parseResult = json::parse(content);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, std::format("parsing config file: {}", parseResult.error().message));

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "parsing config file: top-level value must be an object");

    auto config = AppConfig {};
    auto const defaults = AppConfig {};

    if (root.contains("clockify"))
    {
        auto const& clockify = root["clockify"];
        config.clockify.apiKey = json::getStringOr(clockify, "api_key", "");
        config.clockify.workspaceId = json::getStringOr(clockify, "workspace_id", "");
        config.clockify.baseUrl = json::getStringOr(clockify, "base_url", defaults.clockify.baseUrl);
        if (config.clockify.baseUrl.empty())
            config.clockify.baseUrl = defaults.clockify.baseUrl;
    }

    if (root.contains("schedule"))
    {
        auto const& schedule = root["schedule"];
        config.schedule.intervalMinutes =
            json::getIntOr(schedule, "interval_minutes", defaults.schedule.intervalMinutes);
        config.schedule.workStart = json::getStringOr(schedule, "work_start", defaults.schedule.workStart);
        config.schedule.workEnd = json::getStringOr(schedule, "work_end", defaults.schedule.workEnd);
        config.schedule.workDays = json::getIntArrayOr(schedule, "work_days", defaults.schedule.workDays);
    }

    if (root.contains("ai"))
    {
        auto const& ai = root["ai"];
        config.ai.provider = json::getStringOr(ai, "provider", defaults.ai.provider);
        config.ai.model = json::getStringOr(ai, "model", defaults.ai.model);
        config.ai.executable = json::getStringOr(ai, "executable", defaults.ai.executable);
    }

    if (root.contains("storage"))
        config.storage.path = json::getStringOr(root["storage"], "path", "");

    if (config.schedule.intervalMinutes <= 0)
        return makeError(ErrorCode::ConfigError,
                         std::format("schedule.interval_minutes must be positive, got {}",
                                     config.schedule.intervalMinutes));

    return config;
}

void applyEnvironmentOverrides(AppConfig& config, EnvironmentLookup const& lookup)
{
    overrideFrom(lookup, "CLOCKIFY_API_KEY", config.clockify.apiKey);
    overrideFrom(lookup, "CLOCKIFY_WORKSPACE_ID", config.clockify.workspaceId);
    overrideFrom(lookup, "CLOCKIFY_BASE_URL", config.clockify.baseUrl);
    overrideFrom(lookup, "CLOCKR_AI_MODEL", config.ai.model);
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto config = AppConfig {};

    if (!std::filesystem::exists(path))
    {
        log::debug("No config file found at {}, using defaults", path);
    }
    else
    {
        auto file = std::ifstream(std::string(path));
        if (!file.is_open())
            return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

        auto ss = std::stringstream {};
        ss << file.rdbuf();

        auto parsed = parseConfig(ss.str());
        if (!parsed)
            return std::unexpected(parsed.error());
        config = std::move(*parsed);
    }

    applyEnvironmentOverrides(config, systemEnvironment);
    return config;
}

auto loadConfig() -> Result<AppConfig>
{
    return loadConfigFromFile(defaultConfigPath());
}

auto saveConfigToFile(std::string_view path, AppConfig const& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    root["clockify"] = {
        { "api_key", config.clockify.apiKey },
        { "workspace_id", config.clockify.workspaceId },
        { "base_url", config.clockify.baseUrl },
    };

    root["schedule"] = {
        { "interval_minutes", config.schedule.intervalMinutes },
        { "work_start", config.schedule.workStart },
        { "work_end", config.schedule.workEnd },
        { "work_days", config.schedule.workDays },
    };

    root["ai"] = {
        { "provider", config.ai.provider },
        { "model", config.ai.model },
        { "executable", config.ai.executable },
    };

    if (!config.storage.path.empty())
        root["storage"] = { { "path", config.storage.path } };

    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

} // namespace clockr
