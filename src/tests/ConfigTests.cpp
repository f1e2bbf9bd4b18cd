// SPDX-License-Identifier: Apache-2.0
#include <clockr/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>

using namespace clockr;

namespace
{
auto lookupIn(std::map<std::string, std::string> const& values) -> EnvironmentLookup
{
    return [&values](char const* name) -> char const* {
        auto const it = values.find(name);
        return it == values.end() ? nullptr : it->second.c_str();
    };
}
} // namespace

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    auto const path = defaultConfigPath();
    REQUIRE(path.ends_with("/clockr/config.json"));
    CHECK(defaultStoragePath().ends_with("/clockr/entries.json"));
    CHECK(defaultLogPath().ends_with("/clockr/clockr.log"));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.clockify.apiKey.empty());
    CHECK(config.clockify.baseUrl == "https://api.clockify.me/api/v1");
    CHECK(config.schedule.intervalMinutes == 60);
    CHECK(config.schedule.workStart == "09:00");
    CHECK(config.schedule.workEnd == "17:00");
    CHECK(config.schedule.workDays == std::vector<int> { 1, 2, 3, 4, 5 });
    CHECK(config.ai.provider == "claude-cli");
    CHECK(config.ai.model == "sonnet");
    CHECK(config.storagePath() == defaultStoragePath());
}

TEST_CASE("parseConfig reads every section", "[config]")
{
    auto const result = parseConfig(R"({
        "clockify": {
            "api_key": "abc123",
            "workspace_id": "ws-1",
            "base_url": "https://eu.clockify.test/api/v1"
        },
        "schedule": {
            "interval_minutes": 30,
            "work_start": "08:30",
            "work_end": "16:30",
            "work_days": [1, 2, 3, 4]
        },
        "ai": {
            "model": "opus",
            "executable": "/opt/bin/claude"
        },
        "storage": { "path": "/tmp/entries.json" },
        "unknown": { "ignored": true }
    })");

    REQUIRE(result.has_value());
    auto const& config = *result;

    SECTION("clockify")
    {
        CHECK(config.clockify.apiKey == "abc123");
        CHECK(config.clockify.workspaceId == "ws-1");
        CHECK(config.clockify.baseUrl == "https://eu.clockify.test/api/v1");
    }

    SECTION("schedule")
    {
        CHECK(config.schedule.intervalMinutes == 30);
        CHECK(config.schedule.workStart == "08:30");
        CHECK(config.schedule.workEnd == "16:30");
        CHECK(config.schedule.workDays == std::vector<int> { 1, 2, 3, 4 });
    }

    SECTION("ai keeps defaults for missing keys")
    {
        CHECK(config.ai.provider == "claude-cli");
        CHECK(config.ai.model == "opus");
        CHECK(config.ai.executable == "/opt/bin/claude");
    }

    SECTION("storage")
    {
        CHECK(config.storagePath() == "/tmp/entries.json");
    }
}

TEST_CASE("parseConfig rejects bad documents", "[config]")
{
    SECTION("malformed JSON")
    {
        auto const result = parseConfig("{ not json");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
        CHECK(result.error().message.starts_with("parsing config file:"));
    }

    SECTION("non-object root")
    {
        CHECK(!parseConfig("[1, 2]").has_value());
    }

    SECTION("non-positive interval")
    {
        auto const result = parseConfig(R"({"schedule": {"interval_minutes": 0}})");
        REQUIRE(!result.has_value());
        CHECK(result.error().message == "schedule.interval_minutes must be positive, got 0");
    }
}

TEST_CASE("applyEnvironmentOverrides replaces only non-empty values", "[config]")
{
    auto config = AppConfig {};
    config.clockify.apiKey = "from-file";
    config.clockify.workspaceId = "ws-file";

    auto const env = std::map<std::string, std::string> {
        { "CLOCKIFY_API_KEY", "from-env" },
        { "CLOCKIFY_WORKSPACE_ID", "" },
        { "CLOCKR_AI_MODEL", "haiku" },
    };
    applyEnvironmentOverrides(config, lookupIn(env));

    CHECK(config.clockify.apiKey == "from-env");
    CHECK(config.clockify.workspaceId == "ws-file");
    CHECK(config.clockify.baseUrl == "https://api.clockify.me/api/v1");
    CHECK(config.ai.model == "haiku");
}

TEST_CASE("loadConfigFromFile handles missing and corrupt files", "[config]")
{
    auto const dir = std::filesystem::temp_directory_path() / "clockr_config_tests";
    std::filesystem::create_directories(dir);

    SECTION("missing file yields defaults")
    {
        auto const result = loadConfigFromFile((dir / "does-not-exist.json").string());
        REQUIRE(result.has_value());
        CHECK(result->schedule.intervalMinutes == 60);
    }

    SECTION("corrupt file is a config error")
    {
        auto const path = dir / "corrupt.json";
        {
            auto file = std::ofstream(path);
            file << "{\"schedule\": ";
        }
        auto const result = loadConfigFromFile(path.string());
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("saveConfigToFile writes a document loadConfigFromFile reads back", "[config]")
{
    auto const dir = std::filesystem::temp_directory_path() / "clockr_config_save" / "nested";
    auto const path = dir / "config.json";
    std::filesystem::remove_all(dir.parent_path());

    auto config = AppConfig {};
    config.schedule.intervalMinutes = 45;
    config.schedule.workDays = { 1, 3, 5 };
    config.storage.path = "/tmp/clockr-entries.json";

    REQUIRE(saveConfigToFile(path.string(), config).has_value());
    REQUIRE(std::filesystem::exists(path));

    auto const loaded = loadConfigFromFile(path.string());
    REQUIRE(loaded.has_value());
    CHECK(loaded->schedule.intervalMinutes == 45);
    CHECK(loaded->schedule.workDays == std::vector<int> { 1, 3, 5 });
    CHECK(loaded->storage.path == "/tmp/clockr-entries.json");

    std::filesystem::remove_all(dir.parent_path());
}
