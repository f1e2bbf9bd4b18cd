// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"
#include "ReviewSession.hpp"
#include "Schedule.hpp"

#include <ai/ClaudeCli.hpp>
#include <clockify/ClockifyClient.hpp>
#include <clockify/HttpClient.hpp>
#include <core/Log.hpp>
#include <core/Time.hpp>
#include <review/ReviewStateMachine.hpp>
#include <review/SubmissionPipeline.hpp>
#include <store/JsonEntryStore.hpp>
#include <tui/Theme.hpp>

#include <algorithm>
#include <cstdlib>
#include <format>
#include <optional>
#include <print>
#include <stop_token>

namespace clockr
{

namespace
{
    auto withContext(std::string_view context, Error const& error) -> std::unexpected<Error>
    {
        return makeError(error.code, std::format("{}: {}", context, error.message));
    }
} // namespace

struct App::Impl
{
    AppConfig config;
    std::filesystem::path configPath;

    clockify::CurlHttpClient http;
    std::optional<clockify::ClockifyClient> client;
    std::string workspaceId;
    std::unique_ptr<store::JsonEntryStore> entryStore;

    Impl(AppConfig cfg, std::filesystem::path path): config(std::move(cfg)), configPath(std::move(path)) {}

    auto connectClockify() -> VoidResult
    {
        if (client)
            return {};

        if (config.clockify.apiKey.empty())
            return makeError(ErrorCode::ConfigError,
                             "clockify API key not configured - run 'clockr config --init' to set it up");

        client.emplace(config.clockify.apiKey,
                         http,
                         clockify::ClockifyClientOptions { .baseUrl = config.clockify.baseUrl });

        log::debug("Resolving workspace ID");
        auto resolved = client->resolveWorkspaceId(config.clockify.workspaceId);
        if (!resolved)
        {
            client.reset();
            return std::unexpected(resolved.error());
        }
        workspaceId = std::move(*resolved);
        log::debug("Workspace resolved: {}", workspaceId);
        return {};
    }

    auto openStore() -> VoidResult
    {
        if (entryStore)
            return {};

        auto opened = store::JsonEntryStore::open(config.storagePath());
        if (!opened)
            return withContext("opening entry store", opened.error());
        entryStore = std::move(*opened);
        return {};
    }

    auto loadProjects() -> Result<std::vector<clockify::Project>>
    {
        log::debug("Fetching projects");
        auto projects = client->projects(workspaceId);
        if (!projects)
            return withContext("fetching projects", projects.error());
        log::debug("Projects loaded: {}", projects->size());
        client->enrichProjectsWithClients(workspaceId, *projects);
        return projects;
    }

    auto makeMatcher() const -> Result<ai::ClaudeCli>
    {
        if (config.ai.provider != "claude-cli")
            return makeError(ErrorCode::ConfigError,
                             std::format("unsupported AI provider '{}' (supported: claude-cli)", config.ai.provider));
        return ai::ClaudeCli(ai::ClaudeCliConfig { .executable = config.ai.executable, .model = config.ai.model });
    }

    auto lastRawInput() -> std::string
    {
        auto last = entryStore->lastRawInput();
        if (!last)
        {
            log::warning("Reading last description failed: {}", last.error().message);
            return {};
        }
        return std::move(*last);
    }

    [[nodiscard]] static auto theme() -> tui::Theme
    {
        if (auto const* const noColor = std::getenv("NO_COLOR"); noColor && *noColor)
        {
            auto plain = tui::plainTheme();
            plain.cursor = tui::Style { .inverse = true };
            return plain;
        }
        return tui::defaultTheme();
    }

    template <typename Machine>
    void seedInput(Machine& machine, LogOptions const& options, std::string const& lastInput)
    {
        if (!options.text.empty())
            machine.setInitialInput(options.text);
        else if (options.repeat && !lastInput.empty())
            machine.setInitialInput(lastInput);
    }

    auto runSingle(LogOptions const& options) -> VoidResult
    {
        auto projects = loadProjects();
        if (!projects)
            return std::unexpected(projects.error());

        auto matcher = makeMatcher();
        if (!matcher)
            return std::unexpected(matcher.error());

        auto const interval = singleInterval(now(), config.schedule.intervalMinutes);
        auto const lastInput = lastRawInput();
        auto pipeline = review::SubmissionPipeline(*client, entryStore.get(), workspaceId);

        auto machine = review::ReviewStateMachine(review::SingleIntervalMode(interval.start, interval.end),
                                                  review::ReviewDependencies {
                                                      .matcher = *matcher,
                                                      .pipeline = pipeline,
                                                      .projects = std::move(*projects),
                                                      .lastInput = lastInput,
                                                  });
        seedInput(machine, options, lastInput);

        if (auto result = runReviewSession(machine, theme(), defaultLogPath()); !result)
            return withContext("running review", result.error());

        if (auto const& result = machine.result(); result && result->skipped)
            std::println("{}", formatSkippedOutcome(result->entries, "Entry skipped."));
        return {};
    }

    auto runBatch(LogOptions const& options) -> VoidResult
    {
        auto const today = localDate(now());
        auto const from = parseDateExpression(options.from, today);
        if (!from)
            return withContext("invalid --from date", from.error());
        auto const to = parseDateExpression(options.to, today);
        if (!to)
            return withContext("invalid --to date", to.error());

        auto days = buildDaySlots(*from, *to, config.schedule);
        if (!days)
            return std::unexpected(days.error());
        log::debug("Day slots built: {}", days->size());

        auto projects = loadProjects();
        if (!projects)
            return std::unexpected(projects.error());

        auto matcher = makeMatcher();
        if (!matcher)
            return std::unexpected(matcher.error());

        auto const lastInput = lastRawInput();
        auto pipeline = review::SubmissionPipeline(*client, entryStore.get(), workspaceId);

        auto machine = review::BatchReviewStateMachine(review::BatchMode(std::move(*days)),
                                                       review::ReviewDependencies {
                                                           .matcher = *matcher,
                                                           .pipeline = pipeline,
                                                           .projects = std::move(*projects),
                                                           .lastInput = lastInput,
                                                       });
        seedInput(machine, options, lastInput);

        if (auto result = runReviewSession(machine, theme(), defaultLogPath()); !result)
            return withContext("running batch review", result.error());

        if (auto const& result = machine.result(); result && result->skipped)
            std::println("{}", formatSkippedOutcome(result->entries, "Batch entry skipped."));
        return {};
    }

    auto runSame() -> VoidResult
    {
        auto last = entryStore->lastLogged();
        if (!last)
            return withContext("getting last entry", last.error());
        if (!*last)
            return makeError(ErrorCode::InvalidArgument, "no previous entries found");
        auto const& previous = **last;

        auto projects = client->projects(workspaceId);
        if (!projects)
            return withContext("fetching projects", projects.error());

        auto const exists = std::ranges::any_of(
            *projects, [&](clockify::Project const& project) { return project.id == previous.projectId; });
        if (!exists)
            return makeError(ErrorCode::InvalidArgument,
                             std::format("project \"{}\" ({}) from last entry no longer exists in Clockify - use "
                                         "'clockr log' instead",
                                         previous.projectName,
                                         previous.projectId));

        auto const interval = singleInterval(now(), config.schedule.intervalMinutes);

        auto entry = store::Entry {
            .projectId = previous.projectId,
            .projectName = previous.projectName,
            .clientName = previous.clientName,
            .description = previous.description,
            .start = interval.start,
            .end = interval.end,
            .minutes = interval.minutes(),
            .rawInput = "(--same)",
        };

        auto const created = client->createTimeEntry(workspaceId,
                                                     clockify::TimeEntryRequest {
                                                         .start = entry.start,
                                                         .end = entry.end,
                                                         .projectId = entry.projectId,
                                                         .description = entry.description,
                                                     },
                                                     std::stop_token {});
        if (created)
        {
            entry.status = store::EntryStatus::Logged;
            entry.clockifyId = created->id;
        }
        else
        {
            entry.status = store::EntryStatus::Failed;
            std::println("Warning: failed to create Clockify entry: {}", created.error().message);
        }

        entry.createdAt = now();
        if (auto const id = entryStore->insert(entry); !id)
            return withContext("saving entry", id.error());

        std::println("{}", formatLoggedLine(entry));
        return {};
    }
};

App::App(AppConfig config, std::filesystem::path configPath):
    _impl(std::make_unique<Impl>(std::move(config), std::move(configPath)))
{
}

App::~App() = default;

auto App::log(LogOptions const& options) -> VoidResult
{
    if (auto valid = validateLogOptions(options); !valid)
        return valid;

    if (auto result = _impl->openStore(); !result)
        return result;
    if (auto result = _impl->connectClockify(); !result)
        return result;

    if (options.same)
        return _impl->runSame();
    if (options.isBatch())
        return _impl->runBatch(options);
    return _impl->runSingle(options);
}

auto App::status() -> VoidResult
{
    if (auto result = _impl->openStore(); !result)
        return result;

    auto entries = _impl->entryStore->todayEntries();
    if (!entries)
        return withContext("fetching today's entries", entries.error());

    if (entries->empty())
    {
        std::println("No entries logged today.");
    }
    else
    {
        auto totalMinutes = 0;
        std::println("Today's entries:");
        std::println("");
        for (auto const& entry: *entries)
        {
            std::println("{}", formatStatusLine(entry));
            totalMinutes += entry.minutes;
        }
        std::println("");
        std::println("{}", formatStatusTotal(totalMinutes, entries->size()));
    }

    std::println("{}", formatScheduleHint(now(), _impl->config.schedule));
    return {};
}

auto App::projects() -> VoidResult
{
    if (auto result = _impl->connectClockify(); !result)
        return result;

    auto projects = _impl->loadProjects();
    if (!projects)
        return std::unexpected(projects.error());

    if (projects->empty())
    {
        std::println("No projects found.");
        return {};
    }

    std::println("Found {} projects:", projects->size());
    std::println("");
    for (auto const& project: *projects)
        std::println("{}", formatProjectLine(project));
    return {};
}

auto App::retry() -> VoidResult
{
    if (auto result = _impl->openStore(); !result)
        return result;

    auto entries = _impl->entryStore->failedEntries();
    if (!entries)
        return withContext("fetching failed entries", entries.error());

    if (entries->empty())
    {
        std::println("No failed entries to retry.");
        return {};
    }

    if (auto result = _impl->connectClockify(); !result)
        return result;

    std::println("Retrying {} failed entries...", entries->size());
    for (auto const& entry: *entries)
    {
        auto const created = _impl->client->createTimeEntry(_impl->workspaceId,
                                                            clockify::TimeEntryRequest {
                                                                .start = entry.start,
                                                                .end = entry.end,
                                                                .projectId = entry.projectId,
                                                                .description = entry.description,
                                                            },
                                                            std::stop_token {});
        if (!created)
        {
            std::println("  Retry failed for entry {}: {}", entry.id, created.error().message);
            continue;
        }

        if (auto const updated = _impl->entryStore->updateStatus(entry.id, store::EntryStatus::Logged, created->id);
            !updated)
        {
            std::println("  Failed to update entry {} status: {}", entry.id, updated.error().message);
            continue;
        }

        std::println("  Retried entry {} successfully", entry.id);
    }
    return {};
}

auto App::config(bool init) -> VoidResult
{
    auto const path = _impl->configPath;

    if (init)
    {
        if (std::filesystem::exists(path))
        {
            std::println("Config file already exists at {}", path.string());
            return {};
        }

        if (auto result = saveConfigToFile(path.string(), AppConfig {}); !result)
            return result;
        std::println("Wrote default config to {}", path.string());
        return {};
    }

    std::println("{}", path.string());
    return {};
}

} // namespace clockr
