// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <review/SubmissionPipeline.hpp>

#include <algorithm>
#include <format>
#include <utility>

namespace clockr::review
{

namespace
{
    struct TimeWindow
    {
        TimePoint start;
        TimePoint end;
    };

    auto parseWindow(ai::BatchAllocation const& allocation) -> Result<TimeWindow>
    {
        auto start = parseLocalDateTime(allocation.date, allocation.startTime);
        if (!start)
            return makeError(ErrorCode::ParseError,
                             std::format("parsing start time for {}: {}", allocation.date, start.error().message));

        auto end = parseLocalDateTime(allocation.date, allocation.endTime);
        if (!end)
            return makeError(ErrorCode::ParseError,
                             std::format("parsing end time for {}: {}", allocation.date, end.error().message));

        return TimeWindow { .start = *start, .end = *end };
    }

    auto stopRequested(std::stop_token const& stopToken, std::size_t done, std::size_t total) -> bool
    {
        if (!stopToken.stop_requested())
            return false;
        log::info("Submission stopped after {} of {} entries", done, total);
        return true;
    }
} // namespace

SubmissionPipeline::SubmissionPipeline(clockify::TimeEntryClient& client,
                                       store::EntryStore* store,
                                       std::string workspaceId):
    _client(client), _store(store), _workspaceId(std::move(workspaceId))
{
}

auto SubmissionPipeline::submitInterval(std::vector<ai::Allocation> const& allocations,
                                        TimePoint start,
                                        TimePoint end,
                                        std::string_view rawInput,
                                        std::stop_token stopToken) -> Result<std::vector<store::Entry>>
{
    auto entries = std::vector<store::Entry> {};
    entries.reserve(allocations.size());

    auto cursor = start;
    for (auto const& allocation: allocations)
    {
        if (stopRequested(stopToken, entries.size(), allocations.size()))
            break;

        auto const entryEnd = std::min(cursor + std::chrono::minutes(allocation.minutes), end);

        auto entry = submitEntry(store::Entry {
            .projectId = allocation.projectId,
            .projectName = allocation.projectName,
            .clientName = allocation.clientName,
            .description = allocation.description,
            .start = cursor,
            .end = entryEnd,
            .minutes = allocation.minutes,
            .rawInput = std::string(rawInput),
        }, stopToken);
        if (!entry)
            break;

        entries.push_back(std::move(*entry));
        cursor = entryEnd;
    }

    return entries;
}

auto SubmissionPipeline::submitBatch(std::vector<ai::BatchAllocation> const& allocations,
                                     std::string_view rawInput,
                                     std::stop_token stopToken) -> Result<std::vector<store::Entry>>
{
    auto windows = std::vector<TimeWindow> {};
    windows.reserve(allocations.size());
    for (auto const& allocation: allocations)
    {
        auto window = parseWindow(allocation);
        if (!window)
            return std::unexpected(std::move(window.error()));
        windows.push_back(*window);
    }

    auto entries = std::vector<store::Entry> {};
    entries.reserve(allocations.size());

    for (auto i = std::size_t { 0 }; i < allocations.size(); ++i)
    {
        if (stopRequested(stopToken, entries.size(), allocations.size()))
            break;

        auto const& allocation = allocations[i];
        auto entry = submitEntry(store::Entry {
            .projectId = allocation.projectId,
            .projectName = allocation.projectName,
            .clientName = allocation.clientName,
            .description = allocation.description,
            .start = windows[i].start,
            .end = windows[i].end,
            .minutes = allocation.minutes,
            .rawInput = std::string(rawInput),
        }, stopToken);
        if (!entry)
            break;

        entries.push_back(std::move(*entry));
    }

    return entries;
}

auto SubmissionPipeline::submitEntry(store::Entry entry, std::stop_token const& stopToken)
    -> std::optional<store::Entry>
{
    auto const request = clockify::TimeEntryRequest {
        .start = entry.start,
        .end = entry.end,
        .projectId = entry.projectId,
        .description = entry.description,
    };

    auto created = _client.createTimeEntry(_workspaceId, request, stopToken);
    if (created)
    {
        entry.status = store::EntryStatus::Logged;
        entry.clockifyId = created->id;
    }
    else if (created.error().code == ErrorCode::Cancelled)
    {
        log::info("creating time entry for {} canceled", entry.projectName);
        return std::nullopt;
    }
    else
    {
        log::warning("creating time entry for {} failed: {}", entry.projectName, created.error().message);
        entry.status = store::EntryStatus::Failed;
        entry.clockifyId.clear();
    }

    entry.createdAt = now();

    if (_store != nullptr)
    {
        if (auto id = _store->insert(entry); id)
            entry.id = *id;
        else
            log::warning("saving entry locally failed: {}", id.error().message);
    }

    return entry;
}

} // namespace clockr::review
