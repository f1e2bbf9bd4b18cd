// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ai/Matcher.hpp>
#include <clockify/HttpClient.hpp>
#include <clockify/TimeEntryClient.hpp>
#include <store/EntryStore.hpp>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <format>
#include <functional>
#include <iterator>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <vector>

namespace clockr::test
{

/// @brief Records every create request; fails the calls whose index is listed.
///
/// Calls listed in blockingCalls wait until their stop token fires and then
/// fail as canceled, like a request aborted mid-transfer.
class FakeTimeEntryClient: public clockify::TimeEntryClient
{
  public:
    explicit FakeTimeEntryClient(std::set<std::size_t> failing = {}): failingCalls(std::move(failing)) {}

    auto createTimeEntry(std::string_view workspaceId,
                         clockify::TimeEntryRequest const& request,
                         std::stop_token stopToken) -> Result<clockify::TimeEntry> override
    {
        auto const index = requests.size();
        workspaces.emplace_back(workspaceId);
        requests.push_back(request);

        if (blockingCalls.contains(index))
        {
            auto lock = std::unique_lock { _mutex };
            _blocked = true;
            _blockedChanged.notify_all();
            _blockedChanged.wait(lock, stopToken, [] { return false; });
            return makeError(ErrorCode::Cancelled, "POST /time-entries: canceled");
        }

        if (failingCalls.contains(index))
            return makeError(ErrorCode::ApiError, "API error (status 500): boom");
        return clockify::TimeEntry {
            .id = std::format("ce-{}", index + 1),
            .description = request.description,
            .projectId = request.projectId,
        };
    }

    /// @brief Waits until a blocking call has started.
    void waitUntilBlocked()
    {
        auto lock = std::unique_lock { _mutex };
        _blockedChanged.wait(lock, [this] { return _blocked; });
    }

    std::set<std::size_t> failingCalls;
    std::set<std::size_t> blockingCalls;
    std::vector<std::string> workspaces;
    std::vector<clockify::TimeEntryRequest> requests;

  private:
    std::mutex _mutex;
    std::condition_variable_any _blockedChanged;
    bool _blocked = false;
};

/// @brief EntryStore keeping everything in a vector.
class MemoryEntryStore: public store::EntryStore
{
  public:
    auto insert(store::Entry const& entry) -> Result<std::int64_t> override
    {
        if (failInserts)
            return makeError(ErrorCode::StorageError, "disk full");
        auto stored = entry;
        stored.id = static_cast<std::int64_t>(entries.size()) + 1;
        entries.push_back(stored);
        return stored.id;
    }

    auto updateStatus(std::int64_t id, store::EntryStatus status, std::string_view clockifyId) -> VoidResult override
    {
        for (auto& entry: entries)
        {
            if (entry.id != id)
                continue;
            entry.status = status;
            entry.clockifyId = std::string(clockifyId);
            return {};
        }
        return makeError(ErrorCode::StorageError, std::format("no entry with id {}", id));
    }

    auto todayEntries() -> Result<std::vector<store::Entry>> override { return entries; }

    auto lastLogged() -> Result<std::optional<store::Entry>> override
    {
        for (auto it = entries.rbegin(); it != entries.rend(); ++it)
            if (it->status == store::EntryStatus::Logged)
                return std::optional<store::Entry> { *it };
        return std::optional<store::Entry> {};
    }

    auto failedEntries() -> Result<std::vector<store::Entry>> override
    {
        auto result = std::vector<store::Entry> {};
        std::ranges::copy_if(
            entries, std::back_inserter(result), [](auto const& e) { return e.status == store::EntryStatus::Failed; });
        return result;
    }

    auto lastRawInput() -> Result<std::string> override
    {
        return entries.empty() ? std::string {} : entries.back().rawInput;
    }

    bool failInserts = false;
    std::vector<store::Entry> entries;
};

/// @brief Matcher whose behaviour is supplied by the test.
///
/// Without a handler the call fails with an AiError.
class FakeMatcher: public ai::Matcher
{
  public:
    using SingleHandler =
        std::function<Result<ai::Suggestion>(ai::MatchRequest const&, ai::ThinkingCallback const&, std::stop_token)>;
    using BatchHandler = std::function<Result<ai::BatchSuggestion>(ai::BatchMatchRequest const&,
                                                                   ai::ThinkingCallback const&,
                                                                   std::stop_token)>;

    auto matchSingle(ai::MatchRequest const& request, ai::ThinkingCallback const& onThinking, std::stop_token stop)
        -> Result<ai::Suggestion> override
    {
        singleRequests.push_back(request);
        if (!onSingle)
            return makeError(ErrorCode::AiError, "no single handler");
        return onSingle(request, onThinking, std::move(stop));
    }

    auto matchBatch(ai::BatchMatchRequest const& request,
                    ai::ThinkingCallback const& onThinking,
                    std::stop_token stop) -> Result<ai::BatchSuggestion> override
    {
        batchRequests.push_back(request);
        if (!onBatch)
            return makeError(ErrorCode::AiError, "no batch handler");
        return onBatch(request, onThinking, std::move(stop));
    }

    SingleHandler onSingle;
    BatchHandler onBatch;
    std::vector<ai::MatchRequest> singleRequests;
    std::vector<ai::BatchMatchRequest> batchRequests;
};

/// @brief HttpClient answering from a script of canned responses.
///
/// Once the script runs out the last response is repeated.
class FakeHttpClient: public clockify::HttpClient
{
  public:
    auto send(clockify::HttpRequest const& request) -> Result<clockify::HttpResponse> override
    {
        requests.push_back(request);
        if (responses.empty())
            return makeError(ErrorCode::TransportError, "no scripted response");
        auto response = responses.front();
        if (responses.size() > 1)
            responses.pop_front();
        return response;
    }

    void reply(int status, std::string body)
    {
        responses.emplace_back(clockify::HttpResponse { .status = status, .body = std::move(body) });
    }

    void failTransport(std::string message)
    {
        responses.emplace_back(std::unexpected(Error { ErrorCode::TransportError, std::move(message) }));
    }

    std::deque<Result<clockify::HttpResponse>> responses;
    std::vector<clockify::HttpRequest> requests;
};

} // namespace clockr::test
