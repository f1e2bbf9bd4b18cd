// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ai/Models.hpp>
#include <clockify/Models.hpp>

#include <functional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace clockr::ai
{

/// @brief Receives incremental text while a match call is in flight.
using ThinkingCallback = std::function<void(std::string_view chunk)>;

/// @brief Input for matching a single work interval.
struct MatchRequest
{
    std::string description;
    std::vector<clockify::Project> projects;
    int intervalMinutes = 0;
    std::vector<std::string> contextItems; ///< Calendar, commit and PR summaries.
};

/// @brief Input for matching a multi-day schedule.
struct BatchMatchRequest
{
    std::string description;
    std::vector<clockify::Project> projects;
    std::vector<DaySlot> days;
};

/// @brief An AI backend that turns a work description into project allocations.
///
/// Implementations must return promptly once @p stopToken is triggered.
/// @p onThinking may be empty; when set it is called zero or more times,
/// from the calling thread, before the call returns.
class Matcher
{
  public:
    virtual ~Matcher() = default;

    [[nodiscard]] virtual auto matchSingle(MatchRequest const& request,
                                           ThinkingCallback const& onThinking,
                                           std::stop_token stopToken) -> Result<Suggestion> = 0;

    [[nodiscard]] virtual auto matchBatch(BatchMatchRequest const& request,
                                          ThinkingCallback const& onThinking,
                                          std::stop_token stopToken) -> Result<BatchSuggestion> = 0;
};

} // namespace clockr::ai
