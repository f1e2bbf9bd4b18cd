// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Time.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace clockr::ai
{

/// @brief A proposed slice of a work interval booked to one project.
struct Allocation
{
    std::string projectId;
    std::string projectName;
    std::string clientName; ///< Optional.
    int minutes = 0;
    std::string description;
    double confidence = 0.0; ///< In [0, 1].
};

/// @brief An allocation tagged with the day and local time window it covers.
struct BatchAllocation
{
    std::string date;      ///< YYYY-MM-DD
    std::string startTime; ///< HH:MM (local)
    std::string endTime;   ///< HH:MM (local)
    std::string projectId;
    std::string projectName;
    std::string clientName;
    int minutes = 0;
    std::string description;
    double confidence = 0.0;
};

/// @brief The AI's proposal for an interval, or a request for clarification.
///
/// When a clarification is present the allocations are to be ignored.
template <typename A>
struct SuggestionOf
{
    using AllocationType = A;

    std::vector<A> allocations;
    std::string clarification;

    [[nodiscard]] auto needsClarification() const noexcept -> bool { return !clarification.empty(); }
};

using Suggestion = SuggestionOf<Allocation>;
using BatchSuggestion = SuggestionOf<BatchAllocation>;

/// @brief One work day of a batch request.
struct DaySlot
{
    std::string date;    ///< YYYY-MM-DD
    std::string weekday; ///< "Monday", ...
    TimePoint workStart {};
    TimePoint workEnd {};
    int totalMinutes = 0;
    std::vector<std::string> calendarEvents;
    std::vector<std::string> commitContext;
};

/// @brief Decodes a single-interval suggestion from its JSON text.
///
/// Unless a clarification is requested every allocation must have positive
/// minutes; confidence is clamped to [0, 1]. On failure the error message
/// carries a bounded preview of @p text.
[[nodiscard]] auto decodeSuggestion(std::string_view text) -> Result<Suggestion>;

/// @brief Decodes a batch suggestion from its JSON text.
[[nodiscard]] auto decodeBatchSuggestion(std::string_view text) -> Result<BatchSuggestion>;

[[nodiscard]] auto toJson(Allocation const& allocation) -> nlohmann::json;
[[nodiscard]] auto toJson(BatchAllocation const& allocation) -> nlohmann::json;

/// @brief Maximum number of raw bytes quoted in parse error messages.
inline constexpr auto ParsePreviewLength = std::size_t { 1000 };

} // namespace clockr::ai
