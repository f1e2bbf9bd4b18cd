// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <clockify/Models.hpp>

#include <stop_token>
#include <string_view>

namespace clockr::clockify
{

/// @brief The part of the time-tracking API the submission step depends on.
class TimeEntryClient
{
  public:
    virtual ~TimeEntryClient() = default;

    /// @brief Creates a time entry in the given workspace.
    ///
    /// Once @p stopToken fires, the request and any pending retry are abandoned
    /// and the call fails with ErrorCode::Cancelled.
    /// @return The created entry (carrying its external id) or an error.
    [[nodiscard]] virtual auto createTimeEntry(std::string_view workspaceId,
                                               TimeEntryRequest const& request,
                                               std::stop_token stopToken) -> Result<TimeEntry> = 0;
};

} // namespace clockr::clockify
