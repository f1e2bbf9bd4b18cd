// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ai/Models.hpp>
#include <clockify/TimeEntryClient.hpp>
#include <core/Error.hpp>
#include <core/Time.hpp>
#include <store/Entry.hpp>
#include <store/EntryStore.hpp>

#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace clockr::review
{

/// @brief Turns accepted allocations into time entries, remotely and locally.
///
/// Every allocation is created through the time entry client and then
/// recorded in the entry store, in order. A failed remote creation is recorded
/// with status Failed and an empty external id, and processing continues.
/// Store failures are logged and do not affect the result. The only hard
/// error is an unparsable batch time window, which is detected before any
/// entry is created, so nothing is persisted in that case.
///
/// Once the stop token fires no further allocation is started. An entry whose
/// creation was canceled in flight is neither created nor recorded. The
/// result then holds the entries processed so far.
class SubmissionPipeline
{
  public:
    /// @param store May be null, in which case nothing is persisted locally.
    SubmissionPipeline(clockify::TimeEntryClient& client, store::EntryStore* store, std::string workspaceId);

    /// @brief Submits allocations for one interval.
    ///
    /// Windows are laid out back to back from @p start, each lasting the
    /// allocation's minutes and clamped to @p end.
    [[nodiscard]] auto submitInterval(std::vector<ai::Allocation> const& allocations,
                                      TimePoint start,
                                      TimePoint end,
                                      std::string_view rawInput,
                                      std::stop_token stopToken = {}) -> Result<std::vector<store::Entry>>;

    /// @brief Submits allocations that carry their own date and local time window.
    [[nodiscard]] auto submitBatch(std::vector<ai::BatchAllocation> const& allocations,
                                   std::string_view rawInput,
                                   std::stop_token stopToken = {}) -> Result<std::vector<store::Entry>>;

    [[nodiscard]] auto workspaceId() const noexcept -> std::string const& { return _workspaceId; }

  private:
    /// @brief Creates @p entry remotely, records the outcome locally and returns the final record.
    /// @return nullopt if the creation was canceled through @p stopToken.
    [[nodiscard]] auto submitEntry(store::Entry entry, std::stop_token const& stopToken)
        -> std::optional<store::Entry>;

    clockify::TimeEntryClient& _client;
    store::EntryStore* _store;
    std::string _workspaceId;
};

} // namespace clockr::review
