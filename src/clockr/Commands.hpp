// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <clockify/Models.hpp>
#include <core/Error.hpp>
#include <core/Time.hpp>
#include <store/Entry.hpp>

#include "Config.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace clockr
{

/// @brief Flags of `clockr log`.
struct LogOptions
{
    bool same = false;   ///< Re-log the last entry without the AI step.
    bool repeat = false; ///< Pre-fill the input with the last description.
    std::string from;    ///< Batch range start, YYYY-MM-DD.
    std::string to;      ///< Batch range end, YYYY-MM-DD.
    std::string text;    ///< Pre-fills the input; takes precedence over --repeat.

    [[nodiscard]] auto isBatch() const noexcept -> bool { return !from.empty(); }
};

/// @brief Rejects contradictory flag combinations of `clockr log`.
[[nodiscard]] auto validateLogOptions(LogOptions const& options) -> VoidResult;

/// @brief Client and project name of a stored entry, "Client / Project" when a client is known.
[[nodiscard]] auto entryProjectLabel(store::Entry const& entry) -> std::string;

/// @brief "  HH:MM–HH:MM  <n>min  <project>  <description>  [<status>]"
[[nodiscard]] auto formatStatusLine(store::Entry const& entry) -> std::string;

/// @brief "Total: <h>h <m>min (<n> entries)"
[[nodiscard]] auto formatStatusTotal(int totalMinutes, std::size_t entryCount) -> std::string;

/// @brief Describes where the current time sits relative to the work schedule.
[[nodiscard]] auto formatScheduleHint(TimePoint now, ScheduleConfig const& schedule) -> std::string;

/// @brief "  <id>  <client> / <name>", or "  <id>  <name>" without a client.
[[nodiscard]] auto formatProjectLine(clockify::Project const& project) -> std::string;

/// @brief "Logged: <client/project> - <description> (<n>min) [<status>]"
[[nodiscard]] auto formatLoggedLine(store::Entry const& entry) -> std::string;

/// @brief What `clockr log` prints for a skipped session.
///
/// @p skippedMessage alone when nothing was submitted, otherwise a note that
/// the submission was canceled followed by one formatLoggedLine per entry.
[[nodiscard]] auto formatSkippedOutcome(std::vector<store::Entry> const& entries, std::string_view skippedMessage)
    -> std::string;

} // namespace clockr
