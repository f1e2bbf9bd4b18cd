// SPDX-License-Identifier: Apache-2.0
#include "Commands.hpp"
#include "Schedule.hpp"

#include <format>

namespace clockr
{

auto validateLogOptions(LogOptions const& options) -> VoidResult
{
    if (options.from.empty() != options.to.empty())
        return makeError(ErrorCode::InvalidArgument, "both --from and --to must be provided together");
    if (options.same && options.isBatch())
        return makeError(ErrorCode::InvalidArgument, "--same cannot be combined with --from/--to");
    if (options.same && options.repeat)
        return makeError(ErrorCode::InvalidArgument, "--same cannot be combined with --repeat");
    return {};
}

auto entryProjectLabel(store::Entry const& entry) -> std::string
{
    if (entry.clientName.empty())
        return entry.projectName;
    return entry.clientName + " / " + entry.projectName;
}

auto formatStatusLine(store::Entry const& entry) -> std::string
{
    return std::format("  {}–{}  {}min  {:<30}  {}  [{}]",
                       formatLocalClock(entry.start),
                       formatLocalClock(entry.end),
                       entry.minutes,
                       entryProjectLabel(entry),
                       entry.description,
                       toString(entry.status));
}

auto formatStatusTotal(int totalMinutes, std::size_t entryCount) -> std::string
{
    return std::format("Total: {}h {}min ({} entries)", totalMinutes / 60, totalMinutes % 60, entryCount);
}

auto formatScheduleHint(TimePoint now, ScheduleConfig const& schedule) -> std::string
{
    if (!isWorkTime(now, schedule))
        return "Outside working hours.";
    return std::format("Next interval ends at {}.",
                       formatLocalClock(nextAlignedTick(now, schedule.intervalMinutes)));
}

auto formatProjectLine(clockify::Project const& project) -> std::string
{
    return std::format("  {}  {}", project.id, project.displayName());
}

auto formatLoggedLine(store::Entry const& entry) -> std::string
{
    return std::format("Logged: {} - {} ({}min) [{}]",
                       entryProjectLabel(entry),
                       entry.description,
                       entry.minutes,
                       toString(entry.status));
}

auto formatSkippedOutcome(std::vector<store::Entry> const& entries, std::string_view skippedMessage)
    -> std::string
{
    if (entries.empty())
        return std::string(skippedMessage);

    auto out = std::format("Submission canceled after {} entries:", entries.size());
    for (auto const& entry: entries)
        out += "\n" + formatLoggedLine(entry);
    return out;
}

} // namespace clockr
