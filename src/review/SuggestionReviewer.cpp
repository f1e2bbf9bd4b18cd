// SPDX-License-Identifier: Apache-2.0
#include <core/Time.hpp>

#include <review/SuggestionReviewer.hpp>

#include <tui/Text.hpp>

#include <format>
#include <unordered_map>

namespace clockr::review
{

namespace
{
    auto confidenceText(double confidence) -> std::string
    {
        return std::format("{:.0f}%", confidence * 100.0);
    }

    auto projectDisplay(ai::Allocation const& a) -> std::string
    {
        if (a.clientName.empty())
            return a.projectName;
        return a.clientName + " / " + a.projectName;
    }

    auto lineFor(ai::Allocation const& a, bool selected, tui::Theme const& theme) -> std::string
    {
        return std::format("{}{}  {:3}min  {}  {}",
                           selected ? "> " : "  ",
                           tui::padRight(projectDisplay(a), 30),
                           a.minutes,
                           tui::styled(confidenceText(a.confidence), theme.dim),
                           a.description);
    }

    auto lineFor(ai::BatchAllocation const& a, bool selected, tui::Theme const& theme) -> std::string
    {
        return std::format("{}{}  {:3}min  {}  {}–{}  {}",
                           selected ? "> " : "  ",
                           tui::padRight(a.projectName, 20),
                           a.minutes,
                           tui::styled(confidenceText(a.confidence), theme.dim),
                           a.startTime,
                           a.endTime,
                           a.description);
    }

    auto dayHeader(DayGroup const& group) -> std::string
    {
        auto weekday = std::string_view {};
        if (auto const date = parseDate(group.date); date)
            weekday = shortWeekdayName(std::chrono::weekday { std::chrono::sys_days { *date } });
        return std::format("{} {} ({} min)", weekday, group.date, group.totalMinutes);
    }
} // namespace

auto groupByDate(std::vector<ai::BatchAllocation> const& allocations) -> std::vector<DayGroup>
{
    auto groups = std::vector<DayGroup> {};
    auto positions = std::unordered_map<std::string, std::size_t> {};

    for (auto i = std::size_t { 0 }; i < allocations.size(); ++i)
    {
        auto const& allocation = allocations[i];
        auto [it, inserted] = positions.try_emplace(allocation.date, groups.size());
        if (inserted)
            groups.push_back(DayGroup { .date = allocation.date });
        auto& group = groups[it->second];
        group.indices.push_back(i);
        group.totalMinutes += allocation.minutes;
    }

    return groups;
}

namespace
{
    auto renderAllocations(std::vector<ai::Allocation> const& allocations, std::size_t cursor, tui::Theme const& theme)
        -> std::string
    {
        auto out = tui::styled("Suggested Allocations", theme.title);
        out += "\n\n";

        for (auto i = std::size_t { 0 }; i < allocations.size(); ++i)
        {
            auto const selected = i == cursor;
            auto const line = lineFor(allocations[i], selected, theme);
            out += selected ? tui::styled(line, theme.highlight) : line;
            out += '\n';
        }

        out += '\n';
        out += tui::styled("[a]ccept • [e]dit • [r]etry • [s]kip", theme.help);
        return out;
    }

    auto renderAllocations(std::vector<ai::BatchAllocation> const& allocations,
                           std::size_t cursor,
                           tui::Theme const& theme) -> std::string
    {
        auto out = tui::styled("Suggested Batch Allocations", theme.title);
        out += "\n\n";

        // The cursor counts rows in display order, which is group-major.
        auto row = std::size_t { 0 };
        for (auto const& group: groupByDate(allocations))
        {
            out += tui::styled(dayHeader(group), theme.subtitle);
            out += '\n';

            for (auto const index: group.indices)
            {
                auto const selected = row == cursor;
                auto const line = lineFor(allocations[index], selected, theme);
                out += selected ? tui::styled(line, theme.highlight) : line;
                out += '\n';
                ++row;
            }
        }

        out += '\n';
        out += tui::styled("[a]ccept all • [e]dit • [r]etry • [s]kip", theme.help);
        return out;
    }
} // namespace

template <typename A>
SuggestionReviewer<A>::SuggestionReviewer(ai::SuggestionOf<A> suggestion): _suggestion(std::move(suggestion))
{
}

template <typename A>
auto SuggestionReviewer<A>::handleKey(tui::KeyEvent const& key) -> ReviewAction
{
    using tui::KeyCode;

    if (key.isChar('r'))
        return ReviewAction::Retry;
    if (key.isChar('s'))
        return ReviewAction::Skip;

    if (hasClarification())
        return ReviewAction::None;

    if (key.isChar('a'))
        return ReviewAction::Accept;
    if (key.isChar('e'))
        return ReviewAction::Edit;

    if (key.is(KeyCode::Up) || key.isChar('k'))
    {
        if (_cursor > 0)
            --_cursor;
    }
    else if (key.is(KeyCode::Down) || key.isChar('j'))
    {
        if (_cursor + 1 < _suggestion.allocations.size())
            ++_cursor;
    }
    return ReviewAction::None;
}

template <typename A>
auto SuggestionReviewer<A>::takeAllocations() -> std::vector<A>
{
    auto allocations = std::move(_suggestion.allocations);
    _suggestion.allocations.clear();
    return allocations;
}

template <typename A>
void SuggestionReviewer<A>::replaceAllocations(std::vector<A> allocations)
{
    _suggestion.allocations = std::move(allocations);
    clampCursor();
}

template <typename A>
void SuggestionReviewer<A>::clampCursor() noexcept
{
    if (_suggestion.allocations.empty())
        _cursor = 0;
    else if (_cursor >= _suggestion.allocations.size())
        _cursor = _suggestion.allocations.size() - 1;
}

template <typename A>
auto SuggestionReviewer<A>::render(tui::Theme const& theme) const -> std::string
{
    if (hasClarification())
    {
        return tui::styled("Clarification needed: ", theme.warning) + _suggestion.clarification + "\n\n"
               + tui::styled("[r]etry with more detail • [s]kip", theme.help);
    }
    return tui::frame(renderAllocations(_suggestion.allocations, _cursor, theme), theme.borderStyle, theme.border);
}

template class SuggestionReviewer<ai::Allocation>;
template class SuggestionReviewer<ai::BatchAllocation>;

} // namespace clockr::review
