// SPDX-License-Identifier: Apache-2.0
#include <review/AllocationEditor.hpp>

#include <tui/Text.hpp>

#include <algorithm>
#include <charconv>
#include <format>
#include <type_traits>

namespace clockr::review
{

namespace
{
    template <typename A>
    constexpr bool IsBatch = std::is_same_v<A, ai::BatchAllocation>;

    auto formatEditLine(ai::Allocation const& a, std::string_view prefix) -> std::string
    {
        return std::format("{}{}  {:3}min  {}", prefix, tui::padRight(a.projectName, 20), a.minutes, a.description);
    }

    auto formatEditLine(ai::BatchAllocation const& a, std::string_view prefix) -> std::string
    {
        return std::format("{}{} {}  {:3}min  {}–{}  {}",
                           prefix,
                           a.date,
                           tui::padRight(a.projectName, 20),
                           a.minutes,
                           a.startTime,
                           a.endTime,
                           a.description);
    }
} // namespace

auto parsePositiveMinutes(std::string_view text) noexcept -> int
{
    auto value = 0;
    auto const* const end = text.data() + text.size();
    auto const [ptr, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc {} || ptr != end || value <= 0)
        return 0;
    return value;
}

template <typename A>
AllocationEditor<A>::AllocationEditor(std::vector<A> allocations, FuzzyProjectIndex const& projects):
    _allocations(std::move(allocations)), _projects(&projects)
{
    _input.setCharLimit(FieldCharLimit);
}

template <typename A>
auto AllocationEditor<A>::handleKey(tui::KeyEvent const& key) -> bool
{
    return _editing ? handleEditingKey(key) : handleNavigatingKey(key);
}

template <typename A>
auto AllocationEditor<A>::handlePaste(std::string_view text) -> bool
{
    if (!_editing)
        return false;
    static_cast<void>(_input.processEvent(tui::PasteEvent { .text = std::string(text) }));
    if (_field == EditField::Project)
        refilter();
    return true;
}

template <typename A>
auto AllocationEditor<A>::handleNavigatingKey(tui::KeyEvent const& key) -> bool
{
    using tui::KeyCode;

    if (key.is(KeyCode::Up) || key.isChar('k'))
    {
        if (_cursor > 0)
            --_cursor;
        return true;
    }
    if (key.is(KeyCode::Down) || key.isChar('j'))
    {
        if (_cursor + 1 < _allocations.size())
            ++_cursor;
        return true;
    }
    if (key.is(KeyCode::Tab))
    {
        auto const next = (static_cast<std::size_t>(_field) + 1) % EditorTraits<A>::FieldCount;
        _field = static_cast<EditField>(next);
        return true;
    }
    if (key.is(KeyCode::Enter) && !_allocations.empty())
    {
        beginEdit();
        return true;
    }
    return false;
}

template <typename A>
auto AllocationEditor<A>::handleEditingKey(tui::KeyEvent const& key) -> bool
{
    if (key.is(tui::KeyCode::Enter))
    {
        commitEdit();
        endEdit();
        return true;
    }
    if (key.is(tui::KeyCode::Escape))
    {
        endEdit();
        return true;
    }

    auto const action = _input.processEvent(key);
    if (_field == EditField::Project)
        refilter();
    return action != tui::InputFieldAction::None;
}

template <typename A>
void AllocationEditor<A>::beginEdit()
{
    auto const& allocation = _allocations[_cursor];
    _editing = true;

    switch (_field)
    {
        case EditField::Project:
            _input.setText("");
            _input.setPlaceholder("Search project...");
            _filtered = _projects->projects();
            break;
        case EditField::Minutes:
            _input.setText(std::to_string(allocation.minutes));
            _input.setPlaceholder("Minutes");
            break;
        case EditField::Description:
            _input.setText(allocation.description);
            _input.setPlaceholder("Description");
            break;
        case EditField::StartTime:
            if constexpr (IsBatch<A>)
            {
                _input.setText(allocation.startTime);
                _input.setPlaceholder("Start time (HH:MM)");
            }
            break;
        case EditField::EndTime:
            if constexpr (IsBatch<A>)
            {
                _input.setText(allocation.endTime);
                _input.setPlaceholder("End time (HH:MM)");
            }
            break;
    }
}

template <typename A>
void AllocationEditor<A>::commitEdit()
{
    auto& allocation = _allocations[_cursor];
    auto const value = std::string(_input.text());

    switch (_field)
    {
        case EditField::Project:
            if (!_filtered.empty())
            {
                auto const& project = _filtered.front();
                allocation.projectId = project.id;
                allocation.projectName = project.name;
                allocation.clientName = project.clientName;
            }
            break;
        case EditField::Minutes:
            if (auto const minutes = parsePositiveMinutes(value); minutes > 0)
                allocation.minutes = minutes;
            break;
        case EditField::Description:
            if (!value.empty())
                allocation.description = value;
            break;
        case EditField::StartTime:
            if constexpr (IsBatch<A>)
            {
                if (!value.empty())
                    allocation.startTime = value;
            }
            break;
        case EditField::EndTime:
            if constexpr (IsBatch<A>)
            {
                if (!value.empty())
                    allocation.endTime = value;
            }
            break;
    }
}

template <typename A>
void AllocationEditor<A>::endEdit()
{
    _editing = false;
    _input.clear();
    _filtered.clear();
}

template <typename A>
void AllocationEditor<A>::refilter()
{
    _filtered = _projects->filter(_input.text());
}

template <typename A>
auto AllocationEditor<A>::render(tui::Theme const& theme) const -> std::string
{
    auto out = tui::styled(EditorTraits<A>::Title, theme.title);
    out += "\n\n";

    for (auto i = std::size_t { 0 }; i < _allocations.size(); ++i)
    {
        auto const selected = i == _cursor;
        auto const line = formatEditLine(_allocations[i], selected ? "> " : "  ");
        out += selected ? tui::styled(line, theme.highlight) : line;
        out += '\n';
    }

    out += '\n';
    out += std::format("Field: {}\n", tui::styled(editFieldName(_field), theme.selected));

    if (_editing)
    {
        out += _input.render({}, theme.placeholder, theme.cursor);
        out += '\n';

        if (_field == EditField::Project)
        {
            auto const shown = std::min(_filtered.size(), VisibleProjectMatches);
            for (auto i = std::size_t { 0 }; i < shown; ++i)
                out += std::format("  {}\n", tui::styled(_filtered[i].name, theme.dim));
        }
    }

    out += '\n';
    out += tui::styled("Enter: edit field • Tab: next field • j/k: nav • Esc: done editing", theme.help);

    return tui::frame(out, theme.borderStyle, theme.border);
}

template class AllocationEditor<ai::Allocation>;
template class AllocationEditor<ai::BatchAllocation>;

} // namespace clockr::review
