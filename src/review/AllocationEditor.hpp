// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ai/Models.hpp>
#include <clockify/Models.hpp>
#include <tui/InputEvent.hpp>
#include <tui/InputField.hpp>
#include <tui/Theme.hpp>

#include <review/FuzzyProjectIndex.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace clockr::review
{

/// @brief Editable attributes of an allocation, in tab order.
enum class EditField : std::uint8_t
{
    Project,
    Minutes,
    Description,
    StartTime, ///< Batch only.
    EndTime,   ///< Batch only.
};

[[nodiscard]] constexpr auto editFieldName(EditField field) noexcept -> std::string_view
{
    switch (field)
    {
        case EditField::Project: return "Project";
        case EditField::Minutes: return "Minutes";
        case EditField::Description: return "Description";
        case EditField::StartTime: return "Start Time";
        case EditField::EndTime: return "End Time";
    }
    return "";
}

/// @brief Per-allocation-type constants of the editor.
template <typename A>
struct EditorTraits;

template <>
struct EditorTraits<ai::Allocation>
{
    static constexpr std::size_t FieldCount = 3;
    static constexpr std::string_view Title = "Edit Allocations";
};

template <>
struct EditorTraits<ai::BatchAllocation>
{
    static constexpr std::size_t FieldCount = 5;
    static constexpr std::string_view Title = "Edit Batch Allocations";
};

/// @brief Field-level editor over a list of allocations.
///
/// In navigating mode up/down (or k/j) move the allocation cursor, tab cycles
/// the field and enter opens the field for editing. In editing mode keys go to
/// a text input; enter commits and escape discards. Commits are validated:
/// the project field takes the first fuzzy match, minutes must be a positive
/// integer, and text fields must be non-empty. Invalid commits are dropped
/// silently.
///
/// The editor owns its allocation list. It receives the list by value and
/// hands it back through takeAllocations().
template <typename A>
class AllocationEditor
{
  public:
    static constexpr std::size_t FieldCharLimit = 200;
    static constexpr std::size_t VisibleProjectMatches = 5;

    AllocationEditor(std::vector<A> allocations, FuzzyProjectIndex const& projects);

    /// @brief Handles a key press.
    /// @return True if the key was consumed.
    auto handleKey(tui::KeyEvent const& key) -> bool;

    /// @brief Handles pasted text; only meaningful while editing a field.
    auto handlePaste(std::string_view text) -> bool;

    [[nodiscard]] auto isEditing() const noexcept -> bool { return _editing; }
    [[nodiscard]] auto cursor() const noexcept -> std::size_t { return _cursor; }
    [[nodiscard]] auto field() const noexcept -> EditField { return _field; }
    [[nodiscard]] auto inputText() const noexcept -> std::string_view { return _input.text(); }

    /// @brief Projects matching the current project query, in catalog order.
    [[nodiscard]] auto filtered() const noexcept -> std::vector<clockify::Project> const& { return _filtered; }

    [[nodiscard]] auto allocations() const noexcept -> std::vector<A> const& { return _allocations; }

    [[nodiscard]] auto takeAllocations() && -> std::vector<A> { return std::move(_allocations); }

    [[nodiscard]] auto render(tui::Theme const& theme) const -> std::string;

  private:
    auto handleNavigatingKey(tui::KeyEvent const& key) -> bool;
    auto handleEditingKey(tui::KeyEvent const& key) -> bool;
    void beginEdit();
    void commitEdit();
    void endEdit();
    void refilter();

    std::vector<A> _allocations;
    FuzzyProjectIndex const* _projects;
    std::size_t _cursor = 0;
    EditField _field = EditField::Project;
    bool _editing = false;
    tui::InputField _input;
    std::vector<clockify::Project> _filtered;
};

extern template class AllocationEditor<ai::Allocation>;
extern template class AllocationEditor<ai::BatchAllocation>;

/// @brief Parses a strictly positive decimal integer. Anything else yields 0.
[[nodiscard]] auto parsePositiveMinutes(std::string_view text) noexcept -> int;

} // namespace clockr::review
