// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ai/Models.hpp>
#include <tui/InputEvent.hpp>
#include <tui/Theme.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace clockr::review
{

/// @brief What the user asked for on the suggestion screen.
enum class ReviewAction : std::uint8_t
{
    None,
    Accept,
    Edit,
    Retry,
    Skip,
};

/// @brief Allocations of one day, in order of first appearance.
struct DayGroup
{
    std::string date;
    std::vector<std::size_t> indices; ///< Positions in the flat allocation list.
    int totalMinutes = 0;
};

/// @brief Groups batch allocations by date, keeping the order in which dates first appear.
[[nodiscard]] auto groupByDate(std::vector<ai::BatchAllocation> const& allocations) -> std::vector<DayGroup>;

/// @brief Presents an AI suggestion and maps keys to review actions.
///
/// When the suggestion carries a clarification only retry and skip are
/// offered, even if allocations are present as well. The cursor is an index
/// into the flat allocation list and always stays within its bounds.
template <typename A>
class SuggestionReviewer
{
  public:
    explicit SuggestionReviewer(ai::SuggestionOf<A> suggestion);

    [[nodiscard]] auto handleKey(tui::KeyEvent const& key) -> ReviewAction;

    [[nodiscard]] auto cursor() const noexcept -> std::size_t { return _cursor; }
    [[nodiscard]] auto hasClarification() const noexcept -> bool { return _suggestion.needsClarification(); }
    [[nodiscard]] auto suggestion() const noexcept -> ai::SuggestionOf<A> const& { return _suggestion; }
    [[nodiscard]] auto allocations() const noexcept -> std::vector<A> const& { return _suggestion.allocations; }

    /// @brief Moves the allocation list out, e.g. to hand it to the editor.
    [[nodiscard]] auto takeAllocations() -> std::vector<A>;

    /// @brief Installs an edited allocation list and re-clamps the cursor.
    void replaceAllocations(std::vector<A> allocations);

    [[nodiscard]] auto render(tui::Theme const& theme) const -> std::string;

  private:
    void clampCursor() noexcept;

    ai::SuggestionOf<A> _suggestion;
    std::size_t _cursor = 0;
};

extern template class SuggestionReviewer<ai::Allocation>;
extern template class SuggestionReviewer<ai::BatchAllocation>;

} // namespace clockr::review
