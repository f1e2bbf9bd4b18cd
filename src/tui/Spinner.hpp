// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/TerminalOutput.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace clockr::tui
{

/// @brief Predefined spinner animation patterns.
enum class SpinnerType : std::uint8_t
{
    Dots, ///< ⠋ ⠙ ⠹ ⠸ ⠼ ⠴ ⠦ ⠧ ⠇ ⠏
    Line, ///< - \ | /
};

/// @brief Returns the frames for a given spinner type.
[[nodiscard]] auto spinnerFrames(SpinnerType type) -> std::span<std::string_view const>;

/// @brief A loading spinner animation.
///
/// The spinner does not keep time itself. The owner calls advance() on each
/// tick it receives, which keeps rendering deterministic under test.
class Spinner
{
  public:
    explicit Spinner(SpinnerType type = SpinnerType::Dots);

    /// @brief Moves to the next frame.
    void advance() noexcept;

    /// @brief Returns the current frame as a string.
    [[nodiscard]] auto currentFrame() const noexcept -> std::string_view;

    [[nodiscard]] auto frameIndex() const noexcept -> std::size_t { return _frameIndex; }

    /// @brief Resets the spinner to the first frame.
    void reset() noexcept { _frameIndex = 0; }

    /// @brief Renders the current frame followed by a space and @p label.
    [[nodiscard]] auto renderWithLabel(std::string_view label,
                                       Style const& spinnerStyle = {},
                                       Style const& labelStyle = {}) const -> std::string;

  private:
    std::span<std::string_view const> _frames;
    std::size_t _frameIndex = 0;
};

} // namespace clockr::tui
