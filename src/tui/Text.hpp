// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/TerminalOutput.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace clockr::tui
{

/// @brief Border character sets for framed blocks.
enum class BorderStyle : std::uint8_t
{
    Single,  ///< ┌─┐│└─┘
    Rounded, ///< ╭─╮│╰─╯
};

/// @brief Characters making up a border.
struct BorderChars
{
    std::string_view horizontal;  ///< Horizontal line (─)
    std::string_view vertical;    ///< Vertical line (│)
    std::string_view topLeft;     ///< Top-left corner
    std::string_view topRight;    ///< Top-right corner
    std::string_view bottomLeft;  ///< Bottom-left corner
    std::string_view bottomRight; ///< Bottom-right corner
};

[[nodiscard]] auto borderChars(BorderStyle style) noexcept -> BorderChars;

/// @brief Returns the number of terminal cells @p text occupies.
///
/// SGR escape sequences count as zero width and every other codepoint as one.
[[nodiscard]] auto displayWidth(std::string_view text) -> int;

/// @brief Pads @p text with spaces on the right up to @p width cells. Longer text is left untouched.
[[nodiscard]] auto padRight(std::string_view text, int width) -> std::string;

/// @brief Splits @p text on '\n'. A trailing newline does not produce an extra empty line.
[[nodiscard]] auto splitLines(std::string_view text) -> std::vector<std::string_view>;

/// @brief Draws a border around a multi-line block.
/// @param content Block to frame, lines separated by '\n'.
/// @param border Border character set.
/// @param borderStyle Style applied to the border characters.
/// @param paddingX Spaces between the border and the content on each side.
[[nodiscard]] auto frame(std::string_view content, BorderStyle border, Style const& borderStyle, int paddingX = 1)
    -> std::string;

} // namespace clockr::tui
