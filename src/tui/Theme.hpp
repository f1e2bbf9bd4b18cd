// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/Text.hpp>
#include <tui/TerminalOutput.hpp>

namespace clockr::tui
{

/// @brief Styles used by the review screens.
///
/// Themes are plain values handed to render functions, so a screen can be
/// rendered with plainTheme() in tests and get text free of escape sequences.
struct Theme
{
    Style title;       ///< Screen titles.
    Style subtitle;    ///< Secondary headings and the time range.
    Style success;     ///< Success messages.
    Style error;       ///< Error messages.
    Style warning;     ///< Clarification prompts.
    Style dim;         ///< Confidence percentages and other muted text.
    Style highlight;   ///< The row under the cursor.
    Style selected;    ///< The field being edited.
    Style help;        ///< Key binding hints.
    Style border;      ///< Frame around suggestion lists.
    Style cursor;      ///< Block cursor in text inputs.
    Style placeholder; ///< Placeholder text in empty inputs.
    Style spinner;     ///< Loading spinner.

    BorderStyle borderStyle = BorderStyle::Rounded;
};

/// @brief Returns the default 256-color theme.
[[nodiscard]] auto defaultTheme() -> Theme;

/// @brief Returns a theme without any styling, used when NO_COLOR is set.
[[nodiscard]] auto plainTheme() -> Theme;

} // namespace clockr::tui
