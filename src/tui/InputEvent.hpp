// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace clockr::tui
{

/// @brief Key codes for keyboard events.
///
/// Printable characters use their Unicode codepoint directly (cast to KeyCode).
/// Non-printable keys use values above the BMP so they never collide with text.
enum class KeyCode : std::uint32_t
{
    Enter = 0x10000,
    Tab,
    BackTab,
    Backspace,
    Delete,
    Escape,
    Up,
    Down,
    Left,
    Right,
    Home,
    End,
    PageUp,
    PageDown,
};

/// @brief Bitmask of keyboard modifier keys.
enum class Modifier : std::uint8_t
{
    None = 0,
    Shift = 1 << 0,
    Alt = 1 << 1,
    Ctrl = 1 << 2,
};

[[nodiscard]] constexpr auto operator|(Modifier lhs, Modifier rhs) noexcept -> Modifier
{
    return static_cast<Modifier>(static_cast<std::uint8_t>(lhs) | static_cast<std::uint8_t>(rhs));
}

[[nodiscard]] constexpr auto operator&(Modifier lhs, Modifier rhs) noexcept -> Modifier
{
    return static_cast<Modifier>(static_cast<std::uint8_t>(lhs) & static_cast<std::uint8_t>(rhs));
}

[[nodiscard]] constexpr auto hasModifier(Modifier mods, Modifier flag) noexcept -> bool
{
    return (mods & flag) != Modifier::None;
}

/// @brief Checks whether a key code represents a printable Unicode character.
[[nodiscard]] constexpr auto isPrintable(KeyCode key) noexcept -> bool
{
    return static_cast<std::uint32_t>(key) < 0x10000 && static_cast<std::uint32_t>(key) >= 32;
}

/// @brief Keyboard input event.
struct KeyEvent
{
    KeyCode key {};                      ///< Key code (printable uses codepoint, special keys use enum).
    Modifier modifiers = Modifier::None; ///< Active modifier keys.
    char32_t codepoint = 0;              ///< Unicode codepoint (0 for non-printable keys).

    /// @brief True for the given special key with no Ctrl/Alt held.
    [[nodiscard]] constexpr auto is(KeyCode code) const noexcept -> bool
    {
        return key == code && !hasModifier(modifiers, Modifier::Ctrl) && !hasModifier(modifiers, Modifier::Alt);
    }

    /// @brief True for a plain character key (no Ctrl/Alt).
    [[nodiscard]] constexpr auto isChar(char32_t ch) const noexcept -> bool
    {
        return codepoint == ch && !hasModifier(modifiers, Modifier::Ctrl) && !hasModifier(modifiers, Modifier::Alt);
    }

    /// @brief True for Ctrl + the given lowercase letter.
    [[nodiscard]] constexpr auto isCtrl(char32_t letter) const noexcept -> bool
    {
        return codepoint == letter && hasModifier(modifiers, Modifier::Ctrl);
    }
};

/// @brief Terminal resize event.
struct ResizeEvent
{
    int columns; ///< New terminal width in columns.
    int rows;    ///< New terminal height in rows.
};

/// @brief Bracketed paste event.
struct PasteEvent
{
    std::string text; ///< Pasted text content.
};

/// @brief Discriminated union of all terminal input events.
using InputEvent = std::variant<KeyEvent, ResizeEvent, PasteEvent>;

/// @brief Builds the event for a plain character key.
[[nodiscard]] constexpr auto charKey(char32_t ch, Modifier modifiers = Modifier::None) noexcept -> KeyEvent
{
    return KeyEvent { .key = static_cast<KeyCode>(ch), .modifiers = modifiers, .codepoint = ch };
}

/// @brief Builds the event for a special key.
[[nodiscard]] constexpr auto specialKey(KeyCode code, Modifier modifiers = Modifier::None) noexcept -> KeyEvent
{
    return KeyEvent { .key = code, .modifiers = modifiers, .codepoint = 0 };
}

} // namespace clockr::tui
