// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <tui/InputEvent.hpp>
#include <tui/TerminalOutput.hpp>

namespace clockr::tui
{

/// @brief Result of processing an input event in InputField.
enum class InputFieldAction : std::uint8_t
{
    Changed, ///< Buffer content or cursor changed, re-render needed.
    Submit,  ///< User pressed Enter.
    None,    ///< Event not consumed by InputField.
};

/// @brief Pure-model single-line text editor with Emacs keybindings.
///
/// Accepts InputEvent objects and updates internal state. Operates on grapheme
/// cluster boundaries using libunicode. Pasted line breaks are folded into
/// spaces, and input beyond the character limit (counted in codepoints) is
/// dropped.
class InputField
{
  public:
    static constexpr std::size_t DefaultCharLimit = 5000;

    /// @brief Processes an input event and returns the resulting action.
    [[nodiscard]] auto processEvent(InputEvent const& event) -> InputFieldAction;

    /// @brief Returns the current buffer content.
    [[nodiscard]] auto text() const noexcept -> std::string_view { return _buffer; }

    /// @brief Returns the cursor position as a byte offset into text().
    [[nodiscard]] auto cursor() const noexcept -> std::size_t { return _cursor; }

    /// @brief Clears the buffer and resets cursor to position 0.
    void clear();

    /// @brief Replaces the buffer content and moves the cursor to its end.
    void setText(std::string_view text);

    void setPlaceholder(std::string_view placeholder);
    [[nodiscard]] auto placeholder() const noexcept -> std::string_view { return _placeholder; }

    void setCharLimit(std::size_t limit);
    [[nodiscard]] auto charLimit() const noexcept -> std::size_t { return _charLimit; }

    /// @brief Renders the field with a block cursor.
    ///
    /// An empty buffer shows the placeholder in @p placeholderStyle.
    [[nodiscard]] auto render(Style const& textStyle, Style const& placeholderStyle, Style const& cursorStyle) const
        -> std::string;

  private:
    std::string _buffer;
    std::size_t _cursor = 0;
    std::string _placeholder;
    std::size_t _charLimit = DefaultCharLimit;

    [[nodiscard]] auto handleKey(KeyEvent const& key) -> InputFieldAction;

    void killToEnd();          ///< Ctrl+K: Kill from cursor to end of line.
    void killToStart();        ///< Ctrl+U: Kill from cursor to start of line.
    void killWordBackward();   ///< Alt+Backspace / Ctrl+W: Kill word backward.
    void deleteChar();         ///< Delete / Ctrl+D: Delete character at cursor.
    void deleteCharBackward(); ///< Backspace: Delete character before cursor.
    void moveForwardChar();    ///< Ctrl+F / Right: Move cursor forward one grapheme.
    void moveBackwardChar();   ///< Ctrl+B / Left: Move cursor backward one grapheme.
    void moveForwardWord();    ///< Alt+F / Ctrl+Right: Move cursor forward one word.
    void moveBackwardWord();   ///< Alt+B / Ctrl+Left: Move cursor backward one word.

    /// @brief Inserts UTF-8 text at the cursor, honoring the character limit.
    void insertText(std::string_view text);

    [[nodiscard]] auto nextGraphemeCluster(std::size_t pos) const -> std::size_t;
    [[nodiscard]] auto prevGraphemeCluster(std::size_t pos) const -> std::size_t;
    [[nodiscard]] static auto isWordCharAt(char c) -> bool;
};

} // namespace clockr::tui
