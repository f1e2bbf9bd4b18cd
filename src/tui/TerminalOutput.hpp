// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace clockr::tui
{

/// @brief RGB color representation.
struct RgbColor
{
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
};

/// @brief Color representation: default, 256-color index, or true color (RGB).
using Color = std::variant<std::monostate, std::uint8_t, RgbColor>;

/// @brief Text styling attributes for terminal output.
struct Style
{
    Color fg;                   ///< Foreground color.
    Color bg;                   ///< Background color.
    bool bold = false;          ///< Bold text.
    bool italic = false;        ///< Italic text.
    bool underline = false;     ///< Underlined text.
    bool strikethrough = false; ///< Strikethrough text.
    bool dim = false;           ///< Dim/faint text.
    bool inverse = false;       ///< Inverse/reverse video.

    /// @brief True if no attribute or color is set.
    [[nodiscard]] auto isPlain() const noexcept -> bool;
};

/// @brief Returns the SGR sequence selecting @p style, or an empty string for a plain style.
[[nodiscard]] auto sgr(Style const& style) -> std::string;

/// @brief Wraps @p text in the SGR sequence for @p style and a trailing reset.
///
/// Plain styles return the text unchanged, so rendering with an uncolored
/// theme produces no escape sequences at all.
[[nodiscard]] auto styled(std::string_view text, Style const& style) -> std::string;

/// @brief RAII guard for synchronized terminal output.
///
/// Uses CSI ?2026h/l (synchronized output mode) to prevent tearing.
/// The constructor writes the begin sequence, the destructor writes the end sequence.
class SyncGuard
{
  public:
    /// @brief Begins synchronized output mode.
    /// @param fd File descriptor to write to (typically STDOUT_FILENO).
    explicit SyncGuard(int fd);

    /// @brief Ends synchronized output mode.
    ~SyncGuard();

    SyncGuard(SyncGuard const&) = delete;
    auto operator=(SyncGuard const&) -> SyncGuard& = delete;
    SyncGuard(SyncGuard&&) = delete;
    auto operator=(SyncGuard&&) -> SyncGuard& = delete;

  private:
    int _fd;
};

/// @brief Buffered terminal output with cursor and screen control.
class TerminalOutput
{
  public:
    /// @brief Initializes the terminal output by querying terminal dimensions.
    /// @return Success or IoError.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Writes styled text at the current cursor position.
    void write(std::string_view text, Style const& style = {});

    /// @brief Writes raw text without styling.
    void writeRaw(std::string_view text);

    /// @brief Moves the cursor to an absolute position (1-based).
    void moveTo(int row, int col);

    /// @brief Clears from cursor to end of line.
    void clearToEndOfLine();

    /// @brief Clears from cursor to end of screen.
    void clearToEndOfScreen();

    /// @brief Clears the entire screen.
    void clearScreen();

    void enterAltScreen();
    void leaveAltScreen();

    /// @brief Creates a synchronized output guard.
    [[nodiscard]] auto syncGuard() -> SyncGuard;

    void showCursor();
    void hideCursor();

    /// @brief Enables bracketed paste mode (CSI ?2004h).
    void enableBracketedPaste();

    /// @brief Disables bracketed paste mode (CSI ?2004l).
    void disableBracketedPaste();

    /// @brief Flushes the internal buffer to stdout.
    void flush();

    /// @brief Returns the terminal width in columns.
    [[nodiscard]] auto columns() const noexcept -> int;

    /// @brief Returns the terminal height in rows.
    [[nodiscard]] auto rows() const noexcept -> int;

    /// @brief Updates the cached terminal dimensions.
    void updateDimensions();

  private:
    std::string _buffer; ///< Output buffer for batching writes.
    int _cols = 80;
    int _rows = 24;
};

} // namespace clockr::tui
