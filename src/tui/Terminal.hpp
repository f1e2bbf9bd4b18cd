// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <vector>

#include <termios.h>

#include <tui/InputEvent.hpp>
#include <tui/KeyDecoder.hpp>
#include <tui/TerminalOutput.hpp>

namespace clockr::tui
{

/// @brief Owns the controlling terminal while an interactive session runs.
///
/// Puts stdin into raw mode, switches to the alternate screen with bracketed
/// paste enabled and decodes keyboard input through KeyDecoder. SIGWINCH and
/// cross-thread wakeups are delivered through a self-pipe so poll() returns
/// promptly for either.
class Terminal
{
  public:
    Terminal();
    ~Terminal();

    Terminal(Terminal const&) = delete;
    auto operator=(Terminal const&) -> Terminal& = delete;
    Terminal(Terminal&&) = delete;
    auto operator=(Terminal&&) -> Terminal& = delete;

    /// @brief Enters raw mode and the alternate screen and installs the SIGWINCH handler.
    /// @return Success or an IoError.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Restores the terminal to the state found by initialize().
    void shutdown();

    /// @brief Returns a reference to the output subsystem.
    [[nodiscard]] auto output() noexcept -> TerminalOutput&;

    /// @brief Polls for input events with the given timeout.
    /// @param timeoutMs -1 = block, 0 = non-blocking, >0 = timeout in ms.
    /// @return Decoded events (empty on timeout or wakeup).
    [[nodiscard]] auto poll(int timeoutMs = -1) -> std::vector<InputEvent>;

    /// @brief Interrupts a blocking poll() from another thread.
    void wake() noexcept;

    /// @brief Returns terminal width in columns.
    [[nodiscard]] auto columns() const noexcept -> int;

    /// @brief Returns terminal height in rows.
    [[nodiscard]] auto rows() const noexcept -> int;

    /// @brief Called from the SIGWINCH handler.
    void notifyResize() noexcept;

  private:
    KeyDecoder _decoder;
    TerminalOutput _output;
    int _fd = 0; // STDIN_FILENO
    struct termios _origTermios {};
    bool _rawMode = false;
    bool _initialized = false;
    int _notifyPipe[2] = { -1, -1 }; ///< Self-pipe for SIGWINCH and wakeups.

    void enableRawMode();
    void disableRawMode();
};

} // namespace clockr::tui
