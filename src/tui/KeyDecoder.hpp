// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/InputEvent.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace clockr::tui
{

/// @brief Incremental decoder turning raw terminal bytes into input events.
///
/// Understands control characters, CSI and SS3 cursor/editing keys with
/// xterm modifier parameters, bracketed paste and UTF-8. A lone ESC is held
/// back until timeout() because it may start a longer sequence.
class KeyDecoder
{
  public:
    /// @brief Feeds raw bytes and returns the events completed by them.
    [[nodiscard]] auto feed(std::string_view data) -> std::vector<InputEvent>;

    /// @brief Resolves a pending lone ESC after no further input arrived.
    [[nodiscard]] auto timeout() -> std::vector<InputEvent>;

    /// @brief True while the decoder holds back an incomplete sequence.
    [[nodiscard]] auto pending() const noexcept -> bool { return _state != State::Ground; }

  private:
    enum class State : std::uint8_t
    {
        Ground,
        Escape,
        Csi,
        Ss3,
        Paste,
        Utf8,
    };

    void onGround(std::uint8_t byte, std::vector<InputEvent>& events);
    void onEscape(std::uint8_t byte, std::vector<InputEvent>& events);
    void onCsi(std::uint8_t byte, std::vector<InputEvent>& events);
    void onSs3(std::uint8_t byte, std::vector<InputEvent>& events);
    void onPaste(std::uint8_t byte, std::vector<InputEvent>& events);
    void onUtf8(std::uint8_t byte, std::vector<InputEvent>& events);

    void finishCsi(char finalByte, std::vector<InputEvent>& events);

    State _state = State::Ground;
    std::string _sequence;  ///< CSI parameters or pending UTF-8 bytes.
    std::string _paste;     ///< Bracketed paste content.
    int _utf8Remaining = 0;
};

} // namespace clockr::tui
