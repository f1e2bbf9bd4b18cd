// SPDX-License-Identifier: Apache-2.0
#include <tui/KeyDecoder.hpp>

#include <charconv>
#include <optional>
#include <ranges>

namespace clockr::tui
{

namespace
{
    constexpr auto PasteStart = std::string_view { "200" };
    constexpr auto PasteEnd = std::string_view { "\033[201~" };

    auto splitParams(std::string_view text) -> std::vector<int>
    {
        auto params = std::vector<int> {};
        for (auto const part: text | std::views::split(';'))
        {
            auto const sv = std::string_view(part.begin(), part.end());
            auto value = 0;
            auto const [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
            params.push_back(ec == std::errc {} ? value : 0);
        }
        return params;
    }

    /// xterm encodes modifiers as 1 + shift + 2*alt + 4*ctrl.
    constexpr auto modifiersFromParam(int param) noexcept -> Modifier
    {
        if (param <= 1)
            return Modifier::None;
        auto const bits = param - 1;
        auto mods = Modifier::None;
        if (bits & 1)
            mods = mods | Modifier::Shift;
        if (bits & 2)
            mods = mods | Modifier::Alt;
        if (bits & 4)
            mods = mods | Modifier::Ctrl;
        return mods;
    }

    constexpr auto cursorKey(char finalByte) noexcept -> std::optional<KeyCode>
    {
        switch (finalByte)
        {
            case 'A': return KeyCode::Up;
            case 'B': return KeyCode::Down;
            case 'C': return KeyCode::Right;
            case 'D': return KeyCode::Left;
            case 'H': return KeyCode::Home;
            case 'F': return KeyCode::End;
            default: return std::nullopt;
        }
    }

    constexpr auto tildeKey(int code) noexcept -> std::optional<KeyCode>
    {
        switch (code)
        {
            case 1:
            case 7: return KeyCode::Home;
            case 3: return KeyCode::Delete;
            case 4:
            case 8: return KeyCode::End;
            case 5: return KeyCode::PageUp;
            case 6: return KeyCode::PageDown;
            default: return std::nullopt;
        }
    }

    auto decodeUtf8(std::string_view bytes) noexcept -> char32_t
    {
        auto const* const b = reinterpret_cast<std::uint8_t const*>(bytes.data());
        switch (bytes.size())
        {
            case 2: return static_cast<char32_t>(((b[0] & 0x1F) << 6) | (b[1] & 0x3F));
            case 3: return static_cast<char32_t>(((b[0] & 0x0F) << 12) | ((b[1] & 0x3F) << 6) | (b[2] & 0x3F));
            case 4:
                return static_cast<char32_t>(((b[0] & 0x07) << 18) | ((b[1] & 0x3F) << 12) | ((b[2] & 0x3F) << 6)
                                             | (b[3] & 0x3F));
            default: return 0;
        }
    }
} // namespace

auto KeyDecoder::feed(std::string_view data) -> std::vector<InputEvent>
{
    auto events = std::vector<InputEvent> {};
    for (auto const ch: data)
    {
        auto const byte = static_cast<std::uint8_t>(ch);
        switch (_state)
        {
            case State::Ground: onGround(byte, events); break;
            case State::Escape: onEscape(byte, events); break;
            case State::Csi: onCsi(byte, events); break;
            case State::Ss3: onSs3(byte, events); break;
            case State::Paste: onPaste(byte, events); break;
            case State::Utf8: onUtf8(byte, events); break;
        }
    }
    return events;
}

auto KeyDecoder::timeout() -> std::vector<InputEvent>
{
    auto events = std::vector<InputEvent> {};
    if (_state == State::Escape)
    {
        events.emplace_back(specialKey(KeyCode::Escape));
        _state = State::Ground;
    }
    return events;
}

void KeyDecoder::onGround(std::uint8_t byte, std::vector<InputEvent>& events)
{
    switch (byte)
    {
        case 0x1B: _state = State::Escape; return;
        case '\r':
        case '\n': events.emplace_back(specialKey(KeyCode::Enter)); return;
        case '\t': events.emplace_back(specialKey(KeyCode::Tab)); return;
        case 0x08:
        case 0x7F: events.emplace_back(specialKey(KeyCode::Backspace)); return;
        default: break;
    }

    if (byte < 0x20)
    {
        // Ctrl+letter arrives as letter - 'a' + 1.
        events.emplace_back(charKey(static_cast<char32_t>(byte + 'a' - 1), Modifier::Ctrl));
        return;
    }

    if (byte < 0x80)
    {
        events.emplace_back(charKey(static_cast<char32_t>(byte)));
        return;
    }

    if ((byte & 0xE0) == 0xC0)
        _utf8Remaining = 1;
    else if ((byte & 0xF0) == 0xE0)
        _utf8Remaining = 2;
    else if ((byte & 0xF8) == 0xF0)
        _utf8Remaining = 3;
    else
        return; // stray continuation or invalid lead byte

    _sequence.assign(1, static_cast<char>(byte));
    _state = State::Utf8;
}

void KeyDecoder::onEscape(std::uint8_t byte, std::vector<InputEvent>& events)
{
    _state = State::Ground;
    switch (byte)
    {
        case '[':
            _sequence.clear();
            _state = State::Csi;
            return;
        case 'O': _state = State::Ss3; return;
        case '\r':
        case '\n': events.emplace_back(specialKey(KeyCode::Enter, Modifier::Alt)); return;
        default: break;
    }

    if (byte >= 0x20 && byte < 0x7F)
    {
        events.emplace_back(charKey(static_cast<char32_t>(byte), Modifier::Alt));
        return;
    }

    // ESC followed by something that cannot extend it: a real Escape press.
    events.emplace_back(specialKey(KeyCode::Escape));
    onGround(byte, events);
}

void KeyDecoder::onCsi(std::uint8_t byte, std::vector<InputEvent>& events)
{
    if (byte >= 0x20 && byte <= 0x3F)
    {
        _sequence += static_cast<char>(byte);
        return;
    }

    _state = State::Ground;
    if (byte >= 0x40 && byte <= 0x7E)
        finishCsi(static_cast<char>(byte), events);
}

void KeyDecoder::finishCsi(char finalByte, std::vector<InputEvent>& events)
{
    if (finalByte == '~' && _sequence == PasteStart)
    {
        _paste.clear();
        _state = State::Paste;
        return;
    }

    // Private-mode replies (ESC[?...) are not keys.
    if (!_sequence.empty() && (_sequence.front() < '0' || _sequence.front() > ';'))
        return;

    auto const params = splitParams(_sequence);
    auto const modifiers = params.size() >= 2 ? modifiersFromParam(params[1]) : Modifier::None;

    if (finalByte == 'Z')
    {
        events.emplace_back(specialKey(KeyCode::BackTab, modifiers));
        return;
    }
    if (finalByte == '~')
    {
        if (auto const key = tildeKey(params.empty() ? 0 : params[0]))
            events.emplace_back(specialKey(*key, modifiers));
        return;
    }
    if (auto const key = cursorKey(finalByte))
        events.emplace_back(specialKey(*key, modifiers));
}

void KeyDecoder::onSs3(std::uint8_t byte, std::vector<InputEvent>& events)
{
    _state = State::Ground;
    if (auto const key = cursorKey(static_cast<char>(byte)))
        events.emplace_back(specialKey(*key));
}

void KeyDecoder::onPaste(std::uint8_t byte, std::vector<InputEvent>& events)
{
    _paste += static_cast<char>(byte);
    if (_paste.ends_with(PasteEnd))
    {
        _paste.resize(_paste.size() - PasteEnd.size());
        events.emplace_back(PasteEvent { .text = std::move(_paste) });
        _paste.clear();
        _state = State::Ground;
    }
}

void KeyDecoder::onUtf8(std::uint8_t byte, std::vector<InputEvent>& events)
{
    if ((byte & 0xC0) != 0x80)
    {
        _state = State::Ground;
        onGround(byte, events);
        return;
    }

    _sequence += static_cast<char>(byte);
    if (--_utf8Remaining > 0)
        return;

    _state = State::Ground;
    if (auto const cp = decodeUtf8(_sequence); cp != 0)
        events.emplace_back(charKey(cp));
}

} // namespace clockr::tui
