// SPDX-License-Identifier: Apache-2.0
#include <string>

#include <libunicode/utf8_grapheme_segmenter.h>
#include <tui/InputField.hpp>

namespace clockr::tui
{

namespace
{
    auto encodeUtf8(char32_t cp) -> std::string
    {
        auto result = std::string {};
        if (cp < 0x80)
        {
            result += static_cast<char>(cp);
        }
        else if (cp < 0x800)
        {
            result += static_cast<char>(0xC0 | (cp >> 6));
            result += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else if (cp < 0x10000)
        {
            result += static_cast<char>(0xE0 | (cp >> 12));
            result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            result += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else if (cp < 0x110000)
        {
            result += static_cast<char>(0xF0 | (cp >> 18));
            result += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            result += static_cast<char>(0x80 | (cp & 0x3F));
        }
        return result;
    }

    auto isContinuation(char c) -> bool
    {
        return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
    }

    auto nextUtf8(std::string_view s, std::size_t pos) -> std::size_t
    {
        if (pos >= s.size())
            return pos;
        ++pos;
        while (pos < s.size() && isContinuation(s[pos]))
            ++pos;
        return pos;
    }

    auto prevUtf8(std::string_view s, std::size_t pos) -> std::size_t
    {
        if (pos == 0)
            return 0;
        --pos;
        while (pos > 0 && isContinuation(s[pos]))
            --pos;
        return pos;
    }

    auto codepointCount(std::string_view s) -> std::size_t
    {
        auto count = std::size_t { 0 };
        for (auto const c: s)
            if (!isContinuation(c))
                ++count;
        return count;
    }

    /// Returns the byte length of the longest prefix of @p s holding at most @p limit codepoints.
    auto prefixWithCodepoints(std::string_view s, std::size_t limit) -> std::size_t
    {
        auto pos = std::size_t { 0 };
        for (auto i = std::size_t { 0 }; i < limit && pos < s.size(); ++i)
            pos = nextUtf8(s, pos);
        return pos;
    }
} // namespace

auto InputField::processEvent(InputEvent const& event) -> InputFieldAction
{
    if (auto const* key = std::get_if<KeyEvent>(&event))
        return handleKey(*key);

    if (auto const* paste = std::get_if<PasteEvent>(&event))
    {
        auto text = paste->text;
        for (auto& c: text)
            if (c == '\n' || c == '\r' || c == '\t')
                c = ' ';
        insertText(text);
        return InputFieldAction::Changed;
    }

    return InputFieldAction::None;
}

void InputField::clear()
{
    _buffer.clear();
    _cursor = 0;
}

void InputField::setText(std::string_view text)
{
    _buffer = std::string(text.substr(0, prefixWithCodepoints(text, _charLimit)));
    _cursor = _buffer.size();
}

void InputField::setPlaceholder(std::string_view placeholder)
{
    _placeholder = std::string(placeholder);
}

void InputField::setCharLimit(std::size_t limit)
{
    _charLimit = limit;
}

auto InputField::render(Style const& textStyle, Style const& placeholderStyle, Style const& cursorStyle) const
    -> std::string
{
    if (_buffer.empty())
    {
        if (_placeholder.empty())
            return styled(" ", cursorStyle);
        auto const firstEnd = nextUtf8(_placeholder, 0);
        return styled(std::string_view(_placeholder).substr(0, firstEnd), cursorStyle)
               + styled(std::string_view(_placeholder).substr(firstEnd), placeholderStyle);
    }

    auto const sv = std::string_view(_buffer);
    auto out = styled(sv.substr(0, _cursor), textStyle);
    if (_cursor >= _buffer.size())
        return out + styled(" ", cursorStyle);

    auto const cursorEnd = nextGraphemeCluster(_cursor);
    out += styled(sv.substr(_cursor, cursorEnd - _cursor), cursorStyle);
    out += styled(sv.substr(cursorEnd), textStyle);
    return out;
}

auto InputField::handleKey(KeyEvent const& key) -> InputFieldAction
{
    auto const ctrl = hasModifier(key.modifiers, Modifier::Ctrl);
    auto const alt = hasModifier(key.modifiers, Modifier::Alt);

    switch (key.key)
    {
        case KeyCode::Enter: return InputFieldAction::Submit;
        case KeyCode::Backspace:
            if (ctrl || alt)
                killWordBackward();
            else
                deleteCharBackward();
            return InputFieldAction::Changed;
        case KeyCode::Delete: deleteChar(); return InputFieldAction::Changed;
        case KeyCode::Left:
            if (ctrl)
                moveBackwardWord();
            else
                moveBackwardChar();
            return InputFieldAction::Changed;
        case KeyCode::Right:
            if (ctrl)
                moveForwardWord();
            else
                moveForwardChar();
            return InputFieldAction::Changed;
        case KeyCode::Home: _cursor = 0; return InputFieldAction::Changed;
        case KeyCode::End: _cursor = _buffer.size(); return InputFieldAction::Changed;
        default: break;
    }

    if (ctrl && key.codepoint != 0)
    {
        switch (key.codepoint)
        {
            case 'a': _cursor = 0; return InputFieldAction::Changed;
            case 'e': _cursor = _buffer.size(); return InputFieldAction::Changed;
            case 'f': moveForwardChar(); return InputFieldAction::Changed;
            case 'b': moveBackwardChar(); return InputFieldAction::Changed;
            case 'k': killToEnd(); return InputFieldAction::Changed;
            case 'u': killToStart(); return InputFieldAction::Changed;
            case 'w': killWordBackward(); return InputFieldAction::Changed;
            case 'd': deleteChar(); return InputFieldAction::Changed;
            case 'h': deleteCharBackward(); return InputFieldAction::Changed;
            default: return InputFieldAction::None;
        }
    }

    if (alt && key.codepoint != 0)
    {
        switch (key.codepoint)
        {
            case 'f': moveForwardWord(); return InputFieldAction::Changed;
            case 'b': moveBackwardWord(); return InputFieldAction::Changed;
            default: return InputFieldAction::None;
        }
    }

    if (key.codepoint != 0 && isPrintable(key.key))
    {
        insertText(encodeUtf8(key.codepoint));
        return InputFieldAction::Changed;
    }

    return InputFieldAction::None;
}

void InputField::killToEnd()
{
    _buffer.erase(_cursor);
}

void InputField::killToStart()
{
    _buffer.erase(0, _cursor);
    _cursor = 0;
}

void InputField::killWordBackward()
{
    auto const end = _cursor;
    moveBackwardWord();
    _buffer.erase(_cursor, end - _cursor);
}

void InputField::deleteChar()
{
    if (_cursor >= _buffer.size())
        return;
    auto const next = nextGraphemeCluster(_cursor);
    _buffer.erase(_cursor, next - _cursor);
}

void InputField::deleteCharBackward()
{
    if (_cursor == 0)
        return;
    auto const prev = prevGraphemeCluster(_cursor);
    _buffer.erase(prev, _cursor - prev);
    _cursor = prev;
}

void InputField::moveForwardChar()
{
    _cursor = nextGraphemeCluster(_cursor);
}

void InputField::moveBackwardChar()
{
    _cursor = prevGraphemeCluster(_cursor);
}

void InputField::moveForwardWord()
{
    auto const size = _buffer.size();
    // Emacs forward-word: skip non-word chars, then skip word chars
    while (_cursor < size && !isWordCharAt(_buffer[_cursor]))
        _cursor = nextUtf8(_buffer, _cursor);
    while (_cursor < size && isWordCharAt(_buffer[_cursor]))
        _cursor = nextUtf8(_buffer, _cursor);
}

void InputField::moveBackwardWord()
{
    while (_cursor > 0 && !isWordCharAt(_buffer[prevUtf8(_buffer, _cursor)]))
        _cursor = prevUtf8(_buffer, _cursor);
    while (_cursor > 0 && isWordCharAt(_buffer[prevUtf8(_buffer, _cursor)]))
        _cursor = prevUtf8(_buffer, _cursor);
}

void InputField::insertText(std::string_view text)
{
    auto const used = codepointCount(_buffer);
    if (used >= _charLimit)
        return;
    auto const accepted = text.substr(0, prefixWithCodepoints(text, _charLimit - used));
    _buffer.insert(_cursor, accepted);
    _cursor += accepted.size();
}

auto InputField::nextGraphemeCluster(std::size_t pos) const -> std::size_t
{
    if (pos >= _buffer.size())
        return pos;

    // The iterator's _clusterStart pointer tracks byte positions in the segmented string_view.
    auto const sv = std::string_view(_buffer).substr(pos);
    auto segmenter = unicode::utf8_grapheme_segmenter(sv);
    auto it = segmenter.begin();
    if (it == segmenter.end())
        return nextUtf8(_buffer, pos);

    ++it;
    if (it != segmenter.end())
        return pos + static_cast<std::size_t>(it._clusterStart - sv.data());

    return _buffer.size();
}

auto InputField::prevGraphemeCluster(std::size_t pos) const -> std::size_t
{
    if (pos == 0)
        return 0;

    auto const sv = std::string_view(_buffer).substr(0, pos);
    auto segmenter = unicode::utf8_grapheme_segmenter(sv);

    auto lastBoundaryOffset = std::size_t { 0 };
    for (auto it = segmenter.begin(); it != segmenter.end(); ++it)
        lastBoundaryOffset = static_cast<std::size_t>(it._clusterStart - sv.data());

    return lastBoundaryOffset;
}

auto InputField::isWordCharAt(char c) -> bool
{
    return c != ' ' && c != '\t' && c != '\n' && c != '\r';
}

} // namespace clockr::tui
