// SPDX-License-Identifier: Apache-2.0
#include <tui/Text.hpp>

#include <algorithm>

namespace clockr::tui
{

auto borderChars(BorderStyle style) noexcept -> BorderChars
{
    switch (style)
    {
        case BorderStyle::Single:
            return BorderChars {
                .horizontal = "\u2500",   // ─
                .vertical = "\u2502",     // │
                .topLeft = "\u250C",      // ┌
                .topRight = "\u2510",     // ┐
                .bottomLeft = "\u2514",   // └
                .bottomRight = "\u2518",  // ┘
            };
        case BorderStyle::Rounded:
            return BorderChars {
                .horizontal = "\u2500",   // ─
                .vertical = "\u2502",     // │
                .topLeft = "\u256D",      // ╭
                .topRight = "\u256E",     // ╮
                .bottomLeft = "\u2570",   // ╰
                .bottomRight = "\u256F",  // ╯
            };
    }
    return borderChars(BorderStyle::Single);
}

auto displayWidth(std::string_view text) -> int
{
    auto width = 0;

    for (auto i = std::size_t { 0 }; i < text.size(); ++i)
    {
        auto const ch = static_cast<unsigned char>(text[i]);

        // Skip CSI sequences (ESC [ params final)
        if (ch == 0x1B && i + 1 < text.size() && text[i + 1] == '[')
        {
            i += 2;
            while (i < text.size() && (static_cast<unsigned char>(text[i]) < 0x40 || text[i] > 0x7E))
                ++i;
            continue;
        }

        // Skip UTF-8 continuation bytes
        if ((ch & 0xC0) == 0x80)
            continue;

        // TODO: Use libunicode for proper width calculation (wcwidth equivalent)
        ++width;
    }

    return width;
}

auto padRight(std::string_view text, int width) -> std::string
{
    auto result = std::string(text);
    auto const current = displayWidth(text);
    if (current < width)
        result.append(static_cast<std::size_t>(width - current), ' ');
    return result;
}

auto splitLines(std::string_view text) -> std::vector<std::string_view>
{
    auto lines = std::vector<std::string_view> {};
    while (!text.empty())
    {
        auto const nl = text.find('\n');
        if (nl == std::string_view::npos)
        {
            lines.push_back(text);
            break;
        }
        lines.push_back(text.substr(0, nl));
        text.remove_prefix(nl + 1);
    }
    return lines;
}

auto frame(std::string_view content, BorderStyle border, Style const& borderStyle, int paddingX) -> std::string
{
    auto const chars = borderChars(border);
    auto const lines = splitLines(content);

    auto innerWidth = 0;
    for (auto const line: lines)
        innerWidth = std::max(innerWidth, displayWidth(line));

    auto horizontal = std::string {};
    for (auto i = 0; i < innerWidth + 2 * paddingX; ++i)
        horizontal += chars.horizontal;

    auto const padding = std::string(static_cast<std::size_t>(paddingX), ' ');
    auto const vertical = styled(chars.vertical, borderStyle);

    auto out = styled(std::string(chars.topLeft) + horizontal + std::string(chars.topRight), borderStyle);
    out += '\n';
    for (auto const line: lines)
    {
        out += vertical;
        out += padding;
        out += padRight(line, innerWidth);
        out += padding;
        out += vertical;
        out += '\n';
    }
    out += styled(std::string(chars.bottomLeft) + horizontal + std::string(chars.bottomRight), borderStyle);
    return out;
}

} // namespace clockr::tui
