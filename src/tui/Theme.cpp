// SPDX-License-Identifier: Apache-2.0
#include <tui/Theme.hpp>

namespace clockr::tui
{

namespace
{
    // 256-color palette indexes
    constexpr auto Gray = std::uint8_t { 8 };
    constexpr auto Red = std::uint8_t { 9 };
    constexpr auto Green = std::uint8_t { 10 };
    constexpr auto Yellow = std::uint8_t { 11 };
    constexpr auto Blue = std::uint8_t { 12 };
    constexpr auto Cyan = std::uint8_t { 14 };
} // namespace

auto defaultTheme() -> Theme
{
    auto theme = Theme {};

    theme.title = Style { .fg = Blue, .bold = true };
    theme.subtitle = Style { .fg = Gray };
    theme.success = Style { .fg = Green, .bold = true };
    theme.error = Style { .fg = Red, .bold = true };
    theme.warning = Style { .fg = Yellow };
    theme.dim = Style { .fg = Gray };
    theme.highlight = Style { .fg = Cyan, .bold = true };
    theme.selected = Style { .fg = Green, .bold = true };
    theme.help = Style { .fg = Gray };
    theme.border = Style { .fg = Blue };
    theme.cursor = Style { .inverse = true };
    theme.placeholder = Style { .fg = Gray };
    theme.spinner = Style { .fg = Blue };

    theme.borderStyle = BorderStyle::Rounded;

    return theme;
}

auto plainTheme() -> Theme
{
    auto theme = Theme {};
    theme.borderStyle = BorderStyle::Rounded;
    return theme;
}

} // namespace clockr::tui
