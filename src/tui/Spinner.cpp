// SPDX-License-Identifier: Apache-2.0
#include <tui/Spinner.hpp>

#include <array>

namespace clockr::tui
{

namespace
{

constexpr std::array DotsFrames = {
    std::string_view { "\u280B" }, // ⠋
    std::string_view { "\u2819" }, // ⠙
    std::string_view { "\u2839" }, // ⠹
    std::string_view { "\u2838" }, // ⠸
    std::string_view { "\u283C" }, // ⠼
    std::string_view { "\u2834" }, // ⠴
    std::string_view { "\u2826" }, // ⠦
    std::string_view { "\u2827" }, // ⠧
    std::string_view { "\u2807" }, // ⠇
    std::string_view { "\u280F" }, // ⠏
};

constexpr std::array LineFrames = {
    std::string_view { "-" },
    std::string_view { "\\" },
    std::string_view { "|" },
    std::string_view { "/" },
};

} // namespace

auto spinnerFrames(SpinnerType type) -> std::span<std::string_view const>
{
    switch (type)
    {
        case SpinnerType::Dots: return DotsFrames;
        case SpinnerType::Line: return LineFrames;
    }
    return DotsFrames;
}

Spinner::Spinner(SpinnerType type): _frames(spinnerFrames(type))
{
}

void Spinner::advance() noexcept
{
    _frameIndex = (_frameIndex + 1) % _frames.size();
}

auto Spinner::currentFrame() const noexcept -> std::string_view
{
    if (_frames.empty())
        return "";
    return _frames[_frameIndex];
}

auto Spinner::renderWithLabel(std::string_view label, Style const& spinnerStyle, Style const& labelStyle) const
    -> std::string
{
    return styled(currentFrame(), spinnerStyle) + " " + styled(label, labelStyle);
}

} // namespace clockr::tui
