// SPDX-License-Identifier: Apache-2.0
#include <sys/ioctl.h>

#include <cerrno>
#include <cstring>
#include <format>

#include <unistd.h>

#include <tui/TerminalOutput.hpp>

namespace clockr::tui
{

auto Style::isPlain() const noexcept -> bool
{
    return std::holds_alternative<std::monostate>(fg) && std::holds_alternative<std::monostate>(bg) && !bold
           && !italic && !underline && !strikethrough && !dim && !inverse;
}

auto sgr(Style const& style) -> std::string
{
    if (style.isPlain())
        return {};

    auto out = std::string { "\033[" };
    auto needSemicolon = false;
    auto const appendSep = [&]() {
        if (needSemicolon)
            out += ';';
        needSemicolon = true;
    };

    if (style.bold)
    {
        appendSep();
        out += '1';
    }
    if (style.dim)
    {
        appendSep();
        out += '2';
    }
    if (style.italic)
    {
        appendSep();
        out += '3';
    }
    if (style.underline)
    {
        appendSep();
        out += '4';
    }
    if (style.inverse)
    {
        appendSep();
        out += '7';
    }
    if (style.strikethrough)
    {
        appendSep();
        out += '9';
    }

    if (auto const* idx = std::get_if<std::uint8_t>(&style.fg))
    {
        appendSep();
        out += std::format("38;5;{}", *idx);
    }
    else if (auto const* rgb = std::get_if<RgbColor>(&style.fg))
    {
        appendSep();
        out += std::format("38;2;{};{};{}", rgb->r, rgb->g, rgb->b);
    }

    if (auto const* idx = std::get_if<std::uint8_t>(&style.bg))
    {
        appendSep();
        out += std::format("48;5;{}", *idx);
    }
    else if (auto const* rgb = std::get_if<RgbColor>(&style.bg))
    {
        appendSep();
        out += std::format("48;2;{};{};{}", rgb->r, rgb->g, rgb->b);
    }

    out += 'm';
    return out;
}

auto styled(std::string_view text, Style const& style) -> std::string
{
    if (style.isPlain())
        return std::string(text);
    auto out = sgr(style);
    out.append(text);
    out += "\033[m";
    return out;
}

// --- SyncGuard ---

SyncGuard::SyncGuard(int fd): _fd(fd)
{
    static constexpr auto Begin = "\033[?2026h";
    static_cast<void>(::write(_fd, Begin, std::strlen(Begin)));
}

SyncGuard::~SyncGuard()
{
    static constexpr auto End = "\033[?2026l";
    static_cast<void>(::write(_fd, End, std::strlen(End)));
}

// --- TerminalOutput ---

auto TerminalOutput::initialize() -> VoidResult
{
    updateDimensions();
    return {};
}

void TerminalOutput::write(std::string_view text, Style const& style)
{
    _buffer += styled(text, style);
}

void TerminalOutput::writeRaw(std::string_view text)
{
    _buffer.append(text);
}

void TerminalOutput::moveTo(int row, int col)
{
    _buffer += std::format("\033[{};{}H", row, col);
}

void TerminalOutput::clearToEndOfLine()
{
    _buffer += "\033[K";
}

void TerminalOutput::clearToEndOfScreen()
{
    _buffer += "\033[J";
}

void TerminalOutput::clearScreen()
{
    _buffer += "\033[2J\033[H";
}

void TerminalOutput::enterAltScreen()
{
    _buffer += "\033[?1049h";
}

void TerminalOutput::leaveAltScreen()
{
    _buffer += "\033[?1049l";
}

auto TerminalOutput::syncGuard() -> SyncGuard
{
    flush(); // Flush any pending output before entering sync mode
    return SyncGuard(STDOUT_FILENO);
}

void TerminalOutput::showCursor()
{
    _buffer += "\033[?25h";
}

void TerminalOutput::hideCursor()
{
    _buffer += "\033[?25l";
}

void TerminalOutput::enableBracketedPaste()
{
    _buffer += "\033[?2004h";
}

void TerminalOutput::disableBracketedPaste()
{
    _buffer += "\033[?2004l";
}

void TerminalOutput::flush()
{
    auto remaining = std::string_view { _buffer };
    while (!remaining.empty())
    {
        auto const n = ::write(STDOUT_FILENO, remaining.data(), remaining.size());
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            break;
        }
        remaining.remove_prefix(static_cast<std::size_t>(n));
    }
    _buffer.clear();
}

auto TerminalOutput::columns() const noexcept -> int
{
    return _cols;
}

auto TerminalOutput::rows() const noexcept -> int
{
    return _rows;
}

void TerminalOutput::updateDimensions()
{
    auto ws = winsize {};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
    {
        _cols = ws.ws_col;
        _rows = ws.ws_row;
    }
}

} // namespace clockr::tui
