// SPDX-License-Identifier: Apache-2.0
#include <sys/ioctl.h>

#include <array>
#include <csignal>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <tui/Terminal.hpp>

namespace clockr::tui
{

namespace
{
    constexpr auto ResizeByte = char { 'r' };
    constexpr auto WakeByte = char { 'w' };

    // Global pointer for the SIGWINCH handler. Only one Terminal is active at a time.
    Terminal* gActiveTerminal = nullptr; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
    struct sigaction gPrevSigwinch {};   // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

    void sigwinchHandler(int /*sig*/)
    {
        if (gActiveTerminal != nullptr)
            gActiveTerminal->notifyResize();
    }

    void setNonBlocking(int fd)
    {
        auto const flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
} // namespace

Terminal::Terminal() = default;

Terminal::~Terminal()
{
    shutdown();
}

auto Terminal::initialize() -> VoidResult
{
    if (_initialized)
        return {};

    _fd = STDIN_FILENO;
    if (!isatty(_fd) || !isatty(STDOUT_FILENO))
        return makeError(ErrorCode::IoError, "interactive mode requires a terminal");

    if (auto result = _output.initialize(); !result)
        return result;

    if (pipe(_notifyPipe) == -1)
        return makeError(ErrorCode::IoError, "Failed to create terminal notification pipe");
    setNonBlocking(_notifyPipe[0]);
    setNonBlocking(_notifyPipe[1]);

    enableRawMode();
    _output.enterAltScreen();
    _output.enableBracketedPaste();
    _output.hideCursor();
    _output.clearScreen();
    _output.flush();

    gActiveTerminal = this;
    struct sigaction sa {};
    sa.sa_handler = sigwinchHandler;
    sa.sa_flags = SA_RESTART;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGWINCH, &sa, &gPrevSigwinch);

    _initialized = true;
    return {};
}

void Terminal::shutdown()
{
    if (!_initialized)
        return;

    sigaction(SIGWINCH, &gPrevSigwinch, nullptr);
    gActiveTerminal = nullptr;

    _output.showCursor();
    _output.disableBracketedPaste();
    _output.leaveAltScreen();
    _output.flush();
    disableRawMode();

    close(_notifyPipe[0]);
    close(_notifyPipe[1]);
    _notifyPipe[0] = -1;
    _notifyPipe[1] = -1;
    _initialized = false;
}

auto Terminal::output() noexcept -> TerminalOutput&
{
    return _output;
}

auto Terminal::poll(int timeoutMs) -> std::vector<InputEvent>
{
    auto fds = std::array<struct pollfd, 2> {};
    fds[0] = { .fd = _fd, .events = POLLIN, .revents = 0 };
    fds[1] = { .fd = _notifyPipe[0], .events = POLLIN, .revents = 0 };

    auto const nfds = (_notifyPipe[0] != -1) ? 2 : 1;
    auto const pollResult = ::poll(fds.data(), static_cast<nfds_t>(nfds), timeoutMs);

    if (pollResult <= 0)
    {
        if (pollResult == 0)
            return _decoder.timeout();
        return {};
    }

    auto events = std::vector<InputEvent> {};

    if (nfds >= 2 && (fds[1].revents & POLLIN) != 0)
    {
        auto resized = false;
        auto buf = char {};
        while (read(_notifyPipe[0], &buf, 1) > 0)
            resized = resized || buf == ResizeByte;

        if (resized)
        {
            _output.updateDimensions();
            events.emplace_back(ResizeEvent { .columns = _output.columns(), .rows = _output.rows() });
        }
    }

    if ((fds[0].revents & POLLIN) != 0)
    {
        auto buf = std::array<char, 512> {};
        auto const n = read(_fd, buf.data(), buf.size());
        if (n > 0)
        {
            auto decoded = _decoder.feed(std::string_view(buf.data(), static_cast<size_t>(n)));
            events.insert(
                events.end(), std::make_move_iterator(decoded.begin()), std::make_move_iterator(decoded.end()));
        }
    }

    return events;
}

void Terminal::wake() noexcept
{
    if (_notifyPipe[1] != -1)
        static_cast<void>(write(_notifyPipe[1], &WakeByte, 1));
}

void Terminal::notifyResize() noexcept
{
    if (_notifyPipe[1] != -1)
        static_cast<void>(write(_notifyPipe[1], &ResizeByte, 1));
}

auto Terminal::columns() const noexcept -> int
{
    return _output.columns();
}

auto Terminal::rows() const noexcept -> int
{
    return _output.rows();
}

void Terminal::enableRawMode()
{
    tcgetattr(_fd, &_origTermios);
    auto raw = _origTermios;
    raw.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO | ISIG | IEXTEN);
    raw.c_iflag &= ~static_cast<tcflag_t>(IXON | ICRNL);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    tcsetattr(_fd, TCSAFLUSH, &raw);
    _rawMode = true;
}

void Terminal::disableRawMode()
{
    if (_rawMode)
    {
        tcsetattr(_fd, TCSAFLUSH, &_origTermios);
        _rawMode = false;
    }
}

} // namespace clockr::tui
