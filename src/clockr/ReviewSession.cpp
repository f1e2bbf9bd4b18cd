// SPDX-License-Identifier: Apache-2.0
#include "ReviewSession.hpp"

#include <core/Log.hpp>
#include <review/CommandRunner.hpp>
#include <review/MessageQueue.hpp>
#include <tui/Terminal.hpp>
#include <tui/Text.hpp>

#include <iostream>
#include <mutex>
#include <print>
#include <string>
#include <vector>

namespace clockr
{

namespace
{
    /// Collects log messages while the screen is active and no log file is available.
    class HeldLogs
    {
      public:
        void add(log::Level level, std::string_view message)
        {
            auto const lock = std::lock_guard { _mutex };
            _messages.push_back(std::format("[{}] {}", log::levelPrefix(level), message));
        }

        void replay()
        {
            auto const lock = std::lock_guard { _mutex };
            for (auto const& message: _messages)
                std::println(stderr, "{}", message);
            _messages.clear();
        }

      private:
        std::mutex _mutex;
        std::vector<std::string> _messages;
    };

    auto toMessage(tui::InputEvent const& event) -> review::Message
    {
        if (auto const* key = std::get_if<tui::KeyEvent>(&event))
            return review::KeyMsg { .key = *key };
        if (auto const* paste = std::get_if<tui::PasteEvent>(&event))
            return review::PasteMsg { .text = paste->text };
        auto const& resize = std::get<tui::ResizeEvent>(event);
        return review::ResizeMsg { .columns = resize.columns, .rows = resize.rows };
    }

    template <typename Machine>
    void renderScreen(Machine const& machine, tui::Theme const& theme, tui::TerminalOutput& output)
    {
        auto const view = machine.render(theme);

        auto sync = output.syncGuard();
        output.moveTo(1, 1);
        auto row = 0;
        for (auto const line: tui::splitLines(view))
        {
            if (++row > output.rows())
                break;
            output.moveTo(row, 1);
            output.writeRaw(line);
            output.clearToEndOfLine();
        }
        output.moveTo(row + 1, 1);
        output.clearToEndOfScreen();
        output.flush();
    }
} // namespace

template <typename Machine>
auto runReviewSession(Machine& machine, tui::Theme const& theme, std::filesystem::path const& logFile)
    -> VoidResult
{
    std::cout.flush();

    auto terminal = tui::Terminal {};
    if (auto result = terminal.initialize(); !result)
        return result;

    auto held = HeldLogs {};
    auto const fileLogging = log::setLogFile(logFile);
    if (!fileLogging)
        log::setCallback([&held](log::Level level, std::string_view message) { held.add(level, message); });

    auto& output = terminal.output();

    {
        auto queue = review::MessageQueue {};
        queue.setWakeCallback([&terminal] { terminal.wake(); });
        auto runner = review::CommandRunner { queue };

        runner.dispatch(
            machine.update(review::ResizeMsg { .columns = output.columns(), .rows = output.rows() }));
        renderScreen(machine, theme, output);

        while (!machine.finished())
        {
            auto dirty = false;

            for (auto const& event: terminal.poll(100))
            {
                runner.dispatch(machine.update(toMessage(event)));
                dirty = true;
                if (machine.finished())
                    break;
            }

            for (auto& message: queue.drain())
            {
                if (machine.finished())
                    break;
                runner.dispatch(machine.update(std::move(message)));
                dirty = true;
            }

            if (dirty && !machine.finished())
                renderScreen(machine, theme, output);
        }

        runner.shutdown();
        queue.setWakeCallback({});
    }

    terminal.shutdown();

    if (fileLogging)
        log::closeLogFile();
    else
    {
        log::setCallback({});
        held.replay();
    }

    return {};
}

template auto runReviewSession<review::ReviewStateMachine>(review::ReviewStateMachine&,
                                                           tui::Theme const&,
                                                           std::filesystem::path const&) -> VoidResult;
template auto runReviewSession<review::BatchReviewStateMachine>(review::BatchReviewStateMachine&,
                                                                tui::Theme const&,
                                                                std::filesystem::path const&) -> VoidResult;

} // namespace clockr
