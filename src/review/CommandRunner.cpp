// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <review/CommandRunner.hpp>

#include <algorithm>

namespace clockr::review
{

CommandRunner::CommandRunner(MessageQueue& queue): _queue(queue)
{
}

CommandRunner::~CommandRunner()
{
    shutdown();
}

void CommandRunner::dispatch(Command command)
{
    reap();

    auto done = std::make_shared<std::atomic<bool>>(false);
    auto const kind = command.kind;
    log::trace("dispatching {} command", commandKindName(kind));

    auto thread = std::jthread([this, done, run = std::move(command.run)](std::stop_token stopToken) {
        if (auto message = run(stopToken); message && !stopToken.stop_requested())
            _queue.push(std::move(*message));
        done->store(true);
    });
    _tasks.push_back(Task { .kind = kind, .done = std::move(done), .thread = std::move(thread) });
}

void CommandRunner::dispatch(std::vector<Command> commands)
{
    for (auto& command: commands)
        dispatch(std::move(command));
}

void CommandRunner::shutdown()
{
    for (auto& task: _tasks)
        task.thread.request_stop();
    for (auto& task: _tasks)
    {
        if (task.thread.joinable())
        {
            if (!task.done->load())
                log::debug("waiting for {} command to finish", commandKindName(task.kind));
            task.thread.join();
        }
    }
    _tasks.clear();
}

auto CommandRunner::running() const -> std::size_t
{
    return static_cast<std::size_t>(
        std::ranges::count_if(_tasks, [](Task const& task) { return !task.done->load(); }));
}

void CommandRunner::reap()
{
    std::erase_if(_tasks, [](Task& task) {
        if (!task.done->load())
            return false;
        if (task.thread.joinable())
            task.thread.join();
        return true;
    });
}

} // namespace clockr::review
