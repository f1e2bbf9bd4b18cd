// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <review/Message.hpp>
#include <review/MessageQueue.hpp>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace clockr::review
{

/// @brief Executes commands on worker threads and posts their messages to a MessageQueue.
///
/// Each command gets its own std::jthread. Finished threads are reaped on the
/// next dispatch. shutdown() requests every running command to stop and
/// joins them.
class CommandRunner
{
  public:
    explicit CommandRunner(MessageQueue& queue);
    ~CommandRunner();

    CommandRunner(CommandRunner const&) = delete;
    auto operator=(CommandRunner const&) -> CommandRunner& = delete;
    CommandRunner(CommandRunner&&) = delete;
    auto operator=(CommandRunner&&) -> CommandRunner& = delete;

    void dispatch(Command command);

    void dispatch(std::vector<Command> commands);

    /// @brief Requests all running commands to stop and waits for them.
    void shutdown();

    /// @brief Number of commands that have not finished yet.
    [[nodiscard]] auto running() const -> std::size_t;

  private:
    struct Task
    {
        CommandKind kind;
        std::shared_ptr<std::atomic<bool>> done;
        std::jthread thread;
    };

    void reap();

    MessageQueue& _queue;
    std::vector<Task> _tasks;
};

} // namespace clockr::review
