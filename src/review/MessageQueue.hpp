// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <review/Message.hpp>

#include <deque>
#include <functional>
#include <mutex>
#include <vector>

namespace clockr::review
{

/// @brief Thread-safe FIFO of messages awaiting the UI loop.
///
/// Worker threads push, the UI thread drains. The optional wake callback is
/// invoked after every push so a UI blocked in poll() notices new messages.
class MessageQueue
{
  public:
    using WakeCallback = std::function<void()>;

    void setWakeCallback(WakeCallback callback);

    void push(Message message);

    /// @brief Removes and returns all queued messages in arrival order.
    [[nodiscard]] auto drain() -> std::vector<Message>;

    [[nodiscard]] auto empty() const -> bool;

  private:
    mutable std::mutex _mutex;
    std::deque<Message> _messages;
    WakeCallback _wake;
};

} // namespace clockr::review
