// SPDX-License-Identifier: Apache-2.0
#include <review/MessageQueue.hpp>

namespace clockr::review
{

void MessageQueue::setWakeCallback(WakeCallback callback)
{
    auto const lock = std::lock_guard { _mutex };
    _wake = std::move(callback);
}

void MessageQueue::push(Message message)
{
    auto wake = WakeCallback {};
    {
        auto const lock = std::lock_guard { _mutex };
        _messages.push_back(std::move(message));
        wake = _wake;
    }
    if (wake)
        wake();
}

auto MessageQueue::drain() -> std::vector<Message>
{
    auto const lock = std::lock_guard { _mutex };
    auto messages = std::vector<Message> {};
    messages.reserve(_messages.size());
    for (auto& message: _messages)
        messages.push_back(std::move(message));
    _messages.clear();
    return messages;
}

auto MessageQueue::empty() const -> bool
{
    auto const lock = std::lock_guard { _mutex };
    return _messages.empty();
}

} // namespace clockr::review
