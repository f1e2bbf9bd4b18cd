// SPDX-License-Identifier: Apache-2.0
#include <review/ChunkChannel.hpp>

namespace clockr::review
{

ChunkChannel::ChunkChannel(std::size_t capacity): _capacity(capacity)
{
}

auto ChunkChannel::trySend(std::string chunk) -> bool
{
    {
        auto const lock = std::lock_guard { _mutex };
        if (_closed || _chunks.size() >= _capacity)
            return false;
        _chunks.push_back(std::move(chunk));
    }
    _cv.notify_one();
    return true;
}

void ChunkChannel::close()
{
    {
        auto const lock = std::lock_guard { _mutex };
        _closed = true;
    }
    _cv.notify_all();
}

auto ChunkChannel::receive(std::stop_token stopToken) -> std::optional<std::string>
{
    auto lock = std::unique_lock { _mutex };
    if (!_cv.wait(lock, stopToken, [this] { return _closed || !_chunks.empty(); }))
        return std::nullopt;

    if (_chunks.empty())
        return std::nullopt;

    auto chunk = std::move(_chunks.front());
    _chunks.pop_front();
    return chunk;
}

auto ChunkChannel::isClosed() const -> bool
{
    auto const lock = std::lock_guard { _mutex };
    return _closed;
}

auto ChunkChannel::size() const -> std::size_t
{
    auto const lock = std::lock_guard { _mutex };
    return _chunks.size();
}

} // namespace clockr::review
