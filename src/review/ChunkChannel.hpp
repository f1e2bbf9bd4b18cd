// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

namespace clockr::review
{

/// @brief Bounded FIFO of streamed text chunks between one producer and one consumer.
///
/// The producer never blocks: trySend() drops the chunk when the channel is
/// full. The consumer pulls one chunk at a time with receive(), which blocks
/// until a chunk arrives, the channel is closed and drained, or the stop token
/// is triggered.
class ChunkChannel
{
  public:
    static constexpr std::size_t DefaultCapacity = 100;

    explicit ChunkChannel(std::size_t capacity = DefaultCapacity);

    ChunkChannel(ChunkChannel const&) = delete;
    auto operator=(ChunkChannel const&) -> ChunkChannel& = delete;

    /// @brief Queues a chunk unless the channel is full or closed.
    /// @return True if the chunk was queued.
    auto trySend(std::string chunk) -> bool;

    /// @brief Marks the end of the stream. Idempotent.
    void close();

    /// @brief Takes the next chunk, blocking until one is available.
    /// @return The chunk, or nullopt once the channel is closed and empty or @p stopToken fires.
    [[nodiscard]] auto receive(std::stop_token stopToken) -> std::optional<std::string>;

    [[nodiscard]] auto isClosed() const -> bool;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return _capacity; }

  private:
    mutable std::mutex _mutex;
    std::condition_variable_any _cv;
    std::deque<std::string> _chunks;
    std::size_t _capacity;
    bool _closed = false;
};

} // namespace clockr::review
