// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <clockify/Models.hpp>

#include <chrono>
#include <mutex>
#include <optional>
#include <vector>

namespace clockr::clockify
{

/// @brief Thread-safe in-memory project list with a time-to-live.
class ProjectCache
{
  public:
    using Clock = std::chrono::steady_clock;

    explicit ProjectCache(Clock::duration ttl);

    /// @brief Returns a copy of the cached projects, or nullopt when empty or expired.
    [[nodiscard]] auto get() const -> std::optional<std::vector<Project>>;

    void set(std::vector<Project> projects);
    void invalidate();

  private:
    Clock::duration _ttl;
    mutable std::mutex _mutex;
    std::optional<std::vector<Project>> _projects;
    Clock::time_point _fetchedAt {};
};

} // namespace clockr::clockify
