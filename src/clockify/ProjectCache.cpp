// SPDX-License-Identifier: Apache-2.0
#include <clockify/ProjectCache.hpp>

namespace clockr::clockify
{

ProjectCache::ProjectCache(Clock::duration ttl): _ttl(ttl)
{
}

auto ProjectCache::get() const -> std::optional<std::vector<Project>>
{
    auto const lock = std::lock_guard { _mutex };
    if (!_projects || Clock::now() - _fetchedAt > _ttl)
        return std::nullopt;
    return _projects;
}

void ProjectCache::set(std::vector<Project> projects)
{
    auto const lock = std::lock_guard { _mutex };
    _projects = std::move(projects);
    _fetchedAt = Clock::now();
}

void ProjectCache::invalidate()
{
    auto const lock = std::lock_guard { _mutex };
    _projects.reset();
}

} // namespace clockr::clockify
