// SPDX-License-Identifier: Apache-2.0
#include <clockify/Models.hpp>

#include <core/JsonUtils.hpp>

namespace clockr::clockify
{

auto parseUser(nlohmann::json const& obj) -> Result<User>
{
    auto id = json::getString(obj, "id");
    if (!id)
        return std::unexpected(id.error());

    return User {
        .id = std::move(*id),
        .email = json::getStringOr(obj, "email", ""),
        .name = json::getStringOr(obj, "name", ""),
        .activeWorkspace = json::getStringOr(obj, "activeWorkspace", ""),
        .defaultWorkspace = json::getStringOr(obj, "defaultWorkspace", ""),
    };
}

auto parseProjects(nlohmann::json const& array) -> Result<std::vector<Project>>
{
    if (!array.is_array())
        return makeError(ErrorCode::ProtocolError, "expected a JSON array of projects");

    auto projects = std::vector<Project> {};
    projects.reserve(array.size());
    for (auto const& item: array)
    {
        auto id = json::getString(item, "id");
        if (!id)
            return std::unexpected(id.error());
        projects.push_back(Project {
            .id = std::move(*id),
            .name = json::getStringOr(item, "name", ""),
            .archived = json::getBoolOr(item, "archived", false),
            .color = json::getStringOr(item, "color", ""),
            .clientId = json::getStringOr(item, "clientId", ""),
            .clientName = {},
        });
    }
    return projects;
}

auto parseClients(nlohmann::json const& array) -> Result<std::vector<Client>>
{
    if (!array.is_array())
        return makeError(ErrorCode::ProtocolError, "expected a JSON array of clients");

    auto clients = std::vector<Client> {};
    for (auto const& item: array)
        clients.push_back(Client { .id = json::getStringOr(item, "id", ""), .name = json::getStringOr(item, "name", "") });
    return clients;
}

auto parseTimeEntry(nlohmann::json const& obj) -> Result<TimeEntry>
{
    auto id = json::getString(obj, "id");
    if (!id)
        return std::unexpected(id.error());

    return TimeEntry {
        .id = std::move(*id),
        .description = json::getStringOr(obj, "description", ""),
        .projectId = json::getStringOr(obj, "projectId", ""),
    };
}

auto toJson(TimeEntryRequest const& request) -> nlohmann::json
{
    return nlohmann::json {
        { "start", formatUtcTimestamp(request.start) },
        { "end", formatUtcTimestamp(request.end) },
        { "projectId", request.projectId },
        { "description", request.description },
    };
}

} // namespace clockr::clockify
