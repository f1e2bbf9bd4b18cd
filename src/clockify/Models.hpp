// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Time.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace clockr::clockify
{

/// @brief The authenticated Clockify user.
struct User
{
    std::string id;
    std::string email;
    std::string name;
    std::string activeWorkspace;
    std::string defaultWorkspace;
};

/// @brief A Clockify project. The client name is filled in after fetching clients.
struct Project
{
    std::string id;
    std::string name;
    bool archived = false;
    std::string color;
    std::string clientId;
    std::string clientName;

    /// @brief "Client / Project", or just the project name when there is no client.
    [[nodiscard]] auto displayName() const -> std::string
    {
        return clientName.empty() ? name : clientName + " / " + name;
    }
};

/// @brief A Clockify client (customer).
struct Client
{
    std::string id;
    std::string name;
};

/// @brief Payload for creating a time entry. Start and end are sent as UTC with second precision.
struct TimeEntryRequest
{
    TimePoint start;
    TimePoint end;
    std::string projectId;
    std::string description;
};

/// @brief A time entry as returned by the API.
struct TimeEntry
{
    std::string id;
    std::string description;
    std::string projectId;
};

[[nodiscard]] auto parseUser(nlohmann::json const& obj) -> Result<User>;
[[nodiscard]] auto parseProjects(nlohmann::json const& array) -> Result<std::vector<Project>>;
[[nodiscard]] auto parseClients(nlohmann::json const& array) -> Result<std::vector<Client>>;
[[nodiscard]] auto parseTimeEntry(nlohmann::json const& obj) -> Result<TimeEntry>;
[[nodiscard]] auto toJson(TimeEntryRequest const& request) -> nlohmann::json;

} // namespace clockr::clockify
