// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <clockify/HttpClient.hpp>
#include <clockify/ProjectCache.hpp>
#include <clockify/TimeEntryClient.hpp>

#include <chrono>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace clockr::clockify
{

inline constexpr auto DefaultBaseUrl = std::string_view { "https://api.clockify.me/api/v1" };

/// @brief Tunables for ClockifyClient.
struct ClockifyClientOptions
{
    std::string baseUrl = std::string(DefaultBaseUrl);
    std::chrono::seconds cacheTtl = std::chrono::hours(1);
    int maxRetries = 3;                                                 ///< Retries after the first attempt.
    std::chrono::milliseconds backoffBase = std::chrono::seconds(1);    ///< Delay before retry n is base * 2^n.
};

/// @brief Clockify REST API client.
///
/// Transport failures and HTTP 429/5xx responses are retried with exponential
/// backoff. The project list is cached per client instance.
class ClockifyClient: public TimeEntryClient
{
  public:
    ClockifyClient(std::string apiKey, HttpClient& http, ClockifyClientOptions options = {});

    /// @brief GET /user.
    [[nodiscard]] auto currentUser() -> Result<User>;

    /// @brief All non-archived projects of a workspace, fetched page by page.
    [[nodiscard]] auto projects(std::string_view workspaceId) -> Result<std::vector<Project>>;

    /// @brief All clients of a workspace.
    [[nodiscard]] auto clients(std::string_view workspaceId) -> Result<std::vector<Client>>;

    /// @brief Fills Project::clientName from the workspace's clients.
    ///
    /// Failure to fetch clients is logged and leaves the projects unchanged.
    void enrichProjectsWithClients(std::string_view workspaceId, std::vector<Project>& projects);

    [[nodiscard]] auto createTimeEntry(std::string_view workspaceId,
                                       TimeEntryRequest const& request,
                                       std::stop_token stopToken) -> Result<TimeEntry> override;

    /// @brief Returns the configured workspace, or the user's default workspace.
    [[nodiscard]] auto resolveWorkspaceId(std::string_view configured) -> Result<std::string>;

    [[nodiscard]] auto baseUrl() const noexcept -> std::string const& { return _options.baseUrl; }

  private:
    [[nodiscard]] auto request(std::string_view method,
                               std::string_view path,
                               std::string body = {},
                               std::stop_token stopToken = {}) -> Result<std::string>;

    std::string _apiKey;
    HttpClient& _http;
    ClockifyClientOptions _options;
    ProjectCache _cache;
};

} // namespace clockr::clockify
