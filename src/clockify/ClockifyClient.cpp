// SPDX-License-Identifier: Apache-2.0
#include <clockify/ClockifyClient.hpp>

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <condition_variable>
#include <format>
#include <mutex>
#include <unordered_map>

namespace clockr::clockify
{

namespace
{
    constexpr auto ProjectPageSize = 500;
    constexpr auto MissingWorkspace =
        std::string_view { "workspace ID is empty - set workspace_id in config or CLOCKIFY_WORKSPACE_ID env var" };

    auto trimTrailingSlashes(std::string url) -> std::string
    {
        while (!url.empty() && url.back() == '/')
            url.pop_back();
        return url;
    }

    auto isRetryable(int status) noexcept -> bool
    {
        return status == 429 || status >= 500;
    }

    /// Sleeps for @p delay; false if @p stopToken fired first.
    auto waitBeforeRetry(std::chrono::milliseconds delay, std::stop_token const& stopToken) -> bool
    {
        auto mutex = std::mutex {};
        auto cv = std::condition_variable_any {};
        auto lock = std::unique_lock { mutex };
        return !cv.wait_for(lock, stopToken, delay, [] { return false; }) && !stopToken.stop_requested();
    }

    auto withContext(std::string_view context, Error const& error) -> std::unexpected<Error>
    {
        return makeError(error.code, std::format("{}: {}", context, error.message));
    }
} // namespace

ClockifyClient::ClockifyClient(std::string apiKey, HttpClient& http, ClockifyClientOptions options):
    _apiKey(std::move(apiKey)),
    _http(http),
    _options(std::move(options)),
    _cache(_options.cacheTtl)
{
    if (_options.baseUrl.empty())
        _options.baseUrl = std::string(DefaultBaseUrl);
    _options.baseUrl = trimTrailingSlashes(std::move(_options.baseUrl));
}

auto ClockifyClient::request(std::string_view method,
                             std::string_view path,
                             std::string body,
                             std::stop_token stopToken) -> Result<std::string>
{
    auto const httpRequest = HttpRequest {
        .method = std::string(method),
        .url = _options.baseUrl + std::string(path),
        .headers = { { "X-Api-Key", _apiKey }, { "Content-Type", "application/json" } },
        .body = std::move(body),
        .stopToken = stopToken,
    };

    log::debug("Clockify API request: {} {}", method, path);

    auto const requestStart = std::chrono::steady_clock::now();
    auto response = Result<HttpResponse> {};
    for (auto attempt = 0; attempt <= _options.maxRetries; ++attempt)
    {
        response = _http.send(httpRequest);
        if (!response && response.error().code == ErrorCode::Cancelled)
            return std::unexpected(std::move(response.error()));
        if (!response)
        {
            if (attempt == _options.maxRetries)
            {
                log::error("Clockify request {} {} failed: {}", method, path, response.error().message);
                return makeError(ErrorCode::TransportError,
                                 std::format("sending request: {}", response.error().message));
            }
            log::debug("Transport error on {} {} (attempt {}), retrying: {}",
                       method,
                       path,
                       attempt + 1,
                       response.error().message);
            if (!waitBeforeRetry(_options.backoffBase * (1 << attempt), stopToken))
                return makeError(ErrorCode::Cancelled, std::format("{} {}: canceled before retry", method, path));
            continue;
        }

        if (isRetryable(response->status))
        {
            if (attempt == _options.maxRetries)
            {
                log::error("Clockify request {} {} failed after {} attempts with status {}",
                           method,
                           path,
                           attempt + 1,
                           response->status);
                return makeError(ErrorCode::ApiError,
                                 std::format("API returned status {} after {} retries",
                                             response->status,
                                             _options.maxRetries));
            }
            log::debug("Retryable status {} on {} {} (attempt {})", response->status, method, path, attempt + 1);
            if (!waitBeforeRetry(_options.backoffBase * (1 << attempt), stopToken))
                return makeError(ErrorCode::Cancelled, std::format("{} {}: canceled before retry", method, path));
            continue;
        }
        break;
    }

    log::debug("Clockify API response: {} {} -> {} ({} bytes, {} ms)",
               method,
               path,
               response->status,
               response->body.size(),
               std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now()
                                                                     - requestStart)
                   .count());

    if (!response->isSuccess())
    {
        log::error("Clockify request {} {} failed with status {}", method, path, response->status);
        return makeError(ErrorCode::ApiError,
                         std::format("API error (status {}): {}", response->status, response->body));
    }

    return std::move(response->body);
}

auto ClockifyClient::currentUser() -> Result<User>
{
    auto body = request("GET", "/user");
    if (!body)
        return withContext("getting user", body.error());

    auto const parsed = json::parse(*body);
    if (!parsed)
        return withContext("parsing user response", parsed.error());
    return parseUser(*parsed);
}

auto ClockifyClient::projects(std::string_view workspaceId) -> Result<std::vector<Project>>
{
    if (workspaceId.empty())
        return makeError(ErrorCode::InvalidArgument, std::string(MissingWorkspace));
    if (auto cached = _cache.get())
        return std::move(*cached);

    auto all = std::vector<Project> {};
    for (auto page = 1;; ++page)
    {
        auto const path = std::format(
            "/workspaces/{}/projects?page-size={}&page={}&archived=false", workspaceId, ProjectPageSize, page);
        auto body = request("GET", path);
        if (!body)
            return withContext("getting projects", body.error());

        auto const parsed = json::parse(*body);
        if (!parsed)
            return withContext("parsing projects response", parsed.error());
        auto pageProjects = parseProjects(*parsed);
        if (!pageProjects)
            return withContext("parsing projects response", pageProjects.error());

        auto const pageCount = pageProjects->size();
        all.insert(all.end(),
                   std::make_move_iterator(pageProjects->begin()),
                   std::make_move_iterator(pageProjects->end()));
        if (pageCount < static_cast<std::size_t>(ProjectPageSize))
            break;
    }

    log::debug("Fetched {} projects for workspace {}", all.size(), workspaceId);
    _cache.set(all);
    return all;
}

auto ClockifyClient::clients(std::string_view workspaceId) -> Result<std::vector<Client>>
{
    if (workspaceId.empty())
        return makeError(ErrorCode::InvalidArgument, std::string(MissingWorkspace));

    auto body = request("GET", std::format("/workspaces/{}/clients?page-size={}", workspaceId, ProjectPageSize));
    if (!body)
        return withContext("getting clients", body.error());

    auto const parsed = json::parse(*body);
    if (!parsed)
        return withContext("parsing clients response", parsed.error());
    return parseClients(*parsed);
}

void ClockifyClient::enrichProjectsWithClients(std::string_view workspaceId, std::vector<Project>& projects)
{
    auto const fetched = clients(workspaceId);
    if (!fetched)
    {
        log::debug("Could not fetch clients, continuing without client names: {}", fetched.error().message);
        return;
    }

    auto names = std::unordered_map<std::string, std::string> {};
    for (auto const& client: *fetched)
        names.emplace(client.id, client.name);

    for (auto& project: projects)
        if (auto const it = names.find(project.clientId); it != names.end())
            project.clientName = it->second;
}

auto ClockifyClient::createTimeEntry(std::string_view workspaceId,
                                     TimeEntryRequest const& entry,
                                     std::stop_token stopToken) -> Result<TimeEntry>
{
    if (workspaceId.empty())
        return makeError(ErrorCode::InvalidArgument, std::string(MissingWorkspace));

    auto body = request(
        "POST", std::format("/workspaces/{}/time-entries", workspaceId), toJson(entry).dump(), std::move(stopToken));
    if (!body)
        return withContext("creating time entry", body.error());

    auto const parsed = json::parse(*body);
    if (!parsed)
        return withContext("parsing time entry response", parsed.error());
    return parseTimeEntry(*parsed);
}

auto ClockifyClient::resolveWorkspaceId(std::string_view configured) -> Result<std::string>
{
    if (!configured.empty())
        return std::string(configured);

    auto const user = currentUser();
    if (!user)
        return withContext("getting user info", user.error());
    if (user->defaultWorkspace.empty())
        return makeError(ErrorCode::ConfigError,
                         "workspace ID not configured and user has no default workspace - set workspace_id "
                         "in config or CLOCKIFY_WORKSPACE_ID env var");

    log::debug("Using default workspace {}", user->defaultWorkspace);
    return user->defaultWorkspace;
}

} // namespace clockr::clockify
