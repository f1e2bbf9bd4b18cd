// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace clockr::clockify
{

/// @brief A single HTTP request.
struct HttpRequest
{
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::stop_token stopToken; ///< Aborts the transfer once stop is requested.
};

/// @brief The status and body of an HTTP response.
struct HttpResponse
{
    int status = 0;
    std::string body;

    [[nodiscard]] auto isSuccess() const noexcept -> bool { return status >= 200 && status < 300; }
};

/// @brief Abstract HTTP transport.
///
/// A returned error means the request did not produce an HTTP response at all
/// (connection failure, timeout, ErrorCode::Cancelled once the request's stop
/// token fired). Non-2xx responses are returned as values.
class HttpClient
{
  public:
    virtual ~HttpClient() = default;

    [[nodiscard]] virtual auto send(HttpRequest const& request) -> Result<HttpResponse> = 0;
};

/// @brief HttpClient backed by libcurl.
///
/// Each request uses its own easy handle, so one instance may be shared
/// between threads.
class CurlHttpClient: public HttpClient
{
  public:
    explicit CurlHttpClient(std::chrono::seconds timeout = std::chrono::seconds(30));

    [[nodiscard]] auto send(HttpRequest const& request) -> Result<HttpResponse> override;

  private:
    std::chrono::seconds _timeout;
};

} // namespace clockr::clockify
