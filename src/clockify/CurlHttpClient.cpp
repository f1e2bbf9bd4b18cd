// SPDX-License-Identifier: Apache-2.0
#include <clockify/HttpClient.hpp>

#include <core/Log.hpp>

#include <curl/curl.h>

#include <format>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>

namespace clockr::clockify
{

namespace
{
    struct EasyHandleDeleter
    {
        void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
    };

    struct HeaderListDeleter
    {
        void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
    };

    using EasyHandle = std::unique_ptr<CURL, EasyHandleDeleter>;
    using HeaderList = std::unique_ptr<curl_slist, HeaderListDeleter>;

    auto appendBody(char* data, size_t size, size_t count, void* userData) -> size_t
    {
        static_cast<std::string*>(userData)->append(data, size * count);
        return size * count;
    }

    auto abortWhenStopped(void* userData, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int
    {
        return static_cast<std::stop_token const*>(userData)->stop_requested() ? 1 : 0;
    }

    void initializeCurlOnce()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }
} // namespace

CurlHttpClient::CurlHttpClient(std::chrono::seconds timeout): _timeout(timeout)
{
    initializeCurlOnce();
}

auto CurlHttpClient::send(HttpRequest const& request) -> Result<HttpResponse>
{
    if (request.stopToken.stop_requested())
        return makeError(ErrorCode::Cancelled, std::format("{} {}: canceled", request.method, request.url));

    auto handle = EasyHandle { curl_easy_init() };
    if (!handle)
        return makeError(ErrorCode::TransportError, "curl_easy_init failed");

    auto headers = HeaderList {};
    for (auto const& [name, value]: request.headers)
    {
        auto const line = std::format("{}: {}", name, value);
        auto* const appended = curl_slist_append(headers.get(), line.c_str());
        if (!appended)
            return makeError(ErrorCode::TransportError, "building request headers failed");
        static_cast<void>(headers.release());
        headers.reset(appended);
    }

    auto body = std::string {};
    auto* const curl = handle.get();
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &appendBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    auto stopToken = request.stopToken;
    if (stopToken.stop_possible())
    {
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &abortWhenStopped);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &stopToken);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    }
    if (!request.body.empty())
    {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    log::trace("HTTP {} {}", request.method, request.url);

    auto const code = curl_easy_perform(curl);
    if (code == CURLE_ABORTED_BY_CALLBACK)
        return makeError(ErrorCode::Cancelled, std::format("{} {}: canceled", request.method, request.url));
    if (code != CURLE_OK)
        return makeError(ErrorCode::TransportError,
                         std::format("{} {}: {}", request.method, request.url, curl_easy_strerror(code)));

    auto status = 0L;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    if (status == 0)
        return makeError(ErrorCode::TransportError, std::format("{} {}: no HTTP status", request.method, request.url));

    return HttpResponse { .status = static_cast<int>(status), .body = std::move(body) };
}

} // namespace clockr::clockify
