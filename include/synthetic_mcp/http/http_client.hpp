#pragma once

#include <synthetic_mcp/core/log.hpp>
#include <synthetic_mcp/http/i_http_client.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace synthetic_mcp {

struct HttpClientOptions {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{60};
};

// ---------------------------------------------------------------------------
// HttpClient — IHttpClient over cpp-httplib.
//
// Every request carries "Authorization: Bearer <token>" and
// "Accept: application/json". The token never reaches the log.
// Cancellation is checked before sending. While the request is in flight a
// watcher thread aborts it through httplib::Client::stop() once the token
// fires, whether the client is waiting for headers or reading the body.
// ---------------------------------------------------------------------------
class HttpClient : public IHttpClient {
public:
    HttpClient(const std::string& base_url,
               const std::string& bearer_token,
               Logger& logger,
               const HttpClientOptions& options = {});

    ~HttpClient() override;

    [[nodiscard]] Result<HttpResponse, Error> PostJson(
        std::string_view path,
        std::string_view body,
        const CancellationToken& cancel) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace synthetic_mcp
