#pragma once

#include <synthetic_mcp/core/cancellation.hpp>
#include <synthetic_mcp/core/result.hpp>

#include <map>
#include <string>
#include <string_view>

namespace synthetic_mcp {

using HttpHeaders = std::map<std::string, std::string>;

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;

    [[nodiscard]] bool IsSuccess() const noexcept {
        return status_code >= 200 && status_code < 300;
    }
};

// ---------------------------------------------------------------------------
// IHttpClient — outbound HTTP seam used by capabilities.
//
// Capabilities depend on this interface rather than on cpp-httplib, so they
// can be tested offline against MockHttpClient.
//
// A non-2xx reply is still Ok: the caller decides how to report it. Err is
// reserved for transport failures and cancellation.
// ---------------------------------------------------------------------------
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    IHttpClient(const IHttpClient&) = delete;
    IHttpClient& operator=(const IHttpClient&) = delete;
    IHttpClient(IHttpClient&&) = delete;
    IHttpClient& operator=(IHttpClient&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> PostJson(
        std::string_view path,
        std::string_view body,
        const CancellationToken& cancel) = 0;

protected:
    IHttpClient() = default;
};

} // namespace synthetic_mcp
