#pragma once

#include <azlist/core/cancellation.hpp>
#include <azlist/core/result.hpp>

#include <map>
#include <string>
#include <string_view>

namespace azlist {

// ---------------------------------------------------------------------------
// HttpHeaders: ordered key-value pairs for HTTP headers.
// Header names are case-sensitive in this representation; callers normalise
// as needed.
// ---------------------------------------------------------------------------
using HttpHeaders = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// HttpResponse: the result of an HTTP request.
// ---------------------------------------------------------------------------
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

// ---------------------------------------------------------------------------
// IArmSession: authenticated transport to the Resource Manager endpoint.
//
// ARM clients depend on this interface rather than a concrete HTTP client,
// which enables offline testing via MockArmSession.
//
// `path` is either a path with query ("/subscriptions/...?...") or an
// absolute URL on the session's host (ARM nextLink values are absolute).
//
// Implementations must be safe to call from several threads at once: the
// crawler issues listing requests from every pool worker.
//
// Methods return Result<T, Error> for transport failures only; any HTTP
// status, including 4xx/5xx, comes back as Ok(HttpResponse).
// ---------------------------------------------------------------------------
class IArmSession {
public:
    virtual ~IArmSession() = default;

    IArmSession(const IArmSession&) = delete;
    IArmSession& operator=(const IArmSession&) = delete;
    IArmSession(IArmSession&&) = delete;
    IArmSession& operator=(IArmSession&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Get(
        std::string_view path,
        const CancellationToken& cancel = {},
        const HttpHeaders& headers = {}) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const CancellationToken& cancel = {},
        const HttpHeaders& headers = {}) = 0;

protected:
    IArmSession() = default;
};

} // namespace azlist
