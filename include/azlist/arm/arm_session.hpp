#pragma once

#include <azlist/arm/i_arm_session.hpp>
#include <azlist/core/log.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace azlist {

// ---------------------------------------------------------------------------
// ArmSessionOptions: configuration for the ARM HTTP session.
// ---------------------------------------------------------------------------
struct ArmSessionOptions {
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds read_timeout{120};
    bool disable_tls_verify = false;
    std::string user_agent;
};

// ---------------------------------------------------------------------------
// ArmSession: concrete IArmSession implementation using cpp-httplib.
//
// Uses pimpl to avoid leaking httplib into the public header.
//
// Features:
//   - Bearer token on every request
//   - Accept: application/json, User-Agent
//   - Absolute nextLink URLs on the same host are reduced to their path
//   - One httplib::Client per request, so concurrent calls never share a
//     connection
//   - Cancellation stops the in-flight socket
// ---------------------------------------------------------------------------
/// True when two "scheme://host[:port]" origins name the same server.
/// Scheme and host compare case-insensitively and an omitted port is the
/// scheme default (443 for https, 80 for http).
[[nodiscard]] bool SameOrigin(std::string_view lhs, std::string_view rhs);

class ArmSession : public IArmSession {
public:
    /// `base_url` is scheme + host (+ optional port), e.g.
    /// "https://management.azure.com".
    ArmSession(std::string base_url,
               std::string access_token,
               const ArmSessionOptions& options = {},
               Logger& logger = Logger::Null());

    ~ArmSession() override;

    [[nodiscard]] Result<HttpResponse, Error> Get(
        std::string_view path,
        const CancellationToken& cancel = {},
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const CancellationToken& cancel = {},
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] const std::string& BaseUrl() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace azlist
