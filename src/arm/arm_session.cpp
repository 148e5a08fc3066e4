#include <azlist/arm/arm_session.hpp>
#include <azlist/core/strings.hpp>

#include <httplib.h>

#include <algorithm>
#include <optional>
#include <string>
#include <utility>

namespace azlist {

namespace {

constexpr const char* kComponent = "http";

Error MakeSessionError(const std::string& operation,
                       const std::string& endpoint,
                       const std::string& message,
                       ErrorCategory category = ErrorCategory::Connection) {
    return Error{operation, endpoint, std::nullopt, message, std::nullopt, category};
}

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        case httplib::Error::Canceled:
            return ErrorCategory::Cancelled;
        default:
            return ErrorCategory::Connection;
    }
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

bool IsSensitiveHeader(std::string_view key) {
    return IEquals(key, "authorization") || IEquals(key, "cookie") ||
           IEquals(key, "set-cookie");
}

// Split "https://host[:port]/path?q" into origin and path. Returns nullopt
// for anything that is not an absolute http(s) URL.
std::optional<std::pair<std::string, std::string>> SplitAbsoluteUrl(std::string_view url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::nullopt;
    }
    auto scheme = url.substr(0, scheme_end);
    if (!IEquals(scheme, "http") && !IEquals(scheme, "https")) {
        return std::nullopt;
    }
    auto path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string_view::npos) {
        return std::make_pair(std::string(url), std::string("/"));
    }
    return std::make_pair(std::string(url.substr(0, path_start)),
                          std::string(url.substr(path_start)));
}

struct Origin {
    std::string scheme;
    std::string host;
    std::string port;
};

std::optional<Origin> ParseOrigin(std::string_view origin) {
    const auto sep = origin.find("://");
    if (sep == std::string_view::npos) {
        return std::nullopt;
    }
    Origin out;
    out.scheme = ToLower(origin.substr(0, sep));
    std::string_view authority = origin.substr(sep + 3);
    while (!authority.empty() && authority.back() == '/') {
        authority.remove_suffix(1);
    }

    std::string_view host = authority;
    std::string_view port;
    const auto bracket = authority.rfind(']');
    const auto colon = authority.rfind(':');
    if (colon != std::string_view::npos &&
        (bracket == std::string_view::npos || colon > bracket)) {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }
    if (host.empty()) {
        return std::nullopt;
    }
    out.host = ToLower(host);
    if (!port.empty()) {
        out.port = std::string(port);
    } else if (out.scheme == "https") {
        out.port = "443";
    } else if (out.scheme == "http") {
        out.port = "80";
    }
    return out;
}

} // anonymous namespace

bool SameOrigin(std::string_view lhs, std::string_view rhs) {
    auto a = ParseOrigin(lhs);
    auto b = ParseOrigin(rhs);
    if (!a.has_value() || !b.has_value()) {
        return false;
    }
    return a->scheme == b->scheme && a->host == b->host && a->port == b->port;
}

// ---------------------------------------------------------------------------
// Impl: connection settings shared by all requests.
// ---------------------------------------------------------------------------
struct ArmSession::Impl {
    std::string base_url;
    std::string access_token;
    ArmSessionOptions options;
    Logger& logger;

    Impl(std::string base, std::string token, const ArmSessionOptions& opts,
         Logger& log)
        : base_url(std::move(base)), access_token(std::move(token)),
          options(opts), logger(log) {
        while (!base_url.empty() && base_url.back() == '/') {
            base_url.pop_back();
        }
    }

    // Resolve a relative path or same-host absolute URL to a request path.
    // The bearer token must never leave the configured host.
    Result<std::string, Error> ResolvePath(const std::string& operation,
                                           std::string_view path) const {
        if (!path.empty() && path.front() == '/') {
            return Result<std::string, Error>::Ok(std::string(path));
        }
        auto split = SplitAbsoluteUrl(path);
        if (!split.has_value()) {
            return Result<std::string, Error>::Err(MakeSessionError(
                operation, std::string(path),
                "Request path must start with '/' or be an absolute URL",
                ErrorCategory::Internal));
        }
        if (!SameOrigin(split->first, base_url)) {
            return Result<std::string, Error>::Err(MakeSessionError(
                operation, std::string(path),
                "Refusing to send credentials to foreign host " + split->first,
                ErrorCategory::Internal));
        }
        return Result<std::string, Error>::Ok(std::move(split->second));
    }

    httplib::Headers BuildRequestHeaders(const HttpHeaders& extra) const {
        httplib::Headers hdrs;
        hdrs.emplace("Authorization", "Bearer " + access_token);
        hdrs.emplace("Accept", "application/json");
        if (!options.user_agent.empty()) {
            hdrs.emplace("User-Agent", options.user_agent);
        }
        for (const auto& [key, value] : extra) {
            hdrs.emplace(key, value);
        }
        return hdrs;
    }

    std::unique_ptr<httplib::Client> MakeClient() const {
        auto client = std::make_unique<httplib::Client>(base_url);
        client->set_connection_timeout(options.connect_timeout);
        client->set_read_timeout(options.read_timeout);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        if (options.disable_tls_verify) {
            client->enable_server_certificate_verification(false);
        }
#endif
        return client;
    }

    void LogRequestHeaders(const httplib::Headers& hdrs) const {
        if (!logger.Enabled(LogLevel::Debug)) {
            return;
        }
        for (const auto& [k, v] : hdrs) {
            if (IsSensitiveHeader(k)) {
                logger.Debug(kComponent, "  > " + k + ": <redacted>");
            } else {
                logger.Debug(kComponent, "  > " + k + ": " + v);
            }
        }
    }

    void LogResponse(const std::string& path, int status,
                     const std::string& body) const {
        logger.Info(kComponent, "  < " + std::to_string(status) + " " + path);
        if (status >= 400 && !body.empty()) {
            constexpr size_t kMaxBodyLog = 2000;
            if (body.size() <= kMaxBodyLog) {
                logger.Debug(kComponent, "  < body: " + body);
            } else {
                logger.Debug(kComponent, "  < body: " + body.substr(0, kMaxBodyLog) +
                                             "... (truncated)");
            }
        }
    }

    // Shared request driver: resolves the path, wires cancellation to the
    // client's socket and converts the httplib result.
    template <typename Send>
    Result<HttpResponse, Error> Execute(const std::string& operation,
                                        const char* method,
                                        std::string_view raw_path,
                                        const CancellationToken& cancel,
                                        const HttpHeaders& extra_headers,
                                        Send&& send) const {
        if (cancel.IsCancelled()) {
            return Result<HttpResponse, Error>::Err(MakeSessionError(
                operation, std::string(raw_path), "Request cancelled",
                ErrorCategory::Cancelled));
        }
        auto resolved = ResolvePath(operation, raw_path);
        if (resolved.IsErr()) {
            return Result<HttpResponse, Error>::Err(std::move(resolved).Error());
        }
        const auto path = std::move(resolved).Value();

        auto hdrs = BuildRequestHeaders(extra_headers);
        logger.Info(kComponent, std::string(method) + " " + path);
        LogRequestHeaders(hdrs);

        auto client = MakeClient();
        auto* client_ptr = client.get();
        auto registration = cancel.OnCancel([client_ptr] { client_ptr->stop(); });

        auto res = send(*client, path, hdrs);
        if (!res) {
            const auto http_error = res.error();
            auto category = cancel.IsCancelled()
                ? ErrorCategory::Cancelled
                : CategoryFromHttpTransportError(http_error);
            return Result<HttpResponse, Error>::Err(MakeSessionError(
                operation, path,
                "HTTP request failed: " + httplib::to_string(http_error),
                category));
        }
        LogResponse(path, res->status, res->body);
        return Result<HttpResponse, Error>::Ok(HttpResponse{
            res->status, ToHttpHeaders(res->headers), res->body});
    }
};

// ---------------------------------------------------------------------------
// ArmSession
// ---------------------------------------------------------------------------
ArmSession::ArmSession(std::string base_url,
                       std::string access_token,
                       const ArmSessionOptions& options,
                       Logger& logger)
    : impl_(std::make_unique<Impl>(std::move(base_url), std::move(access_token),
                                   options, logger)) {}

ArmSession::~ArmSession() = default;

Result<HttpResponse, Error> ArmSession::Get(std::string_view path,
                                            const CancellationToken& cancel,
                                            const HttpHeaders& headers) {
    return impl_->Execute(
        "Get", "GET", path, cancel, headers,
        [](httplib::Client& client, const std::string& p,
           const httplib::Headers& hdrs) { return client.Get(p, hdrs); });
}

Result<HttpResponse, Error> ArmSession::Post(std::string_view path,
                                             std::string_view body,
                                             std::string_view content_type,
                                             const CancellationToken& cancel,
                                             const HttpHeaders& headers) {
    const std::string body_str(body);
    const std::string type_str(content_type);
    return impl_->Execute(
        "Post", "POST", path, cancel, headers,
        [&body_str, &type_str](httplib::Client& client, const std::string& p,
                               const httplib::Headers& hdrs) {
            return client.Post(p, hdrs, body_str, type_str);
        });
}

const std::string& ArmSession::BaseUrl() const noexcept {
    return impl_->base_url;
}

} // namespace azlist
