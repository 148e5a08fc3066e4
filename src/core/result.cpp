#include <azlist/core/result.hpp>
#include <azlist/core/strings.hpp>

namespace azlist {

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            std::optional<std::string> arm_error) {
    ErrorCategory category;
    std::string message;

    switch (status_code) {
        case 400:
            category = ErrorCategory::Internal;
            message = "Bad request";
            break;
        case 401:
            category = ErrorCategory::Authentication;
            message = "Authentication failed, check the access token";
            break;
        case 403:
            category = ErrorCategory::Forbidden;
            message = "Forbidden, the caller lacks permission";
            break;
        case 404:
            category = ErrorCategory::NotFound;
            message = "Not found";
            break;
        case 408:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 429:
            category = ErrorCategory::Throttled;
            message = "Too many requests, retry later";
            break;
        case 500:
            category = ErrorCategory::Internal;
            message = "Server internal error";
            break;
        case 502:
        case 503:
            category = ErrorCategory::Connection;
            message = "Service unavailable";
            break;
        case 504:
            category = ErrorCategory::Timeout;
            message = "Gateway timed out";
            break;
        default:
            category = ErrorCategory::Internal;
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    return Error{operation, endpoint, status_code, message, std::move(arm_error), category};
}

std::string Error::ToJson() const {
    std::ostringstream oss;
    oss << R"({"error":{)";
    oss << R"("category":")" << CategoryName() << R"(",)";
    oss << R"("operation":")" << JsonEscape(operation) << R"(",)";
    if (!endpoint.empty()) {
        oss << R"("endpoint":")" << JsonEscape(endpoint) << R"(",)";
    }
    if (http_status.has_value()) {
        oss << R"("http_status":)" << *http_status << R"(,)";
    }
    oss << R"("message":")" << JsonEscape(message) << R"(",)";
    if (arm_error.has_value() && !arm_error->empty()) {
        oss << R"("arm_error":")" << JsonEscape(*arm_error) << R"(",)";
    }
    oss << R"("exit_code":)" << ExitCode();
    oss << R"(}})";
    return oss.str();
}

} // namespace azlist
