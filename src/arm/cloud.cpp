#include <azlist/arm/cloud.hpp>
#include <azlist/core/strings.hpp>

namespace azlist {

Result<CloudEnvironment, Error> ParseCloudEnvironment(std::string_view name) {
    const auto lower = ToLower(name);
    if (lower == "public") {
        return Result<CloudEnvironment, Error>::Ok(CloudEnvironment::Public);
    }
    if (lower == "china") {
        return Result<CloudEnvironment, Error>::Ok(CloudEnvironment::China);
    }
    if (lower == "usgovernment") {
        return Result<CloudEnvironment, Error>::Ok(CloudEnvironment::UsGovernment);
    }
    return Result<CloudEnvironment, Error>::Err(MakeError(
        "ParseCloudEnvironment",
        "Unknown environment '" + std::string(name) +
            "', expected one of: public, china, usgovernment",
        ErrorCategory::Configuration));
}

std::string ResourceManagerEndpoint(CloudEnvironment env) {
    switch (env) {
        case CloudEnvironment::Public:       return "https://management.azure.com";
        case CloudEnvironment::China:        return "https://management.chinacloudapi.cn";
        case CloudEnvironment::UsGovernment: return "https://management.usgovcloudapi.net";
    }
    return "https://management.azure.com";
}

std::string CloudEnvironmentName(CloudEnvironment env) {
    switch (env) {
        case CloudEnvironment::Public:       return "public";
        case CloudEnvironment::China:        return "china";
        case CloudEnvironment::UsGovernment: return "usgovernment";
    }
    return "public";
}

} // namespace azlist
