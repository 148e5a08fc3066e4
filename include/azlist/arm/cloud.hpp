#pragma once

#include <azlist/core/result.hpp>

#include <string>
#include <string_view>

namespace azlist {

// Sovereign clouds the Resource Manager endpoint can live in.
enum class CloudEnvironment {
    Public,
    China,
    UsGovernment,
};

/// Parse "public", "china" or "usgovernment" (case-insensitive).
Result<CloudEnvironment, Error> ParseCloudEnvironment(std::string_view name);

/// Resource Manager base URL, e.g. "https://management.azure.com".
std::string ResourceManagerEndpoint(CloudEnvironment env);

std::string CloudEnvironmentName(CloudEnvironment env);

} // namespace azlist
