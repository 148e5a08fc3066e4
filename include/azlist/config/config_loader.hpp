#pragma once

#include <azlist/config/app_config.hpp>
#include <azlist/core/log.hpp>
#include <azlist/core/result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace azlist {

// Authorization scope filters accepted by Resource Graph.
extern const std::vector<std::string> kAuthorizationScopeFilters;

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Read AZLIST_* (and ARM_SUBSCRIPTION_ID) environment variables.
Result<AppConfig, Error> LoadFromEnvironment();

// Parse CLI arguments into an AppConfig.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: fields set in `overrides` replace those in `base`.
// Boolean switches can only be turned on; lists replace when non-empty.
AppConfig MergeConfigs(const AppConfig& base, const AppConfig& overrides);

// If access_token is empty, read it from the access_token_env variable
// (default AZURE_ACCESS_TOKEN).
Result<AppConfig, Error> ResolveAccessToken(AppConfig config);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Effective log level: explicit level, else -v/-vv, else warn.
LogLevel EffectiveLogLevel(const LoggingConfig& logging);

// Schema snapshot location: listing.schema_file if set, otherwise
// "armschema.json" next to the executable named by argv0.
std::string ResolveSchemaPath(const AppConfig& config, std::string_view argv0);

} // namespace azlist
