#pragma once

#include <optional>
#include <string>
#include <vector>

namespace azlist {

inline constexpr const char* kDefaultAccessTokenEnv = "AZURE_ACCESS_TOKEN";

struct ConnectionConfig {
    std::optional<std::string> environment;   // public | china | usgovernment
    std::string subscription_id;
    std::string access_token;
    std::optional<std::string> access_token_env; // env var name to read the token from
    std::optional<std::string> endpoint;         // overrides the cloud's ARM endpoint
    std::optional<int> timeout_seconds;
    std::optional<bool> insecure;                // skip TLS verification
};

struct ListingConfig {
    std::vector<std::string> predicates;         // exactly one is valid
    std::optional<std::string> table;
    std::optional<std::string> authorization_scope_filter;
    std::optional<int> parallelism;
    std::optional<bool> recursive;
    std::optional<bool> include_managed;
    std::optional<bool> include_resource_group;
    std::vector<std::string> extensions;
    std::optional<std::string> schema_file;
};

struct OutputConfig {
    std::optional<bool> with_body;
    std::optional<bool> print_error;
    std::optional<bool> json;
};

struct LoggingConfig {
    std::optional<std::string> level;            // error | warn | info | debug
    int verbosity = 0;                           // -v info, -vv debug
    std::optional<std::string> format;           // text | json
    std::optional<std::string> file;
    bool color = false;
    bool no_color = false;
};

struct AppConfig {
    std::optional<std::string> config_file;
    ConnectionConfig connection;
    ListingConfig listing;
    OutputConfig output;
    LoggingConfig logging;
};

} // namespace azlist
