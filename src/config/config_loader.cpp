#include <azlist/config/config_loader.hpp>

#include <azlist/arm/cloud.hpp>
#include <azlist/core/strings.hpp>
#include <azlist/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace azlist {

const std::vector<std::string> kAuthorizationScopeFilters = {
    "AtScopeAndBelow",
    "AtScopeAndAbove",
    "AtScopeAboveAndBelow",
    "AtScopeExact",
};

namespace {

Error MakeConfigError(const std::string& message) {
    return MakeError("ConfigLoader", message, ErrorCategory::Configuration);
}

std::optional<std::string> GetEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

Result<bool, Error> ParseEnvBool(const char* name, const std::string& value) {
    auto lower = ToLower(value);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        return Result<bool, Error>::Ok(true);
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        return Result<bool, Error>::Ok(false);
    }
    return Result<bool, Error>::Err(MakeConfigError(
        std::string("Invalid boolean in ") + name + ": '" + value + "'"));
}

Result<int, Error> ParseEnvInt(const char* name, const std::string& value) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used == value.size()) {
            return Result<int, Error>::Ok(parsed);
        }
    } catch (const std::logic_error&) {
        // falls through to the error below
    }
    return Result<int, Error>::Err(MakeConfigError(
        std::string("Invalid integer in ") + name + ": '" + value + "'"));
}

template <typename T>
void ReadOptional(const YAML::Node& node, const char* key, std::optional<T>& out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    config.config_file = std::string(file_path);

    try {
        // -- Connection --
        if (const auto conn = root["connection"]) {
            ReadOptional(conn, "environment", config.connection.environment);
            if (conn["subscription_id"]) {
                config.connection.subscription_id = conn["subscription_id"].as<std::string>();
            }
            if (conn["access_token"]) {
                config.connection.access_token = conn["access_token"].as<std::string>();
            }
            ReadOptional(conn, "access_token_env", config.connection.access_token_env);
            ReadOptional(conn, "endpoint", config.connection.endpoint);
            ReadOptional(conn, "timeout", config.connection.timeout_seconds);
            ReadOptional(conn, "insecure", config.connection.insecure);
        }

        // -- Listing --
        if (const auto listing = root["listing"]) {
            ReadOptional(listing, "table", config.listing.table);
            ReadOptional(listing, "authorization_scope_filter",
                         config.listing.authorization_scope_filter);
            ReadOptional(listing, "parallelism", config.listing.parallelism);
            ReadOptional(listing, "recursive", config.listing.recursive);
            ReadOptional(listing, "include_managed", config.listing.include_managed);
            ReadOptional(listing, "include_resource_group", config.listing.include_resource_group);
            ReadOptional(listing, "schema", config.listing.schema_file);
            if (listing["extensions"]) {
                for (const auto& ext : listing["extensions"]) {
                    config.listing.extensions.push_back(ext.as<std::string>());
                }
            }
        }

        // -- Output --
        if (const auto output = root["output"]) {
            ReadOptional(output, "with_body", config.output.with_body);
            ReadOptional(output, "print_error", config.output.print_error);
            ReadOptional(output, "json", config.output.json);
        }

        // -- Logging --
        if (const auto logging = root["logging"]) {
            ReadOptional(logging, "level", config.logging.level);
            ReadOptional(logging, "format", config.logging.format);
            ReadOptional(logging, "file", config.logging.file);
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in " + std::string(file_path) + ": " + e.what()));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromEnvironment
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromEnvironment() {
    AppConfig config;

    if (auto v = GetEnv("AZLIST_ENV")) {
        config.connection.environment = *v;
    }
    if (auto v = GetEnv("AZLIST_SUBSCRIPTION_ID")) {
        config.connection.subscription_id = *v;
    } else if (auto arm = GetEnv("ARM_SUBSCRIPTION_ID")) {
        config.connection.subscription_id = *arm;
    }
    if (auto v = GetEnv("AZLIST_ENDPOINT")) {
        config.connection.endpoint = *v;
    }
    if (auto v = GetEnv("AZLIST_TABLE")) {
        config.listing.table = *v;
    }
    if (auto v = GetEnv("AZLIST_AUTHORIZATION_SCOPE_FILTER")) {
        config.listing.authorization_scope_filter = *v;
    }
    if (auto v = GetEnv("AZLIST_SCHEMA")) {
        config.listing.schema_file = *v;
    }
    if (auto v = GetEnv("AZLIST_LOG_LEVEL")) {
        config.logging.level = *v;
    }
    if (auto v = GetEnv("AZLIST_EXTENSION")) {
        for (auto& ext : Split(*v, ',')) {
            if (!ext.empty()) {
                config.listing.extensions.push_back(std::move(ext));
            }
        }
    }
    if (auto v = GetEnv("AZLIST_PARALLELISM")) {
        auto parsed = ParseEnvInt("AZLIST_PARALLELISM", *v);
        if (parsed.IsErr()) {
            return Result<AppConfig, Error>::Err(parsed.Error());
        }
        config.listing.parallelism = parsed.Value();
    }

    struct BoolVar {
        const char* name;
        std::optional<bool>* target;
    };
    const BoolVar flags[] = {
        {"AZLIST_RECURSIVE", &config.listing.recursive},
        {"AZLIST_INCLUDE_MANAGED", &config.listing.include_managed},
        {"AZLIST_INCLUDE_RESOURCE_GROUP", &config.listing.include_resource_group},
        {"AZLIST_WITH_BODY", &config.output.with_body},
        {"AZLIST_PRINT_ERROR", &config.output.print_error},
    };
    for (const auto& flag : flags) {
        if (auto v = GetEnv(flag.name)) {
            auto parsed = ParseEnvBool(flag.name, *v);
            if (parsed.IsErr()) {
                return Result<AppConfig, Error>::Err(parsed.Error());
            }
            *flag.target = parsed.Value();
        }
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("azlist", kVersion);
    program.add_description(
        "List Azure resources by an Azure Resource Graph `where` predicate.");
    program.add_epilog("Usage: azlist [options] <where predicate>");

    AppConfig config;

    program.add_argument("predicate")
        .help("Resource Graph where predicate, e.g. \"type =~ 'microsoft.network/virtualnetworks'\"")
        .nargs(argparse::nargs_pattern::any)
        .default_value(std::vector<std::string>{});

    // Connection
    program.add_argument("--env")
        .help("Cloud environment: public, china or usgovernment");
    program.add_argument("-s", "--subscription-id")
        .help("Subscription id");
    program.add_argument("--access-token-env")
        .help("Environment variable holding the ARM bearer token (default AZURE_ACCESS_TOKEN)");
    program.add_argument("--endpoint")
        .help("Resource Manager base URL, overrides --env");
    program.add_argument("--timeout")
        .help("HTTP read timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--insecure")
        .help("Skip TLS certificate verification")
        .default_value(false)
        .implicit_value(true);

    // Listing
    program.add_argument("-r", "--recursive")
        .help("Recursively list child resources of the query result")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-m", "--include-managed")
        .help("Include resources whose lifecycle is managed by others")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--include-resource-group")
        .help("Include the resource groups the listed resources belong to")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-p", "--parallelism")
        .help("Limit the number of parallel listing operations")
        .scan<'i', int>();
    program.add_argument("--extension")
        .help("Extension resource type to list under every resource (repeatable), "
              "e.g. Microsoft.Authorization/roleAssignments")
        .append()
        .default_value(std::vector<std::string>{});
    program.add_argument("-t", "--table")
        .help("Resource Graph table (default Resources)");
    program.add_argument("--authorization-scope-filter")
        .help("AtScopeAndBelow, AtScopeAndAbove, AtScopeAboveAndBelow or AtScopeExact");
    program.add_argument("--schema")
        .help("Path to the resource type schema snapshot (JSON)");

    // Output
    program.add_argument("-b", "--with-body")
        .help("Print each resource's body")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-e", "--print-error")
        .help("Print errors received while listing resources")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--json")
        .help("Print the whole result as one JSON document")
        .default_value(false)
        .implicit_value(true);

    // Logging
    program.add_argument("-L", "--log-level")
        .help("Log level: error, warn, info or debug");
    program.add_argument("-v", "--verbose")
        .help("Increase verbosity (-v info, -vv debug)")
        .action([&config](const auto&) { ++config.logging.verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);
    program.add_argument("--log-format")
        .help("Log format: text or json");
    program.add_argument("--log-file")
        .help("Also write JSON log lines to this file");
    program.add_argument("--color")
        .help("Force colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    try {
        config.listing.predicates = program.get<std::vector<std::string>>("predicate");

        if (auto val = program.present("--config")) {
            config.config_file = *val;
        }

        // Connection
        if (auto val = program.present("--env")) {
            config.connection.environment = *val;
        }
        if (auto val = program.present("--subscription-id")) {
            config.connection.subscription_id = *val;
        }
        if (auto val = program.present("--access-token-env")) {
            config.connection.access_token_env = *val;
        }
        if (auto val = program.present("--endpoint")) {
            config.connection.endpoint = *val;
        }
        if (auto val = program.present<int>("--timeout")) {
            config.connection.timeout_seconds = *val;
        }
        if (program.get<bool>("--insecure")) {
            config.connection.insecure = true;
        }

        // Listing
        if (program.get<bool>("--recursive")) {
            config.listing.recursive = true;
        }
        if (program.get<bool>("--include-managed")) {
            config.listing.include_managed = true;
        }
        if (program.get<bool>("--include-resource-group")) {
            config.listing.include_resource_group = true;
        }
        if (auto val = program.present<int>("--parallelism")) {
            config.listing.parallelism = *val;
        }
        config.listing.extensions = program.get<std::vector<std::string>>("--extension");
        if (auto val = program.present("--table")) {
            config.listing.table = *val;
        }
        if (auto val = program.present("--authorization-scope-filter")) {
            config.listing.authorization_scope_filter = *val;
        }
        if (auto val = program.present("--schema")) {
            config.listing.schema_file = *val;
        }

        // Output
        if (program.get<bool>("--with-body")) {
            config.output.with_body = true;
        }
        if (program.get<bool>("--print-error")) {
            config.output.print_error = true;
        }
        if (program.get<bool>("--json")) {
            config.output.json = true;
        }

        // Logging
        if (auto val = program.present("--log-level")) {
            config.logging.level = *val;
        }
        if (auto val = program.present("--log-format")) {
            config.logging.format = *val;
        }
        if (auto val = program.present("--log-file")) {
            config.logging.file = *val;
        }
        config.logging.color = program.get<bool>("--color");
        config.logging.no_color = program.get<bool>("--no-color");
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const AppConfig& overrides) {
    AppConfig merged = base;

    if (overrides.config_file.has_value()) {
        merged.config_file = overrides.config_file;
    }

    // Connection
    const auto& conn = overrides.connection;
    if (conn.environment.has_value()) {
        merged.connection.environment = conn.environment;
    }
    if (!conn.subscription_id.empty()) {
        merged.connection.subscription_id = conn.subscription_id;
    }
    if (!conn.access_token.empty()) {
        merged.connection.access_token = conn.access_token;
    }
    if (conn.access_token_env.has_value()) {
        merged.connection.access_token_env = conn.access_token_env;
    }
    if (conn.endpoint.has_value()) {
        merged.connection.endpoint = conn.endpoint;
    }
    if (conn.timeout_seconds.has_value()) {
        merged.connection.timeout_seconds = conn.timeout_seconds;
    }
    if (conn.insecure.has_value()) {
        merged.connection.insecure = conn.insecure;
    }

    // Listing
    const auto& listing = overrides.listing;
    if (!listing.predicates.empty()) {
        merged.listing.predicates = listing.predicates;
    }
    if (listing.table.has_value()) {
        merged.listing.table = listing.table;
    }
    if (listing.authorization_scope_filter.has_value()) {
        merged.listing.authorization_scope_filter = listing.authorization_scope_filter;
    }
    if (listing.parallelism.has_value()) {
        merged.listing.parallelism = listing.parallelism;
    }
    if (listing.recursive.has_value()) {
        merged.listing.recursive = listing.recursive;
    }
    if (listing.include_managed.has_value()) {
        merged.listing.include_managed = listing.include_managed;
    }
    if (listing.include_resource_group.has_value()) {
        merged.listing.include_resource_group = listing.include_resource_group;
    }
    if (!listing.extensions.empty()) {
        merged.listing.extensions = listing.extensions;
    }
    if (listing.schema_file.has_value()) {
        merged.listing.schema_file = listing.schema_file;
    }

    // Output
    if (overrides.output.with_body.has_value()) {
        merged.output.with_body = overrides.output.with_body;
    }
    if (overrides.output.print_error.has_value()) {
        merged.output.print_error = overrides.output.print_error;
    }
    if (overrides.output.json.has_value()) {
        merged.output.json = overrides.output.json;
    }

    // Logging
    const auto& logging = overrides.logging;
    if (logging.level.has_value()) {
        merged.logging.level = logging.level;
    }
    if (logging.verbosity > 0) {
        merged.logging.verbosity = logging.verbosity;
    }
    if (logging.format.has_value()) {
        merged.logging.format = logging.format;
    }
    if (logging.file.has_value()) {
        merged.logging.file = logging.file;
    }
    if (logging.color) {
        merged.logging.color = true;
    }
    if (logging.no_color) {
        merged.logging.no_color = true;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ResolveAccessToken
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveAccessToken(AppConfig config) {
    if (!config.connection.access_token.empty()) {
        return Result<AppConfig, Error>::Ok(std::move(config));
    }
    const std::string env_var = config.connection.access_token_env.value_or(kDefaultAccessTokenEnv);
    auto token = GetEnv(env_var.c_str());
    if (!token.has_value()) {
        return Result<AppConfig, Error>::Err(MakeConfigError(
            "Environment variable '" + env_var + "' not set (no access token available)"));
    }
    config.connection.access_token = std::move(*token);
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.listing.predicates.empty()) {
        return Result<void, Error>::Err(MakeConfigError("No where predicate specified"));
    }
    if (config.listing.predicates.size() > 1) {
        return Result<void, Error>::Err(
            MakeConfigError("More than one where predicate specified"));
    }
    if (config.connection.subscription_id.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: subscription id"));
    }
    if (config.connection.access_token.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing access token"));
    }
    if (config.connection.environment.has_value()) {
        auto env = ParseCloudEnvironment(*config.connection.environment);
        if (env.IsErr()) {
            return Result<void, Error>::Err(env.Error());
        }
    }
    if (config.connection.timeout_seconds.has_value() &&
        *config.connection.timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Timeout must be positive, got " +
                            std::to_string(*config.connection.timeout_seconds)));
    }
    if (config.listing.parallelism.has_value() && *config.listing.parallelism <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Parallelism must be positive, got " +
                            std::to_string(*config.listing.parallelism)));
    }
    if (config.listing.authorization_scope_filter.has_value()) {
        const auto& filter = *config.listing.authorization_scope_filter;
        auto it = std::find(kAuthorizationScopeFilters.begin(),
                            kAuthorizationScopeFilters.end(), filter);
        if (it == kAuthorizationScopeFilters.end()) {
            return Result<void, Error>::Err(MakeConfigError(
                "Unknown authorization scope filter: '" + filter + "'"));
        }
    }
    if (config.listing.table.has_value() && config.listing.table->empty()) {
        return Result<void, Error>::Err(MakeConfigError("Table name must not be empty"));
    }
    if (config.logging.level.has_value() && !ParseLogLevel(*config.logging.level)) {
        return Result<void, Error>::Err(
            MakeConfigError("Unknown log level: '" + *config.logging.level + "'"));
    }
    if (config.logging.format.has_value() && *config.logging.format != "text" &&
        *config.logging.format != "json") {
        return Result<void, Error>::Err(
            MakeConfigError("Unknown log format: '" + *config.logging.format + "'"));
    }
    if (config.logging.color && config.logging.no_color) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --color and --no-color"));
    }
    return Result<void, Error>::Ok();
}

LogLevel EffectiveLogLevel(const LoggingConfig& logging) {
    if (logging.level.has_value()) {
        if (auto level = ParseLogLevel(*logging.level)) {
            return *level;
        }
    }
    if (logging.verbosity >= 2) {
        return LogLevel::Debug;
    }
    if (logging.verbosity == 1) {
        return LogLevel::Info;
    }
    return LogLevel::Warn;
}

std::string ResolveSchemaPath(const AppConfig& config, std::string_view argv0) {
    if (config.listing.schema_file.has_value()) {
        return *config.listing.schema_file;
    }
    std::string exe(argv0);
    auto slash = exe.rfind('/');
    if (slash == std::string::npos) {
        return "armschema.json";
    }
    return exe.substr(0, slash + 1) + "armschema.json";
}

} // namespace azlist
