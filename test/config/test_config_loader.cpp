#include <catch2/catch_test_macros.hpp>

#include <azlist/config/config_loader.hpp>

#include <cstdlib>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

using namespace azlist;

namespace {

void SetEnv(const char* name, const char* value) {
    setenv(name, value, 1);
}

void UnsetEnv(const char* name) {
    unsetenv(name);
}

// Clears every variable LoadFromEnvironment reads so tests start clean.
void ClearAzlistEnv() {
    for (const char* name : {"AZLIST_ENV", "AZLIST_SUBSCRIPTION_ID", "ARM_SUBSCRIPTION_ID",
                             "AZLIST_ENDPOINT", "AZLIST_TABLE",
                             "AZLIST_AUTHORIZATION_SCOPE_FILTER", "AZLIST_SCHEMA",
                             "AZLIST_LOG_LEVEL", "AZLIST_EXTENSION", "AZLIST_PARALLELISM",
                             "AZLIST_RECURSIVE", "AZLIST_INCLUDE_MANAGED",
                             "AZLIST_INCLUDE_RESOURCE_GROUP", "AZLIST_WITH_BODY",
                             "AZLIST_PRINT_ERROR"}) {
        UnsetEnv(name);
    }
}

// Tests run from the build directory; derive testdata from this file's path.
std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

AppConfig ValidConfig() {
    AppConfig config;
    config.listing.predicates = {"type =~ 'microsoft.network/virtualnetworks'"};
    config.connection.subscription_id = "s1";
    config.connection.access_token = "token";
    return config;
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.connection.environment == std::optional<std::string>("public"));
    CHECK(config.connection.subscription_id == "00000000-0000-0000-0000-000000000001");
    CHECK(config.connection.access_token.empty());
    CHECK(config.connection.access_token_env == std::optional<std::string>("MY_ARM_TOKEN"));
    CHECK(config.connection.timeout_seconds == std::optional<int>(60));
    CHECK_FALSE(config.connection.insecure.value_or(false));

    CHECK(config.listing.table == std::optional<std::string>("ResourceContainers"));
    CHECK(config.listing.authorization_scope_filter ==
          std::optional<std::string>("AtScopeAndBelow"));
    CHECK(config.listing.parallelism == std::optional<int>(8));
    CHECK(config.listing.recursive == true);
    CHECK_FALSE(config.listing.include_managed.value_or(false));
    CHECK(config.listing.include_resource_group == true);
    CHECK(config.listing.schema_file == std::optional<std::string>("/opt/azlist/armschema.json"));
    CHECK(config.listing.extensions == std::vector<std::string>{
        "Microsoft.Authorization/roleAssignments", "Microsoft.Authorization/locks"});

    CHECK(config.output.with_body == true);
    CHECK(config.output.print_error == true);
    CHECK_FALSE(config.output.json.value_or(false));

    CHECK(config.logging.level == std::optional<std::string>("debug"));
    CHECK(config.logging.format == std::optional<std::string>("json"));
    CHECK(config.logging.file == std::optional<std::string>("/tmp/azlist.log"));
    CHECK(config.config_file == std::optional<std::string>(TestDataPath("valid_config.yaml")));
}

TEST_CASE("LoadFromYaml: minimal config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.connection.subscription_id == "sub-minimal");
    CHECK(config.connection.access_token == "token-from-file");
    CHECK_FALSE(config.connection.environment.has_value());
    CHECK_FALSE(config.listing.table.has_value());
    CHECK_FALSE(config.listing.recursive.value_or(false));
    CHECK(config.listing.extensions.empty());
}

TEST_CASE("LoadFromYaml: nonexistent file", "[config][yaml]") {
    auto result = LoadFromYaml("/nonexistent/path/config.yaml");
    REQUIRE(result.IsErr());
    CHECK(result.Error().operation == "ConfigLoader");
    CHECK(result.Error().category == ErrorCategory::Configuration);
}

TEST_CASE("LoadFromYaml: value of the wrong type", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_value_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Configuration);
    CHECK(result.Error().message.find("Invalid value") != std::string::npos);
}

// ===========================================================================
// LoadFromEnvironment
// ===========================================================================

TEST_CASE("LoadFromEnvironment: reads AZLIST variables", "[config][env]") {
    ClearAzlistEnv();
    SetEnv("AZLIST_SUBSCRIPTION_ID", "env-sub");
    SetEnv("AZLIST_ENV", "china");
    SetEnv("AZLIST_EXTENSION", "Microsoft.Authorization/roleAssignments,,Microsoft.Authorization/locks");
    SetEnv("AZLIST_PARALLELISM", "16");
    SetEnv("AZLIST_RECURSIVE", "yes");
    SetEnv("AZLIST_WITH_BODY", "0");

    auto result = LoadFromEnvironment();
    ClearAzlistEnv();
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.connection.subscription_id == "env-sub");
    CHECK(config.connection.environment == std::optional<std::string>("china"));
    CHECK(config.listing.extensions == std::vector<std::string>{
        "Microsoft.Authorization/roleAssignments", "Microsoft.Authorization/locks"});
    CHECK(config.listing.parallelism == std::optional<int>(16));
    CHECK(config.listing.recursive == true);
    CHECK(config.output.with_body == false);
    CHECK_FALSE(config.output.print_error.has_value());
}

TEST_CASE("LoadFromEnvironment: ARM_SUBSCRIPTION_ID is a fallback", "[config][env]") {
    ClearAzlistEnv();
    SetEnv("ARM_SUBSCRIPTION_ID", "arm-sub");
    auto fallback = LoadFromEnvironment();

    SetEnv("AZLIST_SUBSCRIPTION_ID", "azlist-sub");
    auto preferred = LoadFromEnvironment();
    ClearAzlistEnv();

    REQUIRE(fallback.IsOk());
    CHECK(fallback.Value().connection.subscription_id == "arm-sub");
    REQUIRE(preferred.IsOk());
    CHECK(preferred.Value().connection.subscription_id == "azlist-sub");
}

TEST_CASE("LoadFromEnvironment: invalid boolean", "[config][env]") {
    ClearAzlistEnv();
    SetEnv("AZLIST_INCLUDE_MANAGED", "sometimes");
    auto result = LoadFromEnvironment();
    ClearAzlistEnv();

    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("AZLIST_INCLUDE_MANAGED") != std::string::npos);
}

TEST_CASE("LoadFromEnvironment: invalid integer", "[config][env]") {
    ClearAzlistEnv();
    SetEnv("AZLIST_PARALLELISM", "4x");
    auto result = LoadFromEnvironment();
    ClearAzlistEnv();

    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Configuration);
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: predicate and flags", "[config][cli]") {
    const char* argv[] = {"azlist", "-s", "sub1", "-r", "-m", "--include-resource-group",
                          "-p", "4", "-b", "-e", "--extension",
                          "Microsoft.Authorization/roleAssignments",
                          "--authorization-scope-filter", "AtScopeExact",
                          "type =~ 'microsoft.compute/virtualmachines'"};
    auto result = LoadFromCli(static_cast<int>(std::size(argv)), argv);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.listing.predicates ==
          std::vector<std::string>{"type =~ 'microsoft.compute/virtualmachines'"});
    CHECK(config.connection.subscription_id == "sub1");
    CHECK(config.listing.recursive == true);
    CHECK(config.listing.include_managed == true);
    CHECK(config.listing.include_resource_group == true);
    CHECK(config.listing.parallelism == std::optional<int>(4));
    CHECK(config.output.with_body == true);
    CHECK(config.output.print_error == true);
    CHECK_FALSE(config.output.json.value_or(false));
    CHECK(config.listing.extensions ==
          std::vector<std::string>{"Microsoft.Authorization/roleAssignments"});
    CHECK(config.listing.authorization_scope_filter ==
          std::optional<std::string>("AtScopeExact"));
}

TEST_CASE("LoadFromCli: defaults", "[config][cli]") {
    const char* argv[] = {"azlist", "true"};
    auto result = LoadFromCli(2, argv);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.listing.predicates == std::vector<std::string>{"true"});
    CHECK(config.connection.subscription_id.empty());
    CHECK_FALSE(config.listing.recursive.value_or(false));
    CHECK_FALSE(config.listing.parallelism.has_value());
    CHECK_FALSE(config.connection.insecure.value_or(false));
    CHECK(config.logging.verbosity == 0);
    CHECK_FALSE(config.config_file.has_value());
}

TEST_CASE("LoadFromCli: no predicate parses to an empty list", "[config][cli]") {
    const char* argv[] = {"azlist", "-s", "sub1"};
    auto result = LoadFromCli(3, argv);
    REQUIRE(result.IsOk());
    CHECK(result.Value().listing.predicates.empty());
}

TEST_CASE("LoadFromCli: verbosity counts repeated -v", "[config][cli]") {
    const char* argv[] = {"azlist", "-v", "-v", "true"};
    auto result = LoadFromCli(4, argv);
    REQUIRE(result.IsOk());
    CHECK(result.Value().logging.verbosity == 2);
    CHECK(EffectiveLogLevel(result.Value().logging) == LogLevel::Debug);
}

TEST_CASE("LoadFromCli: logging and connection options", "[config][cli]") {
    const char* argv[] = {"azlist", "--env", "usgovernment", "--endpoint", "http://127.0.0.1:8080",
                          "--timeout", "30", "--insecure", "-L", "info", "--log-format", "json",
                          "--log-file", "out.log", "--no-color", "-c", "azlist.yaml",
                          "--schema", "schema.json", "-t", "ResourceContainers", "true"};
    auto result = LoadFromCli(static_cast<int>(std::size(argv)), argv);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.connection.environment == std::optional<std::string>("usgovernment"));
    CHECK(config.connection.endpoint == std::optional<std::string>("http://127.0.0.1:8080"));
    CHECK(config.connection.timeout_seconds == std::optional<int>(30));
    CHECK(config.connection.insecure == true);
    CHECK(config.logging.level == std::optional<std::string>("info"));
    CHECK(config.logging.format == std::optional<std::string>("json"));
    CHECK(config.logging.file == std::optional<std::string>("out.log"));
    CHECK(config.logging.no_color);
    CHECK(config.config_file == std::optional<std::string>("azlist.yaml"));
    CHECK(config.listing.schema_file == std::optional<std::string>("schema.json"));
    CHECK(config.listing.table == std::optional<std::string>("ResourceContainers"));
}

TEST_CASE("LoadFromCli: unknown option is a configuration error", "[config][cli]") {
    const char* argv[] = {"azlist", "--frobnicate", "true"};
    auto result = LoadFromCli(3, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Configuration);
}

TEST_CASE("LoadFromCli: non-numeric parallelism is rejected", "[config][cli]") {
    const char* argv[] = {"azlist", "-p", "many", "true"};
    auto result = LoadFromCli(4, argv);
    REQUIRE(result.IsErr());
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: overrides replace set fields only", "[config][merge]") {
    auto yaml = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(yaml.IsOk());

    AppConfig cli;
    cli.listing.predicates = {"true"};
    cli.connection.subscription_id = "cli-sub";
    cli.listing.parallelism = 2;
    cli.output.json = true;

    auto merged = MergeConfigs(yaml.Value(), cli);
    CHECK(merged.connection.subscription_id == "cli-sub");
    CHECK(merged.listing.parallelism == std::optional<int>(2));
    CHECK(merged.listing.predicates == std::vector<std::string>{"true"});
    CHECK(merged.output.json == true);
    // Untouched fields come from the base.
    CHECK(merged.listing.table == std::optional<std::string>("ResourceContainers"));
    CHECK(merged.listing.recursive == true);
    CHECK(merged.output.with_body == true);
    CHECK(merged.listing.extensions.size() == 2);
    CHECK(merged.logging.level == std::optional<std::string>("debug"));
}

TEST_CASE("MergeConfigs: yaml < env < cli precedence", "[config][merge]") {
    AppConfig yaml;
    yaml.connection.subscription_id = "yaml-sub";
    yaml.listing.table = std::string("Resources");
    AppConfig env;
    env.connection.subscription_id = "env-sub";
    env.listing.extensions = {"Microsoft.Authorization/locks"};
    AppConfig cli;
    cli.listing.extensions = {"Microsoft.Authorization/roleAssignments"};

    auto merged = MergeConfigs(MergeConfigs(yaml, env), cli);
    CHECK(merged.connection.subscription_id == "env-sub");
    CHECK(merged.listing.table == std::optional<std::string>("Resources"));
    CHECK(merged.listing.extensions ==
          std::vector<std::string>{"Microsoft.Authorization/roleAssignments"});
}

TEST_CASE("MergeConfigs: explicit false in env overrides yaml true", "[config][merge]") {
    auto yaml = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(yaml.IsOk());
    REQUIRE(yaml.Value().listing.recursive == true);

    ClearAzlistEnv();
    SetEnv("AZLIST_RECURSIVE", "false");
    SetEnv("AZLIST_WITH_BODY", "no");
    auto env = LoadFromEnvironment();
    ClearAzlistEnv();
    REQUIRE(env.IsOk());

    AppConfig cli;
    auto merged = MergeConfigs(MergeConfigs(yaml.Value(), env.Value()), cli);
    CHECK(merged.listing.recursive == false);
    CHECK(merged.output.with_body == false);
    // Flags the env leaves unset keep the yaml value.
    CHECK(merged.listing.include_resource_group == true);
    CHECK(merged.output.print_error == true);
}

TEST_CASE("MergeConfigs: yaml false is kept when nothing overrides it", "[config][merge]") {
    AppConfig yaml;
    yaml.connection.insecure = false;
    AppConfig env;

    auto merged = MergeConfigs(yaml, env);
    CHECK(merged.connection.insecure == false);
    CHECK_FALSE(merged.output.json.has_value());
}

// ===========================================================================
// ResolveAccessToken
// ===========================================================================

TEST_CASE("ResolveAccessToken: explicit token wins", "[config][token]") {
    AppConfig config;
    config.connection.access_token = "explicit";
    auto result = ResolveAccessToken(config);
    REQUIRE(result.IsOk());
    CHECK(result.Value().connection.access_token == "explicit");
}

TEST_CASE("ResolveAccessToken: reads the named variable", "[config][token]") {
    SetEnv("AZLIST_TEST_TOKEN", "from-env");
    AppConfig config;
    config.connection.access_token_env = std::string("AZLIST_TEST_TOKEN");
    auto result = ResolveAccessToken(config);
    UnsetEnv("AZLIST_TEST_TOKEN");

    REQUIRE(result.IsOk());
    CHECK(result.Value().connection.access_token == "from-env");
}

TEST_CASE("ResolveAccessToken: default variable", "[config][token]") {
    SetEnv(kDefaultAccessTokenEnv, "default-token");
    auto result = ResolveAccessToken(AppConfig{});
    UnsetEnv(kDefaultAccessTokenEnv);

    REQUIRE(result.IsOk());
    CHECK(result.Value().connection.access_token == "default-token");
}

TEST_CASE("ResolveAccessToken: missing variable", "[config][token]") {
    UnsetEnv("AZLIST_TEST_MISSING_TOKEN");
    AppConfig config;
    config.connection.access_token_env = std::string("AZLIST_TEST_MISSING_TOKEN");
    auto result = ResolveAccessToken(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("AZLIST_TEST_MISSING_TOKEN") != std::string::npos);
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: valid config", "[config][validate]") {
    CHECK(ValidateConfig(ValidConfig()).IsOk());
}

TEST_CASE("ValidateConfig: predicate count", "[config][validate]") {
    auto none = ValidConfig();
    none.listing.predicates.clear();
    auto r1 = ValidateConfig(none);
    REQUIRE(r1.IsErr());
    CHECK(r1.Error().message == "No where predicate specified");

    auto two = ValidConfig();
    two.listing.predicates.push_back("true");
    auto r2 = ValidateConfig(two);
    REQUIRE(r2.IsErr());
    CHECK(r2.Error().message == "More than one where predicate specified");
}

TEST_CASE("ValidateConfig: subscription and token are required", "[config][validate]") {
    auto no_sub = ValidConfig();
    no_sub.connection.subscription_id.clear();
    CHECK(ValidateConfig(no_sub).IsErr());

    auto no_token = ValidConfig();
    no_token.connection.access_token.clear();
    CHECK(ValidateConfig(no_token).IsErr());
}

TEST_CASE("ValidateConfig: value checks", "[config][validate]") {
    auto bad_env = ValidConfig();
    bad_env.connection.environment = std::string("mars");
    CHECK(ValidateConfig(bad_env).IsErr());

    auto bad_timeout = ValidConfig();
    bad_timeout.connection.timeout_seconds = 0;
    CHECK(ValidateConfig(bad_timeout).IsErr());

    auto bad_parallelism = ValidConfig();
    bad_parallelism.listing.parallelism = -1;
    CHECK(ValidateConfig(bad_parallelism).IsErr());

    auto bad_filter = ValidConfig();
    bad_filter.listing.authorization_scope_filter = std::string("Everywhere");
    CHECK(ValidateConfig(bad_filter).IsErr());

    auto empty_table = ValidConfig();
    empty_table.listing.table = std::string();
    CHECK(ValidateConfig(empty_table).IsErr());

    auto bad_level = ValidConfig();
    bad_level.logging.level = std::string("chatty");
    CHECK(ValidateConfig(bad_level).IsErr());

    auto bad_format = ValidConfig();
    bad_format.logging.format = std::string("xml");
    CHECK(ValidateConfig(bad_format).IsErr());

    auto both_colors = ValidConfig();
    both_colors.logging.color = true;
    both_colors.logging.no_color = true;
    CHECK(ValidateConfig(both_colors).IsErr());
}

// ===========================================================================
// EffectiveLogLevel / ResolveSchemaPath
// ===========================================================================

TEST_CASE("EffectiveLogLevel: explicit level beats verbosity", "[config][logging]") {
    LoggingConfig logging;
    CHECK(EffectiveLogLevel(logging) == LogLevel::Warn);
    logging.verbosity = 1;
    CHECK(EffectiveLogLevel(logging) == LogLevel::Info);
    logging.verbosity = 3;
    CHECK(EffectiveLogLevel(logging) == LogLevel::Debug);
    logging.level = std::string("error");
    CHECK(EffectiveLogLevel(logging) == LogLevel::Error);
}

TEST_CASE("ResolveSchemaPath: explicit file, else next to the executable", "[config][schema]") {
    AppConfig config;
    CHECK(ResolveSchemaPath(config, "/usr/local/bin/azlist") == "/usr/local/bin/armschema.json");
    CHECK(ResolveSchemaPath(config, "azlist") == "armschema.json");
    config.listing.schema_file = std::string("/etc/azlist/schema.json");
    CHECK(ResolveSchemaPath(config, "/usr/local/bin/azlist") == "/etc/azlist/schema.json");
}
