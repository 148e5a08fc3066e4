#include <azlist/arm/arm_client.hpp>
#include <azlist/arm/arm_session.hpp>
#include <azlist/arm/cloud.hpp>
#include <azlist/cli/output_formatter.hpp>
#include <azlist/config/config_loader.hpp>
#include <azlist/core/cancellation.hpp>
#include <azlist/core/log.hpp>
#include <azlist/core/terminal.hpp>
#include <azlist/core/version.hpp>
#include <azlist/discovery/builtin_filters.hpp>
#include <azlist/discovery/lister.hpp>
#include <azlist/discovery/schema_tree.hpp>

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;

// ---------------------------------------------------------------------------
// SignalWatcher: turns SIGINT/SIGTERM into a cancellation.
//
// The signals are blocked in every thread (the mask is inherited by threads
// created afterwards) and consumed by a dedicated sigwait() thread, so no
// code runs in signal-handler context. SIGUSR1 wakes the thread for
// shutdown.
// ---------------------------------------------------------------------------
class SignalWatcher {
public:
    SignalWatcher(azlist::CancellationSource& source, azlist::Logger& logger) {
        sigemptyset(&set_);
        sigaddset(&set_, SIGINT);
        sigaddset(&set_, SIGTERM);
        sigaddset(&set_, SIGUSR1);
        pthread_sigmask(SIG_BLOCK, &set_, nullptr);

        thread_ = std::thread([this, &source, &logger] {
            for (;;) {
                int sig = 0;
                if (sigwait(&set_, &sig) != 0 || sig == SIGUSR1) {
                    return;
                }
                logger.Warn("main", std::string("Received ") +
                                        (sig == SIGINT ? "SIGINT" : "SIGTERM") +
                                        ", cancelling");
                source.Cancel();
            }
        });
    }

    ~SignalWatcher() {
        pthread_kill(thread_.native_handle(), SIGUSR1);
        thread_.join();
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    sigset_t set_;
    std::thread thread_;
};

int Fail(const azlist::Error& error, bool json_mode) {
    azlist::OutputFormatter(json_mode, azlist::ShouldUseColor(azlist::ColorMode::Auto,
                                                              STDERR_FILENO))
        .PrintError(error);
    return error.ExitCode();
}

azlist::ColorMode ColorModeFrom(const azlist::LoggingConfig& logging) {
    if (logging.no_color) {
        return azlist::ColorMode::Never;
    }
    if (logging.color) {
        return azlist::ColorMode::Always;
    }
    return azlist::ColorMode::Auto;
}

// Build the config: YAML file < environment < command line.
azlist::Result<azlist::AppConfig, azlist::Error> LoadConfig(int argc, const char* const* argv) {
    using namespace azlist;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        return cli;
    }

    AppConfig base;
    if (cli.Value().config_file.has_value()) {
        auto yaml = LoadFromYaml(*cli.Value().config_file);
        if (yaml.IsErr()) {
            return yaml;
        }
        base = std::move(yaml).Value();
    }

    auto env = LoadFromEnvironment();
    if (env.IsErr()) {
        return env;
    }

    auto merged = MergeConfigs(MergeConfigs(base, env.Value()), cli.Value());
    auto resolved = ResolveAccessToken(std::move(merged));
    if (resolved.IsErr()) {
        return resolved;
    }
    auto valid = ValidateConfig(resolved.Value());
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(valid.Error());
    }
    return resolved;
}

azlist::Result<std::unique_ptr<azlist::Logger>, azlist::Error> MakeLogger(
    const azlist::LoggingConfig& logging) {
    using namespace azlist;

    std::unique_ptr<ILogSink> sink;
    if (logging.format.value_or("text") == "json") {
        sink = std::make_unique<JsonSink>(std::cerr);
    } else {
        sink = std::make_unique<ColorConsoleSink>(
            ShouldUseColor(ColorModeFrom(logging), STDERR_FILENO));
    }
    if (logging.file.has_value()) {
        auto file = FileSink::Open(*logging.file);
        if (file.IsErr()) {
            return Result<std::unique_ptr<Logger>, Error>::Err(std::move(file).Error());
        }
        sink = std::make_unique<TeeSink>(std::move(sink), std::move(file).Value());
    }
    return Result<std::unique_ptr<Logger>, Error>::Ok(
        std::make_unique<Logger>(std::move(sink), EffectiveLogLevel(logging)));
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace azlist;

    auto loaded = LoadConfig(argc, argv);
    if (loaded.IsErr()) {
        return Fail(loaded.Error(), false);
    }
    const auto config = std::move(loaded).Value();
    const bool json_mode = config.output.json.value_or(false);

    auto logger_result = MakeLogger(config.logging);
    if (logger_result.IsErr()) {
        return Fail(logger_result.Error(), json_mode);
    }
    auto logger = std::move(logger_result).Value();

    // -- Schema snapshot -----------------------------------------------------
    const auto schema_path = ResolveSchemaPath(config, argv[0]);
    logger->Debug("main", "Loading schema snapshot " + schema_path);
    auto schema = LoadSchemaTree(schema_path);
    if (schema.IsErr()) {
        return Fail(schema.Error(), json_mode);
    }

    // -- Transport -----------------------------------------------------------
    std::string base_url;
    if (config.connection.endpoint.has_value()) {
        base_url = *config.connection.endpoint;
    } else {
        auto env = ParseCloudEnvironment(config.connection.environment.value_or("public"));
        if (env.IsErr()) {
            return Fail(env.Error(), json_mode);
        }
        base_url = ResourceManagerEndpoint(env.Value());
    }

    ArmSessionOptions session_options;
    session_options.read_timeout =
        std::chrono::seconds(config.connection.timeout_seconds.value_or(120));
    session_options.disable_tls_verify = config.connection.insecure.value_or(false);
    session_options.user_agent = std::string("azlist/") + kVersion;
    ArmSession session(base_url, config.connection.access_token, session_options, *logger);
    ArmClient client(session, *logger);

    // -- Lister --------------------------------------------------------------
    ListerOptions options;
    options.subscriptions = {config.connection.subscription_id};
    options.table = config.listing.table.value_or("Resources");
    options.authorization_scope_filter = config.listing.authorization_scope_filter;
    options.parallelism = static_cast<size_t>(config.listing.parallelism.value_or(0));
    options.recursive = config.listing.recursive.value_or(false);
    options.include_managed = config.listing.include_managed.value_or(false);
    options.include_resource_group = config.listing.include_resource_group.value_or(false);
    for (const auto& type : config.listing.extensions) {
        options.extensions.push_back(MakeExtensionSpec(type));
    }

    const auto& tree = schema.Value();
    Lister lister(client, tree, std::move(options), *logger);

    CancellationSource cancel;
    Result<ListResult, Error> result = Result<ListResult, Error>::Err(
        MakeError("main", "Listing did not run"));
    {
        SignalWatcher watcher(cancel, *logger);
        result = lister.List(config.listing.predicates.front(), cancel.Token());
    }
    if (result.IsErr()) {
        return Fail(result.Error(), json_mode);
    }

    OutputFormatter formatter(json_mode);
    formatter.PrintResult(result.Value(), config.output.with_body.value_or(false),
                          config.output.print_error.value_or(false));
    return kExitSuccess;
}
