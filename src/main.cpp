#include <ccpm/config/config_loader.hpp>
#include <ccpm/config/context.hpp>
#include <ccpm/core/log.hpp>
#include <ccpm/core/prompt.hpp>
#include <ccpm/core/terminal.hpp>
#include <ccpm/deploy/deployment_engine.hpp>
#include <ccpm/recovery/error_recovery.hpp>
#include <ccpm/state/deployment_tracker.hpp>
#include <ccpm/state/schema_migrator.hpp>
#include <ccpm/state/state_store.hpp>
#include <ccpm/workflow/install_workflow.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace {

using namespace ccpm;
using nlohmann::json;

constexpr int kExitSuccess = 0;
// The command ran but reported a failed, partial or invalid outcome.
constexpr int kExitIncomplete = 1;

struct CommandOutput {
    json body;
    bool success = true;
};

void PrintError(const Error& error) {
    std::cerr << error.ToJson() << "\n";
}

std::unique_ptr<ILogSink> MakeSink(const LoggingConfig& logging) {
    if (logging.file.has_value()) {
        auto sink = std::make_unique<FileSink>(*logging.file);
        if (sink->IsOpen()) {
            return sink;
        }
    }
    if (logging.json) {
        return std::make_unique<JsonSink>(std::cerr);
    }
    return std::make_unique<ColorConsoleSink>(logging.color && IsStderrTty());
}

// defaults < YAML < environment < CLI flags.
Result<AppConfig, Error> ResolveConfig(const CliOptions& cli) {
    const char* user_home = std::getenv("HOME");
    if (user_home == nullptr || *user_home == '\0') {
        return Result<AppConfig, Error>::Err(Error{
            "ResolveConfig", "", "HOME is not set", std::nullopt, ErrorCategory::Validation});
    }
    const auto defaults = DefaultConfig(user_home);
    const auto env = ReadEnvironment();

    // The default config file lives in the tool home, which env and CLI may move.
    auto located = ApplyEnvironment(defaults, env);
    if (located.IsErr()) {
        return located;
    }
    const auto home = ApplyCliOverrides(std::move(located).Value(), cli).paths.home;

    std::string config_path;
    if (cli.config_path.has_value()) {
        config_path = *cli.config_path;
    } else {
        std::error_code ec;
        auto candidate = std::filesystem::path(home) / "config.yaml";
        if (std::filesystem::exists(candidate, ec)) {
            config_path = candidate.string();
        }
    }

    AppConfig config = defaults;
    if (!config_path.empty()) {
        auto yaml = LoadFromYaml(config_path, std::move(config));
        if (yaml.IsErr()) {
            return yaml;
        }
        config = std::move(yaml).Value();
    }

    auto with_env = ApplyEnvironment(std::move(config), env);
    if (with_env.IsErr()) {
        return with_env;
    }
    config = ApplyCliOverrides(std::move(with_env).Value(), cli);

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(std::move(valid).Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

RepositoryRef MakeRepositoryRef(const CliOptions& cli) {
    RepositoryRef ref;
    ref.id = cli.id;
    ref.name = cli.id;
    ref.local_path = cli.path;
    ref.type = cli.type;
    if (cli.type.has_value()) {
        ref.deployment_mode = kTypeBasedMode;
    }
    return ref;
}

json MatchesToJson(const std::vector<PatternMatch>& matches) {
    json arr = json::array();
    for (const auto& m : matches) {
        arr.push_back({{"file", m.file},
                       {"pattern", m.pattern},
                       {"targetType", TargetTypeName(m.target_type)}});
    }
    return arr;
}

// ---------------------------------------------------------------------------
// Components wired for one invocation.
// ---------------------------------------------------------------------------
struct App {
    explicit App(const Context& ctx)
        : prompt(ctx.logger),
          store(ctx),
          migrator(ctx),
          recovery(ctx, store, migrator),
          tracker(ctx, store, migrator, recovery),
          engine(ctx, prompt),
          workflow(ctx, engine, tracker, recovery) {}

    TerminalPrompt prompt;
    StateStore store;
    SchemaMigrator migrator;
    ErrorRecovery recovery;
    DeploymentTracker tracker;
    DeploymentEngine engine;
    InstallWorkflow workflow;
};

Result<CommandOutput, Error> FromInstallResult(Result<InstallResult, Error> result) {
    if (result.IsErr()) {
        return Result<CommandOutput, Error>::Err(std::move(result).Error());
    }
    const bool success = result.Value().success;
    return Result<CommandOutput, Error>::Ok(CommandOutput{ToJson(result.Value()), success});
}

Result<CommandOutput, Error> RunCommand(const CliOptions& cli, const Context& ctx, App& app) {
    using R = Result<CommandOutput, Error>;

    switch (cli.command) {
        case CliCommand::Detect:
            return R::Ok(CommandOutput{MatchesToJson(app.engine.DetectPatterns(MakeRepositoryRef(cli))),
                                       true});

        case CliCommand::Install: {
            InstallRequest request;
            request.interactive = cli.interactive || ctx.config.behavior.interactive;
            request.url = cli.url;
            return FromInstallResult(app.workflow.Install(MakeRepositoryRef(cli), request));
        }

        case CliCommand::Uninstall:
            return FromInstallResult(app.workflow.Uninstall(cli.id));

        case CliCommand::Unregister:
            return FromInstallResult(app.workflow.Unregister(cli.id));

        case CliCommand::Clean:
            return FromInstallResult(app.workflow.Clean(MakeRepositoryRef(cli)));

        case CliCommand::History: {
            HistoryFilter filter;
            if (!cli.id.empty()) {
                filter.repository_id = cli.id;
            }
            filter.operation = cli.operation;
            if (cli.limit.has_value()) {
                filter.limit = static_cast<std::size_t>(*cli.limit);
            }
            auto history = app.tracker.GetInstallationHistory(filter);
            if (history.IsErr()) {
                return R::Err(std::move(history).Error());
            }
            json arr = json::array();
            for (const auto& record : history.Value()) {
                arr.push_back(ToJson(record));
            }
            return R::Ok(CommandOutput{std::move(arr), true});
        }

        case CliCommand::Validate: {
            auto report = app.tracker.ValidateState();
            if (report.IsErr()) {
                return R::Err(std::move(report).Error());
            }
            return R::Ok(CommandOutput{ToJson(report.Value()), report.Value().valid});
        }

        case CliCommand::Repair: {
            auto report = app.tracker.RepairState();
            if (report.IsErr()) {
                return R::Err(std::move(report).Error());
            }
            return R::Ok(CommandOutput{ToJson(report.Value()), true});
        }

        case CliCommand::Migrate: {
            auto result = app.migrator.Migrate(ctx.StateFile());
            app.tracker.InvalidateCache();
            return R::Ok(CommandOutput{ToJson(result), result.success});
        }

        case CliCommand::Export: {
            std::optional<std::vector<std::string>> ids;
            if (!cli.ids.empty()) {
                ids = cli.ids;
            }
            auto exported = app.tracker.ExportState(ids);
            if (exported.IsErr()) {
                return R::Err(std::move(exported).Error());
            }
            auto body = ToJson(exported.Value());
            if (cli.out.has_value()) {
                auto written = AtomicWriteFile(*cli.out, SerializeJson(body));
                if (written.IsErr()) {
                    return R::Err(std::move(written).Error());
                }
                return R::Ok(CommandOutput{json{{"exported", *cli.out}}, true});
            }
            return R::Ok(CommandOutput{std::move(body), true});
        }

        case CliCommand::Import: {
            auto contents = ReadFileContents(cli.in);
            if (contents.IsErr()) {
                return R::Err(std::move(contents).Error());
            }
            auto data = json::parse(contents.Value(), nullptr, /*allow_exceptions=*/false);
            if (data.is_discarded()) {
                return R::Err(Error{"Import", cli.in, "Snapshot is not valid JSON", std::nullopt,
                                    ErrorCategory::Validation});
            }
            auto imported = app.tracker.ImportState(data, ImportOptions{!cli.replace});
            if (imported.IsErr()) {
                return R::Err(std::move(imported).Error());
            }
            return R::Ok(CommandOutput{json{{"imported", cli.in},
                                            {"mode", cli.replace ? "replace" : "merge"}},
                                       true});
        }

        case CliCommand::Stats: {
            auto stats = app.tracker.GetDeploymentStatistics();
            if (stats.IsErr()) {
                return R::Err(std::move(stats).Error());
            }
            return R::Ok(CommandOutput{ToJson(stats.Value()), true});
        }
    }
    return R::Err(Error{"RunCommand", "", "Unhandled command", std::nullopt,
                        ErrorCategory::Internal});
}

} // namespace

int main(int argc, const char* argv[]) {
    // Step 1: Parse CLI args (handles --help and --version internally).
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        PrintError(cli_result.Error());
        return cli_result.Error().ExitCode();
    }
    const auto cli = std::move(cli_result).Value();

    // Step 2: Resolve configuration.
    auto config_result = ResolveConfig(cli);
    if (config_result.IsErr()) {
        PrintError(config_result.Error());
        return config_result.Error().ExitCode();
    }
    const auto config = std::move(config_result).Value();

    // Step 3: Logger and components.
    Logger logger(MakeSink(config.logging), config.logging.level);
    const Context ctx{config, logger};
    App app(ctx);

    // Step 4: Run and print.
    auto result = RunCommand(cli, ctx, app);
    if (result.IsErr()) {
        PrintError(result.Error());
        return result.Error().ExitCode();
    }
    std::cout << SerializeJson(result.Value().body) << "\n";
    return result.Value().success ? kExitSuccess : kExitIncomplete;
}
