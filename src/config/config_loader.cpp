#include <ccpm/config/config_loader.hpp>
#include <ccpm/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

extern char** environ;

namespace ccpm {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", message, std::nullopt, ErrorCategory::Validation};
}

std::string JoinPath(const std::string& base, const std::string& leaf) {
    return (std::filesystem::path(base) / leaf).string();
}

} // anonymous namespace

const char* ConflictStrategyName(ConflictStrategy strategy) {
    switch (strategy) {
        case ConflictStrategy::Skip:      return "skip";
        case ConflictStrategy::Overwrite: return "overwrite";
        case ConflictStrategy::Prompt:    return "prompt";
    }
    return "overwrite";
}

std::optional<ConflictStrategy> ParseConflictStrategy(std::string_view name) {
    if (name == "skip") return ConflictStrategy::Skip;
    if (name == "overwrite") return ConflictStrategy::Overwrite;
    if (name == "prompt") return ConflictStrategy::Prompt;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// DefaultConfig
// ---------------------------------------------------------------------------
AppConfig DefaultConfig(const std::string& user_home) {
    AppConfig config;
    config.paths.home = JoinPath(user_home, ".ccpm");
    config.paths.claude_dir = JoinPath(user_home, ".claude");
    return ResolveDerivedPaths(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path, AppConfig base) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config = std::move(base);

    try {
        // -- Paths --
        if (const auto paths = root["paths"]) {
            if (paths["home"]) {
                config.paths.home = paths["home"].as<std::string>();
                // state_file follows home unless set explicitly below.
                config.paths.state_file.clear();
            }
            if (paths["claude_dir"]) {
                config.paths.claude_dir = paths["claude_dir"].as<std::string>();
            }
            if (paths["state_file"]) {
                config.paths.state_file = paths["state_file"].as<std::string>();
            }
        }

        // -- Behavior --
        if (const auto behavior = root["behavior"]) {
            if (behavior["conflict_resolution"]) {
                auto name = behavior["conflict_resolution"].as<std::string>();
                auto strategy = ParseConflictStrategy(name);
                if (!strategy.has_value()) {
                    return Result<AppConfig, Error>::Err(
                        MakeConfigError("Unknown conflict_resolution: " + name));
                }
                config.behavior.conflict_strategy = *strategy;
            }
            if (behavior["interactive"]) {
                config.behavior.interactive = behavior["interactive"].as<bool>();
            }
            if (behavior["prompt_timeout_ms"]) {
                config.behavior.prompt_timeout_ms = behavior["prompt_timeout_ms"].as<int>();
            }
        }

        // -- State --
        if (const auto state = root["state"]) {
            if (state["lock_retries"]) {
                config.state.lock_retries = state["lock_retries"].as<int>();
            }
            if (state["lock_retry_delay_ms"]) {
                config.state.lock_retry_delay_ms = state["lock_retry_delay_ms"].as<int>();
            }
            if (state["cache_ttl_ms"]) {
                config.state.cache_ttl_ms = state["cache_ttl_ms"].as<int>();
            }
        }

        // -- Logging --
        if (const auto logging = root["logging"]) {
            if (logging["level"]) {
                auto name = logging["level"].as<std::string>();
                auto level = ParseLogLevel(name);
                if (!level.has_value()) {
                    return Result<AppConfig, Error>::Err(
                        MakeConfigError("Unknown log level: " + name));
                }
                config.logging.level = *level;
            }
            if (logging["file"]) {
                config.logging.file = logging["file"].as<std::string>();
            }
            if (logging["json"]) {
                config.logging.json = logging["json"].as<bool>();
            }
            if (logging["color"]) {
                config.logging.color = logging["color"].as<bool>();
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(ResolveDerivedPaths(std::move(config)));
}

// ---------------------------------------------------------------------------
// ApplyEnvironment
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ApplyEnvironment(
    AppConfig base, const std::map<std::string, std::string>& env) {
    AppConfig config = std::move(base);

    auto lookup = [&env](const char* name) -> const std::string* {
        auto it = env.find(name);
        if (it == env.end() || it->second.empty()) {
            return nullptr;
        }
        return &it->second;
    };

    if (const auto* home = lookup("CCPM_HOME")) {
        config.paths.home = *home;
        config.paths.state_file.clear();
    }
    if (const auto* claude_dir = lookup("CCPM_CLAUDE_DIR")) {
        config.paths.claude_dir = *claude_dir;
    }
    if (const auto* level_name = lookup("CCPM_LOG_LEVEL")) {
        auto level = ParseLogLevel(*level_name);
        if (!level.has_value()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("CCPM_LOG_LEVEL has unknown value '" + *level_name + "'"));
        }
        config.logging.level = *level;
    }
    if (const auto* strategy_name = lookup("CCPM_CONFLICT")) {
        auto strategy = ParseConflictStrategy(*strategy_name);
        if (!strategy.has_value()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("CCPM_CONFLICT has unknown value '" + *strategy_name + "'"));
        }
        config.behavior.conflict_strategy = *strategy;
    }
    if (lookup("NO_COLOR") != nullptr) {
        config.logging.color = false;
    }

    return Result<AppConfig, Error>::Ok(ResolveDerivedPaths(std::move(config)));
}

std::map<std::string, std::string> ReadEnvironment() {
    std::map<std::string, std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string_view kv{*entry};
        auto eq = kv.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        auto key = kv.substr(0, eq);
        if (key.substr(0, 5) == "CCPM_" || key == "NO_COLOR" || key == "CI") {
            env.emplace(std::string(key), std::string(kv.substr(eq + 1)));
        }
    }
    return env;
}

// ---------------------------------------------------------------------------
// ResolveDerivedPaths
// ---------------------------------------------------------------------------
AppConfig ResolveDerivedPaths(AppConfig config) {
    if (config.paths.state_file.empty() && !config.paths.home.empty()) {
        config.paths.state_file = JoinPath(config.paths.home, "state.json");
    }
    return config;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.paths.home.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required path: home"));
    }
    if (config.paths.claude_dir.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required path: claude_dir"));
    }
    if (config.paths.state_file.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required path: state_file"));
    }
    if (config.state.lock_retries <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("lock_retries must be positive, got " +
                            std::to_string(config.state.lock_retries)));
    }
    if (config.state.lock_retry_delay_ms <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("lock_retry_delay_ms must be positive, got " +
                            std::to_string(config.state.lock_retry_delay_ms)));
    }
    if (config.state.cache_ttl_ms < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("cache_ttl_ms must not be negative, got " +
                            std::to_string(config.state.cache_ttl_ms)));
    }
    if (config.behavior.prompt_timeout_ms <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("prompt_timeout_ms must be positive, got " +
                            std::to_string(config.behavior.prompt_timeout_ms)));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("ccpm", kVersion);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--home")
        .help("Tool home holding state.json");
    program.add_argument("--claude-dir")
        .help("Extension directory");
    program.add_argument("--conflict")
        .help("Conflict strategy: skip, overwrite or prompt");
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--log-file")
        .help("Append log lines to this file");
    program.add_argument("--log-json")
        .help("Log as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Shortcut for --log-level debug")
        .default_value(false)
        .implicit_value(true);

    argparse::ArgumentParser detect_cmd("detect");
    detect_cmd.add_description("List the files a working copy would deploy");
    detect_cmd.add_argument("--path").required().help("Working copy");
    detect_cmd.add_argument("--type").help("Deploy every file as this type");

    argparse::ArgumentParser install_cmd("install");
    install_cmd.add_description("Deploy a working copy and record it");
    install_cmd.add_argument("--id").required().help("Repository id");
    install_cmd.add_argument("--path").required().help("Working copy");
    install_cmd.add_argument("--type").help("Deploy every file as this type");
    install_cmd.add_argument("--url").help("Repository URL recorded in the summary");
    install_cmd.add_argument("--interactive")
        .help("Ask before overwriting existing files")
        .default_value(false)
        .implicit_value(true);

    argparse::ArgumentParser uninstall_cmd("uninstall");
    uninstall_cmd.add_description("Remove a repository's deployed files");
    uninstall_cmd.add_argument("--id").required().help("Repository id");

    argparse::ArgumentParser unregister_cmd("unregister");
    unregister_cmd.add_description("Forget a repository, leaving its files");
    unregister_cmd.add_argument("--id").required().help("Repository id");

    argparse::ArgumentParser history_cmd("history");
    history_cmd.add_description("Show installation history, most recent first");
    history_cmd.add_argument("--id").help("Only this repository");
    history_cmd.add_argument("--operation").help("install, uninstall or unregister");
    history_cmd.add_argument("--limit").help("Maximum records").scan<'i', int>();

    argparse::ArgumentParser validate_cmd("validate");
    validate_cmd.add_description("Check the state file for consistency");

    argparse::ArgumentParser repair_cmd("repair");
    repair_cmd.add_description("Fix what validate reports");

    argparse::ArgumentParser migrate_cmd("migrate");
    migrate_cmd.add_description("Upgrade a legacy state file");

    argparse::ArgumentParser export_cmd("export");
    export_cmd.add_description("Write a state snapshot");
    export_cmd.add_argument("--id")
        .help("Repository to include (repeatable)")
        .default_value(std::vector<std::string>{})
        .append();
    export_cmd.add_argument("--out").help("Output file, stdout when omitted");

    argparse::ArgumentParser import_cmd("import");
    import_cmd.add_description("Load a state snapshot");
    import_cmd.add_argument("--in").required().help("Snapshot file");
    import_cmd.add_argument("--replace")
        .help("Replace instead of merging")
        .default_value(false)
        .implicit_value(true);

    argparse::ArgumentParser clean_cmd("clean");
    clean_cmd.add_description("Remove deployed files whose source is gone");
    clean_cmd.add_argument("--id").required().help("Repository id");
    clean_cmd.add_argument("--path").required().help("Working copy");
    clean_cmd.add_argument("--type").help("Deployment type of the repository");

    argparse::ArgumentParser stats_cmd("stats");
    stats_cmd.add_description("Summarize deployments");

    program.add_subparser(detect_cmd);
    program.add_subparser(install_cmd);
    program.add_subparser(uninstall_cmd);
    program.add_subparser(unregister_cmd);
    program.add_subparser(history_cmd);
    program.add_subparser(validate_cmd);
    program.add_subparser(repair_cmd);
    program.add_subparser(migrate_cmd);
    program.add_subparser(export_cmd);
    program.add_subparser(import_cmd);
    program.add_subparser(clean_cmd);
    program.add_subparser(stats_cmd);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions cli;

    // Globals
    cli.config_path = program.present("--config");
    cli.home = program.present("--home");
    cli.claude_dir = program.present("--claude-dir");
    cli.log_file = program.present("--log-file");
    cli.log_json = program.get<bool>("--log-json");
    if (auto val = program.present("--conflict")) {
        cli.conflict = ParseConflictStrategy(*val);
        if (!cli.conflict.has_value()) {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("Unknown --conflict: " + *val));
        }
    }
    if (auto val = program.present("--log-level")) {
        cli.log_level = ParseLogLevel(*val);
        if (!cli.log_level.has_value()) {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("Unknown --log-level: " + *val));
        }
    }
    if (program.get<bool>("--verbose")) {
        cli.log_level = LogLevel::Debug;
    }

    auto parse_type = [&cli](const argparse::ArgumentParser& cmd) -> Result<void, Error> {
        if (auto val = cmd.present("--type")) {
            cli.type = ParseTargetType(*val);
            if (!cli.type.has_value()) {
                return Result<void, Error>::Err(MakeConfigError("Unknown --type: " + *val));
            }
        }
        return Result<void, Error>::Ok();
    };

    if (program.is_subcommand_used(detect_cmd)) {
        cli.command = CliCommand::Detect;
        cli.path = detect_cmd.get<std::string>("--path");
        auto typed = parse_type(detect_cmd);
        if (typed.IsErr()) {
            return Result<CliOptions, Error>::Err(std::move(typed).Error());
        }
    } else if (program.is_subcommand_used(install_cmd)) {
        cli.command = CliCommand::Install;
        cli.id = install_cmd.get<std::string>("--id");
        cli.path = install_cmd.get<std::string>("--path");
        cli.url = install_cmd.present("--url").value_or("");
        cli.interactive = install_cmd.get<bool>("--interactive");
        auto typed = parse_type(install_cmd);
        if (typed.IsErr()) {
            return Result<CliOptions, Error>::Err(std::move(typed).Error());
        }
    } else if (program.is_subcommand_used(uninstall_cmd)) {
        cli.command = CliCommand::Uninstall;
        cli.id = uninstall_cmd.get<std::string>("--id");
    } else if (program.is_subcommand_used(unregister_cmd)) {
        cli.command = CliCommand::Unregister;
        cli.id = unregister_cmd.get<std::string>("--id");
    } else if (program.is_subcommand_used(history_cmd)) {
        cli.command = CliCommand::History;
        cli.id = history_cmd.present("--id").value_or("");
        if (auto val = history_cmd.present("--operation")) {
            cli.operation = ParseInstallationOperation(*val);
            if (!cli.operation.has_value()) {
                return Result<CliOptions, Error>::Err(
                    MakeConfigError("Unknown --operation: " + *val));
            }
        }
        cli.limit = history_cmd.present<int>("--limit");
        if (cli.limit.has_value() && *cli.limit < 0) {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("--limit must not be negative"));
        }
    } else if (program.is_subcommand_used(validate_cmd)) {
        cli.command = CliCommand::Validate;
    } else if (program.is_subcommand_used(repair_cmd)) {
        cli.command = CliCommand::Repair;
    } else if (program.is_subcommand_used(migrate_cmd)) {
        cli.command = CliCommand::Migrate;
    } else if (program.is_subcommand_used(export_cmd)) {
        cli.command = CliCommand::Export;
        cli.ids = export_cmd.get<std::vector<std::string>>("--id");
        cli.out = export_cmd.present("--out");
    } else if (program.is_subcommand_used(import_cmd)) {
        cli.command = CliCommand::Import;
        cli.in = import_cmd.get<std::string>("--in");
        cli.replace = import_cmd.get<bool>("--replace");
    } else if (program.is_subcommand_used(clean_cmd)) {
        cli.command = CliCommand::Clean;
        cli.id = clean_cmd.get<std::string>("--id");
        cli.path = clean_cmd.get<std::string>("--path");
        auto typed = parse_type(clean_cmd);
        if (typed.IsErr()) {
            return Result<CliOptions, Error>::Err(std::move(typed).Error());
        }
    } else if (program.is_subcommand_used(stats_cmd)) {
        cli.command = CliCommand::Stats;
    } else {
        return Result<CliOptions, Error>::Err(MakeConfigError("No command given"));
    }

    return Result<CliOptions, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// ApplyCliOverrides
// ---------------------------------------------------------------------------
AppConfig ApplyCliOverrides(AppConfig config, const CliOptions& cli) {
    if (cli.home.has_value()) {
        config.paths.home = *cli.home;
        config.paths.state_file.clear();
    }
    if (cli.claude_dir.has_value()) {
        config.paths.claude_dir = *cli.claude_dir;
    }
    if (cli.conflict.has_value()) {
        config.behavior.conflict_strategy = *cli.conflict;
    }
    if (cli.interactive) {
        config.behavior.interactive = true;
    }
    if (cli.log_level.has_value()) {
        config.logging.level = *cli.log_level;
    }
    if (cli.log_file.has_value()) {
        config.logging.file = cli.log_file;
    }
    if (cli.log_json) {
        config.logging.json = true;
    }
    return ResolveDerivedPaths(std::move(config));
}

} // namespace ccpm
