#pragma once

#include <ccpm/config/app_config.hpp>
#include <ccpm/core/result.hpp>
#include <ccpm/core/types.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ccpm {

// Built-in defaults rooted at the given user home directory:
// <home>/.ccpm for the tool, <home>/.claude for extensions.
AppConfig DefaultConfig(const std::string& user_home);

// Overlay a YAML config file onto base. Keys absent from the file keep the
// value from base.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path, AppConfig base);

// Overlay environment variables (CCPM_HOME, CCPM_CLAUDE_DIR, CCPM_LOG_LEVEL,
// CCPM_CONFLICT) onto base. The map is injected so tests need not touch the
// process environment; ReadEnvironment() builds it from getenv.
Result<AppConfig, Error> ApplyEnvironment(
    AppConfig base, const std::map<std::string, std::string>& env);

std::map<std::string, std::string> ReadEnvironment();

// Derive dependent paths (state_file from home) once overrides are applied.
AppConfig ResolveDerivedPaths(AppConfig config);

// Validate that paths are set and numeric knobs are positive.
Result<void, Error> ValidateConfig(const AppConfig& config);

// ---------------------------------------------------------------------------
// Command line
// ---------------------------------------------------------------------------
enum class CliCommand {
    Detect,
    Install,
    Uninstall,
    Unregister,
    History,
    Validate,
    Repair,
    Migrate,
    Export,
    Import,
    Clean,
    Stats,
};

struct CliOptions {
    CliCommand command = CliCommand::Validate;

    // Global overrides, applied last.
    std::optional<std::string> config_path;
    std::optional<std::string> home;
    std::optional<std::string> claude_dir;
    std::optional<ConflictStrategy> conflict;
    std::optional<LogLevel> log_level;
    std::optional<std::string> log_file;
    bool log_json = false;

    // Subcommand arguments.
    std::string id;
    std::vector<std::string> ids;
    std::string path;
    std::string url;
    std::optional<TargetType> type;
    bool interactive = false;
    std::optional<InstallationOperation> operation;
    std::optional<int> limit;
    std::optional<std::string> out;
    std::string in;
    bool replace = false;
};

// Parse argv with argparse. --help and --version print and exit.
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// Overlay the global CLI overrides onto config.
AppConfig ApplyCliOverrides(AppConfig config, const CliOptions& cli);

} // namespace ccpm
