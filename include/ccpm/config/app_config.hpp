#pragma once

#include <ccpm/core/log.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace ccpm {

// ---------------------------------------------------------------------------
// ConflictStrategy: what to do when a deployment target already exists.
// ---------------------------------------------------------------------------
enum class ConflictStrategy {
    Skip,
    Overwrite,
    Prompt,
};

[[nodiscard]] const char* ConflictStrategyName(ConflictStrategy strategy);
[[nodiscard]] std::optional<ConflictStrategy> ParseConflictStrategy(std::string_view name);

struct PathsConfig {
    std::string home;         // tool home, holds state.json and config.yaml
    std::string claude_dir;   // extension directory
    std::string state_file;   // defaults to <home>/state.json
};

struct BehaviorConfig {
    ConflictStrategy conflict_strategy = ConflictStrategy::Overwrite;
    bool interactive = false;
    int prompt_timeout_ms = 30000;
};

struct StateConfig {
    int lock_retries = 10;
    int lock_retry_delay_ms = 100;
    int cache_ttl_ms = 5000;
};

struct LoggingConfig {
    LogLevel level = LogLevel::Info;
    std::optional<std::string> file;
    bool json = false;
    bool color = true;
};

struct AppConfig {
    PathsConfig paths;
    BehaviorConfig behavior;
    StateConfig state;
    LoggingConfig logging;
};

} // namespace ccpm
