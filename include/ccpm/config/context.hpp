#pragma once

#include <ccpm/config/app_config.hpp>
#include <ccpm/core/log.hpp>

#include <filesystem>

namespace ccpm {

// ---------------------------------------------------------------------------
// Context: resolved configuration plus the logger, handed to every
// component's constructor. Neither is owned; both must outlive the components.
// ---------------------------------------------------------------------------
struct Context {
    const AppConfig& config;
    Logger& logger;

    [[nodiscard]] std::filesystem::path StateFile() const {
        return std::filesystem::path(config.paths.state_file);
    }

    [[nodiscard]] std::filesystem::path ExtensionRoot() const {
        return std::filesystem::path(config.paths.claude_dir);
    }
};

} // namespace ccpm
