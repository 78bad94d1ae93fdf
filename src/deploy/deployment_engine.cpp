#include <ccpm/deploy/deployment_engine.hpp>

#include <ccpm/core/hash.hpp>
#include <ccpm/core/timestamp.hpp>

#include <system_error>

namespace ccpm {

namespace fs = std::filesystem;

namespace {

constexpr const char* kComponent = "deploy";
constexpr const char* kClaudePrefix = ".claude/";

Error MakeDeployError(const std::string& operation, const std::string& path,
                      const std::string& message, ErrorCategory category) {
    return Error{operation, path, message, std::nullopt, category};
}

Result<void, Error> CopyTree(const fs::path& source, const fs::path& target) {
    std::error_code ec;
    fs::create_directories(target, ec);
    if (ec) {
        return Result<void, Error>::Err(
            Error::FromErrorCode("CopyWithStructure", target.string(), ec));
    }

    for (fs::directory_iterator it(source, ec), end; !ec && it != end; it.increment(ec)) {
        const auto dest = target / it->path().filename();
        if (it->is_directory(ec)) {
            auto sub = CopyTree(it->path(), dest);
            if (sub.IsErr()) {
                return sub;
            }
        } else if (it->is_regular_file(ec)) {
            fs::copy_file(it->path(), dest, fs::copy_options::overwrite_existing, ec);
            if (ec) {
                return Result<void, Error>::Err(
                    Error::FromErrorCode("CopyWithStructure", dest.string(), ec));
            }
        }
        // Symlinks, sockets and devices are not deployable.
    }
    if (ec) {
        return Result<void, Error>::Err(
            Error::FromErrorCode("CopyWithStructure", source.string(), ec));
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

DeploymentEngine::DeploymentEngine(const Context& ctx, IPrompt& prompt)
    : ctx_(ctx),
      matcher_(ctx.logger),
      resolver_(prompt, ctx.logger,
                std::chrono::milliseconds(ctx.config.behavior.prompt_timeout_ms)) {}

// ---------------------------------------------------------------------------
// Deploy
// ---------------------------------------------------------------------------
Result<DeploymentResult, Error> DeploymentEngine::Deploy(const RepositoryRef& repository,
                                                         const DeployOptions& options) {
    const fs::path root(repository.local_path);
    std::error_code ec;
    if (repository.local_path.empty() || !fs::is_directory(root, ec)) {
        return Result<DeploymentResult, Error>::Err(MakeDeployError(
            "Deploy", repository.local_path,
            "Repository working copy not found for " + repository.name,
            ErrorCategory::NotFound));
    }

    const ConflictStrategy strategy =
        options.interactive ? ConflictStrategy::Prompt
                            : options.strategy.value_or(ctx_.config.behavior.conflict_strategy);

    ctx_.logger.Info(kComponent, "Deploying " + repository.name + " (strategy " +
                     ConflictStrategyName(strategy) + ")");

    DeploymentResult result;
    for (const auto& match : DetectPatterns(repository)) {
        const auto source = root / match.file;
        const auto target = ResolveTargetPath(match);

        if (fs::exists(target, ec)) {
            result.conflicts.push_back(match.file);
            if (!resolver_.ShouldOverwrite(target, strategy)) {
                result.skipped.push_back(match.file);
                continue;
            }
        }

        auto copied = CopyWithStructure(source, target);
        if (copied.IsErr()) {
            ctx_.logger.Error(kComponent, "Failed to deploy " + match.file + ": " +
                              copied.Error().ToString());
            result.failed.push_back(match.file);
            continue;
        }

        auto hash = HashFile(target);
        if (hash.IsErr()) {
            ctx_.logger.Error(kComponent, "Failed to hash " + target.string() + ": " +
                              hash.Error().ToString());
            result.failed.push_back(match.file);
            continue;
        }

        DeployedFile deployed;
        deployed.source = match.file;
        deployed.target = target.string();
        deployed.hash = std::move(hash).Value();
        deployed.deployed_at = Iso8601Now();
        deployed.type = match.target_type;
        deployed.path = DisplayPath(target);
        result.deployed.push_back(std::move(deployed));
        ctx_.logger.Info(kComponent, "Deployed: " + match.file);
    }

    ctx_.logger.Info(kComponent, "Deployment of " + repository.name + " finished: " +
                     std::to_string(result.deployed.size()) + " deployed, " +
                     std::to_string(result.skipped.size()) + " skipped, " +
                     std::to_string(result.failed.size()) + " failed");
    return Result<DeploymentResult, Error>::Ok(std::move(result));
}

// ---------------------------------------------------------------------------
// Detection
// ---------------------------------------------------------------------------
std::vector<PatternMatch> DeploymentEngine::DetectPatterns(
    const fs::path& repository_path) const {
    return matcher_.Detect(repository_path);
}

std::vector<PatternMatch> DeploymentEngine::DetectPatterns(
    const RepositoryRef& repository) const {
    if (repository.IsTypeBased()) {
        return matcher_.DetectTypeBased(repository.local_path, *repository.type);
    }
    return matcher_.Detect(repository.local_path);
}

fs::path DeploymentEngine::ResolveTargetPath(const PatternMatch& match) const {
    const std::string category = TargetTypeName(match.target_type);

    std::string relative = match.file;
    if (match.pattern == kTypeBasedMode) {
        return ctx_.ExtensionRoot() / category / relative;
    }
    if (relative.compare(0, std::char_traits<char>::length(kClaudePrefix), kClaudePrefix) == 0) {
        relative = relative.substr(std::char_traits<char>::length(kClaudePrefix));
    }
    // Single-file form: commands.md -> commands/commands.md
    if (relative.find('/') == std::string::npos) {
        return ctx_.ExtensionRoot() / category / relative;
    }
    return ctx_.ExtensionRoot() / relative;
}

std::string DeploymentEngine::DisplayPath(const fs::path& target) const {
    const auto root = ctx_.ExtensionRoot().lexically_normal();
    auto name = root.filename();
    if (name.empty()) {
        name = root.parent_path().filename();
    }
    const auto relative = target.lexically_normal().lexically_relative(root);
    if (relative.empty() || *relative.begin() == "..") {
        return target.generic_string();
    }
    return (name / relative).generic_string();
}

// ---------------------------------------------------------------------------
// CopyWithStructure
// ---------------------------------------------------------------------------
Result<void, Error> DeploymentEngine::CopyWithStructure(const fs::path& source,
                                                        const fs::path& target) const {
    std::error_code ec;
    const auto status = fs::status(source, ec);
    if (ec || !fs::exists(status)) {
        return Result<void, Error>::Err(MakeDeployError(
            "CopyWithStructure", source.string(), "Source does not exist",
            ErrorCategory::NotFound));
    }

    if (fs::is_directory(status)) {
        return CopyTree(source, target);
    }

    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return Result<void, Error>::Err(
                Error::FromErrorCode("CopyWithStructure", target.parent_path().string(), ec));
        }
    }

    fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Result<void, Error>::Err(
            Error::FromErrorCode("CopyWithStructure", target.string(), ec));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// CleanOrphanedFiles
// ---------------------------------------------------------------------------
Result<int, Error> DeploymentEngine::CleanOrphanedFiles(
    const RepositoryRef& repository,
    const std::vector<DeployedFile>& tracked_files) const {
    ctx_.logger.Info(kComponent, "Cleaning orphaned files for " + repository.name);

    const fs::path root(repository.local_path);
    int cleaned = 0;
    for (const auto& file : tracked_files) {
        std::error_code ec;
        const fs::path target(file.target);
        if (!fs::exists(target, ec)) {
            continue;
        }
        if (fs::exists(root / file.source, ec)) {
            continue;
        }
        fs::remove(target, ec);
        if (ec) {
            return Result<int, Error>::Err(
                Error::FromErrorCode("CleanOrphanedFiles", target.string(), ec));
        }
        ++cleaned;
        ctx_.logger.Info(kComponent, "Cleaned orphaned file: " + file.source);
    }

    ctx_.logger.Info(kComponent, "Cleaned " + std::to_string(cleaned) + " orphaned files");
    return Result<int, Error>::Ok(cleaned);
}

} // namespace ccpm
