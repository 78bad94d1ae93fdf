#include <ccpm/deploy/pattern_matcher.hpp>

#include <algorithm>
#include <cctype>
#include <set>
#include <system_error>

namespace ccpm {

namespace {

constexpr const char* kComponent = "deploy";
constexpr const char* kTypeBasedPattern = "type-based";
constexpr const char* kExtensions = "{js,ts,mjs,md}";

std::vector<std::string_view> SplitSegments(std::string_view path) {
    std::vector<std::string_view> out;
    size_t start = 0;
    while (start <= path.size()) {
        auto slash = path.find('/', start);
        if (slash == std::string_view::npos) {
            slash = path.size();
        }
        if (slash > start) {
            out.push_back(path.substr(start, slash - start));
        }
        start = slash + 1;
    }
    return out;
}

bool MatchSegment(std::string_view pat, std::string_view text) {
    size_t p = 0;
    size_t t = 0;
    size_t star = std::string_view::npos;
    size_t mark = 0;
    while (t < text.size()) {
        if (p < pat.size() && (pat[p] == '?' || pat[p] == text[t])) {
            ++p;
            ++t;
        } else if (p < pat.size() && pat[p] == '*') {
            star = p++;
            mark = t;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            t = ++mark;
        } else {
            return false;
        }
    }
    while (p < pat.size() && pat[p] == '*') {
        ++p;
    }
    return p == pat.size();
}

bool MatchSegments(const std::vector<std::string_view>& pat, size_t pi,
                   const std::vector<std::string_view>& path, size_t si) {
    if (pi == pat.size()) {
        return si == path.size();
    }
    if (pat[pi] == "**") {
        // Zero segments, or consume one and stay on "**".
        if (MatchSegments(pat, pi + 1, path, si)) {
            return true;
        }
        return si < path.size() && MatchSegments(pat, pi, path, si + 1);
    }
    if (si == path.size()) {
        return false;
    }
    return MatchSegment(pat[pi], path[si]) &&
           MatchSegments(pat, pi + 1, path, si + 1);
}

// README, LICENSE, CHANGELOG and friends.
bool HasUppercaseStem(std::string_view file_name) {
    auto dot = file_name.rfind('.');
    auto stem = file_name.substr(0, dot);
    bool has_letter = false;
    for (char c : stem) {
        auto uc = static_cast<unsigned char>(c);
        if (std::islower(uc)) {
            return false;
        }
        if (std::isalpha(uc)) {
            has_letter = true;
        }
    }
    return has_letter;
}

} // anonymous namespace

std::vector<std::string> ExpandBraces(std::string_view pattern) {
    auto open = pattern.find('{');
    if (open == std::string_view::npos) {
        return {std::string(pattern)};
    }
    auto close = pattern.find('}', open);
    if (close == std::string_view::npos) {
        return {std::string(pattern)};
    }

    auto prefix = pattern.substr(0, open);
    auto body = pattern.substr(open + 1, close - open - 1);
    auto suffix = pattern.substr(close + 1);

    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        auto comma = body.find(',', start);
        auto alt = body.substr(start, comma == std::string_view::npos
                                          ? std::string_view::npos
                                          : comma - start);
        std::string head(prefix);
        head.append(alt);
        for (auto& tail : ExpandBraces(suffix)) {
            out.push_back(head + tail);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return out;
}

bool GlobMatch(std::string_view pattern, std::string_view path) {
    const auto path_segments = SplitSegments(path);
    for (const auto& alternative : ExpandBraces(pattern)) {
        if (MatchSegments(SplitSegments(alternative), 0, path_segments, 0)) {
            return true;
        }
    }
    return false;
}

bool HasDeployableExtension(std::string_view file_name) {
    auto dot = file_name.rfind('.');
    if (dot == std::string_view::npos || dot == 0) {
        return false;
    }
    auto ext = file_name.substr(dot);
    return ext == ".js" || ext == ".ts" || ext == ".mjs" || ext == ".md";
}

bool IsIgnoredDirectory(std::string_view name) {
    return name == "node_modules" || name == ".git" || name == "dist" || name == "build";
}

std::vector<std::string> PatternsFor(TargetType type) {
    const std::string c = TargetTypeName(type);
    const std::string ext = kExtensions;
    return {
        ".claude/" + c + "/**/*." + ext,
        c + "/**/*." + ext,
        ".claude/" + c + "." + ext,
        c + "." + ext,
    };
}

// ---------------------------------------------------------------------------
// PatternMatcher
// ---------------------------------------------------------------------------
PatternMatcher::PatternMatcher(Logger& logger) : logger_(logger) {}

std::vector<std::string> PatternMatcher::ListFiles(const std::filesystem::path& root,
                                                   bool skip_hidden) const {
    namespace fs = std::filesystem;
    std::vector<std::string> files;

    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        logger_.Warn(kComponent, "Cannot scan " + root.string() + ": " + ec.message());
        return files;
    }

    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            logger_.Warn(kComponent, "Scan error under " + root.string() + ": " + ec.message());
            break;
        }
        const auto name = it->path().filename().string();
        if (it->is_directory(ec)) {
            if (IsIgnoredDirectory(name) || (skip_hidden && name.front() == '.')) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }
        if (skip_hidden && name.front() == '.') {
            continue;
        }
        files.push_back(it->path().lexically_relative(root).generic_string());
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::vector<PatternMatch> PatternMatcher::Detect(
    const std::filesystem::path& repository_root) const {
    const auto files = ListFiles(repository_root, /*skip_hidden=*/false);

    std::vector<PatternMatch> matches;
    std::set<std::string> seen;
    for (auto type : kAllTargetTypes) {
        for (const auto& pattern : PatternsFor(type)) {
            for (const auto& file : files) {
                if (seen.count(file) != 0 || !GlobMatch(pattern, file)) {
                    continue;
                }
                seen.insert(file);
                matches.push_back(PatternMatch{file, pattern, type});
            }
        }
    }

    logger_.Info(kComponent, "Detected " + std::to_string(matches.size()) + " files to deploy");
    return matches;
}

std::vector<PatternMatch> PatternMatcher::DetectTypeBased(
    const std::filesystem::path& repository_root, TargetType type) const {
    std::vector<PatternMatch> matches;
    for (const auto& file : ListFiles(repository_root, /*skip_hidden=*/true)) {
        auto slash = file.rfind('/');
        auto name = slash == std::string::npos ? file : file.substr(slash + 1);
        if (!HasDeployableExtension(name) || HasUppercaseStem(name)) {
            continue;
        }
        matches.push_back(PatternMatch{file, kTypeBasedPattern, type});
    }

    logger_.Info(kComponent, "Detected " + std::to_string(matches.size()) + " " +
                 TargetTypeName(type) + " files (type-based)");
    return matches;
}

} // namespace ccpm
