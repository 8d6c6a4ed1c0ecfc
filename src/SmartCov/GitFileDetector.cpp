// =================================================================
// src/SmartCov/GitFileDetector.cpp
// =================================================================
// Implementation for git-based changed file discovery.

#include "SmartCov/GitFileDetector.hpp"
#include "SmartCov/SysInteraction.hpp"
#include "SmartCov/Errors.hpp"
#include "SmartCov/Logger.hpp"
#include <filesystem>
#include <sstream>

namespace SmartCov {

namespace {

// Exit status reported by the shell when git is not on PATH
constexpr int kCommandNotFound = 127;

constexpr int kMaxParentLevels = 100;

std::filesystem::path canonicalDirectory(const std::string& path) {
    std::error_code ec;
    std::filesystem::path resolved = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        resolved = std::filesystem::absolute(path).lexically_normal();
    }
    if (!resolved.has_filename() && resolved.has_relative_path()) {
        resolved = resolved.parent_path();
    }
    return resolved;
}

} // namespace

GitFileDetector::GitFileDetector(SysInteraction& sys,
                                 const std::vector<std::string>& extensions,
                                 const std::vector<std::string>& exclude_patterns)
    : m_sys(sys),
      m_extensions(extensions),
      m_exclude_patterns(exclude_patterns)
{
}

std::vector<std::string> GitFileDetector::targetFiles(const std::string& base_branch,
                                                      const std::string& package_root) {
    Logger& logger = Logger::getInstance();
    std::string package_dir = canonicalDirectory(package_root).string();

    std::string git_root = findGitRoot(package_dir);
    if (git_root.empty()) {
        throw VcsUnavailableError("Not a git repository (searched from: " + package_dir + ")");
    }

    std::string relative_package = getRelativePackagePath(package_dir, git_root);
    logger.debug("GitFileDetector", "Git repository found", git_root);
    logger.debug("GitFileDetector", "Current package",
                 relative_package.empty() ? std::string("<repository root>") : relative_package);

    SourceScanner scanner(package_dir, m_extensions, m_exclude_patterns);

    std::vector<std::string> changed;
    auto committed = runGit({"diff", "--name-only", base_branch, "HEAD"}, git_root);
    if (committed.second == 0) {
        changed = splitLines(committed.first);
        logger.debug("GitFileDetector",
                     "Found " + std::to_string(changed.size()) + " modified file(s) compared to " + base_branch);
    } else {
        logger.warning("GitFileDetector", "git diff against base branch failed",
                       "Base: " + base_branch + ", exit code: " + std::to_string(committed.second));
    }

    if (changed.empty()) {
        logger.info("GitFileDetector", "No committed changes found, checking uncommitted changes");
        auto uncommitted = runGit({"diff", "--name-only", "HEAD"}, git_root);
        if (uncommitted.second == 0) {
            changed = splitLines(uncommitted.first);
        }
    }

    if (changed.empty()) {
        logger.info("GitFileDetector", "No changes detected, using all source files in the package");
        return scanner.scanFiles();
    }

    std::vector<std::string> filtered = filterAndAdjustPaths(changed, relative_package, scanner);
    if (filtered.empty()) {
        logger.info("GitFileDetector", "No modified source files in this package, using all source files",
                    relative_package);
        return scanner.scanFiles();
    }

    logger.info("GitFileDetector", "Analyzing " + std::to_string(filtered.size()) + " modified file(s)");
    return filtered;
}

std::string GitFileDetector::findGitRoot(const std::string& start_path) {
    std::filesystem::path current = canonicalDirectory(start_path);

    for (int attempts = 0; attempts < kMaxParentLevels; ++attempts) {
        std::error_code ec;
        // .git is a directory in a normal clone and a file in worktrees/submodules
        if (std::filesystem::exists(current / ".git", ec)) {
            return current.string();
        }

        std::filesystem::path parent = current.parent_path();
        if (parent.empty() || parent == current) {
            break;
        }
        current = parent;
    }

    return "";
}

std::string GitFileDetector::getRelativePackagePath(const std::string& package_dir, const std::string& git_root) {
    std::filesystem::path relative = std::filesystem::path(package_dir).lexically_relative(git_root);
    std::string result = relative.generic_string();
    if (result == "." || result.empty()) {
        return "";
    }
    // Package outside the repository: treat paths as repository-relative
    if (result.compare(0, 2, "..") == 0) {
        return "";
    }
    return result;
}

std::pair<std::string, int> GitFileDetector::runGit(const std::vector<std::string>& args, const std::string& git_root) {
    std::pair<std::string, int> result;
    try {
        result = m_sys.executeCommand("git", args, git_root, false);
    } catch (const std::runtime_error& e) {
        throw DiscoveryError(std::string("Failed to run git: ") + e.what());
    }
    if (result.second == kCommandNotFound) {
        throw VcsUnavailableError("git executable not found");
    }
    return result;
}

std::vector<std::string> GitFileDetector::filterAndAdjustPaths(const std::vector<std::string>& files,
                                                               const std::string& relative_package_path,
                                                               const SourceScanner& scanner) const {
    std::vector<std::string> result;
    const std::string prefix = relative_package_path.empty() ? "" : relative_package_path + "/";

    for (const auto& file : files) {
        std::string adjusted = file;
        if (!prefix.empty()) {
            if (adjusted.compare(0, prefix.size(), prefix) != 0) {
                continue;  // belongs to another package of the monorepo
            }
            adjusted.erase(0, prefix.size());
        }
        if (scanner.isSourceFile(adjusted)) {
            result.push_back(adjusted);
        }
    }

    return result;
}

std::vector<std::string> GitFileDetector::splitLines(const std::string& output) {
    std::vector<std::string> lines;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

} // namespace SmartCov
