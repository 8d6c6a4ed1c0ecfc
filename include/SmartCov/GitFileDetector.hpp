// =================================================================
// include/SmartCov/GitFileDetector.hpp
// =================================================================
// Git-based discovery of the files changed in a package.

#pragma once

#include "SmartCov/FileDiscovery.hpp"
#include "SmartCov/SourceScanner.hpp"
#include <string>
#include <vector>
#include <utility>

namespace SmartCov {

class SysInteraction;

/**
 * @brief Finds changed source files with git, with monorepo support
 *
 * The repository root is located by walking up from the package root, so
 * a package nested inside a larger repository works. Changes are taken
 * from, in order:
 *
 *   1. git diff --name-only <base> HEAD
 *   2. git diff --name-only HEAD (uncommitted changes)
 *   3. every source file of the package
 *
 * Only files inside the package with a configured source extension that
 * are not excluded are returned, relative to the package root.
 */
class GitFileDetector : public FileDiscovery {
public:
    /**
     * @brief Construct a detector
     * @param sys System access used to run git
     * @param extensions Source extensions including the dot
     * @param exclude_patterns Gitignore-style patterns for generated/build files
     */
    GitFileDetector(SysInteraction& sys,
                    const std::vector<std::string>& extensions,
                    const std::vector<std::string>& exclude_patterns);

    /**
     * @brief Determine changed source files of the package
     * @throws VcsUnavailableError if the package is not inside a git
     *         repository or git cannot be found
     * @throws DiscoveryError if the git process cannot be started
     */
    std::vector<std::string> targetFiles(const std::string& base_branch,
                                         const std::string& package_root) override;

    /**
     * @brief Locate the repository root by searching for .git upwards
     * @param start_path Directory to start from
     * @return Repository root, or an empty string if none was found
     */
    static std::string findGitRoot(const std::string& start_path);

    /**
     * @brief Path of the package relative to the repository root
     * @return Empty when the package is the repository root
     */
    static std::string getRelativePackagePath(const std::string& package_dir, const std::string& git_root);

private:
    SysInteraction& m_sys;
    std::vector<std::string> m_extensions;
    std::vector<std::string> m_exclude_patterns;

    /**
     * @brief Run git in the repository root
     * @return Pair of stdout and exit code
     */
    std::pair<std::string, int> runGit(const std::vector<std::string>& args, const std::string& git_root);

    /**
     * @brief Keep package files and make them package-relative
     */
    std::vector<std::string> filterAndAdjustPaths(const std::vector<std::string>& files,
                                                  const std::string& relative_package_path,
                                                  const SourceScanner& scanner) const;

    static std::vector<std::string> splitLines(const std::string& output);
};

} // namespace SmartCov
