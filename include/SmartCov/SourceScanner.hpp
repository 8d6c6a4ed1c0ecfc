// =================================================================
// include/SmartCov/SourceScanner.hpp
// =================================================================
// Header for listing the source files of a package.

#pragma once

#include "SmartCov/ExcludePattern.hpp"
#include <string>
#include <vector>
#include <filesystem>

namespace SmartCov {

/**
 * @brief Lists package source files by extension, honoring exclude patterns
 *
 * Used as the last fallback of git-based discovery, when no diff can be
 * obtained or no changed source file belongs to the package.
 */
class SourceScanner {
public:
    /**
     * @brief Construct a new SourceScanner
     * @param root_path Package root directory
     * @param extensions Source extensions including the dot (e.g. ".dart")
     * @param exclude_patterns Gitignore-style patterns for generated/build files
     */
    SourceScanner(const std::string& root_path,
                  const std::vector<std::string>& extensions,
                  const std::vector<std::string>& exclude_patterns);

    /**
     * @brief Scan the package for source files
     * @return Sorted paths relative to the root, slash separated
     */
    std::vector<std::string> scanFiles() const;

    /**
     * @brief Check a relative path against the extension and exclude rules
     * @param relative_path Slash-separated path relative to the root
     */
    bool isSourceFile(const std::string& relative_path) const;

private:
    std::string m_root_path;
    std::vector<std::string> m_extensions;
    ExcludePatternSet m_exclude_patterns;

    bool hasSourceExtension(const std::string& relative_path) const;
    std::string getRelativePath(const std::filesystem::path& abs_path) const;
};

} // namespace SmartCov
