// =================================================================
// include/SmartCov/ExcludePattern.hpp
// =================================================================
// Gitignore-style patterns used to drop generated and build files.

#pragma once

#include <string>
#include <vector>
#include <regex>

namespace SmartCov {

/**
 * @brief A single gitignore-style pattern
 *
 * Supports:
 * - Wildcards: *, **, ?
 * - Negation: !pattern
 * - Directory patterns: dir/ (matches anything below such a directory)
 * - Anchored patterns: /pattern
 * - Comment lines: # comment
 */
class ExcludePattern {
public:
    /**
     * @brief Construct a pattern matcher
     * @param pattern The pattern string
     */
    explicit ExcludePattern(const std::string& pattern);

    /**
     * @brief Check if a file path matches this pattern
     * @param path Slash-separated path relative to the package root
     * @return true if path matches the pattern
     */
    bool matches(const std::string& path) const;

    bool isNegation() const { return m_is_negation; }
    bool isDirectoryOnly() const { return m_directory_only; }
    bool isEmpty() const { return m_is_empty; }
    const std::string& getPattern() const { return m_original_pattern; }

private:
    std::string m_original_pattern;
    bool m_is_negation;
    bool m_directory_only;
    bool m_is_anchored;
    bool m_is_empty;
    std::regex m_regex;

    void processPattern(const std::string& pattern);

    /**
     * @brief Convert glob syntax to an ECMAScript regex
     * @param glob_pattern Pattern without negation, anchor or trailing slash
     * @return Regex matching a whole relative path
     */
    std::string globToRegex(const std::string& glob_pattern) const;
};

/**
 * @brief Ordered collection of patterns, later patterns override earlier ones
 */
class ExcludePatternSet {
public:
    ExcludePatternSet() = default;
    explicit ExcludePatternSet(const std::vector<std::string>& patterns);

    void addPattern(const std::string& pattern);

    /**
     * @brief Check if a path is excluded
     * @param path Slash-separated path relative to the package root
     */
    bool isExcluded(const std::string& path) const;

    size_t size() const { return m_patterns.size(); }

private:
    std::vector<ExcludePattern> m_patterns;
};

} // namespace SmartCov
