// =================================================================
// include/SmartCov/CoverageFilter.hpp
// =================================================================
// Selects the coverage records that belong to a set of target paths.

#pragma once

#include "SmartCov/CoverageData.hpp"
#include <string>
#include <vector>

namespace SmartCov {

/**
 * @brief Matches LCOV source paths against target file paths
 *
 * Recorded paths may be absolute, repository-relative or
 * package-relative, and targets come from git relative to some other
 * root. Both sides are normalized and then compared with a ladder of
 * heuristics; a record is kept if any target matches it:
 *
 *   1. exact match
 *   2. the recorded path ends with the target
 *   3. the target ends with the recorded path
 *   4. same basename, and the recorded path contains the target with a
 *      leading "lib/" removed
 *
 * Rule 4 can pair unrelated files that share a basename. It is kept as
 * is because downstream reports rely on its package-root bridging.
 */
class CoverageFilter {
public:
    /**
     * @brief Keep only the files matching any of the targets
     * @param data Parsed corpus, left untouched
     * @param targets Target paths; an empty list selects nothing
     * @return New corpus with the matched files and a recomputed summary
     */
    static CoverageData filterByTargets(const CoverageData& data, const std::vector<std::string>& targets);

    /**
     * @brief Normalize a path for matching
     *
     * Converts backslashes to slashes and removes one leading "./" or "/".
     */
    static std::string normalizePath(const std::string& path);

    /**
     * @brief Check whether a recorded path matches a target
     * @param recorded_path Normalized path from the SF: record
     * @param target Normalized target path
     */
    static bool pathsMatch(const std::string& recorded_path, const std::string& target);

    /**
     * @brief Last path component of a slash-separated path
     */
    static std::string basename(const std::string& path);
};

} // namespace SmartCov
