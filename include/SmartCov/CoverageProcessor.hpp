// =================================================================
// include/SmartCov/CoverageProcessor.hpp
// =================================================================
// Coordinates parsing, change discovery and filtering of coverage data.

#pragma once

#include "SmartCov/CoverageData.hpp"
#include "SmartCov/LcovParser.hpp"
#include <string>
#include <memory>

namespace SmartCov {

class FileDiscovery;

/**
 * @brief Which corpus an analysis ended up reporting on
 */
enum class CoverageScope {
    Filtered,             ///< Only the changed files
    FullNoBaseBranch,     ///< No base branch configured
    FullVcsUnavailable,   ///< Not a git repository or git missing
    FullNoMatches,        ///< Changed files had no coverage records
    FullNoTargets         ///< Discovery returned no files
};

/**
 * @brief Human readable reason for a scope
 */
std::string describeScope(CoverageScope scope);

/**
 * @brief Coverage data together with the scope it was produced for
 */
struct CoverageResult {
    CoverageData data;
    CoverageScope scope = CoverageScope::FullNoBaseBranch;

    bool isFiltered() const { return scope == CoverageScope::Filtered; }
};

/**
 * @brief Main service of the coverage workflow
 *
 * processCoverage() narrows a tracefile down to the files changed
 * relative to a base branch and widens back to the whole corpus whenever
 * the narrowing cannot produce a meaningful result:
 *
 *   - no base branch configured
 *   - discovery raises VcsUnavailableError
 *   - discovery returns no files
 *   - none of the changed files has a coverage record
 *
 * Every other error from discovery or parsing propagates unchanged.
 */
class CoverageProcessor {
public:
    /**
     * @brief Construct a processor
     * @param discovery Collaborator producing the changed files
     * @param worker_threshold Tracefile size from which parsing runs on a worker thread
     */
    explicit CoverageProcessor(FileDiscovery& discovery,
                               size_t worker_threshold = LcovParser::kDefaultWorkerThreshold);

    /**
     * @brief Run the narrowing/fallback ladder
     * @param lcov_path Path to the tracefile
     * @param base_branch Branch to diff against, empty when not configured
     * @param package_root Package directory handed to discovery
     * @return Coverage data and the scope it covers
     * @throws std::invalid_argument if package_root is not a directory
     * @throws NotFoundError if the tracefile does not exist
     */
    CoverageResult processCoverage(const std::string& lcov_path,
                                   const std::string& base_branch,
                                   const std::string& package_root);

    /**
     * @brief Parse the whole tracefile without filtering
     * @throws std::invalid_argument if package_root is not a directory
     */
    CoverageData processAllFilesCoverage(const std::string& lcov_path, const std::string& package_root);

    /**
     * @brief Coverage of a single source file
     * @param lcov_path Path to the tracefile
     * @param file_path Source path, matched with the same rules as targets
     * @return First matching record, nullptr when none matched
     */
    std::unique_ptr<FileCoverage> getFileCoverage(const std::string& lcov_path, const std::string& file_path);

    /**
     * @brief Line-level difference between two tracefiles
     *
     * For files present in both, only lines whose hit count changed are
     * kept (with the signed difference) along with lines new in the
     * current tracefile; unchanged files are dropped. Files only present
     * in the current tracefile are included as is. Needs no discovery.
     * @throws NotFoundError if either tracefile does not exist
     */
    static CoverageData calculateCoverageDelta(const std::string& base_lcov_path,
                                               const std::string& current_lcov_path,
                                               size_t worker_threshold = LcovParser::kDefaultWorkerThreshold);

    /**
     * @brief Delta computation on already parsed data
     */
    static CoverageData computeDelta(const CoverageData& base, const CoverageData& current);

    /**
     * @brief Check that the package root is an existing directory
     * @throws std::invalid_argument otherwise
     */
    static void validatePackageRoot(const std::string& package_root);

    const ParseStats& getLastParseStats() const { return m_parser.getLastParseStats(); }

private:
    FileDiscovery& m_discovery;
    LcovParser m_parser;

    CoverageResult fullCorpus(const std::string& lcov_path, CoverageScope scope, const std::string& detail);
};

} // namespace SmartCov
