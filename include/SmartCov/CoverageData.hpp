// =================================================================
// include/SmartCov/CoverageData.hpp
// =================================================================
// Defines the in-memory coverage model produced by the LCOV parser.

#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace SmartCov {

/**
 * @brief Aggregate coverage counters for a file or a whole corpus
 *
 * The found/hit counters come straight from the LF/LH, FNF/FNH and
 * BRF/BRH record tags. Percentages are derived and clamped to [0, 100].
 */
struct CoverageSummary {
    uint64_t lines_found = 0;       ///< Executable lines (LF)
    uint64_t lines_hit = 0;         ///< Lines executed at least once (LH)
    uint64_t functions_found = 0;   ///< Functions (FNF)
    uint64_t functions_hit = 0;     ///< Functions executed (FNH)
    uint64_t branches_found = 0;    ///< Branches (BRF)
    uint64_t branches_hit = 0;      ///< Branches taken (BRH)

    /**
     * @brief Line coverage percentage (0.0 to 100.0)
     * @return 0.0 when no lines were found
     */
    double linePercentage() const;

    /**
     * @brief Function coverage percentage (0.0 to 100.0)
     */
    double functionPercentage() const;

    /**
     * @brief Branch coverage percentage (0.0 to 100.0)
     */
    double branchPercentage() const;

    /**
     * @brief Field-wise accumulation of another summary
     */
    CoverageSummary& operator+=(const CoverageSummary& other);

    bool operator==(const CoverageSummary& other) const;
    bool operator!=(const CoverageSummary& other) const { return !(*this == other); }
};

/**
 * @brief Hit information for a single source line
 */
struct LineCoverage {
    uint64_t line_number = 0;   ///< 1-based line number
    int64_t hit_count = 0;      ///< Execution count (signed so deltas fit)

    LineCoverage() = default;
    LineCoverage(uint64_t line, int64_t hits) : line_number(line), hit_count(hits) {}

    bool isCovered() const { return hit_count > 0; }

    bool operator==(const LineCoverage& other) const {
        return line_number == other.line_number && hit_count == other.hit_count;
    }
    bool operator!=(const LineCoverage& other) const { return !(*this == other); }
};

/**
 * @brief Coverage for one SF: record
 *
 * summary.lines_found is taken from the record counters and may differ
 * from lines.size(); the counters drive percentages, the per-line records
 * are for detail output only.
 */
struct FileCoverage {
    std::string path;                   ///< Path exactly as recorded by the producing tool
    std::vector<LineCoverage> lines;    ///< Per-line records in input order
    CoverageSummary summary;            ///< Counters scoped to this file

    bool operator==(const FileCoverage& other) const;
    bool operator!=(const FileCoverage& other) const { return !(*this == other); }
};

/**
 * @brief A parsed coverage corpus
 *
 * Files are not deduplicated: a path recorded twice yields two entries.
 * The summary is always the field-wise sum of the file summaries.
 */
struct CoverageData {
    std::vector<FileCoverage> files;
    CoverageSummary summary;

    /**
     * @brief Build a corpus from file records, computing the summary
     * @param files File records to take ownership of
     * @return New coverage data with a freshly summed summary
     */
    static CoverageData fromFiles(std::vector<FileCoverage> files);

    /**
     * @brief Empty corpus with a zero summary
     */
    static CoverageData empty();

    /**
     * @brief Field-wise sum of the summaries of the given files
     */
    static CoverageSummary calculateSummary(const std::vector<FileCoverage>& files);

    bool operator==(const CoverageData& other) const;
    bool operator!=(const CoverageData& other) const { return !(*this == other); }
};

} // namespace SmartCov
