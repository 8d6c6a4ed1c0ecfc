// =================================================================
// include/SmartCov/LcovParser.hpp
// =================================================================
// Parser for the LCOV tracefile format.

#pragma once

#include "SmartCov/CoverageData.hpp"
#include <string>
#include <cstddef>

namespace SmartCov {

/**
 * @brief Statistics from the most recent parse
 */
struct ParseStats {
    size_t input_bytes = 0;       ///< Size of the parsed text
    size_t file_count = 0;        ///< SF: records produced
    size_t skipped_records = 0;   ///< Malformed DA: records dropped
    bool on_worker = false;       ///< True if the worker thread did the work
    long duration_ms = 0;         ///< Wall time including the hand-off
};

/**
 * @brief Converts LCOV text into CoverageData
 *
 * Recognized tags are SF, DA, LF, LH, FNF, FNH, BRF, BRH and
 * end_of_record; everything else is ignored. Malformed DA records are
 * skipped and never abort the parse.
 *
 * Inputs at or above the worker threshold are moved to a separate thread
 * which runs the same algorithm and hands back the finished CoverageData
 * (or the exception) through a future. The caller blocks until then.
 */
class LcovParser {
public:
    static constexpr size_t kDefaultWorkerThreshold = 1024 * 1024; // 1MB

    /**
     * @brief Construct a parser
     * @param worker_threshold Input size in bytes from which the worker thread is used
     */
    explicit LcovParser(size_t worker_threshold = kDefaultWorkerThreshold);

    /**
     * @brief Parse LCOV text
     * @param content Tracefile contents; moved to the worker for large inputs
     * @return Parsed coverage corpus
     */
    CoverageData parseContent(std::string content);

    /**
     * @brief Read and parse an LCOV file
     * @param file_path Path to the tracefile
     * @return Parsed coverage corpus
     * @throws NotFoundError if the file does not exist
     * @throws std::runtime_error if the file exists but cannot be read
     */
    CoverageData parseFile(const std::string& file_path);

    /**
     * @brief Run the parse algorithm on the calling thread
     * @param content Tracefile contents
     * @param stats Optional receiver for file/skip counts
     * @return Parsed coverage corpus
     */
    static CoverageData parseContentSync(const std::string& content, ParseStats* stats = nullptr);

    /**
     * @brief Get statistics from the last parseContent/parseFile call
     */
    const ParseStats& getLastParseStats() const { return m_last_stats; }

    size_t getWorkerThreshold() const { return m_worker_threshold; }

private:
    size_t m_worker_threshold;
    ParseStats m_last_stats;

    /**
     * @brief Hand the text to a worker thread and wait for the result
     */
    static CoverageData parseOnWorker(std::string content, ParseStats& stats);
};

} // namespace SmartCov
