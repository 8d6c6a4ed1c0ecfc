// =================================================================
// include/SmartCov/CoverageSerializer.hpp
// =================================================================
// Conversions of CoverageData to LCOV text and JSON documents.

#pragma once

#include "SmartCov/CoverageData.hpp"
#include "nlohmann/json.hpp"
#include <string>

namespace SmartCov {

/**
 * @brief Writes coverage data as LCOV and JSON
 *
 * toLcov() output parses back into an equal CoverageData. toJson() and
 * fromJson() are the structural JSON form used for tooling, while
 * toJsonReport() produces the human-oriented report document.
 */
class CoverageSerializer {
public:
    /**
     * @brief Render coverage data as an LCOV tracefile
     *
     * Every counter tag is written for every record, zero or not.
     */
    static std::string toLcov(const CoverageData& data);

    /**
     * @brief Build the JSON report document
     * @return Object with timestamp, summary and per-file details
     */
    static nlohmann::json toJsonReport(const CoverageData& data);

    /**
     * @brief Structural JSON form holding every field
     */
    static nlohmann::json toJson(const CoverageData& data);

    /**
     * @brief Rebuild coverage data from toJson() output
     * @throws std::invalid_argument if the document does not have the expected shape
     */
    static CoverageData fromJson(const nlohmann::json& document);

    /**
     * @brief JSON object with summary counters and percentages
     */
    static nlohmann::json summaryToJson(const CoverageSummary& summary);

private:
    static nlohmann::json countersToJson(const CoverageSummary& summary);
    static CoverageSummary countersFromJson(const nlohmann::json& node);
    static std::string currentTimestamp();
};

} // namespace SmartCov
