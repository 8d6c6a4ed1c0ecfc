// =================================================================
// include/SmartCov/ReportGenerator.hpp
// =================================================================
// Produces console, JSON and LCOV reports for coverage results.

#pragma once

#include "SmartCov/CoverageData.hpp"
#include "SmartCov/SmartCovConfig.hpp"
#include <string>
#include <vector>

namespace SmartCov {

class SysInteraction;

class ReportGenerator {
public:
    static constexpr size_t kMaxConsoleFiles = 10;
    static constexpr const char* kJsonReportName = "coverage_report.json";
    static constexpr const char* kLcovReportName = "coverage_report.lcov";

    explicit ReportGenerator(SysInteraction& sys);

    /**
     * @brief Format the human readable summary
     *
     * Lists at most kMaxConsoleFiles files, each marked by its line
     * coverage: ✅ from 80%, ⚠️ from 60%, ❌ below.
     */
    static std::string generateConsoleOutput(const CoverageData& data);

    /**
     * @brief Percentage with one decimal and a trailing %, e.g. "66.7%"
     */
    static std::string formatPercentage(double percentage);

    /**
     * @brief Write the file-based reports requested by the configuration
     * @param data Coverage to report
     * @param config Supplies output formats and directory
     * @return Paths of the files written
     * @throws std::runtime_error if the directory or a report cannot be written
     */
    std::vector<std::string> generateReports(const CoverageData& data, const SmartCovConfig& config);

    /**
     * @brief Status marker for a line coverage percentage
     */
    static std::string statusIcon(double percentage);

private:
    SysInteraction& m_sys;

    void writeReport(const std::string& path, const std::string& content);
};

} // namespace SmartCov
