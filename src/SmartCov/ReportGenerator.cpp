// =================================================================
// src/SmartCov/ReportGenerator.cpp
// =================================================================
// Implementation for coverage report output.

#include "SmartCov/ReportGenerator.hpp"
#include "SmartCov/CoverageSerializer.hpp"
#include "SmartCov/SysInteraction.hpp"
#include "SmartCov/Logger.hpp"
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace SmartCov {

std::string ReportGenerator::formatPercentage(double percentage) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << percentage << "%";
    return out.str();
}

ReportGenerator::ReportGenerator(SysInteraction& sys)
    : m_sys(sys)
{
}

std::string ReportGenerator::generateConsoleOutput(const CoverageData& data) {
    std::ostringstream out;
    const CoverageSummary& summary = data.summary;

    out << "\n📈 Coverage Summary:\n";
    out << "  Files analyzed: " << data.files.size() << "\n";
    out << "  Lines found: " << summary.lines_found << "\n";
    out << "  Lines hit: " << summary.lines_hit << "\n";
    out << "  Line coverage: " << formatPercentage(summary.linePercentage()) << "\n";

    if (summary.functions_found > 0) {
        out << "  Function coverage: " << formatPercentage(summary.functionPercentage()) << "\n";
    }

    if (summary.branches_found > 0) {
        out << "  Branch coverage: " << formatPercentage(summary.branchPercentage()) << "\n";
    }

    if (!data.files.empty()) {
        out << "\n📁 File Coverage:\n";
        size_t shown = 0;
        for (const auto& file : data.files) {
            if (shown++ == kMaxConsoleFiles) {
                break;
            }
            double percentage = file.summary.linePercentage();
            out << "  " << statusIcon(percentage) << " " << file.path << ": " << formatPercentage(percentage) << "\n";
        }

        if (data.files.size() > kMaxConsoleFiles) {
            out << "  ... and " << (data.files.size() - kMaxConsoleFiles) << " more files\n";
        }
    }

    return out.str();
}

std::vector<std::string> ReportGenerator::generateReports(const CoverageData& data, const SmartCovConfig& config) {
    std::vector<std::string> written;
    const std::string output_dir = config.resolvedOutputDir();

    bool needs_directory = config.hasOutputFormat("json") || config.hasOutputFormat("lcov");
    if (needs_directory && !m_sys.createDirectories(output_dir)) {
        throw std::runtime_error("Failed to create output directory: " + output_dir);
    }

    for (const auto& format : config.output_formats) {
        if (format == "json") {
            std::string path = (std::filesystem::path(output_dir) / kJsonReportName).string();
            writeReport(path, CoverageSerializer::toJsonReport(data).dump(2) + "\n");
            written.push_back(path);
        } else if (format == "lcov") {
            std::string path = (std::filesystem::path(output_dir) / kLcovReportName).string();
            writeReport(path, CoverageSerializer::toLcov(data));
            written.push_back(path);
        } else if (format == "console") {
            // Printed by the caller
        } else {
            Logger::getInstance().warning("ReportGenerator", "Unknown output format skipped", format);
        }
    }

    return written;
}

std::string ReportGenerator::statusIcon(double percentage) {
    if (percentage >= 80.0) {
        return "✅";
    }
    if (percentage >= 60.0) {
        return "⚠️";
    }
    return "❌";
}

void ReportGenerator::writeReport(const std::string& path, const std::string& content) {
    if (!m_sys.writeFile(path, content)) {
        throw std::runtime_error("Failed to write report: " + path);
    }
    Logger::getInstance().info("ReportGenerator", "Report written", path);
}

} // namespace SmartCov
