// =================================================================
// src/SmartCov/CoverageData.cpp
// =================================================================
// Implementation for the coverage model helpers.

#include "SmartCov/CoverageData.hpp"
#include <algorithm>

namespace SmartCov {

static double percentage(uint64_t hit, uint64_t found) {
    if (found == 0) {
        return 0.0;
    }
    // Producers occasionally report hit > found; keep the result in range
    double value = static_cast<double>(hit) / static_cast<double>(found) * 100.0;
    return std::min(value, 100.0);
}

double CoverageSummary::linePercentage() const {
    return percentage(lines_hit, lines_found);
}

double CoverageSummary::functionPercentage() const {
    return percentage(functions_hit, functions_found);
}

double CoverageSummary::branchPercentage() const {
    return percentage(branches_hit, branches_found);
}

CoverageSummary& CoverageSummary::operator+=(const CoverageSummary& other) {
    lines_found += other.lines_found;
    lines_hit += other.lines_hit;
    functions_found += other.functions_found;
    functions_hit += other.functions_hit;
    branches_found += other.branches_found;
    branches_hit += other.branches_hit;
    return *this;
}

bool CoverageSummary::operator==(const CoverageSummary& other) const {
    return lines_found == other.lines_found &&
           lines_hit == other.lines_hit &&
           functions_found == other.functions_found &&
           functions_hit == other.functions_hit &&
           branches_found == other.branches_found &&
           branches_hit == other.branches_hit;
}

bool FileCoverage::operator==(const FileCoverage& other) const {
    return path == other.path && lines == other.lines && summary == other.summary;
}

CoverageData CoverageData::fromFiles(std::vector<FileCoverage> files) {
    CoverageData data;
    data.summary = calculateSummary(files);
    data.files = std::move(files);
    return data;
}

CoverageData CoverageData::empty() {
    return CoverageData();
}

CoverageSummary CoverageData::calculateSummary(const std::vector<FileCoverage>& files) {
    CoverageSummary total;
    for (const auto& file : files) {
        total += file.summary;
    }
    return total;
}

bool CoverageData::operator==(const CoverageData& other) const {
    return files == other.files && summary == other.summary;
}

} // namespace SmartCov
