// =================================================================
// src/SmartCov/CoverageSerializer.cpp
// =================================================================
// Implementation for LCOV and JSON output of coverage data.

#include "SmartCov/CoverageSerializer.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace SmartCov {

namespace {

const nlohmann::json& requireField(const nlohmann::json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end()) {
        throw std::invalid_argument(std::string("Missing field in coverage JSON: ") + key);
    }
    return *it;
}

uint64_t requireUnsigned(const nlohmann::json& node, const char* key) {
    const nlohmann::json& value = requireField(node, key);
    if (!value.is_number_integer() || (!value.is_number_unsigned() && value.get<int64_t>() < 0)) {
        throw std::invalid_argument(std::string("Field must be a non-negative integer: ") + key);
    }
    return value.get<uint64_t>();
}

} // namespace

std::string CoverageSerializer::toLcov(const CoverageData& data) {
    std::ostringstream out;

    for (const auto& file : data.files) {
        const CoverageSummary& summary = file.summary;
        out << "TN:\n";
        out << "SF:" << file.path << "\n";
        out << "FNF:" << summary.functions_found << "\n";
        out << "FNH:" << summary.functions_hit << "\n";
        for (const auto& line : file.lines) {
            out << "DA:" << line.line_number << "," << line.hit_count << "\n";
        }
        out << "LF:" << summary.lines_found << "\n";
        out << "LH:" << summary.lines_hit << "\n";
        out << "BRF:" << summary.branches_found << "\n";
        out << "BRH:" << summary.branches_hit << "\n";
        out << "end_of_record\n";
    }

    return out.str();
}

nlohmann::json CoverageSerializer::toJsonReport(const CoverageData& data) {
    nlohmann::json report;
    report["timestamp"] = currentTimestamp();

    nlohmann::json summary = summaryToJson(data.summary);
    summary["totalFiles"] = data.files.size();
    report["summary"] = summary;

    nlohmann::json files = nlohmann::json::array();
    for (const auto& file : data.files) {
        nlohmann::json lines = nlohmann::json::array();
        for (const auto& line : file.lines) {
            lines.push_back({
                {"lineNumber", line.line_number},
                {"hitCount", line.hit_count},
                {"isCovered", line.isCovered()}
            });
        }

        files.push_back({
            {"sourceFile", file.path},
            {"summary", summaryToJson(file.summary)},
            {"lines", lines}
        });
    }
    report["files"] = files;

    return report;
}

nlohmann::json CoverageSerializer::summaryToJson(const CoverageSummary& summary) {
    return {
        {"totalLines", summary.lines_found},
        {"coveredLines", summary.lines_hit},
        {"linePercentage", summary.linePercentage()},
        {"totalFunctions", summary.functions_found},
        {"coveredFunctions", summary.functions_hit},
        {"functionPercentage", summary.functionPercentage()},
        {"totalBranches", summary.branches_found},
        {"coveredBranches", summary.branches_hit},
        {"branchPercentage", summary.branchPercentage()}
    };
}

nlohmann::json CoverageSerializer::toJson(const CoverageData& data) {
    nlohmann::json files = nlohmann::json::array();
    for (const auto& file : data.files) {
        nlohmann::json lines = nlohmann::json::array();
        for (const auto& line : file.lines) {
            lines.push_back({{"line_number", line.line_number}, {"hit_count", line.hit_count}});
        }
        files.push_back({
            {"path", file.path},
            {"lines", lines},
            {"summary", countersToJson(file.summary)}
        });
    }

    return {
        {"files", files},
        {"summary", countersToJson(data.summary)}
    };
}

CoverageData CoverageSerializer::fromJson(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw std::invalid_argument("Coverage JSON must be an object");
    }

    const nlohmann::json& files = requireField(document, "files");
    if (!files.is_array()) {
        throw std::invalid_argument("Coverage JSON field 'files' must be an array");
    }

    std::vector<FileCoverage> result_files;
    result_files.reserve(files.size());
    for (const auto& file_node : files) {
        if (!file_node.is_object()) {
            throw std::invalid_argument("Coverage JSON file entry must be an object");
        }

        FileCoverage file;
        const nlohmann::json& path = requireField(file_node, "path");
        if (!path.is_string()) {
            throw std::invalid_argument("Coverage JSON field 'path' must be a string");
        }
        file.path = path.get<std::string>();

        const nlohmann::json& lines = requireField(file_node, "lines");
        if (!lines.is_array()) {
            throw std::invalid_argument("Coverage JSON field 'lines' must be an array");
        }
        for (const auto& line_node : lines) {
            if (!line_node.is_object()) {
                throw std::invalid_argument("Coverage JSON line entry must be an object");
            }
            const nlohmann::json& hits = requireField(line_node, "hit_count");
            if (!hits.is_number_integer()) {
                throw std::invalid_argument("Field must be an integer: hit_count");
            }
            file.lines.emplace_back(requireUnsigned(line_node, "line_number"), hits.get<int64_t>());
        }

        file.summary = countersFromJson(requireField(file_node, "summary"));
        result_files.push_back(std::move(file));
    }

    CoverageData data = CoverageData::fromFiles(std::move(result_files));

    auto summary_it = document.find("summary");
    if (summary_it != document.end() && countersFromJson(*summary_it) != data.summary) {
        throw std::invalid_argument("Coverage JSON summary does not match its files");
    }

    return data;
}

nlohmann::json CoverageSerializer::countersToJson(const CoverageSummary& summary) {
    return {
        {"lines_found", summary.lines_found},
        {"lines_hit", summary.lines_hit},
        {"functions_found", summary.functions_found},
        {"functions_hit", summary.functions_hit},
        {"branches_found", summary.branches_found},
        {"branches_hit", summary.branches_hit}
    };
}

CoverageSummary CoverageSerializer::countersFromJson(const nlohmann::json& node) {
    if (!node.is_object()) {
        throw std::invalid_argument("Coverage JSON summary must be an object");
    }

    CoverageSummary summary;
    summary.lines_found = requireUnsigned(node, "lines_found");
    summary.lines_hit = requireUnsigned(node, "lines_hit");
    summary.functions_found = requireUnsigned(node, "functions_found");
    summary.functions_hit = requireUnsigned(node, "functions_hit");
    summary.branches_found = requireUnsigned(node, "branches_found");
    summary.branches_hit = requireUnsigned(node, "branches_hit");
    return summary;
}

std::string CoverageSerializer::currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_utc{};
    gmtime_r(&time_t, &tm_utc);

    std::stringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

} // namespace SmartCov
