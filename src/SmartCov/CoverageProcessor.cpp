// =================================================================
// src/SmartCov/CoverageProcessor.cpp
// =================================================================
// Implementation for the coverage workflow.

#include "SmartCov/CoverageProcessor.hpp"
#include "SmartCov/CoverageFilter.hpp"
#include "SmartCov/FileDiscovery.hpp"
#include "SmartCov/Errors.hpp"
#include "SmartCov/Logger.hpp"
#include <filesystem>
#include <stdexcept>
#include <unordered_map>

namespace SmartCov {

std::string describeScope(CoverageScope scope) {
    switch (scope) {
        case CoverageScope::Filtered:
            return "Analyzing modified files only";
        case CoverageScope::FullNoBaseBranch:
            return "no base branch configured";
        case CoverageScope::FullVcsUnavailable:
            return "git is not available";
        case CoverageScope::FullNoMatches:
            return "no coverage data for modified files";
        case CoverageScope::FullNoTargets:
            return "no modified files detected";
    }
    return "unknown";
}

CoverageProcessor::CoverageProcessor(FileDiscovery& discovery, size_t worker_threshold)
    : m_discovery(discovery),
      m_parser(worker_threshold)
{
}

CoverageResult CoverageProcessor::processCoverage(const std::string& lcov_path,
                                                  const std::string& base_branch,
                                                  const std::string& package_root) {
    validatePackageRoot(package_root);

    if (base_branch.empty()) {
        return fullCorpus(lcov_path, CoverageScope::FullNoBaseBranch, package_root);
    }

    std::vector<std::string> targets;
    try {
        targets = m_discovery.targetFiles(base_branch, package_root);
    } catch (const VcsUnavailableError& e) {
        return fullCorpus(lcov_path, CoverageScope::FullVcsUnavailable, e.what());
    }

    if (targets.empty()) {
        return fullCorpus(lcov_path, CoverageScope::FullNoTargets, "Base: " + base_branch);
    }

    CoverageData all_data = m_parser.parseFile(lcov_path);
    CoverageData filtered = CoverageFilter::filterByTargets(all_data, targets);

    CoverageResult result;
    if (filtered.files.empty()) {
        Logger::getInstance().logScopeDecision(CoverageScope::FullNoMatches,
                                               std::to_string(targets.size()) + " modified file(s)");
        result.data = std::move(all_data);
        result.scope = CoverageScope::FullNoMatches;
        return result;
    }

    Logger::getInstance().logScopeDecision(CoverageScope::Filtered,
                                           std::to_string(filtered.files.size()) + " of " +
                                           std::to_string(all_data.files.size()) + " file(s), base: " + base_branch);
    result.data = std::move(filtered);
    result.scope = CoverageScope::Filtered;
    return result;
}

CoverageData CoverageProcessor::processAllFilesCoverage(const std::string& lcov_path, const std::string& package_root) {
    validatePackageRoot(package_root);
    return m_parser.parseFile(lcov_path);
}

std::unique_ptr<FileCoverage> CoverageProcessor::getFileCoverage(const std::string& lcov_path,
                                                                 const std::string& file_path) {
    CoverageData all_data = m_parser.parseFile(lcov_path);
    CoverageData matched = CoverageFilter::filterByTargets(all_data, {file_path});
    if (matched.files.empty()) {
        return nullptr;
    }
    return std::make_unique<FileCoverage>(std::move(matched.files.front()));
}

CoverageData CoverageProcessor::calculateCoverageDelta(const std::string& base_lcov_path,
                                                       const std::string& current_lcov_path,
                                                       size_t worker_threshold) {
    LcovParser parser(worker_threshold);
    CoverageData base = parser.parseFile(base_lcov_path);
    CoverageData current = parser.parseFile(current_lcov_path);

    CoverageData delta = computeDelta(base, current);
    SMARTCOV_LOG_INFO("CoverageProcessor",
                      "Coverage delta: " + std::to_string(delta.files.size()) + " changed file(s)");
    return delta;
}

CoverageData CoverageProcessor::computeDelta(const CoverageData& base, const CoverageData& current) {
    // Later records for the same path replace earlier ones
    std::unordered_map<std::string, const FileCoverage*> base_files;
    for (const auto& file : base.files) {
        base_files[file.path] = &file;
    }

    std::vector<FileCoverage> delta_files;
    for (const auto& current_file : current.files) {
        auto base_it = base_files.find(current_file.path);
        if (base_it == base_files.end()) {
            delta_files.push_back(current_file);
            continue;
        }

        std::unordered_map<uint64_t, int64_t> base_hits;
        for (const auto& line : base_it->second->lines) {
            base_hits[line.line_number] = line.hit_count;
        }

        FileCoverage delta_file;
        delta_file.path = current_file.path;
        for (const auto& line : current_file.lines) {
            auto hit_it = base_hits.find(line.line_number);
            if (hit_it == base_hits.end()) {
                delta_file.lines.push_back(line);
                continue;
            }
            int64_t difference = line.hit_count - hit_it->second;
            if (difference != 0) {
                delta_file.lines.emplace_back(line.line_number, difference);
            }
        }

        if (delta_file.lines.empty()) {
            continue;
        }

        delta_file.summary.lines_found = delta_file.lines.size();
        for (const auto& line : delta_file.lines) {
            if (line.isCovered()) {
                delta_file.summary.lines_hit++;
            }
        }
        delta_files.push_back(std::move(delta_file));
    }

    return CoverageData::fromFiles(std::move(delta_files));
}

void CoverageProcessor::validatePackageRoot(const std::string& package_root) {
    std::error_code ec;
    if (package_root.empty() || !std::filesystem::is_directory(package_root, ec)) {
        throw std::invalid_argument("Invalid package directory: " + package_root);
    }
}

CoverageResult CoverageProcessor::fullCorpus(const std::string& lcov_path, CoverageScope scope,
                                             const std::string& detail) {
    Logger::getInstance().logScopeDecision(scope, detail);

    CoverageResult result;
    result.data = m_parser.parseFile(lcov_path);
    result.scope = scope;
    return result;
}

} // namespace SmartCov
