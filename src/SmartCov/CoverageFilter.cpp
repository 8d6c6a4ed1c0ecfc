// =================================================================
// src/SmartCov/CoverageFilter.cpp
// =================================================================
// Implementation for target path matching and re-aggregation.

#include "SmartCov/CoverageFilter.hpp"
#include "SmartCov/Logger.hpp"
#include <algorithm>

namespace SmartCov {

static bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

CoverageData CoverageFilter::filterByTargets(const CoverageData& data, const std::vector<std::string>& targets) {
    if (targets.empty()) {
        SMARTCOV_LOG_WARNING("CoverageFilter", "No files to filter - returning empty coverage data");
        return CoverageData::empty();
    }

    std::vector<std::string> normalized_targets;
    normalized_targets.reserve(targets.size());
    for (const auto& target : targets) {
        normalized_targets.push_back(normalizePath(target));
    }
    std::sort(normalized_targets.begin(), normalized_targets.end());
    normalized_targets.erase(std::unique(normalized_targets.begin(), normalized_targets.end()),
                             normalized_targets.end());

    std::vector<FileCoverage> matched;
    for (const auto& file : data.files) {
        std::string recorded = normalizePath(file.path);
        bool keep = std::any_of(normalized_targets.begin(), normalized_targets.end(),
                                [&recorded](const std::string& target) {
                                    return pathsMatch(recorded, target);
                                });
        if (keep) {
            matched.push_back(file);
        }
    }

    Logger& logger = Logger::getInstance();
    logger.logFilter(data.files.size(), targets.size(), matched.size());
    if (matched.empty()) {
        logger.warning("CoverageFilter", "No matches found",
                       "Target example: " + targets.front() +
                       ", LCOV example: " + (data.files.empty() ? std::string("none") : data.files.front().path));
    }

    return CoverageData::fromFiles(std::move(matched));
}

std::string CoverageFilter::normalizePath(const std::string& path) {
    std::string normalized = path;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');

    if (normalized.compare(0, 2, "./") == 0) {
        normalized.erase(0, 2);
    } else if (!normalized.empty() && normalized[0] == '/') {
        normalized.erase(0, 1);
    }
    return normalized;
}

bool CoverageFilter::pathsMatch(const std::string& recorded_path, const std::string& target) {
    if (recorded_path == target) {
        return true;
    }

    // Recorded path is deeper, e.g. absolute path vs. package-relative target
    if (endsWith(recorded_path, target)) {
        return true;
    }

    // Target is deeper, e.g. repository-relative target vs. package-relative record
    if (endsWith(target, recorded_path)) {
        return true;
    }

    if (basename(recorded_path) == basename(target)) {
        std::string stripped = target;
        if (stripped.compare(0, 4, "lib/") == 0) {
            stripped.erase(0, 4);
        }
        if (recorded_path.find(stripped) != std::string::npos) {
            return true;
        }
    }

    return false;
}

std::string CoverageFilter::basename(const std::string& path) {
    size_t slash = path.find_last_of('/');
    if (slash == std::string::npos) {
        return path;
    }
    return path.substr(slash + 1);
}

} // namespace SmartCov
