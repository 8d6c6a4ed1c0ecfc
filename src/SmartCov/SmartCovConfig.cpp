// =================================================================
// src/SmartCov/SmartCovConfig.cpp
// =================================================================
// Implementation for coverage analysis configuration.

#include "SmartCov/SmartCovConfig.hpp"
#include "SmartCov/CliParser.hpp"
#include "SmartCov/Logger.hpp"
#include <algorithm>
#include <filesystem>

namespace SmartCov {

static std::string joinToPackage(const std::string& package_path, const std::string& path) {
    std::filesystem::path candidate(path);
    if (candidate.is_absolute()) {
        return path;
    }
    return (std::filesystem::path(package_path) / candidate).lexically_normal().string();
}

void SmartCovConfig::applyCommandOverrides(const Commands& commands) {
    // Override with command-line options if provided
    if (!commands.package_path.empty()) {
        package_path = commands.package_path;
    }

    if (!commands.base_branch.empty()) {
        base_branch = commands.base_branch;
    }

    if (!commands.lcov_file.empty()) {
        lcov_file = commands.lcov_file;
    }

    if (!commands.output_dir.empty()) {
        output_dir = commands.output_dir;
    }

    if (!commands.output_formats.empty()) {
        output_formats = commands.output_formats;
    }
}

std::vector<std::string> SmartCovConfig::validationErrors() const {
    std::vector<std::string> errors;

    if (package_path.empty()) {
        errors.push_back("package_path cannot be empty");
    }

    if (lcov_file.empty()) {
        errors.push_back("lcov_file cannot be empty");
    }

    if (output_dir.empty()) {
        errors.push_back("output_dir cannot be empty");
    }

    if (output_formats.empty()) {
        errors.push_back("at least one output format is required");
    }

    const auto supported = getSupportedOutputFormats();
    for (const auto& format : output_formats) {
        if (std::find(supported.begin(), supported.end(), format) == supported.end()) {
            errors.push_back("unknown output format '" + format + "' (expected console, json or lcov)");
        }
    }

    if (source_extensions.empty()) {
        errors.push_back("source_extensions cannot be empty");
    }

    for (const auto& extension : source_extensions) {
        if (extension.size() < 2 || extension[0] != '.') {
            errors.push_back("source extension '" + extension + "' must start with a dot");
        }
    }

    if (parse_worker_threshold == 0) {
        errors.push_back("parse_worker_threshold must be greater than 0");
    }

    return errors;
}

bool SmartCovConfig::validate() const {
    auto errors = validationErrors();
    for (const auto& message : errors) {
        Logger::getInstance().error("Config", message);
    }
    return errors.empty();
}

std::string SmartCovConfig::resolvedOutputDir() const {
    return joinToPackage(package_path, output_dir);
}

std::string SmartCovConfig::resolvedLcovPath() const {
    return joinToPackage(package_path, lcov_file);
}

bool SmartCovConfig::hasOutputFormat(const std::string& format) const {
    return std::find(output_formats.begin(), output_formats.end(), format) != output_formats.end();
}

std::vector<std::string> SmartCovConfig::getDefaultExtensions() {
    return {".dart"};
}

std::vector<std::string> SmartCovConfig::getDefaultExcludePatterns() {
    return {
        ".dart_tool/",
        "build/",
        "**/generated/**",
        "*.g.dart",
        "*.freezed.dart"
    };
}

std::vector<std::string> SmartCovConfig::getSupportedOutputFormats() {
    return {"console", "json", "lcov"};
}

} // namespace SmartCov
