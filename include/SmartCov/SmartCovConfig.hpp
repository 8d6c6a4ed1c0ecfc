// =================================================================
// include/SmartCov/SmartCovConfig.hpp
// =================================================================
// Configuration structure for coverage analysis settings.

#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace SmartCov {

/**
 * @brief Settings for an analysis run
 *
 * Filled from defaults, then the YAML file, then SMART_COVERAGE_*
 * environment variables, then command-line options (see ConfigLoader).
 */
struct SmartCovConfig {
    // Package settings
    std::string package_path = ".";
    std::string base_branch;                         ///< Empty analyzes all files
    std::string lcov_file = "coverage/lcov.info";

    // Output settings
    std::string output_dir = "coverage/smart_coverage";
    std::vector<std::string> output_formats = {"console"};

    // File discovery settings
    std::vector<std::string> source_extensions = getDefaultExtensions();
    std::vector<std::string> exclude_patterns = getDefaultExcludePatterns();

    // Parser settings
    size_t parse_worker_threshold = 1024 * 1024; // 1MB

    // Logging settings
    std::string log_dir;                             ///< Empty disables file logging

    /**
     * @brief Apply command-line overrides
     * @param commands Command-line arguments, empty values are ignored
     */
    void applyCommandOverrides(const struct Commands& commands);

    /**
     * @brief Collect every configuration problem
     * @return One message per problem, empty if the configuration is usable
     */
    std::vector<std::string> validationErrors() const;

    /**
     * @brief Validate configuration settings, logging each problem
     * @return True if configuration is valid
     */
    bool validate() const;

    /**
     * @brief Output directory, joined to the package path when relative
     */
    std::string resolvedOutputDir() const;

    /**
     * @brief Tracefile path, joined to the package path when relative
     */
    std::string resolvedLcovPath() const;

    bool hasOutputFormat(const std::string& format) const;

    static std::vector<std::string> getDefaultExtensions();
    static std::vector<std::string> getDefaultExcludePatterns();
    static std::vector<std::string> getSupportedOutputFormats();
};

} // namespace SmartCov
