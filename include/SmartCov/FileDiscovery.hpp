// =================================================================
// include/SmartCov/FileDiscovery.hpp
// =================================================================
// Interface for services that decide which files a report covers.

#pragma once

#include <string>
#include <vector>

namespace SmartCov {

/**
 * @brief Source of target file paths for a coverage run
 *
 * Implementations throw VcsUnavailableError when no revision-control
 * context exists. Any other exception is treated as a real failure by
 * CoverageProcessor and propagated.
 */
class FileDiscovery {
public:
    virtual ~FileDiscovery() = default;

    /**
     * @brief Determine the files of interest
     * @param base_branch Revision to diff against
     * @param package_root Package directory the coverage belongs to
     * @return Paths relative to the package root; may be empty
     */
    virtual std::vector<std::string> targetFiles(const std::string& base_branch,
                                                 const std::string& package_root) = 0;
};

} // namespace SmartCov
