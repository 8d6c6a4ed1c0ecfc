// =================================================================
// include/SmartCov/Errors.hpp
// =================================================================
// Exception types raised across the coverage pipeline.

#pragma once

#include <stdexcept>
#include <string>

namespace SmartCov {

/**
 * @brief The coverage source file does not exist
 */
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& path)
        : std::runtime_error("LCOV file not found: " + path), m_path(path) {}

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

/**
 * @brief No revision-control context could be established
 *
 * Raised by FileDiscovery implementations. CoverageProcessor reacts to
 * this type (and only this type) by widening to the full corpus.
 */
class VcsUnavailableError : public std::runtime_error {
public:
    explicit VcsUnavailableError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief File discovery failed for a reason other than a missing repository
 */
class DiscoveryError : public std::runtime_error {
public:
    explicit DiscoveryError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Configuration could not be loaded or is invalid
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace SmartCov
