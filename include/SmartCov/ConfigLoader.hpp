// =================================================================
// include/SmartCov/ConfigLoader.hpp
// =================================================================
// Loads SmartCovConfig from YAML, the environment and the command line.

#pragma once

#include "SmartCov/SmartCovConfig.hpp"
#include <string>
#include <vector>

namespace SmartCov {

struct Commands;
class SysInteraction;

/**
 * @brief Builds the effective configuration for a run
 *
 * Sources in increasing priority: built-in defaults, the YAML file,
 * SMART_COVERAGE_* environment variables, command-line options.
 */
class ConfigLoader {
public:
    static constexpr const char* kDefaultConfigFile = "smart_coverage.yaml";
    static constexpr const char* kEnvPrefix = "SMART_COVERAGE_";

    /**
     * @brief Load the configuration for the given command line
     *
     * The YAML file is --config when given, otherwise smart_coverage.yaml
     * in the package directory. A missing default file is fine.
     *
     * @throws ConfigError if an explicitly given config file does not exist
     */
    static SmartCovConfig load(const Commands& commands);

    /**
     * @brief Merge a YAML file into the configuration
     * @param config Configuration to update; left untouched on error
     * @param config_path YAML file to read
     * @return False if the file could not be parsed
     */
    static bool loadFromFile(SmartCovConfig& config, const std::string& config_path);

    /**
     * @brief Merge YAML text into the configuration
     * @return False if the text is not a valid configuration document
     */
    static bool loadFromString(SmartCovConfig& config, const std::string& yaml_text);

    /**
     * @brief Merge SMART_COVERAGE_* environment variables into the configuration
     */
    static void applyEnvironment(SmartCovConfig& config);

    /**
     * @brief Commented configuration file with the default values
     */
    static std::string defaultConfigTemplate();

    /**
     * @brief Write the default configuration file unless it already exists
     * @param package_path Package directory
     * @param sys System access used for writing
     * @return True if the file was written
     * @throws ConfigError if the file cannot be written
     */
    static bool writeDefaultConfig(const std::string& package_path, SysInteraction& sys);

    /**
     * @brief Split a comma separated list, trimming blanks and dropping empty items
     */
    static std::vector<std::string> splitList(const std::string& value);

private:
    static std::string getEnv(const std::string& name);
};

} // namespace SmartCov
