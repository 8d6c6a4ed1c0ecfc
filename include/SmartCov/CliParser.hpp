// =================================================================
// include/SmartCov/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace SmartCov {

// A simple struct to hold parsed command information.
// Empty strings mean "not given on the command line".
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Options for 'analyze' (also used by 'file' and 'init')
    std::string package_path;
    std::string base_branch;
    std::string lcov_file;
    std::string output_dir;
    std::string config_file;
    std::vector<std::string> output_formats;
    bool verbose = false;
    bool quiet = false;

    // Options for 'file'
    std::string file_path;

    // Options for 'delta'
    std::string base_lcov;
    std::string current_lcov;
    std::string delta_output;
    bool delta_json = false;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupAnalyzeCommand(CLI::App& app);
    void setupFileCommand(CLI::App& app);
    void setupDeltaCommand(CLI::App& app);
    void setupInitCommand(CLI::App& app);

    void addCommonOptions(CLI::App& sub);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace SmartCov
