// =================================================================
// src/SmartCov/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "SmartCov/CliParser.hpp"

namespace SmartCov {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("smart_coverage: coverage analysis focused on the files you changed.");
    m_app->require_subcommand(1);

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    // Define all commands
    setupAnalyzeCommand(*m_app);
    setupFileCommand(*m_app);
    setupDeltaCommand(*m_app);
    setupInitCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::addCommonOptions(CLI::App& sub) {
    sub.add_option("-p,--package", m_commands.package_path, "Path to the package to analyze (default: .)");
    sub.add_option("-c,--config", m_commands.config_file, "Configuration file (default: smart_coverage.yaml in the package)");
    auto* verbose = sub.add_flag("-v,--verbose", m_commands.verbose, "Show debug output");
    auto* quiet = sub.add_flag("-q,--quiet", m_commands.quiet, "Suppress log output");
    verbose->excludes(quiet);
}

void CliParser::setupAnalyzeCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("analyze", "Analyzes coverage of the files changed since a base branch.");
    addCommonOptions(*sub);
    sub->add_option("-b,--base", m_commands.base_branch, "Base branch to compare against (e.g. origin/main)");
    sub->add_option("-l,--lcov", m_commands.lcov_file, "Path to the LCOV tracefile (default: coverage/lcov.info)");
    sub->add_option("-o,--output", m_commands.output_dir, "Directory for generated reports");
    sub->add_option("--output-formats", m_commands.output_formats, "Report formats: console, json, lcov")
        ->delimiter(',');
}

void CliParser::setupFileCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("file", "Shows the coverage of a single source file.");
    addCommonOptions(*sub);
    sub->add_option("path", m_commands.file_path, "Source file path as it appears in the tracefile.")->required();
    sub->add_option("-l,--lcov", m_commands.lcov_file, "Path to the LCOV tracefile (default: coverage/lcov.info)");
}

void CliParser::setupDeltaCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("delta", "Computes the line coverage difference between two tracefiles.");
    sub->add_option("base", m_commands.base_lcov, "Baseline LCOV tracefile.")->required();
    sub->add_option("current", m_commands.current_lcov, "Current LCOV tracefile.")->required();
    sub->add_option("-o,--output", m_commands.delta_output, "Write the delta to this file");
    sub->add_flag("--json", m_commands.delta_json, "Write the delta as a JSON report instead of LCOV");
    auto* verbose = sub->add_flag("-v,--verbose", m_commands.verbose, "Show debug output");
    auto* quiet = sub->add_flag("-q,--quiet", m_commands.quiet, "Suppress log output");
    verbose->excludes(quiet);
}

void CliParser::setupInitCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("init", "Writes a default smart_coverage.yaml into the package.");
    sub->add_option("-p,--package", m_commands.package_path, "Package directory (default: .)");
}

} // namespace SmartCov
