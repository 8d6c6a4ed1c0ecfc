// =================================================================
// src/SmartCov/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "SmartCov/Core.hpp"
#include "SmartCov/ConfigLoader.hpp"
#include "SmartCov/CoverageProcessor.hpp"
#include "SmartCov/CoverageSerializer.hpp"
#include "SmartCov/GitFileDetector.hpp"
#include "SmartCov/ReportGenerator.hpp"
#include "SmartCov/SysInteraction.hpp"
#include "SmartCov/Errors.hpp"
#include "SmartCov/Logger.hpp"
#include <iostream>
#include <stdexcept>
#include <chrono>

namespace SmartCov {

Core::Core(const Commands& commands)
    : m_commands(commands),
      m_sys(std::make_unique<SysInteraction>())
{
}

Core::~Core() = default;

int Core::run() {
    if (m_commands.active_command.empty()) {
        return kExitSuccess;
    }

    applyVerbosity();

    auto start_time = std::chrono::steady_clock::now();
    Logger::getInstance().logSessionStart(m_commands.active_command,
                                          m_commands.package_path.empty() ? "." : m_commands.package_path);

    int exit_code = kExitFailure;
    try {
        if (m_commands.active_command == "analyze") {
            exit_code = handleAnalyze();
        } else if (m_commands.active_command == "file") {
            exit_code = handleFile();
        } else if (m_commands.active_command == "delta") {
            exit_code = handleDelta();
        } else if (m_commands.active_command == "init") {
            exit_code = handleInit();
        } else {
            std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
        }
    } catch (const ConfigError& e) {
        std::cerr << "❌ Configuration error: " << e.what() << std::endl;
        exit_code = kExitConfigError;
    } catch (const NotFoundError& e) {
        std::cerr << "❌ " << e.what() << std::endl;
        std::cerr << "Run your tests with coverage enabled first (e.g. flutter test --coverage)." << std::endl;
        exit_code = kExitFailure;
    } catch (const std::invalid_argument& e) {
        std::cerr << "❌ " << e.what() << std::endl;
        exit_code = kExitFailure;
    } catch (const std::exception& e) {
        Logger::getInstance().error("Core", "Command failed", e.what());
        std::cerr << "❌ Error: " << e.what() << std::endl;
        exit_code = kExitFailure;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    Logger::getInstance().logSessionEnd(m_commands.active_command, exit_code, duration.count());
    Logger::getInstance().flush();
    return exit_code;
}

void Core::applyVerbosity() {
    Logger& logger = Logger::getInstance();
    if (m_commands.quiet) {
        logger.setConsoleLogging(false);
    } else if (m_commands.verbose) {
        logger.setConsoleLogLevel(LogLevel::DEBUG);
    }
}

bool Core::prepareConfig() {
    m_config = ConfigLoader::load(m_commands);

    if (!m_config.log_dir.empty()) {
        Logger::getInstance().initialize(m_config.log_dir);
    }

    // Printed directly: the console logger is off with --quiet
    auto errors = m_config.validationErrors();
    if (!errors.empty()) {
        std::cerr << "❌ Invalid configuration:" << std::endl;
        for (const auto& message : errors) {
            Logger::getInstance().error("Config", message);
            std::cerr << "  - " << message << std::endl;
        }
        return false;
    }
    return true;
}

int Core::handleAnalyze() {
    if (!prepareConfig()) {
        return kExitConfigError;
    }

    std::cout << "🔍 Analyzing coverage for package: " << m_config.package_path << std::endl;

    GitFileDetector detector(*m_sys, m_config.source_extensions, m_config.exclude_patterns);
    CoverageProcessor processor(detector, m_config.parse_worker_threshold);

    CoverageResult result = processor.processCoverage(m_config.resolvedLcovPath(),
                                                      m_config.base_branch,
                                                      m_config.package_path);

    if (result.isFiltered()) {
        std::cout << "🎯 Analyzing modified files only (base: " << m_config.base_branch << ")" << std::endl;
    } else {
        std::cout << "📊 Analyzing all files: " << describeScope(result.scope) << std::endl;
    }

    if (m_config.hasOutputFormat("console")) {
        std::cout << ReportGenerator::generateConsoleOutput(result.data) << std::endl;
    }

    ReportGenerator generator(*m_sys);
    for (const auto& path : generator.generateReports(result.data, m_config)) {
        std::cout << "📄 Report written: " << path << std::endl;
    }

    std::cout << "✅ Coverage analysis completed" << std::endl;
    return kExitSuccess;
}

int Core::handleFile() {
    if (!prepareConfig()) {
        return kExitConfigError;
    }

    GitFileDetector detector(*m_sys, m_config.source_extensions, m_config.exclude_patterns);
    CoverageProcessor processor(detector, m_config.parse_worker_threshold);

    auto file = processor.getFileCoverage(m_config.resolvedLcovPath(), m_commands.file_path);
    if (!file) {
        std::cerr << "No coverage data found for: " << m_commands.file_path << std::endl;
        return kExitFailure;
    }

    const CoverageSummary& summary = file->summary;
    std::cout << ReportGenerator::statusIcon(summary.linePercentage()) << " " << file->path << std::endl;
    std::cout << "  Lines found: " << summary.lines_found << std::endl;
    std::cout << "  Lines hit: " << summary.lines_hit << std::endl;
    std::cout << "  Line coverage: " << ReportGenerator::formatPercentage(summary.linePercentage()) << std::endl;
    if (summary.functions_found > 0) {
        std::cout << "  Function coverage: " << ReportGenerator::formatPercentage(summary.functionPercentage()) << std::endl;
    }
    if (summary.branches_found > 0) {
        std::cout << "  Branch coverage: " << ReportGenerator::formatPercentage(summary.branchPercentage()) << std::endl;
    }

    size_t uncovered = 0;
    for (const auto& line : file->lines) {
        if (!line.isCovered()) {
            uncovered++;
        }
    }
    if (uncovered > 0) {
        std::cout << "  Uncovered lines:";
        for (const auto& line : file->lines) {
            if (!line.isCovered()) {
                std::cout << " " << line.line_number;
            }
        }
        std::cout << std::endl;
    }

    return kExitSuccess;
}

int Core::handleDelta() {
    CoverageData delta = CoverageProcessor::calculateCoverageDelta(m_commands.base_lcov, m_commands.current_lcov);

    if (m_commands.delta_json && m_commands.delta_output.empty()) {
        std::cout << CoverageSerializer::toJsonReport(delta).dump(2) << std::endl;
        return kExitSuccess;
    }

    std::cout << ReportGenerator::generateConsoleOutput(delta) << std::endl;

    if (!m_commands.delta_output.empty()) {
        std::string content = m_commands.delta_json
            ? CoverageSerializer::toJsonReport(delta).dump(2) + "\n"
            : CoverageSerializer::toLcov(delta);
        if (!m_sys->writeFile(m_commands.delta_output, content)) {
            throw std::runtime_error("Failed to write delta: " + m_commands.delta_output);
        }
        std::cout << "📄 Delta written: " << m_commands.delta_output << std::endl;
    }

    return kExitSuccess;
}

int Core::handleInit() {
    std::cout << "Initializing smart_coverage configuration..." << std::endl;

    std::string package_path = m_commands.package_path.empty() ? "." : m_commands.package_path;
    if (ConfigLoader::writeDefaultConfig(package_path, *m_sys)) {
        std::cout << "✅ Created " << ConfigLoader::kDefaultConfigFile << ". Edit it to set your base branch." << std::endl;
    } else {
        std::cout << ConfigLoader::kDefaultConfigFile << " already exists, nothing to do." << std::endl;
    }
    return kExitSuccess;
}

} // namespace SmartCov
