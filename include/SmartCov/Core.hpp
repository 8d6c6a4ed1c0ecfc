// =================================================================
// include/SmartCov/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "SmartCov/CliParser.hpp"
#include "SmartCov/SmartCovConfig.hpp"
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace SmartCov {
    class SysInteraction;
}

namespace SmartCov {

class Core {
public:
    static constexpr int kExitSuccess = 0;
    static constexpr int kExitFailure = 1;
    static constexpr int kExitConfigError = 2;

    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs the main application logic based on parsed commands.
     * @return 0 on success, 1 on failure, 2 on configuration errors.
     */
    int run();

private:
    // Command Handlers
    int handleAnalyze();
    int handleFile();
    int handleDelta();
    int handleInit();

    /**
     * @brief Load and validate the configuration for this run.
     * @return False if the configuration is unusable.
     */
    bool prepareConfig();

    void applyVerbosity();

    const Commands& m_commands;
    SmartCovConfig m_config;
    std::unique_ptr<SysInteraction> m_sys;
};

} // namespace SmartCov
