// =================================================================
// tests/ConfigLoaderTest.cpp
// =================================================================
// Unit tests for configuration loading and validation.

#include "SmartCov/ConfigLoader.hpp"
#include "SmartCov/CliParser.hpp"
#include "SmartCov/SysInteraction.hpp"
#include "SmartCov/Errors.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>
#include <cstdlib>

namespace fs = std::filesystem;
using namespace SmartCov;

class ConfigLoaderTest {
private:
    std::string test_dir;

    void cleanupTestFiles() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    static void clearEnvironment() {
        const char* names[] = {
            "SMART_COVERAGE_PACKAGE_PATH", "SMART_COVERAGE_BASE_BRANCH", "SMART_COVERAGE_LCOV_FILE",
            "SMART_COVERAGE_OUTPUT_DIR", "SMART_COVERAGE_OUTPUT_FORMATS", "SMART_COVERAGE_SOURCE_EXTENSIONS",
            "SMART_COVERAGE_EXCLUDE_PATTERNS", "SMART_COVERAGE_PARSE_WORKER_THRESHOLD", "SMART_COVERAGE_LOG_DIR"
        };
        for (const char* name : names) {
            unsetenv(name);
        }
    }

public:
    ConfigLoaderTest() : test_dir((fs::temp_directory_path() / "smartcov_config_test").string()) {}

    void testDefaults() {
        std::cout << "Testing default configuration..." << std::endl;

        SmartCovConfig config;
        assert(config.package_path == ".");
        assert(config.base_branch.empty() && "No base branch by default");
        assert(config.lcov_file == "coverage/lcov.info");
        assert(config.output_dir == "coverage/smart_coverage");
        assert(config.output_formats == std::vector<std::string>{"console"});
        assert(config.source_extensions == std::vector<std::string>{".dart"});
        assert(config.exclude_patterns.size() == 5);
        assert(config.parse_worker_threshold == 1024 * 1024);
        assert(config.validate() && "Defaults should be valid");

        std::cout << "✓ Defaults test passed" << std::endl;
    }

    void testYamlValues() {
        std::cout << "Testing YAML values..." << std::endl;

        SmartCovConfig config;
        bool loaded = ConfigLoader::loadFromString(config,
            "base_branch: origin/main\n"
            "lcov_file: out/lcov.info\n"
            "output_formats:\n"
            "  - json\n"
            "  - lcov\n"
            "source_extensions: .dart, .kt\n"
            "parse_worker_threshold: 42\n"
            "log_dir: .smart_coverage/logs\n");

        assert(loaded);
        assert(config.base_branch == "origin/main");
        assert(config.lcov_file == "out/lcov.info");
        assert((config.output_formats == std::vector<std::string>{"json", "lcov"}));
        assert((config.source_extensions == std::vector<std::string>{".dart", ".kt"}) &&
               "Comma separated strings are accepted for lists");
        assert(config.parse_worker_threshold == 42);
        assert(config.log_dir == ".smart_coverage/logs");
        assert(config.output_dir == "coverage/smart_coverage" && "Unset keys keep their defaults");

        std::cout << "✓ YAML values test passed" << std::endl;
    }

    void testInvalidYamlIgnored() {
        std::cout << "Testing invalid YAML handling..." << std::endl;

        SmartCovConfig config;
        assert(!ConfigLoader::loadFromString(config, "base_branch: [unterminated\n"));
        assert(!ConfigLoader::loadFromString(config, "- just\n- a list\n") && "Top level must be a mapping");
        assert(!ConfigLoader::loadFromString(config, "base_branch: develop\nparse_worker_threshold: lots\n"));
        assert(config.base_branch.empty() && "A rejected document leaves the configuration untouched");
        assert(config.parse_worker_threshold == 1024 * 1024);

        assert(ConfigLoader::loadFromString(config, "") && "Empty document is fine");

        std::cout << "✓ Invalid YAML test passed" << std::endl;
    }

    void testEnvironment() {
        std::cout << "Testing environment overrides..." << std::endl;
        clearEnvironment();

        setenv("SMART_COVERAGE_BASE_BRANCH", "develop", 1);
        setenv("SMART_COVERAGE_OUTPUT_FORMATS", "console,json", 1);
        setenv("SMART_COVERAGE_PARSE_WORKER_THRESHOLD", "not-a-number", 1);

        SmartCovConfig config;
        ConfigLoader::applyEnvironment(config);
        assert(config.base_branch == "develop");
        assert((config.output_formats == std::vector<std::string>{"console", "json"}));
        assert(config.parse_worker_threshold == 1024 * 1024 && "Invalid numbers keep the previous value");

        setenv("SMART_COVERAGE_PARSE_WORKER_THRESHOLD", "2048", 1);
        ConfigLoader::applyEnvironment(config);
        assert(config.parse_worker_threshold == 2048);

        clearEnvironment();
        std::cout << "✓ Environment test passed" << std::endl;
    }

    void testPriority() {
        std::cout << "Testing configuration priority..." << std::endl;
        clearEnvironment();
        fs::create_directories(test_dir);
        std::ofstream(test_dir + "/smart_coverage.yaml") << "base_branch: main\noutput_dir: reports\n";

        Commands commands;
        commands.package_path = test_dir;

        SmartCovConfig from_file = ConfigLoader::load(commands);
        assert(from_file.base_branch == "main" && "YAML overrides defaults");
        assert(from_file.package_path == test_dir);
        assert(from_file.resolvedOutputDir() == (fs::path(test_dir) / "reports").lexically_normal().string());

        setenv("SMART_COVERAGE_BASE_BRANCH", "develop", 1);
        SmartCovConfig from_env = ConfigLoader::load(commands);
        assert(from_env.base_branch == "develop" && "Environment overrides YAML");

        commands.base_branch = "feature";
        SmartCovConfig from_cli = ConfigLoader::load(commands);
        assert(from_cli.base_branch == "feature" && "Command line overrides environment");

        clearEnvironment();
        cleanupTestFiles();
        std::cout << "✓ Priority test passed" << std::endl;
    }

    void testExplicitConfigMissing() {
        std::cout << "Testing missing explicit config file..." << std::endl;

        Commands commands;
        commands.config_file = test_dir + "/does_not_exist.yaml";

        bool threw = false;
        try {
            ConfigLoader::load(commands);
        } catch (const ConfigError&) {
            threw = true;
        }
        assert(threw && "An explicitly requested config file must exist");

        std::cout << "✓ Missing explicit config test passed" << std::endl;
    }

    void testValidation() {
        std::cout << "Testing validation..." << std::endl;

        SmartCovConfig config;
        config.output_formats = {"console", "html"};
        config.parse_worker_threshold = 0;
        config.source_extensions = {"dart"};
        config.lcov_file = "";

        auto errors = config.validationErrors();
        assert(errors.size() == 4 && "Every problem is reported");
        assert(!config.validate());

        std::cout << "✓ Validation test passed" << std::endl;
    }

    void testPathResolution() {
        std::cout << "Testing path resolution..." << std::endl;

        SmartCovConfig config;
        config.package_path = "packages/app";
        assert(config.resolvedOutputDir() == "packages/app/coverage/smart_coverage");
        assert(config.resolvedLcovPath() == "packages/app/coverage/lcov.info");

        config.output_dir = "/tmp/reports";
        assert(config.resolvedOutputDir() == "/tmp/reports" && "Absolute paths are kept");

        std::cout << "✓ Path resolution test passed" << std::endl;
    }

    void testSplitList() {
        std::cout << "Testing list splitting..." << std::endl;

        assert((ConfigLoader::splitList(" json , lcov,,console ") ==
                std::vector<std::string>{"json", "lcov", "console"}));
        assert(ConfigLoader::splitList("").empty());

        std::cout << "✓ List splitting test passed" << std::endl;
    }

    void testDefaultConfigFile() {
        std::cout << "Testing default config file generation..." << std::endl;
        fs::create_directories(test_dir);

        SysInteraction sys;
        assert(ConfigLoader::writeDefaultConfig(test_dir, sys) && "First init writes the file");
        assert(fs::exists(test_dir + "/smart_coverage.yaml"));
        assert(!ConfigLoader::writeDefaultConfig(test_dir, sys) && "Existing file is left alone");

        SmartCovConfig defaults;
        SmartCovConfig loaded;
        loaded.lcov_file = "changed";
        assert(ConfigLoader::loadFromFile(loaded, test_dir + "/smart_coverage.yaml"));
        assert(loaded.lcov_file == defaults.lcov_file && "Template holds the default values");
        assert(loaded.base_branch.empty());
        assert(loaded.output_formats == defaults.output_formats);
        assert(loaded.source_extensions == defaults.source_extensions);
        assert(loaded.exclude_patterns == defaults.exclude_patterns);
        assert(loaded.parse_worker_threshold == defaults.parse_worker_threshold);

        cleanupTestFiles();
        std::cout << "✓ Default config file test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ConfigLoader unit tests..." << std::endl;

        testDefaults();
        testYamlValues();
        testInvalidYamlIgnored();
        testEnvironment();
        testPriority();
        testExplicitConfigMissing();
        testValidation();
        testPathResolution();
        testSplitList();
        testDefaultConfigFile();

        std::cout << "All ConfigLoader tests passed!" << std::endl;
    }
};

int main() {
    try {
        ConfigLoaderTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
