// =================================================================
// tests/IntegrationTest.cpp
// =================================================================
// End-to-end tests running commands against packages on disk.

#include "SmartCov/Core.hpp"
#include "SmartCov/CoverageProcessor.hpp"
#include "SmartCov/GitFileDetector.hpp"
#include "SmartCov/SysInteraction.hpp"
#include "SmartCov/LcovParser.hpp"
#include "nlohmann/json.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cassert>

namespace fs = std::filesystem;
using namespace SmartCov;

static const char* kPackageLcov =
    "SF:lib/main.dart\n"
    "DA:1,1\n"
    "DA:2,1\n"
    "DA:3,0\n"
    "LF:3\n"
    "LH:2\n"
    "end_of_record\n"
    "SF:lib/src/util.dart\n"
    "DA:1,4\n"
    "LF:1\n"
    "LH:1\n"
    "end_of_record\n";

// Redirects a stream into a buffer for the lifetime of the object
class StreamCapture {
public:
    explicit StreamCapture(std::ostream& stream) : m_stream(stream), m_old(stream.rdbuf(m_buffer.rdbuf())) {}
    ~StreamCapture() { m_stream.rdbuf(m_old); }

    std::string text() const { return m_buffer.str(); }

private:
    std::ostream& m_stream;
    std::stringstream m_buffer;
    std::streambuf* m_old;
};

class IntegrationTest {
private:
    std::string test_dir;

    void setupPackage() {
        cleanupTestFiles();
        fs::create_directories(test_dir + "/coverage");
        fs::create_directories(test_dir + "/lib/src");
        std::ofstream(test_dir + "/lib/main.dart") << "void main() {}";
        std::ofstream(test_dir + "/lib/src/util.dart") << "int util() => 1;";
        std::ofstream(test_dir + "/coverage/lcov.info") << kPackageLcov;
    }

    void cleanupTestFiles() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    static std::string readAll(const std::string& path) {
        std::ifstream stream(path);
        std::stringstream buffer;
        buffer << stream.rdbuf();
        return buffer.str();
    }

    Commands analyzeCommands() const {
        Commands commands;
        commands.active_command = "analyze";
        commands.package_path = test_dir;
        commands.quiet = true;
        return commands;
    }

public:
    IntegrationTest() : test_dir((fs::temp_directory_path() / "smartcov_integration_test").string()) {}

    void testPackageWithoutGit() {
        std::cout << "Testing analysis of a package outside git..." << std::endl;
        setupPackage();

        SysInteraction sys;
        GitFileDetector detector(sys, {".dart"}, {});
        CoverageProcessor processor(detector, 16);

        CoverageResult result = processor.processCoverage(test_dir + "/coverage/lcov.info", "main", test_dir);
        assert(result.scope == CoverageScope::FullVcsUnavailable && "No repository widens to all files");
        assert(result.data.files.size() == 2);
        assert(result.data.summary.lines_found == 4);
        assert(result.data.summary.lines_hit == 3);
        assert(processor.getLastParseStats().on_worker && "Small threshold moves parsing to the worker");

        cleanupTestFiles();
        std::cout << "✓ Package without git test passed" << std::endl;
    }

    void testAnalyzeCommandWritesReports() {
        std::cout << "Testing analyze command..." << std::endl;
        setupPackage();

        Commands commands = analyzeCommands();
        commands.base_branch = "main";
        commands.output_formats = {"json", "lcov"};

        Core core(commands);
        assert(core.run() == Core::kExitSuccess);

        std::string json_path = test_dir + "/coverage/smart_coverage/coverage_report.json";
        std::string lcov_path = test_dir + "/coverage/smart_coverage/coverage_report.lcov";
        assert(fs::exists(json_path) && "JSON report is written to the default output directory");
        assert(fs::exists(lcov_path));

        nlohmann::json report = nlohmann::json::parse(readAll(json_path));
        assert(report["summary"]["totalFiles"] == 2);
        assert(report["summary"]["coveredLines"] == 3);

        CoverageData original = LcovParser::parseContentSync(kPackageLcov);
        assert(LcovParser::parseContentSync(readAll(lcov_path)) == original);

        cleanupTestFiles();
        std::cout << "✓ Analyze command test passed" << std::endl;
    }

    void testAnalyzeExitCodes() {
        std::cout << "Testing analyze exit codes..." << std::endl;
        setupPackage();

        Commands missing_lcov = analyzeCommands();
        missing_lcov.lcov_file = "coverage/missing.info";
        Core missing_core(missing_lcov);
        assert(missing_core.run() == Core::kExitFailure && "Missing tracefile fails");

        Commands bad_format = analyzeCommands();
        bad_format.output_formats = {"pdf"};
        Core bad_format_core(bad_format);
        std::string errors;
        {
            StreamCapture capture(std::cerr);
            assert(bad_format_core.run() == Core::kExitConfigError && "Unknown format is a configuration error");
            errors = capture.text();
        }
        assert(errors.find("unknown output format 'pdf'") != std::string::npos &&
               "Validation errors reach stderr even with --quiet");

        Commands bad_config = analyzeCommands();
        bad_config.config_file = test_dir + "/nope.yaml";
        Core bad_config_core(bad_config);
        assert(bad_config_core.run() == Core::kExitConfigError && "Missing explicit config is a configuration error");

        cleanupTestFiles();
        std::cout << "✓ Analyze exit codes test passed" << std::endl;
    }

    void testInitThenAnalyze() {
        std::cout << "Testing init followed by analyze..." << std::endl;
        setupPackage();

        Commands init;
        init.active_command = "init";
        init.package_path = test_dir;
        Core init_core(init);
        assert(init_core.run() == Core::kExitSuccess);
        assert(fs::exists(test_dir + "/smart_coverage.yaml"));

        const std::string default_line = "output_dir: coverage/smart_coverage";
        std::string config_text = readAll(test_dir + "/smart_coverage.yaml");
        size_t position = config_text.find(default_line);
        assert(position != std::string::npos && "Template lists the default output directory");
        config_text.replace(position, default_line.size(), "output_dir: reports");
        std::ofstream(test_dir + "/smart_coverage.yaml", std::ios::trunc) << config_text;

        Commands analyze = analyzeCommands();
        analyze.output_formats = {"json"};
        Core analyze_core(analyze);
        assert(analyze_core.run() == Core::kExitSuccess);
        assert(fs::exists(test_dir + "/reports/coverage_report.json") && "output_dir from the config file is used");

        cleanupTestFiles();
        std::cout << "✓ Init then analyze test passed" << std::endl;
    }

    void testFileAndDeltaCommands() {
        std::cout << "Testing file and delta commands..." << std::endl;
        setupPackage();

        Commands file = analyzeCommands();
        file.active_command = "file";
        file.file_path = "lib/src/util.dart";
        Core file_core(file);
        assert(file_core.run() == Core::kExitSuccess);

        file.file_path = "lib/main.dart";
        Core main_core(file);
        std::string file_report;
        {
            StreamCapture capture(std::cout);
            assert(main_core.run() == Core::kExitSuccess);
            file_report = capture.text();
        }
        assert(file_report.find("Line coverage: 66.7%") != std::string::npos &&
               "Per-file percentages use one decimal");
        assert(file_report.find("Uncovered lines: 3") != std::string::npos);

        file.file_path = "lib/unknown.dart";
        Core unknown_core(file);
        assert(unknown_core.run() == Core::kExitFailure && "Unknown file is reported as failure");

        std::string base_path = test_dir + "/coverage/base.info";
        std::ofstream(base_path) << "SF:lib/main.dart\nDA:1,1\nDA:2,0\nDA:3,0\nLF:3\nLH:1\nend_of_record\n";

        Commands delta;
        delta.active_command = "delta";
        delta.base_lcov = base_path;
        delta.current_lcov = test_dir + "/coverage/lcov.info";
        delta.delta_output = test_dir + "/coverage/delta.info";
        delta.quiet = true;
        Core delta_core(delta);
        assert(delta_core.run() == Core::kExitSuccess);

        CoverageData written = LcovParser::parseContentSync(readAll(delta.delta_output));
        assert(written.files.size() == 2 && "Changed file and new file are written");
        assert(written.files[0].path == "lib/main.dart");
        assert(written.files[0].lines.size() == 1);
        assert(written.files[0].lines[0] == LineCoverage(2, 1));
        assert(written.files[1].path == "lib/src/util.dart");

        cleanupTestFiles();
        std::cout << "✓ File and delta commands test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running integration tests..." << std::endl;

        testPackageWithoutGit();
        testAnalyzeCommandWritesReports();
        testAnalyzeExitCodes();
        testInitThenAnalyze();
        testFileAndDeltaCommands();

        std::cout << "All integration tests passed!" << std::endl;
    }
};

int main() {
    try {
        IntegrationTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
