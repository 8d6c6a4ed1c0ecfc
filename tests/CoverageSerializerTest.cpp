// =================================================================
// tests/CoverageSerializerTest.cpp
// =================================================================
// Unit tests for LCOV and JSON serialization.

#include "SmartCov/CoverageSerializer.hpp"
#include "SmartCov/LcovParser.hpp"
#include <iostream>
#include <cassert>
#include <cmath>

using namespace SmartCov;

class CoverageSerializerTest {
private:
    CoverageData sampleData() const {
        return LcovParser::parseContentSync(
            "TN:\n"
            "SF:lib/a.dart\n"
            "FNF:2\n"
            "FNH:1\n"
            "DA:1,1\n"
            "DA:2,0\n"
            "LF:2\n"
            "LH:1\n"
            "BRF:4\n"
            "BRH:3\n"
            "end_of_record\n"
            "SF:lib/b.dart\n"
            "DA:1,3\n"
            "LF:1\n"
            "LH:1\n"
            "end_of_record\n");
    }

public:
    void testLcovRoundTrip() {
        std::cout << "Testing LCOV round trip..." << std::endl;

        CoverageData data = sampleData();
        std::string lcov = CoverageSerializer::toLcov(data);
        CoverageData reparsed = LcovParser::parseContentSync(lcov);

        assert(reparsed == data && "Serialized LCOV should parse back to equal data");
        assert(lcov.find("SF:lib/b.dart\n") != std::string::npos);
        assert(lcov.find("BRF:0\n") != std::string::npos && "Zero counters are written too");
        assert(lcov.find("end_of_record\n") != std::string::npos);

        std::cout << "✓ LCOV round trip test passed" << std::endl;
    }

    void testJsonReport() {
        std::cout << "Testing JSON report document..." << std::endl;

        nlohmann::json report = CoverageSerializer::toJsonReport(sampleData());

        assert(report["timestamp"].is_string() && "Report carries a timestamp");
        assert(report["summary"]["totalFiles"] == 2);
        assert(report["summary"]["totalLines"] == 3);
        assert(report["summary"]["coveredLines"] == 2);
        assert(std::fabs(report["summary"]["linePercentage"].get<double>() - 200.0 / 3.0) < 0.001);
        assert(report["summary"]["totalBranches"] == 4);
        assert(report["summary"]["coveredBranches"] == 3);

        const nlohmann::json& files = report["files"];
        assert(files.is_array() && files.size() == 2);
        assert(files[0]["sourceFile"] == "lib/a.dart");
        assert(files[0]["lines"].size() == 2);
        assert(files[0]["lines"][0]["lineNumber"] == 1);
        assert(files[0]["lines"][0]["isCovered"] == true);
        assert(files[0]["lines"][1]["hitCount"] == 0);
        assert(files[0]["lines"][1]["isCovered"] == false);
        assert(files[1]["summary"]["linePercentage"].get<double>() == 100.0);

        std::cout << "✓ JSON report test passed" << std::endl;
    }

    void testStructuralJsonRoundTrip() {
        std::cout << "Testing structural JSON round trip..." << std::endl;

        CoverageData data = sampleData();
        data.files[1].lines.emplace_back(5, -2);
        data = CoverageData::fromFiles(data.files);

        nlohmann::json document = CoverageSerializer::toJson(data);
        assert(CoverageSerializer::fromJson(document) == data && "In-memory round trip should be lossless");

        nlohmann::json reparsed = nlohmann::json::parse(document.dump());
        assert(CoverageSerializer::fromJson(reparsed) == data && "Text round trip should be lossless");

        std::cout << "✓ Structural JSON round trip test passed" << std::endl;
    }

    void testInvalidJsonRejected() {
        std::cout << "Testing invalid JSON documents..." << std::endl;

        auto rejects = [](const nlohmann::json& document) {
            try {
                CoverageSerializer::fromJson(document);
            } catch (const std::invalid_argument&) {
                return true;
            }
            return false;
        };

        assert(rejects(nlohmann::json::array()) && "Top level must be an object");
        assert(rejects(nlohmann::json::parse(R"({"files": 3})")) && "files must be an array");
        assert(rejects(nlohmann::json::parse(R"({"files": [{"lines": []}]})")) && "path is required");

        nlohmann::json negative = CoverageSerializer::toJson(sampleData());
        negative["files"][0]["lines"][0]["line_number"] = -1;
        assert(rejects(negative) && "Negative line numbers are invalid");

        nlohmann::json inconsistent = CoverageSerializer::toJson(sampleData());
        inconsistent["summary"]["lines_found"] = 99;
        assert(rejects(inconsistent) && "Summary must match the files");

        nlohmann::json missing_summary = CoverageSerializer::toJson(sampleData());
        missing_summary["files"][0].erase("summary");
        assert(rejects(missing_summary) && "File summary is required");

        std::cout << "✓ Invalid JSON test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running CoverageSerializer unit tests..." << std::endl;

        testLcovRoundTrip();
        testJsonReport();
        testStructuralJsonRoundTrip();
        testInvalidJsonRejected();

        std::cout << "All CoverageSerializer tests passed!" << std::endl;
    }
};

int main() {
    try {
        CoverageSerializerTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
