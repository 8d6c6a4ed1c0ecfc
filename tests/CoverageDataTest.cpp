// =================================================================
// tests/CoverageDataTest.cpp
// =================================================================
// Unit tests for the coverage model.

#include "SmartCov/CoverageData.hpp"
#include <iostream>
#include <cassert>
#include <cmath>

using namespace SmartCov;

class CoverageDataTest {
private:
    static bool near(double a, double b) {
        return std::fabs(a - b) < 0.001;
    }

    static FileCoverage makeFile(const std::string& path, uint64_t found, uint64_t hit) {
        FileCoverage file;
        file.path = path;
        file.summary.lines_found = found;
        file.summary.lines_hit = hit;
        return file;
    }

public:
    void testPercentages() {
        std::cout << "Testing summary percentages..." << std::endl;

        CoverageSummary summary;
        summary.lines_found = 4;
        summary.lines_hit = 3;
        summary.functions_found = 2;
        summary.functions_hit = 1;

        assert(near(summary.linePercentage(), 75.0) && "3 of 4 lines should be 75%");
        assert(near(summary.functionPercentage(), 50.0) && "1 of 2 functions should be 50%");
        assert(summary.branchPercentage() == 0.0 && "No branches should give 0%");

        CoverageSummary overreported;
        overreported.lines_found = 2;
        overreported.lines_hit = 5;
        assert(near(overreported.linePercentage(), 100.0) && "Percentage should be clamped to 100");

        std::cout << "✓ Percentage test passed" << std::endl;
    }

    void testSummaryAccumulation() {
        std::cout << "Testing summary accumulation..." << std::endl;

        CoverageSummary total;
        CoverageSummary part;
        part.lines_found = 10;
        part.lines_hit = 4;
        part.branches_found = 2;
        part.branches_hit = 1;

        total += part;
        total += part;

        assert(total.lines_found == 20);
        assert(total.lines_hit == 8);
        assert(total.branches_found == 4);
        assert(total.branches_hit == 2);
        assert(total.functions_found == 0);

        std::cout << "✓ Summary accumulation test passed" << std::endl;
    }

    void testFromFilesComputesSummary() {
        std::cout << "Testing CoverageData::fromFiles..." << std::endl;

        std::vector<FileCoverage> files;
        files.push_back(makeFile("lib/a.dart", 2, 1));
        files.push_back(makeFile("lib/b.dart", 1, 1));

        CoverageData data = CoverageData::fromFiles(files);

        assert(data.files.size() == 2 && "Files should be kept");
        assert(data.summary.lines_found == 3 && "lines_found should be summed");
        assert(data.summary.lines_hit == 2 && "lines_hit should be summed");
        assert(data.summary == CoverageData::calculateSummary(data.files) && "Summary should match files");

        std::cout << "✓ fromFiles test passed" << std::endl;
    }

    void testEmptyData() {
        std::cout << "Testing empty coverage data..." << std::endl;

        CoverageData data = CoverageData::empty();
        assert(data.files.empty());
        assert(data.summary == CoverageSummary() && "Empty data should have a zero summary");
        assert(data.summary.linePercentage() == 0.0);

        std::cout << "✓ Empty data test passed" << std::endl;
    }

    void testLineCoverage() {
        std::cout << "Testing line coverage..." << std::endl;

        assert(LineCoverage(1, 3).isCovered() && "Positive hit count is covered");
        assert(!LineCoverage(2, 0).isCovered() && "Zero hit count is not covered");
        assert(!LineCoverage(3, -2).isCovered() && "Negative delta is not covered");
        assert(LineCoverage(4, 1) == LineCoverage(4, 1));
        assert(LineCoverage(4, 1) != LineCoverage(4, 2));

        std::cout << "✓ Line coverage test passed" << std::endl;
    }

    void testDuplicatePathsKept() {
        std::cout << "Testing duplicate paths..." << std::endl;

        std::vector<FileCoverage> files;
        files.push_back(makeFile("lib/a.dart", 2, 2));
        files.push_back(makeFile("lib/a.dart", 3, 0));

        CoverageData data = CoverageData::fromFiles(files);
        assert(data.files.size() == 2 && "Records with the same path are not merged");
        assert(data.summary.lines_found == 5);

        std::cout << "✓ Duplicate paths test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running CoverageData unit tests..." << std::endl;

        testPercentages();
        testSummaryAccumulation();
        testFromFilesComputesSummary();
        testEmptyData();
        testLineCoverage();
        testDuplicatePathsKept();

        std::cout << "All CoverageData tests passed!" << std::endl;
    }
};

int main() {
    try {
        CoverageDataTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
