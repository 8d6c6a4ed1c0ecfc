// =================================================================
// src/SmartCov/LcovParser.cpp
// =================================================================
// Implementation for the LCOV tracefile parser.

#include "SmartCov/LcovParser.hpp"
#include "SmartCov/Errors.hpp"
#include "SmartCov/Logger.hpp"
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <future>
#include <limits>
#include <sstream>
#include <utility>

namespace SmartCov {

namespace {

bool hasTag(const char* begin, const char* end, const char* tag, size_t tag_len) {
    return static_cast<size_t>(end - begin) >= tag_len && std::memcmp(begin, tag, tag_len) == 0;
}

// Accepts optional surrounding blanks and a leading '+'; no sign otherwise.
bool parseUnsigned(const char* begin, const char* end, uint64_t& out) {
    while (begin < end && (*begin == ' ' || *begin == '\t')) {
        ++begin;
    }
    while (end > begin && (end[-1] == ' ' || end[-1] == '\t')) {
        --end;
    }
    if (begin < end && *begin == '+') {
        ++begin;
    }
    if (begin == end) {
        return false;
    }

    uint64_t value = 0;
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    for (const char* p = begin; p < end; ++p) {
        if (*p < '0' || *p > '9') {
            return false;
        }
        uint64_t digit = static_cast<uint64_t>(*p - '0');
        if (value > (max - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

// Counter tags fall back to 0 when the value is not a number.
uint64_t parseCounter(const char* begin, const char* end) {
    uint64_t value = 0;
    if (!parseUnsigned(begin, end, value)) {
        return 0;
    }
    return value;
}

bool parseLineRecord(const char* begin, const char* end, LineCoverage& out) {
    const char* comma = static_cast<const char*>(std::memchr(begin, ',', end - begin));
    if (comma == nullptr) {
        return false;
    }
    const char* hits_end = static_cast<const char*>(std::memchr(comma + 1, ',', end - (comma + 1)));
    if (hits_end == nullptr) {
        hits_end = end;  // no checksum field
    }

    uint64_t line_number = 0;
    uint64_t hit_count = 0;
    if (!parseUnsigned(begin, comma, line_number) || line_number == 0) {
        return false;
    }
    if (!parseUnsigned(comma + 1, hits_end, hit_count) ||
        hit_count > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return false;
    }

    out = LineCoverage(line_number, static_cast<int64_t>(hit_count));
    return true;
}

} // namespace

LcovParser::LcovParser(size_t worker_threshold)
    : m_worker_threshold(worker_threshold)
{
}

CoverageData LcovParser::parseContent(std::string content) {
    auto start = std::chrono::steady_clock::now();
    ParseStats stats;
    stats.input_bytes = content.size();

    CoverageData data;
    if (content.size() >= m_worker_threshold) {
        stats.on_worker = true;
        data = parseOnWorker(std::move(content), stats);
    } else {
        data = parseContentSync(content, &stats);
    }

    auto end = std::chrono::steady_clock::now();
    stats.duration_ms = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count());
    m_last_stats = stats;

    Logger::getInstance().logParse(stats.input_bytes, stats.file_count, stats.skipped_records,
                                   stats.on_worker, stats.duration_ms);
    return data;
}

CoverageData LcovParser::parseFile(const std::string& file_path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path, ec)) {
        throw NotFoundError(file_path);
    }

    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        throw std::runtime_error("Failed to open LCOV file: " + file_path);
    }

    std::string content;
    auto size = std::filesystem::file_size(file_path, ec);
    if (!ec) {
        content.resize(static_cast<size_t>(size));
        file_stream.read(&content[0], static_cast<std::streamsize>(size));
        content.resize(static_cast<size_t>(file_stream.gcount()));
    } else {
        std::ostringstream buffer;
        buffer << file_stream.rdbuf();
        content = buffer.str();
    }

    if (file_stream.bad()) {
        throw std::runtime_error("Failed to read LCOV file: " + file_path);
    }

    SMARTCOV_LOG_DEBUG("LcovParser", "Read " + std::to_string(content.size()) + " bytes from " + file_path);
    return parseContent(std::move(content));
}

CoverageData LcovParser::parseOnWorker(std::string content, ParseStats& stats) {
    // The worker owns the text; only the finished result (or the
    // exception) comes back through the future.
    auto worker = std::async(std::launch::async, [text = std::move(content)]() {
        ParseStats worker_stats;
        CoverageData data = parseContentSync(text, &worker_stats);
        return std::make_pair(std::move(data), worker_stats);
    });

    auto result = worker.get();
    stats.file_count = result.second.file_count;
    stats.skipped_records = result.second.skipped_records;
    return std::move(result.first);
}

CoverageData LcovParser::parseContentSync(const std::string& content, ParseStats* stats) {
    std::vector<FileCoverage> files;
    FileCoverage current;
    bool has_current = false;
    size_t skipped = 0;

    const char* cursor = content.data();
    const char* const content_end = content.data() + content.size();

    while (cursor < content_end) {
        const char* line_end = static_cast<const char*>(std::memchr(cursor, '\n', content_end - cursor));
        if (line_end == nullptr) {
            line_end = content_end;
        }
        const char* line_begin = cursor;
        cursor = line_end + 1;

        const char* end = line_end;
        if (end > line_begin && end[-1] == '\r') {
            --end;
        }
        if (end == line_begin) {
            continue;
        }

        if (hasTag(line_begin, end, "SF:", 3)) {
            if (has_current) {
                files.push_back(std::move(current));
            }
            current = FileCoverage();
            current.path.assign(line_begin + 3, end);
            has_current = true;
        } else if (hasTag(line_begin, end, "DA:", 3)) {
            if (!has_current) {
                continue;
            }
            LineCoverage line;
            if (parseLineRecord(line_begin + 3, end, line)) {
                current.lines.push_back(line);
            } else {
                ++skipped;
            }
        } else if (!has_current) {
            // Counters before the first SF: have no file to attach to
            continue;
        } else if (hasTag(line_begin, end, "LF:", 3)) {
            current.summary.lines_found = parseCounter(line_begin + 3, end);
        } else if (hasTag(line_begin, end, "LH:", 3)) {
            current.summary.lines_hit = parseCounter(line_begin + 3, end);
        } else if (hasTag(line_begin, end, "FNF:", 4)) {
            current.summary.functions_found = parseCounter(line_begin + 4, end);
        } else if (hasTag(line_begin, end, "FNH:", 4)) {
            current.summary.functions_hit = parseCounter(line_begin + 4, end);
        } else if (hasTag(line_begin, end, "BRF:", 4)) {
            current.summary.branches_found = parseCounter(line_begin + 4, end);
        } else if (hasTag(line_begin, end, "BRH:", 4)) {
            current.summary.branches_hit = parseCounter(line_begin + 4, end);
        }
        // end_of_record and all other tags (TN, FN, FNDA, BRDA, ...) need no action:
        // the open record is flushed by the next SF: or at end of input.
    }

    if (has_current) {
        files.push_back(std::move(current));
    }

    if (stats != nullptr) {
        stats->file_count = files.size();
        stats->skipped_records = skipped;
    }

    return CoverageData::fromFiles(std::move(files));
}

} // namespace SmartCov
