// =================================================================
// src/SmartCov/SysInteraction.cpp
// =================================================================
// Implementation for system-level operations.

#include "SmartCov/SysInteraction.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <filesystem>
#include <cstdio>
#include <memory>
#include <array>
#include <sys/wait.h>

namespace SmartCov {

std::string SysInteraction::readFile(const std::string& file_path) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        throw std::runtime_error("Failed to open file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file_stream.rdbuf();
    return buffer.str();
}

bool SysInteraction::writeFile(const std::string& file_path, const std::string& content) {
    std::filesystem::path parent = std::filesystem::path(file_path).parent_path();
    if (!parent.empty() && !createDirectories(parent.string())) {
        return false;
    }

    std::ofstream file_stream(file_path, std::ios::binary | std::ios::trunc);
    if (!file_stream) {
        return false;
    }
    file_stream << content;
    return file_stream.good();
}

bool SysInteraction::fileExists(const std::string& file_path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(file_path, ec);
}

bool SysInteraction::directoryExists(const std::string& dir_path) {
    std::error_code ec;
    return std::filesystem::is_directory(dir_path, ec);
}

bool SysInteraction::createDirectories(const std::string& dir_path) {
    std::error_code ec;
    std::filesystem::create_directories(dir_path, ec);
    return !ec && directoryExists(dir_path);
}

std::string SysInteraction::shellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::pair<std::string, int> SysInteraction::executeCommand(const std::string& command,
                                                           const std::vector<std::string>& args,
                                                           const std::string& working_dir,
                                                           bool capture_stderr) {
    std::string full_command;
    if (!working_dir.empty()) {
        full_command = "cd " + shellQuote(working_dir) + " && ";
    }
    full_command += command;
    for (const auto& arg : args) {
        full_command += " " + shellQuote(arg);
    }
    full_command += capture_stderr ? " 2>&1" : " 2>/dev/null";

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(full_command.c_str(), "r"), pclose);
    if (!pipe) {
        throw std::runtime_error("Failed to execute command: " + full_command);
    }

    std::array<char, 4096> buffer;
    std::string result;
    size_t bytes_read = 0;
    while ((bytes_read = fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
        result.append(buffer.data(), bytes_read);
    }

    int exit_status = pclose(pipe.release());
    if (exit_status == -1) {
        throw std::runtime_error("Failed to collect exit status of: " + full_command);
    }

    if (WIFEXITED(exit_status)) {
        exit_status = WEXITSTATUS(exit_status);
    } else {
        // Process terminated abnormally
        exit_status = -1;
    }

    return {result, exit_status};
}

} // namespace SmartCov
