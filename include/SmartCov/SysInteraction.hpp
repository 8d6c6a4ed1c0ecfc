// =================================================================
// include/SmartCov/SysInteraction.hpp
// =================================================================
// Defines the interface for system-level operations like file I/O
// and running external processes.

#pragma once

#include <string>
#include <vector>
#include <utility> // For std::pair

namespace SmartCov {

class SysInteraction {
public:
    virtual ~SysInteraction() = default;

    /**
     * @brief Reads the entire content of a file into a string.
     * @param file_path The path to the file.
     * @return The content of the file. Throws std::runtime_error on failure.
     */
    virtual std::string readFile(const std::string& file_path);

    /**
     * @brief Writes content to a file, creating parent directories and overwriting it.
     * @param file_path The path to the file.
     * @param content The content to write.
     * @return True on success, false on failure.
     */
    virtual bool writeFile(const std::string& file_path, const std::string& content);

    /**
     * @brief Checks if a regular file exists.
     */
    virtual bool fileExists(const std::string& file_path);

    /**
     * @brief Checks if a directory exists.
     */
    virtual bool directoryExists(const std::string& dir_path);

    /**
     * @brief Creates a directory and any missing parents.
     */
    virtual bool createDirectories(const std::string& dir_path);

    /**
     * @brief Executes an external command and captures its output.
     * @param command The command to execute.
     * @param args A vector of arguments for the command.
     * @param working_dir Directory to run in, empty for the current one.
     * @param capture_stderr Merge stderr into the captured output; otherwise it is discarded.
     * @return A pair containing the captured output and the exit code (127 if the command was not found).
     */
    virtual std::pair<std::string, int> executeCommand(const std::string& command,
                                                       const std::vector<std::string>& args,
                                                       const std::string& working_dir = "",
                                                       bool capture_stderr = true);

    /**
     * @brief Quote a single argument for /bin/sh.
     */
    static std::string shellQuote(const std::string& arg);
};

} // namespace SmartCov
