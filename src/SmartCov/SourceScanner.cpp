// =================================================================
// src/SmartCov/SourceScanner.cpp
// =================================================================
// Implementation for package source file listing.

#include "SmartCov/SourceScanner.hpp"
#include "SmartCov/Logger.hpp"
#include <algorithm>

namespace SmartCov {

static std::string normalizeRoot(const std::string& root_path) {
    std::filesystem::path root = std::filesystem::absolute(root_path).lexically_normal();
    if (!root.has_filename() && root.has_relative_path()) {
        root = root.parent_path();  // drop the trailing separator left by "."
    }
    return root.string();
}

SourceScanner::SourceScanner(const std::string& root_path,
                             const std::vector<std::string>& extensions,
                             const std::vector<std::string>& exclude_patterns)
    : m_root_path(normalizeRoot(root_path)),
      m_extensions(extensions),
      m_exclude_patterns(exclude_patterns)
{
}

std::vector<std::string> SourceScanner::scanFiles() const {
    std::vector<std::string> discovered_files;

    std::error_code ec;
    if (!std::filesystem::is_directory(m_root_path, ec)) {
        Logger::getInstance().warning("SourceScanner", "Package root is not a directory", m_root_path);
        return discovered_files;
    }

    try {
        auto options = std::filesystem::directory_options::skip_permission_denied;
        for (auto it = std::filesystem::recursive_directory_iterator(m_root_path, options);
             it != std::filesystem::recursive_directory_iterator(); ++it) {
            if (it->is_directory()) {
                if (it->path().filename() == ".git") {
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (!it->is_regular_file()) {
                continue;
            }

            std::string relative_path = getRelativePath(it->path());
            if (isSourceFile(relative_path)) {
                discovered_files.push_back(relative_path);
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        Logger::getInstance().error("SourceScanner", "Filesystem error while scanning", e.what());
    }

    std::sort(discovered_files.begin(), discovered_files.end());

    Logger::getInstance().debug("SourceScanner",
                                "Discovered " + std::to_string(discovered_files.size()) + " source files",
                                m_root_path);
    return discovered_files;
}

bool SourceScanner::isSourceFile(const std::string& relative_path) const {
    if (relative_path.empty() || !hasSourceExtension(relative_path)) {
        return false;
    }
    return !m_exclude_patterns.isExcluded(relative_path);
}

bool SourceScanner::hasSourceExtension(const std::string& relative_path) const {
    return std::any_of(m_extensions.begin(), m_extensions.end(), [&relative_path](const std::string& ext) {
        return relative_path.size() >= ext.size() &&
               relative_path.compare(relative_path.size() - ext.size(), ext.size(), ext) == 0;
    });
}

std::string SourceScanner::getRelativePath(const std::filesystem::path& abs_path) const {
    std::filesystem::path relative = abs_path.lexically_relative(m_root_path);
    return relative.generic_string();
}

} // namespace SmartCov
