// =================================================================
// src/SmartCov/ExcludePattern.cpp
// =================================================================
// Implementation for gitignore-style exclusion patterns.

#include "SmartCov/ExcludePattern.hpp"
#include "SmartCov/Logger.hpp"

namespace SmartCov {

ExcludePattern::ExcludePattern(const std::string& pattern)
    : m_original_pattern(pattern),
      m_is_negation(false),
      m_directory_only(false),
      m_is_anchored(false),
      m_is_empty(false)
{
    processPattern(pattern);
}

bool ExcludePattern::matches(const std::string& path) const {
    if (m_is_empty) {
        return false;
    }
    return std::regex_match(path, m_regex);
}

void ExcludePattern::processPattern(const std::string& pattern) {
    std::string working_pattern = pattern;

    size_t first = working_pattern.find_first_not_of(" \t\r");
    if (first == std::string::npos || working_pattern[first] == '#') {
        m_is_empty = true;
        return;
    }
    working_pattern.erase(0, first);
    working_pattern.erase(working_pattern.find_last_not_of(" \t\r") + 1);

    if (working_pattern[0] == '!') {
        m_is_negation = true;
        working_pattern.erase(0, 1);
    }

    if (!working_pattern.empty() && working_pattern.back() == '/') {
        m_directory_only = true;
        working_pattern.pop_back();
    }

    if (!working_pattern.empty() && working_pattern[0] == '/') {
        m_is_anchored = true;
        working_pattern.erase(0, 1);
    }

    if (working_pattern.empty()) {
        m_is_empty = true;
        return;
    }

    std::string body = globToRegex(working_pattern);
    std::string prefix = m_is_anchored ? "^" : "^(?:.*/)?";
    // A directory pattern only matches paths below that directory
    std::string suffix = m_directory_only ? "/.*$" : "(?:/.*)?$";

    try {
        m_regex = std::regex(prefix + body + suffix, std::regex_constants::ECMAScript);
    } catch (const std::regex_error& e) {
        Logger::getInstance().warning("ExcludePattern", "Invalid pattern ignored",
                                      pattern + ": " + e.what());
        m_is_empty = true;
    }
}

std::string ExcludePattern::globToRegex(const std::string& glob_pattern) const {
    std::string regex_pattern;
    bool in_brackets = false;

    for (size_t i = 0; i < glob_pattern.length(); ++i) {
        char c = glob_pattern[i];

        if (in_brackets) {
            if (c == ']') {
                in_brackets = false;
            }
            regex_pattern += c;
            continue;
        }

        switch (c) {
            case '*':
                if (i + 1 < glob_pattern.length() && glob_pattern[i + 1] == '*') {
                    if (i + 2 < glob_pattern.length() && glob_pattern[i + 2] == '/') {
                        // "**/" spans zero or more directories
                        regex_pattern += "(?:.*/)?";
                        i += 2;
                    } else {
                        regex_pattern += ".*";
                        i += 1;
                    }
                } else {
                    regex_pattern += "[^/]*";
                }
                break;

            case '?':
                regex_pattern += "[^/]";
                break;

            case '[':
                in_brackets = true;
                regex_pattern += '[';
                break;

            case '\\':
                if (i + 1 < glob_pattern.length()) {
                    regex_pattern += '\\';
                    regex_pattern += glob_pattern[++i];
                } else {
                    regex_pattern += "\\\\";
                }
                break;

            case '.': case '^': case '$': case '+': case '{': case '}':
            case '|': case '(': case ')': case ']':
                regex_pattern += '\\';
                regex_pattern += c;
                break;

            default:
                regex_pattern += c;
                break;
        }
    }

    if (in_brackets) {
        // Unterminated class, treat the bracket literally
        size_t open = regex_pattern.rfind('[');
        regex_pattern.insert(open, "\\");
    }

    return regex_pattern;
}

ExcludePatternSet::ExcludePatternSet(const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        addPattern(pattern);
    }
}

void ExcludePatternSet::addPattern(const std::string& pattern) {
    ExcludePattern exclude_pattern(pattern);
    if (!exclude_pattern.isEmpty()) {
        m_patterns.push_back(std::move(exclude_pattern));
    }
}

bool ExcludePatternSet::isExcluded(const std::string& path) const {
    bool excluded = false;

    for (const auto& pattern : m_patterns) {
        if (pattern.matches(path)) {
            excluded = !pattern.isNegation();
        }
    }

    return excluded;
}

} // namespace SmartCov
