// =================================================================
// src/SmartCov/ConfigLoader.cpp
// =================================================================
// Implementation for layered configuration loading.

#include "SmartCov/ConfigLoader.hpp"
#include "SmartCov/CliParser.hpp"
#include "SmartCov/SysInteraction.hpp"
#include "SmartCov/Errors.hpp"
#include "SmartCov/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace SmartCov {

namespace {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\n\r");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, (last - first + 1));
}

std::vector<std::string> readList(const YAML::Node& node) {
    if (node.IsSequence()) {
        return node.as<std::vector<std::string>>();
    }
    return ConfigLoader::splitList(node.as<std::string>());
}

// Throws YAML::Exception on type mismatches
void applyYaml(SmartCovConfig& config, const YAML::Node& root) {
    if (root["package_path"]) {
        config.package_path = root["package_path"].as<std::string>();
    }
    if (root["base_branch"]) {
        config.base_branch = root["base_branch"].IsNull() ? "" : root["base_branch"].as<std::string>();
    }
    if (root["lcov_file"]) {
        config.lcov_file = root["lcov_file"].as<std::string>();
    }
    if (root["output_dir"]) {
        config.output_dir = root["output_dir"].as<std::string>();
    }
    if (root["output_formats"]) {
        config.output_formats = readList(root["output_formats"]);
    }
    if (root["source_extensions"]) {
        config.source_extensions = readList(root["source_extensions"]);
    }
    if (root["exclude_patterns"]) {
        config.exclude_patterns = readList(root["exclude_patterns"]);
    }
    if (root["parse_worker_threshold"]) {
        config.parse_worker_threshold = root["parse_worker_threshold"].as<size_t>();
    }
    if (root["log_dir"]) {
        config.log_dir = root["log_dir"].as<std::string>();
    }
}

bool mergeDocument(SmartCovConfig& config, const YAML::Node& root, const std::string& source) {
    if (!root || root.IsNull()) {
        return true; // empty document
    }
    if (!root.IsMap()) {
        Logger::getInstance().error("ConfigLoader", "Configuration must be a mapping", source);
        return false;
    }

    // Merge into a copy so a bad value leaves the configuration untouched
    SmartCovConfig updated = config;
    applyYaml(updated, root);
    config = updated;
    return true;
}

} // namespace

SmartCovConfig ConfigLoader::load(const Commands& commands) {
    SmartCovConfig config;

    std::string package = commands.package_path;
    if (package.empty()) {
        package = getEnv("PACKAGE_PATH");
    }
    if (package.empty()) {
        package = config.package_path;
    }

    const bool explicit_file = !commands.config_file.empty();
    std::string config_path = explicit_file
        ? commands.config_file
        : (std::filesystem::path(package) / kDefaultConfigFile).string();

    std::error_code ec;
    if (std::filesystem::is_regular_file(config_path, ec)) {
        if (loadFromFile(config, config_path)) {
            Logger::getInstance().debug("ConfigLoader", "Loaded configuration file", config_path);
        } else {
            Logger::getInstance().warning("ConfigLoader", "Ignoring configuration file", config_path);
        }
    } else if (explicit_file) {
        throw ConfigError("Configuration file not found: " + config_path);
    }

    applyEnvironment(config);
    config.applyCommandOverrides(commands);
    return config;
}

bool ConfigLoader::loadFromFile(SmartCovConfig& config, const std::string& config_path) {
    try {
        return mergeDocument(config, YAML::LoadFile(config_path), config_path);
    } catch (const YAML::Exception& e) {
        Logger::getInstance().error("ConfigLoader", "Failed to parse configuration: " + std::string(e.what()),
                                    config_path);
        return false;
    }
}

bool ConfigLoader::loadFromString(SmartCovConfig& config, const std::string& yaml_text) {
    try {
        return mergeDocument(config, YAML::Load(yaml_text), "<string>");
    } catch (const YAML::Exception& e) {
        Logger::getInstance().error("ConfigLoader", "Failed to parse configuration: " + std::string(e.what()));
        return false;
    }
}

void ConfigLoader::applyEnvironment(SmartCovConfig& config) {
    std::string value = getEnv("PACKAGE_PATH");
    if (!value.empty()) {
        config.package_path = value;
    }

    value = getEnv("BASE_BRANCH");
    if (!value.empty()) {
        config.base_branch = value;
    }

    value = getEnv("LCOV_FILE");
    if (!value.empty()) {
        config.lcov_file = value;
    }

    value = getEnv("OUTPUT_DIR");
    if (!value.empty()) {
        config.output_dir = value;
    }

    value = getEnv("OUTPUT_FORMATS");
    if (!value.empty()) {
        config.output_formats = splitList(value);
    }

    value = getEnv("SOURCE_EXTENSIONS");
    if (!value.empty()) {
        config.source_extensions = splitList(value);
    }

    value = getEnv("EXCLUDE_PATTERNS");
    if (!value.empty()) {
        config.exclude_patterns = splitList(value);
    }

    value = getEnv("PARSE_WORKER_THRESHOLD");
    if (!value.empty()) {
        try {
            size_t consumed = 0;
            unsigned long long threshold = std::stoull(value, &consumed);
            if (consumed != value.size()) {
                throw std::invalid_argument("trailing characters");
            }
            config.parse_worker_threshold = static_cast<size_t>(threshold);
        } catch (const std::exception&) {
            Logger::getInstance().warning("ConfigLoader",
                                          "Invalid " + std::string(kEnvPrefix) + "PARSE_WORKER_THRESHOLD value, using default",
                                          value);
        }
    }

    value = getEnv("LOG_DIR");
    if (!value.empty()) {
        config.log_dir = value;
    }
}

std::string ConfigLoader::defaultConfigTemplate() {
    SmartCovConfig defaults;
    std::ostringstream out;

    out << "# smart_coverage configuration\n";
    out << "# Values can be overridden by SMART_COVERAGE_* environment variables\n";
    out << "# and by command-line options.\n\n";
    out << "# Branch to compare against; leave empty to analyze every file\n";
    out << "base_branch: \"\"\n\n";
    out << "# LCOV tracefile, relative to the package\n";
    out << "lcov_file: " << defaults.lcov_file << "\n\n";
    out << "# Report directory, relative to the package\n";
    out << "output_dir: " << defaults.output_dir << "\n\n";
    out << "# Report formats: console, json, lcov\n";
    out << "output_formats:\n";
    for (const auto& format : defaults.output_formats) {
        out << "  - " << format << "\n";
    }
    out << "\n# Files considered source code\n";
    out << "source_extensions:\n";
    for (const auto& extension : defaults.source_extensions) {
        out << "  - \"" << extension << "\"\n";
    }
    out << "\n# Generated and build files never analyzed (gitignore syntax)\n";
    out << "exclude_patterns:\n";
    for (const auto& pattern : defaults.exclude_patterns) {
        out << "  - \"" << pattern << "\"\n";
    }
    out << "\n# Tracefiles of at least this many bytes are parsed on a worker thread\n";
    out << "parse_worker_threshold: " << defaults.parse_worker_threshold << "\n\n";
    out << "# Directory for log files; leave empty to log to the console only\n";
    out << "log_dir: \"\"\n";

    return out.str();
}

bool ConfigLoader::writeDefaultConfig(const std::string& package_path, SysInteraction& sys) {
    std::string config_path = (std::filesystem::path(package_path) / kDefaultConfigFile).string();

    if (sys.fileExists(config_path)) {
        Logger::getInstance().info("ConfigLoader", "Configuration file already exists, leaving it untouched",
                                   config_path);
        return false;
    }

    if (!sys.writeFile(config_path, defaultConfigTemplate())) {
        throw ConfigError("Failed to write configuration file: " + config_path);
    }

    Logger::getInstance().info("ConfigLoader", "Created configuration file", config_path);
    return true;
}

std::vector<std::string> ConfigLoader::splitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::string ConfigLoader::getEnv(const std::string& name) {
    const char* value = std::getenv((std::string(kEnvPrefix) + name).c_str());
    return value ? std::string(value) : std::string();
}

} // namespace SmartCov
