/**
 * project_config.cpp
 * INI-style ignite.abc reader
 *
 * Copyright (c) 2025 Redstone OS Project
 */

#include "core/project_config.hpp"
#include "core/errors.hpp"

#include <fstream>
#include <functional>
#include <map>
#include <sstream>

namespace ignite::build {

namespace {

using Setter = std::function<void(ProjectConfig&, const std::string&)>;

Setter text_value(std::string ProjectConfig::*member) {
    return [member](ProjectConfig& cfg, const std::string& value) { cfg.*member = value; };
}

Setter path_value(fs::path ProjectConfig::*member) {
    return [member](ProjectConfig& cfg, const std::string& value) { cfg.*member = value; };
}

// "section.key" -> setter
const std::map<std::string, Setter>& known_keys() {
    static const std::map<std::string, Setter> keys = {
        {"project.name",              text_value(&ProjectConfig::name)},
        {"project.version",           text_value(&ProjectConfig::version)},
        {"project.descriptor",        text_value(&ProjectConfig::descriptor)},
        {"project.tests_dir",         text_value(&ProjectConfig::tests_dir)},
        {"project.test_extension",    text_value(&ProjectConfig::test_extension)},
        {"project.config_file",       text_value(&ProjectConfig::config_file)},
        {"toolchain.build_tool",      text_value(&ProjectConfig::build_tool)},
        {"toolchain.toolchain_manager", text_value(&ProjectConfig::toolchain_manager)},
        {"toolchain.package",         text_value(&ProjectConfig::package)},
        {"toolchain.target",          text_value(&ProjectConfig::target)},
        {"toolchain.artifact",        text_value(&ProjectConfig::artifact)},
        {"paths.target_dir",          path_value(&ProjectConfig::target_dir)},
        {"paths.dist_dir",            path_value(&ProjectConfig::dist_dir)},
        {"paths.log_dir",             path_value(&ProjectConfig::log_dir)},
        {"paths.state_dir",           path_value(&ProjectConfig::state_dir)},
        {"dist.efi_dir",              path_value(&ProjectConfig::efi_dir)},
        {"dist.boot_binary",          text_value(&ProjectConfig::boot_binary)},
        {"dist.boot_dir",             path_value(&ProjectConfig::boot_dir)},
        {"dist.manifest",             text_value(&ProjectConfig::manifest)},
    };
    return keys;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

} // namespace

ConfigLoadResult load_project_config(const fs::path& project_root,
                                     const fs::path& config_file) {
    ConfigLoadResult result;
    result.config.project_root = project_root;

    fs::path config_path = config_file.is_absolute() ? config_file : project_root / config_file;

    std::error_code ec;
    if (!fs::exists(config_path, ec)) {
        return result;
    }

    std::ifstream file(config_path);
    if (!file) {
        throw IgniteError("Cannot open config file: " + config_path.string());
    }
    result.file_found = true;

    std::string section;
    std::string line;
    size_t line_num = 0;

    while (std::getline(file, line)) {
        line_num++;
        line = trim(line);

        // Skip blanks and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        // Section header
        if (line[0] == '[') {
            auto end = line.find(']');
            if (end == std::string::npos) {
                result.warnings.push_back("Invalid section header at line " + std::to_string(line_num));
                continue;
            }
            section = trim(line.substr(1, end - 1));
            continue;
        }

        // key = value
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            result.warnings.push_back("Expected key = value at line " + std::to_string(line_num));
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from string values
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        std::string qualified = section + "." + key;

        if (qualified == "output.verbose") {
            if (value == "true" || value == "false") {
                result.config.verbose = (value == "true");
            } else {
                result.warnings.push_back("output.verbose must be true or false at line "
                                          + std::to_string(line_num));
            }
            continue;
        }

        auto it = known_keys().find(qualified);
        if (it == known_keys().end()) {
            result.warnings.push_back("Unknown key '" + qualified + "' at line "
                                      + std::to_string(line_num));
            continue;
        }
        it->second(result.config, value);
    }

    return result;
}

} // namespace ignite::build
