/**
 * project_config.hpp
 * Project configuration for ignite_build
 *
 * Read from ignite.abc at the project root (INI-style):
 *
 *   [project]
 *   name = "ignite"
 *   version = "0.4.0"
 *
 *   [toolchain]
 *   build_tool = "cargo"
 *   target = "x86_64-unknown-uefi"
 *
 *   [paths]
 *   dist_dir = "dist"
 *
 * Every key is optional; a missing file means all defaults.
 *
 * Copyright (c) 2025 Redstone OS Project
 */

#ifndef IGNITE_BUILD_PROJECT_CONFIG_HPP
#define IGNITE_BUILD_PROJECT_CONFIG_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace ignite::build {

namespace fs = std::filesystem;

struct ProjectConfig {
    // Project root directory (all relative paths resolve against it)
    fs::path project_root;

    // [project]
    std::string name = "ignite";
    std::string version = "0.4.0";
    std::string descriptor = "Cargo.toml";     // Required marker for health
    std::string tests_dir = "tests";
    std::string test_extension = ".rs";
    std::string config_file = "ignite.conf";   // Shipped in the distribution

    // [toolchain]
    std::string build_tool = "cargo";
    std::string toolchain_manager = "rustup";
    std::string package = "ignite";
    std::string target = "x86_64-unknown-uefi";
    std::string artifact = "ignite.efi";

    // [paths]
    fs::path target_dir = "target";
    fs::path dist_dir = "dist";
    fs::path log_dir = "tools/log";
    fs::path state_dir = ".ignite";

    // [dist]
    fs::path efi_dir = "EFI/BOOT";
    std::string boot_binary = "BOOTX64.EFI";
    fs::path boot_dir = "boot";
    std::string manifest = "manifest.json";

    // [output]
    bool verbose = false;   // Echo every tool output line to the console

    fs::path resolve(const fs::path& path) const {
        return path.is_absolute() ? path : project_root / path;
    }

    fs::path cache_dir() const { return resolve(state_dir) / "cache"; }
};

struct ConfigLoadResult {
    ProjectConfig config;
    bool file_found = false;
    std::vector<std::string> warnings;   // Malformed lines, unknown keys
};

constexpr const char* DEFAULT_CONFIG_FILE = "ignite.abc";

/**
 * Load configuration for a project.
 *
 * @param project_root Project directory
 * @param config_file Config path, relative to project_root unless absolute
 * @throws IgniteError if the file exists but cannot be read
 */
ConfigLoadResult load_project_config(const fs::path& project_root,
                                     const fs::path& config_file = DEFAULT_CONFIG_FILE);

} // namespace ignite::build

#endif // IGNITE_BUILD_PROJECT_CONFIG_HPP
