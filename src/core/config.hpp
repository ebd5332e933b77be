#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from ~/.jumpline/config.yaml
    static Result<Config> load_default();

    // Load from an explicit file
    static Result<Config> load(const fs::path& path);

    // Parse YAML text (no file access)
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const std::vector<HopConfig>& hops() const { return hops_; }
    const RunDefaults& run() const { return run_; }
    const LogConfig& log() const { return log_; }

    // Last hop: the host commands run on
    const HopConfig& target() const { return hops_.back(); }

public:
    Config() = default;

private:
    std::vector<HopConfig> hops_;
    RunDefaults run_;
    LogConfig log_;
};

// Helper to check if the default config exists
bool default_config_exists();

// Get paths
fs::path get_config_dir();
fs::path get_default_config_path();

// Expand a leading "~/" against the home directory.
std::string expand_home(const std::string& path);
