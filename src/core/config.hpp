#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

struct NodeConfig {
    std::string name;
    std::string address;
    ParamMap params;
};

class Config {
public:
    // Load pool config from a YAML file (default ~/.delta/config.yaml)
    static Result<Config> load(const fs::path& path);

    // Parse pool config from YAML text
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const ParamMap& defaults() const { return defaults_; }
    const std::vector<NodeConfig>& nodes() const { return nodes_; }
    int startup_pause() const { return startup_pause_; }
    const fs::path& source() const { return source_; }

public:
    Config() = default;

private:
    ParamMap defaults_;
    std::vector<NodeConfig> nodes_;
    int startup_pause_ = 0;
    fs::path source_;
};

bool config_exists(const fs::path& path);

// Get paths
fs::path get_config_dir();
fs::path get_config_path();

// Create a commented template config (no-op if it already exists)
Result<void> create_default_config(const fs::path& path);
