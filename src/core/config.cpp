#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

bool config_exists(const fs::path& path) {
    return fs::exists(path);
}

fs::path get_config_dir() {
    return platform::home_dir() / DELTA_CONFIG_DIR;
}

fs::path get_config_path() {
    return get_config_dir() / DELTA_CONFIG_FILE;
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# Delta node pool configuration

# Pool-wide parameter defaults; each node may override any of them
defaults:
  username: ""
  password: ""
  distr: ""                        # local path of the visao archive (.tar.xz)
  bind_addr: "127.0.0.1"
  bind_port: "5700"

# Seconds to wait after launching before probing the remote pid
startup_pause: 4

# Nodes registered at startup
nodes: {}
#  node1:
#    address: "node1.example.org:22"
#    params:
#      bind_port: "5701"
)";

    try {
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }
        std::ofstream out(path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

// Scalars only; nested maps or sequences are a config error.
static Result<ParamMap> parse_params(const YAML::Node& node, const std::string& where) {
    ParamMap params;
    if (!node || node.IsNull()) return Result<ParamMap>::Ok(params);
    if (!node.IsMap()) {
        return Result<ParamMap>::Err(fmt::format("'{}' must be a map", where));
    }
    for (const auto& kv : node) {
        std::string key = kv.first.as<std::string>();
        if (!kv.second.IsScalar() && !kv.second.IsNull()) {
            return Result<ParamMap>::Err(fmt::format("'{}.{}' must be a scalar", where, key));
        }
        params[key] = kv.second.as<std::string>("");
    }
    return Result<ParamMap>::Ok(params);
}

static Result<void> parse_root(const YAML::Node& root, ParamMap& defaults,
                               std::vector<NodeConfig>& nodes, int& startup_pause) {
    if (!root || root.IsNull()) return Result<void>::Ok();
    if (!root.IsMap()) return Result<void>::Err("Config root must be a map");

    auto defs = parse_params(root["defaults"], "defaults");
    if (defs.is_err()) return Result<void>::Err(defs.error);
    defaults = defs.value;

    startup_pause = root["startup_pause"].as<int>(DEFAULT_STARTUP_PAUSE_SECS);
    if (startup_pause < 0) {
        return Result<void>::Err("'startup_pause' must not be negative");
    }

    auto nodes_node = root["nodes"];
    if (nodes_node && !nodes_node.IsNull()) {
        if (!nodes_node.IsMap()) return Result<void>::Err("'nodes' must be a map");
        for (const auto& kv : nodes_node) {
            NodeConfig nc;
            nc.name = kv.first.as<std::string>();

            if (kv.second.IsScalar()) {
                // Bare string shorthand: `n1: host:22`
                nc.address = kv.second.as<std::string>("");
            } else if (kv.second.IsMap()) {
                nc.address = kv.second["address"].as<std::string>("");
                auto params = parse_params(kv.second["params"], "nodes." + nc.name + ".params");
                if (params.is_err()) return Result<void>::Err(params.error);
                nc.params = params.value;
            }

            if (nc.address.empty()) {
                return Result<void>::Err(fmt::format("Node '{}' has no address", nc.name));
            }
            nodes.push_back(nc);
        }
    }
    return Result<void>::Ok();
}

Result<Config> Config::parse(const std::string& yaml_text) {
    Config config;
    config.startup_pause_ = DEFAULT_STARTUP_PAUSE_SECS;
    try {
        YAML::Node root = YAML::Load(yaml_text);
        auto r = parse_root(root, config.defaults_, config.nodes_, config.startup_pause_);
        if (r.is_err()) return Result<Config>::Err(r.error);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err("Invalid config: " + std::string(e.what()));
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config file: " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();

    auto result = parse(ss.str());
    if (result.is_err()) {
        result.error = path.string() + ": " + result.error;
        return result;
    }
    result.value.source_ = path;
    return result;
}
