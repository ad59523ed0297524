#pragma once

#include "base_cli.hpp"
#include <string>

// Forward declarations for command registration
void register_node_commands(BaseCLI& cli);
void register_session_commands(BaseCLI& cli);
void register_deploy_commands(BaseCLI& cli);

class DeltaCLI : public BaseCLI {
public:
    DeltaCLI();

    // Interactive loop until quit/EOF. config_path may not exist yet.
    void run_repl(const fs::path& config_path);

    // Write a template config file
    void run_init(const fs::path& config_path);

private:
    bool quit_requested_ = false;

    void register_all_commands();
};
