#include "delta_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <ssh/transport.hpp>
#include <readline/readline.h>
#include <readline/history.h>

DeltaCLI::DeltaCLI()
    : BaseCLI(std::make_unique<SshTransport>(SSH_CONNECT_TIMEOUT_SECS, SSH_CMD_TIMEOUT_SECS)) {
    register_all_commands();
}

void DeltaCLI::register_all_commands() {
    add_command("help", [this](BaseCLI&, const std::string&) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [this](BaseCLI&, const std::string&) {
        quit_requested_ = true;
    }, "Disconnect all nodes and exit");

    add_command("exit", [this](BaseCLI&, const std::string&) {
        quit_requested_ = true;
    }, "Disconnect all nodes and exit");

    add_command("clear", [](BaseCLI&, const std::string&) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    register_node_commands(*this);
    register_session_commands(*this);
    register_deploy_commands(*this);
}

void DeltaCLI::run_repl(const fs::path& config_path) {
    std::cout << theme::banner(DELTA_VERSION);

    std::cout << theme::section("Configuration");
    if (config_exists(config_path)) {
        if (!load_config(config_path)) {
            std::cout << "\n";
            return;
        }
        std::cout << theme::check("Loaded " + config_path.string());
        std::cout << theme::kv("Nodes", std::to_string(pool->node_names().size()));
    } else {
        std::cout << theme::info("No config at " + config_path.string() + " (run 'delta init')");
    }
    std::cout << theme::kv("Log", delta_log_path());
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (!quit_requested_) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        execute_command(command, args);
    }

    std::cout << theme::dim("    Disconnecting...") << "\n";
    for (const auto& name : pool->node_names()) {
        pool->disconnect(name);
    }
}

void DeltaCLI::run_init(const fs::path& config_path) {
    if (config_exists(config_path)) {
        std::cout << theme::info("Config already exists at " + config_path.string());
        return;
    }
    auto result = create_default_config(config_path);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    std::cout << theme::ok("Config written to " + config_path.string());
    std::cout << theme::step("Edit it to add nodes, then run 'delta'.");
}
