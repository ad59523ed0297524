#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <algorithm>
#include <vector>
#include <fmt/format.h>

BaseCLI::BaseCLI(std::unique_ptr<RemoteTransport> t)
    : transport(std::move(t)) {
    pool = std::make_unique<NodePool>(*transport);
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::load_config(const fs::path& path) {
    auto config_result = Config::load(path);
    if (config_result.is_err()) {
        std::cout << theme::fail(config_result.error);
        return false;
    }
    config = config_result.value;

    auto duplicates = pool->apply(config.value());
    for (const auto& name : duplicates) {
        std::cout << theme::fail("Node '" + name + "' is already registered; config entry ignored.");
    }
    return true;
}

bool BaseCLI::require_node(const std::string& name) {
    if (name.empty()) {
        std::cout << theme::fail("Missing node name.");
        return false;
    }
    auto names = pool->node_names();
    if (std::find(names.begin(), names.end(), name) == names.end()) {
        std::cout << theme::fail("Unknown node: " + name);
        std::cout << theme::step("Use 'nodes' to list registered nodes.");
        return false;
    }
    return true;
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Nodes",      {"nodes", "add", "remove", "set", "param"}},
        {"Sessions",   {"connect", "disconnect", "status"}},
        {"Deployment", {"deploy", "run", "alive"}},
        {"General",    {"help", "clear", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    size_t connected = 0;
    auto names = pool->node_names();
    for (const auto& name : names) {
        if (pool->is_connected(name).connected) connected++;
    }

    return rl_esc(theme::color::BROWN) + "delta"
         + rl_esc(theme::color::RESET) + ":"
         + rl_esc(connected ? theme::color::GREEN : theme::color::BLUE)
         + fmt::format("{}/{}", connected, names.size())
         + rl_esc(theme::color::RESET) + "> ";
}
