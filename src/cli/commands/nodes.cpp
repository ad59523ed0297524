#include "../base_cli.hpp"
#include "../theme.hpp"
#include <util/string_utils.hpp>
#include <iostream>
#include <algorithm>
#include <fmt/format.h>

static std::string masked(const std::string& key, const std::string& value) {
    if (key == to_string(NodeParameter::Password) && !value.empty()) {
        return std::string(value.size(), '*');
    }
    return value;
}

static void do_nodes(BaseCLI& cli, const std::string& arg) {
    auto names = cli.pool->node_names();
    if (names.empty()) {
        std::cout << theme::dim("  No nodes registered.") << "\n";
        return;
    }

    size_t w0 = 4;
    for (const auto& n : names) w0 = std::max(w0, n.size());

    std::string hfmt = fmt::format("  {{:<{}}} {{:<10}} {{}}\n", w0 + 2);

    std::cout << "\n";
    std::cout << theme::color::DIM
              << fmt::format(fmt::runtime(hfmt), "NODE", "SESSION", "USER")
              << theme::color::RESET;

    for (const auto& name : names) {
        bool connected = cli.pool->is_connected(name).connected;
        std::string user = cli.pool->get_param(name, NodeParameter::Username);
        std::cout << "  " << theme::color::BLUE << fmt::format("{:<{}}", name, w0 + 2)
                  << theme::color::RESET << " "
                  << (connected ? theme::color::GREEN : theme::color::DIM)
                  << fmt::format("{:<10}", connected ? "connected" : "idle")
                  << theme::color::RESET << " " << user << "\n";
    }
    std::cout << "\n";
}

static void do_add(BaseCLI& cli, const std::string& arg) {
    auto tokens = StringUtils::split(arg);
    if (tokens.size() < 2) {
        std::cout << theme::fail("Usage: add <name> <address> [key=value ...]");
        return;
    }

    ParamMap params;
    for (size_t i = 2; i < tokens.size(); i++) {
        auto kv = StringUtils::parse_assignment(tokens[i]);
        if (!kv) {
            std::cout << theme::fail("Expected key=value, got: " + tokens[i]);
            return;
        }
        params[kv->first] = kv->second;
    }

    auto result = cli.pool->add(tokens[0], tokens[1], params);
    if (result == AddResult::NodeAlreadyExists) {
        std::cout << theme::fail("Node '" + tokens[0] + "' already exists.");
        return;
    }
    std::cout << theme::ok("Added " + tokens[0]);
}

static void do_remove(BaseCLI& cli, const std::string& arg) {
    std::string name = StringUtils::trim(arg);
    if (!cli.require_node(name)) return;

    if (cli.pool->remove(name) != RemoveResult::Ok) {
        std::cout << theme::fail("Node '" + name + "' not found.");
        return;
    }
    std::cout << theme::ok("Removed " + name);
}

static void do_set(BaseCLI& cli, const std::string& arg) {
    auto tokens = StringUtils::split(arg);
    if (tokens.size() != 2) {
        std::cout << theme::fail("Usage: set <key> <value>");
        return;
    }
    if (!parse_parameter(tokens[0])) {
        std::cout << theme::info("'" + tokens[0] + "' is not a known parameter; stored anyway.");
    }
    cli.pool->set_default_param(tokens[0], tokens[1]);
    std::cout << theme::ok(fmt::format("Default {} = {}", tokens[0], masked(tokens[0], tokens[1])));
}

static void do_param(BaseCLI& cli, const std::string& arg) {
    auto tokens = StringUtils::split(arg);
    if (tokens.empty() || tokens.size() > 2) {
        std::cout << theme::fail("Usage: param <name> [key]");
        return;
    }
    if (!cli.require_node(tokens[0])) return;

    std::cout << theme::section(tokens[0]);
    if (tokens.size() == 2) {
        std::string value = cli.pool->get_param(tokens[0], tokens[1]);
        std::cout << theme::kv(tokens[1], value.empty() ? theme::dim("(unset)") : masked(tokens[1], value));
        std::cout << "\n";
        return;
    }

    for (auto param : {NodeParameter::Username, NodeParameter::Password, NodeParameter::Distr,
                       NodeParameter::BindAddr, NodeParameter::BindPort}) {
        std::string key = to_string(param);
        std::string value = cli.pool->get_param(tokens[0], param);
        std::cout << theme::kv(key, value.empty() ? theme::dim("(unset)") : masked(key, value));
    }
    std::cout << "\n";
}

void register_node_commands(BaseCLI& cli) {
    cli.add_command("nodes", do_nodes, "List registered nodes");
    cli.add_command("add", do_add, "Register a node: add <name> <address> [key=value ...]");
    cli.add_command("remove", do_remove, "Remove a node and drop its session");
    cli.add_command("set", do_set, "Set a pool-wide default: set <key> <value>");
    cli.add_command("param", do_param, "Show resolved parameters: param <name> [key]");
}
