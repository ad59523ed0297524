#include "../base_cli.hpp"
#include "../theme.hpp"
#include <util/string_utils.hpp>
#include <iostream>
#include <fmt/format.h>

static void do_connect(BaseCLI& cli, const std::string& arg) {
    std::string name = StringUtils::trim(arg);
    if (!cli.require_node(name)) return;

    std::cout << theme::step("Connecting to " + name + "...");
    auto result = cli.pool->connect(name);
    switch (result) {
        case ConnectResult::Ok: {
            auto status = cli.pool->is_connected(name);
            std::cout << theme::ok("Connected " + name);
            if (!status.platform.empty()) {
                std::cout << theme::kv("Platform", status.platform);
            }
            break;
        }
        case ConnectResult::NotAuthenticated:
            std::cout << theme::fail("Could not authenticate to " + name + " (see log)");
            break;
        default:
            std::cout << theme::fail(fmt::format("{}: {}", name, to_string(result)));
            break;
    }
}

static void do_disconnect(BaseCLI& cli, const std::string& arg) {
    std::string name = StringUtils::trim(arg);
    if (!cli.require_node(name)) return;

    cli.pool->disconnect(name);
    std::cout << theme::ok("Disconnected " + name);
}

static void print_node_status(BaseCLI& cli, const std::string& name) {
    auto status = cli.pool->is_connected(name);
    std::cout << theme::section(name);
    std::cout << theme::kv("Connected", theme::flag(status.connected));
    if (!status.connected) return;
    if (!status.platform.empty()) {
        std::cout << theme::kv("Platform", status.platform);
    }

    for (auto subject : deployable_subjects()) {
        auto s = status.get_subject(subject);
        std::cout << theme::dim("    " + to_string(subject)) << "\n";
        std::cout << theme::kv("  copied", theme::flag(s.deploy_archive_copied));
        std::cout << theme::kv("  extracted", theme::flag(s.deploy_archive_extracted));
        std::cout << theme::kv("  tested", theme::flag(s.deploy_archive_tested));
        std::cout << theme::kv("  deployed", theme::flag(s.deployed));
        std::cout << theme::kv("  running", theme::flag(s.running));
    }
}

static void do_status(BaseCLI& cli, const std::string& arg) {
    std::string name = StringUtils::trim(arg);
    if (!name.empty()) {
        if (!cli.require_node(name)) return;
        print_node_status(cli, name);
        std::cout << "\n";
        return;
    }

    std::cout << theme::section("Status");
    if (cli.config.has_value()) {
        std::cout << theme::kv("Config", cli.config->source().string());
    } else {
        std::cout << theme::kv("Config", theme::dim("(none)"));
    }
    std::cout << theme::kv("Pause", fmt::format("{}s", cli.pool->startup_pause()));

    for (const auto& n : cli.pool->node_names()) {
        print_node_status(cli, n);
    }
    std::cout << "\n";
}

void register_session_commands(BaseCLI& cli) {
    cli.add_command("connect", do_connect, "Open an SSH session: connect <name>");
    cli.add_command("disconnect", do_disconnect, "Close a node's session: disconnect <name>");
    cli.add_command("status", do_status, "Show session and pipeline state: status [name]");
}
