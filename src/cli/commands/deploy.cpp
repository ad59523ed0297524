#include "../base_cli.hpp"
#include "../theme.hpp"
#include <util/string_utils.hpp>
#include <iostream>
#include <fmt/format.h>

// "<name> [subject]" -> name, subject. Subject defaults to visao.
static bool parse_target(const std::string& arg, const std::string& usage,
                         std::string& name, DeploySubject& subject) {
    auto tokens = StringUtils::split(arg);
    if (tokens.empty() || tokens.size() > 2) {
        std::cout << theme::fail("Usage: " + usage);
        return false;
    }
    name = tokens[0];
    subject = DeploySubject::Visao;
    if (tokens.size() == 2) {
        auto parsed = parse_subject(tokens[1]);
        if (!parsed) {
            std::cout << theme::fail("Unknown subject: " + tokens[1]);
            return false;
        }
        subject = *parsed;
    }
    return true;
}

static void do_deploy(BaseCLI& cli, const std::string& arg) {
    std::string name;
    DeploySubject subject;
    if (!parse_target(arg, "deploy <name> [subject]", name, subject)) return;
    if (!cli.require_node(name)) return;

    std::cout << theme::step(fmt::format("Deploying {} to {}...", to_string(subject), name));
    auto result = cli.pool->deploy(name, subject);
    if (result == DeployResult::Ok) {
        std::cout << theme::ok("Deployed " + to_string(subject));
        return;
    }
    std::cout << theme::fail(fmt::format("Deploy failed: {}", to_string(result)));
}

static void do_run(BaseCLI& cli, const std::string& arg) {
    std::string name;
    DeploySubject subject;
    if (!parse_target(arg, "run <name> [subject]", name, subject)) return;
    if (!cli.require_node(name)) return;

    std::cout << theme::step(fmt::format("Starting {} on {} (waiting {}s)...",
                                         to_string(subject), name, cli.pool->startup_pause()));
    auto result = cli.pool->run(name, subject);
    if (result == RunResult::Ok) {
        std::cout << theme::ok(to_string(subject) + " is running");
        return;
    }
    std::cout << theme::fail(fmt::format("Run failed: {}", to_string(result)));
}

static void do_alive(BaseCLI& cli, const std::string& arg) {
    std::string name = StringUtils::trim(arg);
    if (!cli.require_node(name)) return;

    auto status = cli.pool->is_alive_all(name);
    std::cout << theme::section(name);
    for (const auto& [subject, s] : status.subjects) {
        if (s.alive) {
            std::cout << theme::kv(to_string(subject),
                                   theme::green(fmt::format("alive on {}:{}", s.bind_addr, s.bind_port)));
        } else {
            std::cout << theme::kv(to_string(subject), theme::dim("not running"));
        }
    }
    std::cout << "\n";
}

void register_deploy_commands(BaseCLI& cli) {
    cli.add_command("deploy", do_deploy, "Upload, extract and test: deploy <name> [subject]");
    cli.add_command("run", do_run, "Start the deployed server: run <name> [subject]");
    cli.add_command("alive", do_alive, "Probe running servers: alive <name>");
}
