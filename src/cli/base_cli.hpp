#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <managers/node_pool.hpp>
#include <ssh/remote_session.hpp>

class BaseCLI {
public:
    explicit BaseCLI(std::unique_ptr<RemoteTransport> transport);
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    // Load config from path and seed the pool. Prints what happened.
    bool load_config(const fs::path& path);

    bool require_node(const std::string& name);

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Public state
    std::optional<Config> config;
    std::unique_ptr<RemoteTransport> transport;
    std::unique_ptr<NodePool> pool;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
