#include "subject_layout.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

std::optional<SubjectLayout> subject_layout(DeploySubject subject) {
    if (subject == DeploySubject::Delta) return std::nullopt;

    SubjectLayout l;
    l.name = to_string(subject);
    l.deploy_dir = fmt::format(REMOTE_DEPLOY_DIR, l.name);
    l.archive_path = fmt::format(REMOTE_ARCHIVE_PATH, l.name);
    l.binary = fmt::format(REMOTE_BINARY_PATH, l.name);
    l.archive_entry = fmt::format(ARCHIVE_BINARY_ENTRY, l.name);
    l.pid_file = l.deploy_dir + "/" + SENTINEL_PID;
    l.bind_addr_file = l.deploy_dir + "/" + SENTINEL_BIND_ADDR;
    l.bind_port_file = l.deploy_dir + "/" + SENTINEL_BIND_PORT;
    return l;
}

std::string read_file_command(const std::string& path) {
    return fmt::format("cat {} 2> /dev/null", shell_quote(path));
}

std::string extract_command(const SubjectLayout& layout) {
    auto dir = shell_quote(layout.deploy_dir);
    return fmt::format("mkdir -p {0} && tar xf {1} -C {0} > /dev/null 2> /dev/null && echo ok",
                       dir, shell_quote(layout.archive_path));
}

std::string version_command(const SubjectLayout& layout) {
    return fmt::format("{} --version", shell_quote(layout.binary));
}

std::string terminate_command(uint64_t pid) {
    return fmt::format("kill {} 2> /dev/null", pid);
}

std::string probe_command(uint64_t pid) {
    return fmt::format("kill -0 {} 2> /dev/null && echo runs", pid);
}

std::vector<std::string> launch_script(const SubjectLayout& layout,
                                       const std::string& bind_addr,
                                       const std::string& bind_port,
                                       int startup_pause_secs) {
    auto pid_file = shell_quote(layout.pid_file);
    std::vector<std::string> commands;
    commands.push_back(fmt::format("{} --server {} < /dev/null > /dev/null 2> /dev/null &",
                                   shell_quote(layout.binary),
                                   shell_quote("tcp://" + bind_addr + ":" + bind_port)));
    commands.push_back(fmt::format("echo $! > {}", pid_file));
    commands.push_back(fmt::format("echo {} > {}", shell_quote(bind_addr),
                                   shell_quote(layout.bind_addr_file)));
    commands.push_back(fmt::format("echo {} > {}", shell_quote(bind_port),
                                   shell_quote(layout.bind_port_file)));
    commands.push_back(fmt::format("sleep {}", startup_pause_secs));
    // Split marker so the literal only appears in output, never in the command text
    commands.push_back(fmt::format("kill -0 \"$(cat {0})\" 2> /dev/null && echo __DELTA_ALI''VE__ \"$(cat {0})\"",
                                   pid_file));
    return commands;
}
