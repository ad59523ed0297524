#include "liveness_prober.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

LivenessProber::LivenessProber(RemoteSession& session, const SubjectLayout& layout,
                               const std::string& node_name)
    : session_(session), layout_(layout), node_name_(node_name) {}

std::string LivenessProber::read_sentinel(const std::string& path) {
    auto cmd = read_file_command(path);
    auto r = session_.run(cmd);
    delta_log_ssh(fmt::format("[{}] probe", node_name_), cmd, r);
    return trimmed(r.stdout_data);
}

SubjectAliveStatus LivenessProber::probe() {
    SubjectAliveStatus status;

    auto pid = parse_pid(read_sentinel(layout_.pid_file));
    if (!pid) return status;

    auto cmd = probe_command(*pid);
    auto runs = session_.run(cmd);
    delta_log_ssh(fmt::format("[{}] probe", node_name_), cmd, runs);
    if (runs.stdout_data.find("runs") == std::string::npos) return status;

    auto bind_addr = read_sentinel(layout_.bind_addr_file);
    auto bind_port = parse_u16(read_sentinel(layout_.bind_port_file));
    if (!bind_port) {
        delta_log(fmt::format("[{}] {} runs but bind port sentinel is malformed",
                              node_name_, layout_.name));
        return status;
    }

    status.alive = true;
    status.bind_addr = bind_addr;
    status.bind_port = *bind_port;
    return status;
}
