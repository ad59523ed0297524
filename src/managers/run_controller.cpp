#include "run_controller.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

BindEndpoint sanitize_bind_endpoint(const std::string& addr, const std::string& port) {
    BindEndpoint ep{addr, port};

    if (ep.addr.find('\'') != std::string::npos || ep.addr.find('"') != std::string::npos) {
        delta_log("Reset bind address due to bad symbols: " + ep.addr);
        ep.addr.clear();
    }
    if (ep.addr.empty()) {
        ep.addr = DEFAULT_BIND_ADDR;
    }

    if (!ep.port.empty()) {
        auto parsed = parse_u16(ep.port);
        if (!parsed) {
            delta_log("Reset bind port due to bad symbols: " + ep.port);
            ep.port.clear();
        } else {
            ep.port = std::to_string(*parsed);
        }
    }
    if (ep.port.empty()) {
        ep.port = DEFAULT_BIND_PORT;
    }
    return ep;
}

RunController::RunController(RemoteSession& session, const SubjectLayout& layout,
                             const std::string& node_name, int startup_pause_secs)
    : session_(session), layout_(layout), node_name_(node_name),
      startup_pause_secs_(startup_pause_secs) {}

void RunController::stop_previous() {
    auto cmd = read_file_command(layout_.pid_file);
    auto r = session_.run(cmd);
    delta_log_ssh(fmt::format("[{}] read pid", node_name_), cmd, r);

    auto pid = parse_pid(trimmed(r.stdout_data));
    if (!pid) return;

    auto kill_cmd = terminate_command(*pid);
    auto kr = session_.run(kill_cmd);
    delta_log_ssh(fmt::format("[{}] stop", node_name_), kill_cmd, kr);
}

RunResult RunController::start(const BindEndpoint& endpoint, SubjectStatus& status) {
    status.running = false;

    auto script = launch_script(layout_, endpoint.addr, endpoint.port, startup_pause_secs_);
    auto r = session_.run_script(script);

    std::string joined;
    for (const auto& line : script) joined += line + "; ";
    delta_log_ssh(fmt::format("[{}] run", node_name_), joined, r);

    if (r.stdout_data.find(DELTA_ALIVE_MARKER) == std::string::npos) {
        delta_log(fmt::format("[{}] {} did not come up on {}:{}", node_name_, layout_.name,
                              endpoint.addr, endpoint.port));
        return RunResult::RunFailed;
    }

    status.running = true;
    delta_log(fmt::format("[{}] {} running on {}:{}", node_name_, layout_.name,
                          endpoint.addr, endpoint.port));
    return RunResult::Ok;
}
