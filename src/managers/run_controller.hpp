#pragma once

#include <string>
#include <core/results.hpp>
#include <core/status.hpp>
#include <ssh/remote_session.hpp>
#include "subject_layout.hpp"

struct BindEndpoint {
    std::string addr;
    std::string port;
};

// Values end up inside a remote shell command: an address carrying quote
// characters falls back to 127.0.0.1, a port that is not a u16 to 5700.
// Empty values take the same defaults. A valid port comes back in plain decimal.
BindEndpoint sanitize_bind_endpoint(const std::string& addr, const std::string& port);

// Stops the previous instance of a subject and launches a new one.
class RunController {
public:
    RunController(RemoteSession& session, const SubjectLayout& layout,
                  const std::string& node_name, int startup_pause_secs);

    // Best effort: SIGTERM whatever pid the sentinel names. Never fails the run.
    void stop_previous();

    RunResult start(const BindEndpoint& endpoint, SubjectStatus& status);

private:
    RemoteSession& session_;
    const SubjectLayout& layout_;
    std::string node_name_;
    int startup_pause_secs_;
};
