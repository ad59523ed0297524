#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>

// Capability the node pool consumes from the transport. One instance is one
// authenticated shell session to one node; it is owned exclusively by the
// pool's Instance for that node and never shared.
//
// Every call is blocking. Transport faults never escape as exceptions: they
// come back as a failed SSHResult (exit_code -1, reason in stderr_data).
class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    // Password authentication after the handshake. Success means the server
    // reports the session as authenticated.
    virtual SSHResult authenticate(const std::string& user, const std::string& password) = 0;

    // Run one command on a fresh exec channel; stdout/stderr are separated.
    virtual SSHResult run(const std::string& command) = 0;

    // Feed commands, one per line, to a single shell and return its combined output.
    virtual SSHResult run_script(const std::vector<std::string>& commands) = 0;

    // Copy a local file to remote_path (mode 0644).
    virtual SSHResult upload(const std::filesystem::path& local, const std::string& remote_path) = 0;

    // Close channels and the session. Safe to call more than once.
    virtual void close() = 0;

    virtual bool is_active() const = 0;
};

class RemoteTransport {
public:
    virtual ~RemoteTransport() = default;

    // Connect and handshake with address ("host" or "host:port"). The returned
    // session is not yet authenticated.
    virtual Result<std::unique_ptr<RemoteSession>> open(const std::string& address) = 0;
};
