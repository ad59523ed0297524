#pragma once

#include <memory>
#include <string>
#include "remote_session.hpp"

// RemoteTransport backed by libssh2. Each open() yields an independent
// SessionManager with its own socket.
class SshTransport : public RemoteTransport {
public:
    explicit SshTransport(int connect_timeout_secs = 30, int command_timeout_secs = 300);

    Result<std::unique_ptr<RemoteSession>> open(const std::string& address) override;

private:
    int connect_timeout_secs_;
    int command_timeout_secs_;
};
