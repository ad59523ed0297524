#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "remote_session.hpp"
#include "connection.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

struct SessionTarget {
    std::string host;
    int port = 22;
    int timeout = 30;          // connect + handshake, seconds
    int command_timeout = 300; // per remote command, seconds
};

// One libssh2 session over one TCP socket. establish() connects and performs
// the handshake; authenticate() completes the login. Everything is torn down
// by close(), which the destructor also calls.
class SessionManager : public RemoteSession {
public:
    explicit SessionManager(const SessionTarget& target);
    ~SessionManager() override;

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    SSHResult establish();

    SSHResult authenticate(const std::string& user, const std::string& password) override;
    SSHResult run(const std::string& command) override;
    SSHResult run_script(const std::vector<std::string>& commands) override;
    SSHResult upload(const fs::path& local, const std::string& remote_path) override;
    void close() override;
    bool is_active() const override;

private:
    SessionTarget target_;
    LIBSSH2_SESSION* session_;
    int sock_;
    bool handshaken_;
    bool active_;
    std::string target_str_;
    std::shared_ptr<std::mutex> io_mutex_;
    std::unique_ptr<SSHConnection> conn_;

    SSHResult not_active() const;
};
