#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>

namespace fs = std::filesystem;

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Channel-level operations on an established, authenticated libssh2 session.
// The session is non-blocking; every libssh2 call is made under io_mutex and
// retried on EAGAIN until the command timeout.
class SSHConnection {
public:
    SSHConnection(LIBSSH2_SESSION* session, std::shared_ptr<std::mutex> io_mutex,
                  int timeout_secs);

    SSHResult run(const std::string& command);
    SSHResult run_script(const std::vector<std::string>& commands);
    SSHResult upload(const fs::path& local, const std::string& remote);

private:
    LIBSSH2_SESSION* session_;
    std::shared_ptr<std::mutex> io_mutex_;
    int timeout_secs_;

    LIBSSH2_CHANNEL* open_channel(std::string& err);
    bool write_all(LIBSSH2_CHANNEL* channel, const char* data, size_t len);
    bool send_eof(LIBSSH2_CHANNEL* channel);

    // Read stdout/stderr until EOF, close the channel, collect exit status, free it.
    SSHResult collect(LIBSSH2_CHANNEL* channel);
    void discard(LIBSSH2_CHANNEL* channel);
};
