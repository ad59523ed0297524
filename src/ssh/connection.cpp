#include "connection.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <sys/stat.h>
#include <chrono>
#include <cstdint>
#include <fstream>

SSHConnection::SSHConnection(LIBSSH2_SESSION* session, std::shared_ptr<std::mutex> io_mutex,
                             int timeout_secs)
    : session_(session), io_mutex_(io_mutex), timeout_secs_(timeout_secs) {
}

LIBSSH2_CHANNEL* SSHConnection::open_channel(std::string& err) {
    if (!session_) {
        err = "No session available";
        return nullptr;
    }

    LIBSSH2_CHANNEL* ch = nullptr;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs_);
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            ch = libssh2_channel_open_session(session_);
            if (!ch && libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
                err = "Failed to open channel";
                return nullptr;
            }
        }
        if (ch) return ch;
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    err = "Timed out opening channel";
    return nullptr;
}

bool SSHConnection::write_all(LIBSSH2_CHANNEL* channel, const char* data, size_t len) {
    size_t sent = 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs_);
    while (sent < len) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            w = libssh2_channel_write(channel, data + sent, len - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            if (std::chrono::steady_clock::now() >= deadline) return false;
            platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
            continue;
        }
        if (w < 0) return false;
        sent += static_cast<size_t>(w);
    }
    return true;
}

bool SSHConnection::send_eof(LIBSSH2_CHANNEL* channel) {
    int rc;
    do {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_send_eof(channel);
        }
        if (rc == LIBSSH2_ERROR_EAGAIN) platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    } while (rc == LIBSSH2_ERROR_EAGAIN);
    return rc == 0;
}

void SSHConnection::discard(LIBSSH2_CHANNEL* channel) {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    libssh2_channel_close(channel);
    libssh2_channel_free(channel);
}

SSHResult SSHConnection::collect(LIBSSH2_CHANNEL* channel) {
    std::string output;
    std::string stderr_data;
    char buf[SSH_READ_BUF_SIZE];
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs_);
    bool timed_out = true;
    bool read_error = false;

    while (std::chrono::steady_clock::now() < deadline) {
        ssize_t n, e;
        bool eof;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n = libssh2_channel_read(channel, buf, sizeof(buf));
            if (n > 0) output.append(buf, static_cast<size_t>(n));
            e = libssh2_channel_read_stderr(channel, buf, sizeof(buf));
            if (e > 0) stderr_data.append(buf, static_cast<size_t>(e));
            eof = libssh2_channel_eof(channel) != 0;
        }
        if ((n < 0 && n != LIBSSH2_ERROR_EAGAIN) || (e < 0 && e != LIBSSH2_ERROR_EAGAIN)) {
            read_error = true;
            timed_out = false;
            break;
        }
        if (n > 0 || e > 0) continue;
        if (eof) {
            timed_out = false;
            break;
        }
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }

    int rc;
    do {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_close(channel);
        }
        if (rc == LIBSSH2_ERROR_EAGAIN) platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    } while (rc == LIBSSH2_ERROR_EAGAIN);

    int exit_status = -1;
    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        if (rc == 0) exit_status = libssh2_channel_get_exit_status(channel);
        libssh2_channel_free(channel);
    }

    if (read_error) {
        return SSHResult{-1, output, "SSH channel read error"};
    }
    if (timed_out) {
        return SSHResult{-1, output,
                         "Command timed out after " + std::to_string(timeout_secs_) + "s"};
    }
    return SSHResult{exit_status, output, stderr_data};
}

SSHResult SSHConnection::run(const std::string& command) {
    std::string err;
    LIBSSH2_CHANNEL* ch = open_channel(err);
    if (!ch) return SSHResult{-1, "", err};

    int rc;
    do {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_exec(ch, command.c_str());
        }
        if (rc == LIBSSH2_ERROR_EAGAIN) platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    } while (rc == LIBSSH2_ERROR_EAGAIN);

    if (rc != 0) {
        discard(ch);
        return SSHResult{-1, "", "Failed to exec command on channel"};
    }
    return collect(ch);
}

SSHResult SSHConnection::run_script(const std::vector<std::string>& commands) {
    std::string err;
    LIBSSH2_CHANNEL* ch = open_channel(err);
    if (!ch) return SSHResult{-1, "", err};

    // No PTY: the shell reads commands from stdin and does not echo them back
    int rc;
    do {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_shell(ch);
        }
        if (rc == LIBSSH2_ERROR_EAGAIN) platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    } while (rc == LIBSSH2_ERROR_EAGAIN);

    if (rc != 0) {
        discard(ch);
        return SSHResult{-1, "", "Failed to request shell"};
    }

    for (const auto& command : commands) {
        std::string line = command + "\n";
        if (!write_all(ch, line.data(), line.size())) {
            discard(ch);
            return SSHResult{-1, "", "Failed to send command to shell"};
        }
    }

    if (!send_eof(ch)) {
        discard(ch);
        return SSHResult{-1, "", "Failed to close shell input"};
    }

    auto result = collect(ch);
    // Combined output: the shell's stderr belongs to the transcript too
    if (!result.stderr_data.empty() && result.exit_code != -1) {
        result.stdout_data += result.stderr_data;
    }
    return result;
}

SSHResult SSHConnection::upload(const fs::path& local, const std::string& remote) {
    if (!session_) {
        return SSHResult{-1, "", "No session available"};
    }

    std::ifstream file(local, std::ios::binary);
    if (!file) {
        return SSHResult{-1, "", "Cannot read file: " + local.string()};
    }

    std::error_code ec;
    auto size = fs::file_size(local, ec);
    if (ec) {
        return SSHResult{-1, "", "Cannot stat file: " + local.string() + " (" + ec.message() + ")"};
    }

    LIBSSH2_CHANNEL* ch = nullptr;
    auto open_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs_);
    while (std::chrono::steady_clock::now() < open_deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            ch = libssh2_scp_send64(session_, remote.c_str(), 0644,
                                    static_cast<libssh2_int64_t>(size), 0, 0);
            if (!ch && libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
                char* msg = nullptr;
                libssh2_session_last_error(session_, &msg, nullptr, 0);
                return SSHResult{-1, "", "SCP rejected " + remote + ": " + (msg ? msg : "unknown")};
            }
        }
        if (ch) break;
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    if (!ch) {
        return SSHResult{-1, "", "Timed out opening SCP channel"};
    }

    std::vector<char> buf(SCP_CHUNK_SIZE);
    uint64_t total = 0;
    while (file) {
        file.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto n = file.gcount();
        if (n <= 0) break;
        if (!write_all(ch, buf.data(), static_cast<size_t>(n))) {
            discard(ch);
            return SSHResult{-1, "", "SCP write failed after " + std::to_string(total) + " bytes"};
        }
        total += static_cast<uint64_t>(n);
    }

    if (total != size) {
        discard(ch);
        return SSHResult{-1, "", "Short read from " + local.string()};
    }

    if (!send_eof(ch)) {
        discard(ch);
        return SSHResult{-1, "", "SCP failed to send EOF"};
    }

    int rc;
    do {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_wait_eof(ch);
        }
        if (rc == LIBSSH2_ERROR_EAGAIN) platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    } while (rc == LIBSSH2_ERROR_EAGAIN);

    do {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_close(ch);
        }
        if (rc == LIBSSH2_ERROR_EAGAIN) platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    } while (rc == LIBSSH2_ERROR_EAGAIN);

    do {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_wait_closed(ch);
        }
        if (rc == LIBSSH2_ERROR_EAGAIN) platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    } while (rc == LIBSSH2_ERROR_EAGAIN);

    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        libssh2_channel_free(ch);
    }

    if (rc != 0) {
        return SSHResult{-1, "", "SCP channel did not close cleanly"};
    }
    return SSHResult{0, "Uploaded " + std::to_string(total) + " bytes to " + remote, ""};
}
