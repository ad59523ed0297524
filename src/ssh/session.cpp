#include "session.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <mutex>
#include <chrono>

// libssh2_init is process-wide and not thread-safe; run it exactly once.
static int init_libssh2() {
    static std::once_flag once;
    static int rc = 0;
    std::call_once(once, [] { rc = libssh2_init(0); });
    return rc;
}

SessionManager::SessionManager(const SessionTarget& target)
    : target_(target), session_(nullptr), sock_(DELTA_INVALID_SOCKET), handshaken_(false),
      active_(false), target_str_(target.host + ":" + std::to_string(target.port)),
      io_mutex_(std::make_shared<std::mutex>()) {
}

SessionManager::~SessionManager() {
    close();
}

SSHResult SessionManager::establish() {
    if (init_libssh2() != 0) {
        return SSHResult{-1, "", "Failed to initialize libssh2"};
    }

    auto sock = platform::connect_tcp(target_.host, target_.port, target_.timeout * 1000);
    if (sock.is_err()) {
        return SSHResult{-1, "", sock.error};
    }
    sock_ = sock.value;

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        close();
        return SSHResult{-1, "", "Failed to create SSH session"};
    }

    libssh2_session_set_blocking(session_, 0);

    // SSH handshake (key exchange)
    int ret;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(target_.timeout);
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (std::chrono::steady_clock::now() >= deadline) break;
        platform::sleep_ms(SSH_HANDSHAKE_SLEEP_MS);
    }

    if (ret != 0) {
        close();
        return SSHResult{-1, "", "SSH handshake failed with " + target_str_};
    }

    platform::enable_keepalive(sock_);
    libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_SECS);

    handshaken_ = true;
    return SSHResult{0, "", ""};
}

SSHResult SessionManager::authenticate(const std::string& user, const std::string& password) {
    if (!session_ || !handshaken_) {
        return SSHResult{-1, "", "Session not established"};
    }

    int ret;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(target_.timeout);
    while ((ret = libssh2_userauth_password(session_, user.c_str(),
                                            password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
        if (std::chrono::steady_clock::now() >= deadline) break;
        platform::sleep_ms(SSH_HANDSHAKE_SLEEP_MS);
    }

    if (ret != 0) {
        return SSHResult{-1, "", "Credentials not accepted for " + user + "@" + target_str_};
    }

    if (!libssh2_userauth_authenticated(session_)) {
        return SSHResult{-1, "", "Server did not confirm authentication"};
    }

    conn_ = std::make_unique<SSHConnection>(session_, io_mutex_, target_.command_timeout);
    active_ = true;
    return SSHResult{0, "", ""};
}

SSHResult SessionManager::not_active() const {
    return SSHResult{-1, "", "Session to " + target_str_ + " is not active"};
}

SSHResult SessionManager::run(const std::string& command) {
    if (!active_ || !conn_) return not_active();
    return conn_->run(command);
}

SSHResult SessionManager::run_script(const std::vector<std::string>& commands) {
    if (!active_ || !conn_) return not_active();
    return conn_->run_script(commands);
}

SSHResult SessionManager::upload(const fs::path& local, const std::string& remote_path) {
    if (!active_ || !conn_) return not_active();
    return conn_->upload(local, remote_path);
}

void SessionManager::close() {
    // Mark inactive first so concurrent operations bail out early
    active_ = false;
    handshaken_ = false;
    conn_.reset();

    if (session_) {
        // Blocking for the goodbye so the server sees a clean disconnect
        std::lock_guard<std::mutex> lock(*io_mutex_);
        libssh2_session_set_blocking(session_, 1);
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }

    if (sock_ != DELTA_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = DELTA_INVALID_SOCKET;
    }
}

bool SessionManager::is_active() const {
    return active_;
}
