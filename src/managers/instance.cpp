#include "instance.hpp"

Instance::Instance(std::unique_ptr<RemoteSession> s, const std::string& platform)
    : session(std::move(s)) {
    conn_status.connected = true;
    conn_status.platform = platform;
}

Instance::~Instance() {
    if (session) {
        session->close();
    }
}
