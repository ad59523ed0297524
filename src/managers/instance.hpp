#pragma once

#include <memory>
#include <string>
#include <core/status.hpp>
#include <ssh/remote_session.hpp>

// Live state for one connected node: the exclusively owned session and its
// status. Destroying the Instance closes the session.
struct Instance {
    std::unique_ptr<RemoteSession> session;
    ConnStatus conn_status;

    Instance(std::unique_ptr<RemoteSession> s, const std::string& platform);
    ~Instance();

    Instance(const Instance&) = delete;
    Instance& operator=(const Instance&) = delete;
};
