#pragma once

#include <string>
#include <core/status.hpp>
#include <ssh/remote_session.hpp>
#include "subject_layout.hpp"

// Read-only: reports alive only when the pid sentinel names a live process
// and the bind port sentinel holds a valid u16.
class LivenessProber {
public:
    LivenessProber(RemoteSession& session, const SubjectLayout& layout,
                   const std::string& node_name);

    SubjectAliveStatus probe();

private:
    RemoteSession& session_;
    const SubjectLayout& layout_;
    std::string node_name_;

    std::string read_sentinel(const std::string& path);
};
