#pragma once

#include <map>
#include <string>
#include <cstdint>
#include "types.hpp"

// Pipeline progress for one subject on one node. Stage flags are reset at the
// start of every deploy attempt; deployed implies all three stages passed.
struct SubjectStatus {
    bool deploy_archive_copied = false;
    bool deploy_archive_extracted = false;
    bool deploy_archive_tested = false;
    bool deployed = false;
    bool running = false;

    bool operator==(const SubjectStatus& o) const {
        return deploy_archive_copied == o.deploy_archive_copied &&
               deploy_archive_extracted == o.deploy_archive_extracted &&
               deploy_archive_tested == o.deploy_archive_tested &&
               deployed == o.deployed && running == o.running;
    }
    bool operator!=(const SubjectStatus& o) const { return !(*this == o); }
};

struct ConnStatus {
    bool connected = false;
    std::string platform;                            // `uname -a` captured at connect
    std::map<DeploySubject, SubjectStatus> subjects;

    // Defaulted (all false) if the subject was never touched
    SubjectStatus get_subject(DeploySubject subject) const;
    void set_subject(DeploySubject subject, const SubjectStatus& status);
};

// Derived fresh from the node on every probe, never cached.
struct SubjectAliveStatus {
    bool alive = false;
    std::string bind_addr;
    uint16_t bind_port = 0;
};

struct ConnAliveStatus {
    std::map<DeploySubject, SubjectAliveStatus> subjects;
};
