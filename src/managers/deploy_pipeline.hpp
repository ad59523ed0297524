#pragma once

#include <string>
#include <core/results.hpp>
#include <core/status.hpp>
#include <ssh/remote_session.hpp>
#include "subject_layout.hpp"

// copy -> extract -> test against one live session. Stage flags in the
// status are reset on entry and set strictly in order, so after a failure
// the status shows exactly how far the attempt got.
class DeployPipeline {
public:
    DeployPipeline(RemoteSession& session, const SubjectLayout& layout,
                   const std::string& node_name);

    DeployResult execute(const std::string& archive_path, SubjectStatus& status);

private:
    RemoteSession& session_;
    const SubjectLayout& layout_;
    std::string node_name_;

    bool copy_archive(const std::string& archive_path);
    bool extract_archive();
    bool test_binary();
};
