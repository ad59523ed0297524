#include "deploy_pipeline.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/archive.hpp>
#include <fmt/format.h>
#include <algorithm>

DeployPipeline::DeployPipeline(RemoteSession& session, const SubjectLayout& layout,
                               const std::string& node_name)
    : session_(session), layout_(layout), node_name_(node_name) {}

DeployResult DeployPipeline::execute(const std::string& archive_path, SubjectStatus& status) {
    status.deployed = false;
    status.deploy_archive_copied = false;
    status.deploy_archive_extracted = false;
    status.deploy_archive_tested = false;

    if (!copy_archive(archive_path)) {
        return DeployResult::DeployCopyFailed;
    }
    status.deploy_archive_copied = true;

    if (!extract_archive()) {
        return DeployResult::DeployExtractionFailed;
    }
    status.deploy_archive_extracted = true;

    if (!test_binary()) {
        return DeployResult::DeployTestFailed;
    }
    status.deploy_archive_tested = true;

    status.deployed = true;
    delta_log(fmt::format("[{}] {} deployed", node_name_, layout_.name));
    return DeployResult::Ok;
}

bool DeployPipeline::copy_archive(const std::string& archive_path) {
    if (archive_path.empty()) {
        delta_log(fmt::format("[{}] deploy: no distribution archive configured", node_name_));
        return false;
    }

    // Refuse anything libarchive cannot read. A missing binary is left to the
    // version test so the status shows the copy and extraction succeeded.
    auto entries = platform::list_archive(archive_path);
    if (entries.is_err()) {
        delta_log(fmt::format("[{}] deploy: {}", node_name_, entries.error));
        return false;
    }
    if (std::find(entries.value.begin(), entries.value.end(), layout_.archive_entry) ==
        entries.value.end()) {
        delta_log(fmt::format("[{}] deploy: {} has no '{}' entry, uploading anyway",
                              node_name_, archive_path, layout_.archive_entry));
    }

    auto r = session_.upload(archive_path, layout_.archive_path);
    delta_log_ssh(fmt::format("[{}] upload", node_name_),
                  archive_path + " -> " + layout_.archive_path, r);
    return r.success();
}

bool DeployPipeline::extract_archive() {
    auto cmd = extract_command(layout_);
    auto r = session_.run(cmd);
    delta_log_ssh(fmt::format("[{}] extract", node_name_), cmd, r);
    return !trimmed(r.stdout_data).empty();
}

bool DeployPipeline::test_binary() {
    auto cmd = version_command(layout_);
    auto r = session_.run(cmd);
    delta_log_ssh(fmt::format("[{}] test", node_name_), cmd, r);
    return !trimmed(r.stdout_data).empty();
}
