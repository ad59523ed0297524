#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

// Where a subject lives on a node and the remote commands that touch it.
// All paths are fixed per subject; sentinel files sit in the deploy directory.
struct SubjectLayout {
    std::string name;             // "visao"
    std::string deploy_dir;       // /tmp/visao
    std::string archive_path;     // /tmp/visao-archive.tar.xz (staging)
    std::string binary;           // /tmp/visao/bin/visao
    std::string archive_entry;    // bin/visao, must be present in the archive
    std::string pid_file;
    std::string bind_addr_file;
    std::string bind_port_file;
};

// nullopt for the orchestrator itself (DeploySubject::Delta)
std::optional<SubjectLayout> subject_layout(DeploySubject subject);

// Marker echoed by the run script only if the launched pid answers kill -0
inline constexpr const char* DELTA_ALIVE_MARKER = "__DELTA_ALIVE__";

// ── Command builders ──────────────────────────────────────────
// Every interpolated value is shell-quoted or validated numeric.

std::string read_file_command(const std::string& path);
std::string extract_command(const SubjectLayout& layout);
std::string version_command(const SubjectLayout& layout);
std::string terminate_command(uint64_t pid);
std::string probe_command(uint64_t pid);

// Launch script for the run pipeline. addr/port must already be sanitized.
std::vector<std::string> launch_script(const SubjectLayout& layout,
                                       const std::string& bind_addr,
                                       const std::string& bind_port,
                                       int startup_pause_secs);
