#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

namespace platform {

// Create a tar archive at tar_path containing the specified files
// from base_dir. Each entry in files is a relative path from base_dir.
void create_tar(const std::filesystem::path& tar_path,
                const std::filesystem::path& base_dir,
                const std::vector<std::string>& files);

// List entry paths of any archive libarchive can read (tar, tar.xz, ...).
// Leading "./" is stripped from each entry.
Result<std::vector<std::string>> list_archive(const std::filesystem::path& path);

} // namespace platform
