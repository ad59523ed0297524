#include "archive.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <fstream>
#include <stdexcept>
#include <cstring>

namespace fs = std::filesystem;

namespace platform {

void create_tar(const fs::path& tar_path,
                const fs::path& base_dir,
                const std::vector<std::string>& files) {
    struct archive* a = archive_write_new();
    if (!a) throw std::runtime_error("Failed to create archive writer");

    archive_write_set_format_ustar(a);

    if (archive_write_open_filename(a, tar_path.string().c_str()) != ARCHIVE_OK) {
        std::string err = archive_error_string(a);
        archive_write_free(a);
        throw std::runtime_error("Failed to open tar file: " + err);
    }

    struct archive_entry* entry = archive_entry_new();

    for (const auto& rel_path : files) {
        fs::path full_path = base_dir / rel_path;

        if (!fs::exists(full_path) || !fs::is_regular_file(full_path)) continue;

        auto file_size = fs::file_size(full_path);
        auto perms = fs::status(full_path).permissions();
        bool exec = (perms & fs::perms::owner_exec) != fs::perms::none;

        archive_entry_clear(entry);
        archive_entry_set_pathname(entry, rel_path.c_str());
        archive_entry_set_size(entry, static_cast<int64_t>(file_size));
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, exec ? 0755 : 0644);

        if (archive_write_header(a, entry) != ARCHIVE_OK) {
            continue;  // skip files that fail
        }

        // Write file contents in chunks
        std::ifstream in(full_path, std::ios::binary);
        if (!in) continue;

        char buf[65536];
        while (in) {
            in.read(buf, sizeof(buf));
            auto bytes_read = in.gcount();
            if (bytes_read > 0) {
                archive_write_data(a, buf, static_cast<size_t>(bytes_read));
            }
        }
    }

    archive_entry_free(entry);
    archive_write_close(a);
    archive_write_free(a);
}

Result<std::vector<std::string>> list_archive(const fs::path& path) {
    using R = Result<std::vector<std::string>>;

    struct archive* a = archive_read_new();
    if (!a) return R::Err("Failed to create archive reader");

    archive_read_support_filter_all(a);
    archive_read_support_format_all(a);

    if (archive_read_open_filename(a, path.string().c_str(), 10240) != ARCHIVE_OK) {
        std::string err = archive_error_string(a) ? archive_error_string(a) : "unknown error";
        archive_read_free(a);
        return R::Err("Cannot open archive " + path.string() + ": " + err);
    }

    std::vector<std::string> entries;
    struct archive_entry* entry = nullptr;
    int rc;
    while ((rc = archive_read_next_header(a, &entry)) == ARCHIVE_OK) {
        const char* name = archive_entry_pathname(entry);
        std::string p = name ? name : "";
        while (p.rfind("./", 0) == 0) p.erase(0, 2);
        if (!p.empty()) entries.push_back(p);
        archive_read_data_skip(a);
    }

    if (rc != ARCHIVE_EOF) {
        std::string err = archive_error_string(a) ? archive_error_string(a) : "truncated archive";
        archive_read_free(a);
        return R::Err("Corrupt archive " + path.string() + ": " + err);
    }

    archive_read_free(a);
    if (entries.empty()) {
        return R::Err("Archive is empty: " + path.string());
    }
    return R::Ok(entries);
}

} // namespace platform
