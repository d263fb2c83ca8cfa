#include "tar.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace {
    la_ssize_t writeCallback(struct archive*, void* userData, const void* buffer, size_t length) {
        auto* data = static_cast<std::string*>(userData);
        data->append(static_cast<const char*>(buffer), length);
        return static_cast<la_ssize_t>(length);
    }

    void check(struct archive* a, int status, const std::string& what) {
        if (status < ARCHIVE_WARN) {
            std::string message = what + ": " + (archive_error_string(a) ? archive_error_string(a) : "unknown error");
            archive_write_free(a);
            throw std::runtime_error(message);
        }
    }
}

namespace Docker {
    std::string tarDirectory(const std::string& directory) {
        if (!std::filesystem::is_directory(directory)) {
            throw std::runtime_error("Context path is not a directory: " + directory);
        }

        // Sorted so the same tree always yields the same archive.
        std::vector<std::filesystem::directory_entry> entries;
        for (const auto& entry : std::filesystem::recursive_directory_iterator(directory)) {
            if (entry.is_directory() || entry.is_regular_file()) entries.push_back(entry);
        }
        std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) { return a.path() < b.path(); });

        std::string buffer;
        struct archive* a = archive_write_new();
        archive_write_set_format_pax_restricted(a);
        archive_write_add_filter_none(a);
        check(a, archive_write_open(a, &buffer, nullptr, writeCallback, nullptr), "Failed to open build archive");

        for (const auto& entry : entries) {
            std::string relPath = std::filesystem::relative(entry.path(), directory).generic_string();

            struct archive_entry* ae = archive_entry_new();
            archive_entry_set_pathname(ae, relPath.c_str());
            if (entry.is_directory()) {
                archive_entry_set_filetype(ae, AE_IFDIR);
                archive_entry_set_perm(ae, 0755);
                archive_entry_set_size(ae, 0);
            } else {
                archive_entry_set_filetype(ae, AE_IFREG);
                archive_entry_set_perm(ae, static_cast<int>(entry.status().permissions() & std::filesystem::perms::mask));
                archive_entry_set_size(ae, static_cast<la_int64_t>(entry.file_size()));
            }
            int status = archive_write_header(a, ae);
            archive_entry_free(ae);
            check(a, status, "Failed to add " + relPath);

            if (entry.is_directory()) continue;

            std::ifstream file(entry.path(), std::ios::binary);
            if (!file) {
                archive_write_free(a);
                throw std::runtime_error("Failed to open file: " + entry.path().string());
            }
            char chunk[8192];
            while (file) {
                file.read(chunk, sizeof(chunk));
                if (file.gcount() > 0 && archive_write_data(a, chunk, static_cast<size_t>(file.gcount())) < 0) {
                    check(a, ARCHIVE_FATAL, "Failed to write " + relPath);
                }
            }
        }

        check(a, archive_write_close(a), "Failed to finish build archive");
        archive_write_free(a);

        return buffer;
    }
}
