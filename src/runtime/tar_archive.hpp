/**
 * Minimal ustar codec for sandbox file transfer
 *
 * Writes regular files (plus their parent directories) with fixed
 * ownership and reads back the single member of an archive stream.
 */
#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace warden::runtime {

struct TarEntry {
    std::string path;      // relative, '/'-separated
    std::string content;
};

struct TarOptions {
    uint32_t uid = 1000;
    uint32_t gid = 1000;
    uint32_t file_mode = 0644;
    uint32_t dir_mode = 0755;
    int64_t mtime = 0;     // 0 = now
};

// Throws PathSecurityError if a path cannot be represented in ustar
std::string write_tar(const std::vector<TarEntry>& entries, const TarOptions& options = {});

struct TarFile {
    std::string name;
    std::string content;
};

// Return the first member of the archive, skipping pax/GNU metadata
// headers. A first member that is not a regular file throws
// NotAFileError. The header size is checked against max_size before
// any content is copied; larger members throw FileSizeError. Malformed
// archives throw warden::Error.
TarFile read_first_file(const std::string& archive, uint64_t max_size);

} // namespace warden::runtime
