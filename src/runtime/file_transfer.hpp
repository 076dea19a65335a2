/**
 * Sandbox file transfer rules
 *
 * Every path crossing into or out of a sandbox goes through
 * PathValidator before the container runtime is touched.
 */
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace warden::runtime {

// Extensions never accepted from callers
const std::vector<std::string> DANGEROUS_EXTENSIONS = {
    ".exe", ".dll", ".so", ".dylib",
    ".sh", ".bash", ".zsh",
    ".pyo", ".pyc",
};

struct TransferLimits {
    uint64_t max_file_size = 10 * 1024 * 1024;     // 10MB per file
    uint64_t max_total_size = 100 * 1024 * 1024;   // 100MB per upload
};

class PathValidator {
public:
    // Returns the normalized relative path ("./" segments dropped).
    // Throws PathSecurityError for empty paths, null bytes, "..",
    // absolute paths, characters outside [A-Za-z0-9_.-] and, unless
    // allow_dangerous is set, dangerous extensions.
    static std::string validate(const std::string& path, bool allow_dangerous = false);

    static bool is_safe(const std::string& path);

    static bool has_dangerous_extension(const std::string& component);
};

} // namespace warden::runtime
