#include "runtime/file_transfer.hpp"
#include "util/errors.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace warden::runtime {

namespace {

const std::regex COMPONENT_PATTERN("^[A-Za-z0-9_.\\-]+$");

std::vector<std::string> split_components(const std::string& path) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        parts.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return parts;
}

} // namespace

bool PathValidator::has_dangerous_extension(const std::string& component) {
    size_t dot = component.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return false;
    }
    std::string ext = component.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::find(DANGEROUS_EXTENSIONS.begin(), DANGEROUS_EXTENSIONS.end(), ext)
        != DANGEROUS_EXTENSIONS.end();
}

std::string PathValidator::validate(const std::string& path, bool allow_dangerous) {
    if (path.empty()) {
        throw PathSecurityError("path must not be empty");
    }
    if (path.find('\0') != std::string::npos) {
        throw PathSecurityError("path contains a null byte");
    }
    if (path.front() == '/') {
        throw PathSecurityError("absolute paths are not allowed");
    }

    std::string normalized;
    for (const auto& part : split_components(path)) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            throw PathSecurityError("path traversal is not allowed");
        }
        if (!std::regex_match(part, COMPONENT_PATTERN)) {
            throw PathSecurityError("invalid characters in path component: " + part);
        }
        if (!allow_dangerous && has_dangerous_extension(part)) {
            throw PathSecurityError("file type not allowed: " + part);
        }
        if (!normalized.empty()) normalized += '/';
        normalized += part;
    }

    if (normalized.empty()) {
        throw PathSecurityError("path does not name a file");
    }
    return normalized;
}

bool PathValidator::is_safe(const std::string& path) {
    try {
        validate(path);
        return true;
    } catch (const PathSecurityError&) {
        return false;
    }
}

} // namespace warden::runtime
