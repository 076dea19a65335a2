#pragma once
#include <string>

namespace warden::util {

// True if the bytes form well-formed UTF-8
bool is_valid_utf8(const std::string& bytes);

// Copy of bytes with every ill-formed sequence replaced by U+FFFD
std::string sanitize_utf8(const std::string& bytes);

} // namespace warden::util
