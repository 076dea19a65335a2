#pragma once
#include <cstddef>
#include <string>

namespace warden::util {

// Random lowercase hex string of the given length
std::string random_hex(size_t length);

std::string base64_encode(const std::string& bytes);

} // namespace warden::util
