/**
 * Stored file encoding
 *
 * Every stored file value starts with a one-byte codec tag so a reader
 * decodes it whatever its own compression setting:
 *   'z' zlib stream follows
 *   'r' raw bytes follow
 */
#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace warden::persistence {

constexpr char CODEC_ZLIB = 'z';
constexpr char CODEC_RAW = 'r';

std::string encode_file(const std::string& content, bool compress);

// nullopt for an unknown tag, a corrupt stream or output above max_size
std::optional<std::string> decode_file(const std::string& stored, size_t max_size);

} // namespace warden::persistence
