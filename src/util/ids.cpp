#include "util/ids.hpp"
#include <cstdint>
#include <mutex>
#include <random>

namespace warden::util {

std::string random_hex(size_t length) {
    static std::mutex mutex;
    static std::mt19937_64 engine{std::random_device{}()};
    static const char* digits = "0123456789abcdef";

    std::lock_guard<std::mutex> lock(mutex);
    std::uniform_int_distribution<int> dist(0, 15);
    std::string out;
    out.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        out += digits[dist(engine)];
    }
    return out;
}

std::string base64_encode(const std::string& bytes) {
    static const char* table =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);
    size_t i = 0;
    while (i + 2 < bytes.size()) {
        uint32_t n = (static_cast<uint8_t>(bytes[i]) << 16) |
                     (static_cast<uint8_t>(bytes[i + 1]) << 8) |
                      static_cast<uint8_t>(bytes[i + 2]);
        out += table[(n >> 18) & 63];
        out += table[(n >> 12) & 63];
        out += table[(n >> 6) & 63];
        out += table[n & 63];
        i += 3;
    }
    size_t rem = bytes.size() - i;
    if (rem == 1) {
        uint32_t n = static_cast<uint8_t>(bytes[i]) << 16;
        out += table[(n >> 18) & 63];
        out += table[(n >> 12) & 63];
        out += "==";
    } else if (rem == 2) {
        uint32_t n = (static_cast<uint8_t>(bytes[i]) << 16) |
                     (static_cast<uint8_t>(bytes[i + 1]) << 8);
        out += table[(n >> 18) & 63];
        out += table[(n >> 12) & 63];
        out += table[(n >> 6) & 63];
        out += '=';
    }
    return out;
}

} // namespace warden::util
