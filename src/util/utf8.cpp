#include "util/utf8.hpp"
#include <cstdint>

namespace warden::util {

namespace {

constexpr const char* REPLACEMENT = "\xEF\xBF\xBD";

// Length of the well-formed sequence starting at pos, or 0 if ill-formed
size_t sequence_length(const std::string& s, size_t pos) {
    auto byte = [&](size_t i) { return static_cast<uint8_t>(s[i]); };
    uint8_t lead = byte(pos);
    size_t remaining = s.size() - pos;

    if (lead < 0x80) return 1;

    size_t len = 0;
    uint8_t lo = 0x80, hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
        if (lead == 0xE0) lo = 0xA0;
        if (lead == 0xED) hi = 0x9F;   // no surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
        if (lead == 0xF0) lo = 0x90;
        if (lead == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }

    if (remaining < len) return 0;

    uint8_t second = byte(pos + 1);
    if (second < lo || second > hi) return 0;
    for (size_t i = 2; i < len; ++i) {
        uint8_t cont = byte(pos + i);
        if (cont < 0x80 || cont > 0xBF) return 0;
    }
    return len;
}

} // namespace

bool is_valid_utf8(const std::string& bytes) {
    size_t pos = 0;
    while (pos < bytes.size()) {
        size_t len = sequence_length(bytes, pos);
        if (len == 0) return false;
        pos += len;
    }
    return true;
}

std::string sanitize_utf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());
    size_t pos = 0;
    while (pos < bytes.size()) {
        size_t len = sequence_length(bytes, pos);
        if (len == 0) {
            out += REPLACEMENT;
            pos += 1;
        } else {
            out.append(bytes, pos, len);
            pos += len;
        }
    }
    return out;
}

} // namespace warden::util
