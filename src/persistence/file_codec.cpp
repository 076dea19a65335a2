#include "persistence/file_codec.hpp"
#include <spdlog/spdlog.h>
#include <zlib.h>

namespace warden::persistence {

namespace {

std::optional<std::string> deflate_bytes(const std::string& input) {
    uLongf bound = compressBound(static_cast<uLong>(input.size()));
    std::string output(bound, '\0');
    int rc = compress2(reinterpret_cast<Bytef*>(&output[0]), &bound,
                       reinterpret_cast<const Bytef*>(input.data()),
                       static_cast<uLong>(input.size()), Z_DEFAULT_COMPRESSION);
    if (rc != Z_OK) {
        spdlog::error("zlib compress failed: {}", rc);
        return std::nullopt;
    }
    output.resize(bound);
    return output;
}

std::optional<std::string> inflate_bytes(const char* data, size_t len, size_t max_size) {
    z_stream stream{};
    if (inflateInit(&stream) != Z_OK) {
        return std::nullopt;
    }
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
    stream.avail_in = static_cast<uInt>(len);

    std::string output;
    char chunk[16384];
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        stream.next_out = reinterpret_cast<Bytef*>(chunk);
        stream.avail_out = sizeof(chunk);
        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            inflateEnd(&stream);
            return std::nullopt;
        }
        output.append(chunk, sizeof(chunk) - stream.avail_out);
        if (output.size() > max_size) {
            inflateEnd(&stream);
            return std::nullopt;
        }
        if (rc == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
            // Input exhausted before the end of the stream
            inflateEnd(&stream);
            return std::nullopt;
        }
    }
    inflateEnd(&stream);
    return output;
}

} // namespace

std::string encode_file(const std::string& content, bool compress) {
    if (compress) {
        if (auto deflated = deflate_bytes(content)) {
            return std::string(1, CODEC_ZLIB) + *deflated;
        }
    }
    return std::string(1, CODEC_RAW) + content;
}

std::optional<std::string> decode_file(const std::string& stored, size_t max_size) {
    if (stored.empty()) {
        return std::nullopt;
    }
    switch (stored[0]) {
        case CODEC_RAW:
            if (stored.size() - 1 > max_size) return std::nullopt;
            return stored.substr(1);
        case CODEC_ZLIB:
            return inflate_bytes(stored.data() + 1, stored.size() - 1, max_size);
        default:
            return std::nullopt;
    }
}

} // namespace warden::persistence
