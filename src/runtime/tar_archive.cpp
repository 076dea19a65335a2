#include "runtime/tar_archive.hpp"
#include "util/errors.hpp"
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <optional>
#include <set>

namespace warden::runtime {

namespace {

constexpr size_t BLOCK = 512;

// ustar header field offsets
constexpr size_t NAME_OFF = 0, NAME_LEN = 100;
constexpr size_t MODE_OFF = 100;
constexpr size_t UID_OFF = 108;
constexpr size_t GID_OFF = 116;
constexpr size_t SIZE_OFF = 124, SIZE_LEN = 12;
constexpr size_t MTIME_OFF = 136;
constexpr size_t CHKSUM_OFF = 148, CHKSUM_LEN = 8;
constexpr size_t TYPE_OFF = 156;
constexpr size_t MAGIC_OFF = 257;
constexpr size_t VERSION_OFF = 263;
constexpr size_t PREFIX_OFF = 345, PREFIX_LEN = 155;

void put_octal(char* field, size_t width, uint64_t value) {
    // width includes the trailing NUL
    std::snprintf(field, width, "%0*llo", static_cast<int>(width - 1),
                  static_cast<unsigned long long>(value));
}

void put_string(char* field, size_t width, const std::string& value) {
    std::memcpy(field, value.data(), std::min(width, value.size()));
}

// Split a path into ustar (prefix, name)
std::pair<std::string, std::string> split_name(const std::string& path) {
    if (path.size() <= NAME_LEN) {
        return {"", path};
    }
    size_t slash = path.rfind('/', PREFIX_LEN);
    while (slash != std::string::npos) {
        std::string prefix = path.substr(0, slash);
        std::string name = path.substr(slash + 1);
        if (prefix.size() <= PREFIX_LEN && name.size() <= NAME_LEN && !name.empty()) {
            return {prefix, name};
        }
        if (slash == 0) break;
        slash = path.rfind('/', slash - 1);
    }
    throw PathSecurityError("path too long for archive: " + path);
}

std::string make_header(const std::string& path, char type, uint64_t size,
                        uint32_t mode, const TarOptions& options, int64_t mtime) {
    std::string header(BLOCK, '\0');
    char* h = &header[0];

    auto [prefix, name] = split_name(path);
    put_string(h + NAME_OFF, NAME_LEN, name);
    put_octal(h + MODE_OFF, 8, mode);
    put_octal(h + UID_OFF, 8, options.uid);
    put_octal(h + GID_OFF, 8, options.gid);
    put_octal(h + SIZE_OFF, SIZE_LEN, size);
    put_octal(h + MTIME_OFF, 12, static_cast<uint64_t>(mtime));
    h[TYPE_OFF] = type;
    std::memcpy(h + MAGIC_OFF, "ustar", 6);
    std::memcpy(h + VERSION_OFF, "00", 2);
    put_string(h + PREFIX_OFF, PREFIX_LEN, prefix);

    // Checksum is computed with the checksum field set to spaces
    std::memset(h + CHKSUM_OFF, ' ', CHKSUM_LEN);
    unsigned int sum = 0;
    for (size_t i = 0; i < BLOCK; ++i) {
        sum += static_cast<unsigned char>(h[i]);
    }
    std::snprintf(h + CHKSUM_OFF, 7, "%06o", sum);
    h[CHKSUM_OFF + 6] = '\0';
    h[CHKSUM_OFF + 7] = ' ';
    return header;
}

void pad_to_block(std::string& out) {
    size_t rem = out.size() % BLOCK;
    if (rem != 0) {
        out.append(BLOCK - rem, '\0');
    }
}

// Parse an octal numeric field; nullopt for base-256 or garbage
std::optional<uint64_t> parse_octal(const char* field, size_t width) {
    if (static_cast<unsigned char>(field[0]) & 0x80) {
        return std::nullopt;
    }
    uint64_t value = 0;
    size_t i = 0;
    while (i < width && (field[i] == ' ' || field[i] == '\0')) ++i;
    for (; i < width && field[i] >= '0' && field[i] <= '7'; ++i) {
        value = value * 8 + static_cast<uint64_t>(field[i] - '0');
    }
    for (; i < width; ++i) {
        if (field[i] != ' ' && field[i] != '\0') return std::nullopt;
    }
    return value;
}

std::string field_string(const char* field, size_t width) {
    size_t len = strnlen(field, width);
    return std::string(field, len);
}

bool is_zero_block(const char* block) {
    for (size_t i = 0; i < BLOCK; ++i) {
        if (block[i] != '\0') return false;
    }
    return true;
}

// pax extended/global headers and GNU long name/link records
bool is_metadata_type(char type) {
    return type == 'x' || type == 'g' || type == 'L' || type == 'K';
}

} // namespace

std::string write_tar(const std::vector<TarEntry>& entries, const TarOptions& options) {
    int64_t mtime = options.mtime != 0 ? options.mtime : static_cast<int64_t>(std::time(nullptr));
    std::string out;
    std::set<std::string> dirs_written;

    for (const auto& entry : entries) {
        // Parent directories first so extraction assigns our ownership
        size_t pos = entry.path.find('/');
        while (pos != std::string::npos) {
            std::string dir = entry.path.substr(0, pos) + "/";
            if (dirs_written.insert(dir).second) {
                out += make_header(dir, '5', 0, options.dir_mode, options, mtime);
            }
            pos = entry.path.find('/', pos + 1);
        }

        out += make_header(entry.path, '0', entry.content.size(), options.file_mode, options, mtime);
        out += entry.content;
        pad_to_block(out);
    }

    // End-of-archive marker
    out.append(BLOCK * 2, '\0');
    return out;
}

TarFile read_first_file(const std::string& archive, uint64_t max_size) {
    size_t offset = 0;
    while (offset + BLOCK <= archive.size()) {
        const char* header = archive.data() + offset;
        if (is_zero_block(header)) {
            break;
        }

        auto size = parse_octal(header + SIZE_OFF, SIZE_LEN);
        if (!size) {
            throw FileSizeError("archive member size not representable");
        }
        char type = header[TYPE_OFF];
        size_t data_offset = offset + BLOCK;
        uint64_t padded = (*size + BLOCK - 1) / BLOCK * BLOCK;
        std::string prefix = field_string(header + PREFIX_OFF, PREFIX_LEN);
        std::string name = field_string(header + NAME_OFF, NAME_LEN);
        std::string member = prefix.empty() ? name : prefix + "/" + name;

        if (type != '0' && type != '\0' && !is_metadata_type(type)) {
            throw NotAFileError(member + " is not a regular file");
        }
        if (type == '0' || type == '\0') {
            if (*size > max_size) {
                throw FileSizeError("file size " + std::to_string(*size) +
                                    " exceeds limit of " + std::to_string(max_size) + " bytes");
            }
            if (data_offset + *size > archive.size()) {
                throw Error("truncated archive");
            }

            TarFile file;
            file.name = member;
            file.content = archive.substr(data_offset, static_cast<size_t>(*size));
            return file;
        }

        // pax/GNU extension header describing the next member
        if (data_offset + padded > archive.size() && padded > 0) {
            throw Error("truncated archive");
        }
        offset = data_offset + static_cast<size_t>(padded);
    }
    throw Error("archive contains no regular file");
}

} // namespace warden::runtime
