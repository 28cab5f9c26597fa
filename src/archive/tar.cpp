#include "imgkit/tar.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <vector>

namespace imgkit {

// ============================================================================
// Tar Format Constants (POSIX ustar)
// ============================================================================

static constexpr size_t TAR_BLOCK_SIZE = 512;
static constexpr size_t TAR_NAME_SIZE = 100;
static constexpr size_t TAR_MODE_SIZE = 8;
static constexpr size_t TAR_UID_SIZE = 8;
static constexpr size_t TAR_GID_SIZE = 8;
static constexpr size_t TAR_SIZE_SIZE = 12;
static constexpr size_t TAR_MTIME_SIZE = 12;
static constexpr size_t TAR_CHKSUM_SIZE = 8;
static constexpr size_t TAR_LINKNAME_SIZE = 100;
static constexpr size_t TAR_MAGIC_SIZE = 6;
static constexpr size_t TAR_VERSION_SIZE = 2;
static constexpr size_t TAR_UNAME_SIZE = 32;
static constexpr size_t TAR_GNAME_SIZE = 32;
static constexpr size_t TAR_PREFIX_SIZE = 155;

// Largest value an 11-digit octal size field holds
static constexpr uint64_t TAR_MAX_OCTAL_SIZE = 077777777777ULL;

// Upper bound for PAX / GNU long-name payloads kept in memory
static constexpr uint64_t TAR_MAX_META_SIZE = 1024 * 1024;

static constexpr size_t COPY_CHUNK_SIZE = 64 * 1024;

// Tar type flags
static constexpr char TAR_REGTYPE = '0';
static constexpr char TAR_AREGTYPE = '\0';
static constexpr char TAR_LNKTYPE = '1';
static constexpr char TAR_SYMTYPE = '2';
static constexpr char TAR_DIRTYPE = '5';
static constexpr char TAR_CONTTYPE = '7';
static constexpr char TAR_PAXTYPE = 'x';
static constexpr char TAR_PAXGLOBALTYPE = 'g';
static constexpr char TAR_GNU_LONGNAME = 'L';
static constexpr char TAR_GNU_LONGLINK = 'K';

// Name of the PAX extended header record itself
static constexpr const char* PAX_HEADER_NAME = "././@PaxHeader";

// ============================================================================
// Tar Header Structure
// ============================================================================

#pragma pack(push, 1)
struct TarHeader {
    char name[TAR_NAME_SIZE];       // 0
    char mode[TAR_MODE_SIZE];       // 100
    char uid[TAR_UID_SIZE];         // 108
    char gid[TAR_GID_SIZE];         // 116
    char size[TAR_SIZE_SIZE];       // 124
    char mtime[TAR_MTIME_SIZE];     // 136
    char chksum[TAR_CHKSUM_SIZE];   // 148
    char typeflag;                   // 156
    char linkname[TAR_LINKNAME_SIZE]; // 157
    char magic[TAR_MAGIC_SIZE];     // 257
    char version[TAR_VERSION_SIZE]; // 263
    char uname[TAR_UNAME_SIZE];     // 265
    char gname[TAR_GNAME_SIZE];     // 297
    char devmajor[8];               // 329
    char devminor[8];               // 337
    char prefix[TAR_PREFIX_SIZE];   // 345
    char padding[12];               // 500
};
#pragma pack(pop)

static_assert(sizeof(TarHeader) == TAR_BLOCK_SIZE, "TarHeader must be 512 bytes");

// ============================================================================
// Helper Functions
// ============================================================================

namespace {

// Write an octal value with leading zeros into a fixed-size field
void write_octal(char* dest, size_t size, uint64_t value) {
    size_t digits = size - 1;
    dest[digits] = '\0';
    for (size_t i = digits; i > 0; --i) {
        dest[i - 1] = static_cast<char>('0' + (value & 7));
        value >>= 3;
    }
}

// Checksum field is treated as spaces during calculation
uint32_t calculate_checksum(const TarHeader& header) {
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&header);
    uint32_t sum = 0;

    for (size_t i = 0; i < sizeof(TarHeader); ++i) {
        if (i >= 148 && i < 156) {
            sum += ' ';
        } else {
            sum += bytes[i];
        }
    }

    return sum;
}

// Parse a numeric header field: octal text, or base-256 when the high bit of
// the first byte is set (GNU extension for large values)
uint64_t parse_numeric(const char* data, size_t size) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(data);
    if (size > 0 && (bytes[0] & 0x80) != 0) {
        uint64_t result = bytes[0] & 0x7f;
        for (size_t i = 1; i < size; ++i) {
            result = (result << 8) | bytes[i];
        }
        return result;
    }

    uint64_t result = 0;
    size_t i = 0;
    while (i < size && data[i] == ' ') ++i;
    for (; i < size && data[i] != '\0' && data[i] != ' '; ++i) {
        if (data[i] >= '0' && data[i] <= '7') {
            result = (result << 3) | static_cast<uint64_t>(data[i] - '0');
        }
    }
    return result;
}

size_t padding_for(uint64_t size) {
    return static_cast<size_t>((TAR_BLOCK_SIZE - (size % TAR_BLOCK_SIZE)) % TAR_BLOCK_SIZE);
}

// Place `name` into the ustar name/prefix fields. Returns false if it does not fit.
bool fit_ustar_name(const std::string& name, TarHeader& header) {
    if (name.size() <= TAR_NAME_SIZE) {
        std::memcpy(header.name, name.data(), name.size());
        return true;
    }

    // Split at a '/' so that prefix <= 155 and name <= 100. A trailing '/'
    // (directories) cannot be the split point.
    size_t search_end = std::min(name.size() - 2, TAR_PREFIX_SIZE);
    for (size_t split = search_end + 1; split-- > 1;) {
        if (name[split] != '/') continue;
        size_t rest = name.size() - split - 1;
        if (rest > TAR_NAME_SIZE) break;
        std::memcpy(header.prefix, name.data(), split);
        std::memcpy(header.name, name.data() + split + 1, rest);
        return true;
    }

    return false;
}

// Build a header with the normalized metadata. `name` must already fit.
TarHeader build_header(char typeflag, uint32_t mode, uint64_t size) {
    TarHeader header;
    std::memset(&header, 0, sizeof(header));

    write_octal(header.mode, TAR_MODE_SIZE, mode);
    write_octal(header.uid, TAR_UID_SIZE, 0);
    write_octal(header.gid, TAR_GID_SIZE, 0);
    write_octal(header.size, TAR_SIZE_SIZE, size);
    write_octal(header.mtime, TAR_MTIME_SIZE, 0);
    header.typeflag = typeflag;

    std::memcpy(header.magic, "ustar", 5);
    header.magic[5] = '\0';
    header.version[0] = '0';
    header.version[1] = '0';

    // uname/gname/devmajor/devminor stay zeroed
    return header;
}

void seal_checksum(TarHeader& header) {
    uint32_t checksum = calculate_checksum(header);

    // 6 octal digits + NUL + space
    char chksum_str[8];
    std::snprintf(chksum_str, sizeof(chksum_str), "%06o", checksum);
    std::memcpy(header.chksum, chksum_str, 6);
    header.chksum[6] = '\0';
    header.chksum[7] = ' ';
}

// "<len> path=<value>\n" where <len> counts the whole record including itself
std::string pax_record(const std::string& key, const std::string& value) {
    std::string body = " " + key + "=" + value + "\n";
    size_t length = body.size() + 1;
    for (;;) {
        size_t candidate = body.size() + std::to_string(length).size();
        if (candidate == length) break;
        length = candidate;
    }
    return std::to_string(length) + body;
}

bool is_zero_block(const char* block) {
    for (size_t i = 0; i < TAR_BLOCK_SIZE; ++i) {
        if (block[i] != 0) return false;
    }
    return true;
}

std::string field_string(const char* data, size_t size) {
    return std::string(data, strnlen(data, size));
}

std::string normalize_entry_path(std::string path) {
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    while (path.rfind("./", 0) == 0) {
        path = path.substr(2);
    }
    return path;
}

TarStatus tar_error(ErrorKind kind, const std::string& message) {
    TarStatus status;
    status.kind = kind;
    status.error = message;
    return status;
}

TarStatus tar_ok() {
    TarStatus status;
    status.ok = true;
    return status;
}

} // namespace

// ============================================================================
// TarWriter
// ============================================================================

TarWriter::TarWriter(std::ostream& out) : out_(out) {}

TarStatus TarWriter::write_block(const char* data, size_t size) {
    out_.write(data, static_cast<std::streamsize>(size));
    if (!out_) {
        return tar_error(ErrorKind::Io, "failed to write archive");
    }
    return tar_ok();
}

TarStatus TarWriter::write_pax_path(const std::string& name) {
    std::string record = pax_record("path", name);

    TarHeader header = build_header(TAR_PAXTYPE, TAR_FILE_MODE, record.size());
    std::memcpy(header.name, PAX_HEADER_NAME, std::strlen(PAX_HEADER_NAME));
    seal_checksum(header);

    auto status = write_block(reinterpret_cast<const char*>(&header), TAR_BLOCK_SIZE);
    if (!status.ok) return status;

    status = write_block(record.data(), record.size());
    if (!status.ok) return status;

    std::vector<char> zeros(padding_for(record.size()), 0);
    return write_block(zeros.data(), zeros.size());
}

TarStatus TarWriter::write_header(const TarEntry& entry) {
    if (finished_) {
        return tar_error(ErrorKind::Invariant, "archive already finished");
    }
    if (entry.path.empty()) {
        return tar_error(ErrorKind::Structural, "empty entry name");
    }
    if (entry.size > TAR_MAX_OCTAL_SIZE) {
        return tar_error(ErrorKind::Structural, "file too large for archive: " + entry.path);
    }

    std::string name = entry.path;
    char typeflag = TAR_REGTYPE;
    uint32_t mode = TAR_FILE_MODE;
    uint64_t size = entry.size;

    switch (entry.type) {
        case TarEntryType::Directory:
            name += '/';
            typeflag = TAR_DIRTYPE;
            mode = TAR_DIR_MODE;
            size = 0;
            break;
        case TarEntryType::RegularFile:
            break;
        default:
            return tar_error(ErrorKind::Structural,
                             "Expected file '" + entry.path + "' to be a regular file");
    }

    TarHeader header = build_header(typeflag, mode, size);
    if (!fit_ustar_name(name, header)) {
        auto status = write_pax_path(name);
        if (!status.ok) return status;
        std::memcpy(header.name, name.data(), TAR_NAME_SIZE);
    }
    seal_checksum(header);

    return write_block(reinterpret_cast<const char*>(&header), TAR_BLOCK_SIZE);
}

TarStatus TarWriter::write_directory(const std::string& path) {
    TarEntry entry;
    entry.path = path;
    entry.type = TarEntryType::Directory;
    return write_header(entry);
}

TarStatus TarWriter::write_file(const std::string& path, uint64_t size, std::istream& content) {
    TarEntry entry;
    entry.path = path;
    entry.type = TarEntryType::RegularFile;
    entry.size = size;

    auto status = write_header(entry);
    if (!status.ok) return status;

    std::vector<char> buffer(COPY_CHUNK_SIZE);
    uint64_t remaining = size;
    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
        content.read(buffer.data(), static_cast<std::streamsize>(want));
        size_t got = static_cast<size_t>(content.gcount());
        if (got != want) {
            return tar_error(ErrorKind::Io, "file size changed while archiving: " + path);
        }
        status = write_block(buffer.data(), got);
        if (!status.ok) return status;
        remaining -= got;
    }

    // Data that grew past the recorded size would be silently dropped
    if (content.peek() != std::char_traits<char>::eof()) {
        return tar_error(ErrorKind::Io, "file size changed while archiving: " + path);
    }

    std::vector<char> zeros(padding_for(size), 0);
    return write_block(zeros.data(), zeros.size());
}

TarStatus TarWriter::finish() {
    if (finished_) {
        return tar_ok();
    }
    std::vector<char> zeros(TAR_BLOCK_SIZE * 2, 0);
    auto status = write_block(zeros.data(), zeros.size());
    if (!status.ok) return status;

    out_.flush();
    if (!out_) {
        return tar_error(ErrorKind::Io, "failed to flush archive");
    }
    finished_ = true;
    return tar_ok();
}

// ============================================================================
// TarReader
// ============================================================================

TarReader::TarReader(std::istream& in) : in_(in) {}

TarStatus TarReader::skip_data() {
    uint64_t total = remaining_ + padding_;
    remaining_ = 0;
    padding_ = 0;
    if (total == 0) return tar_ok();

    in_.ignore(static_cast<std::streamsize>(total));
    if (static_cast<uint64_t>(in_.gcount()) != total) {
        return tar_error(ErrorKind::Structural, "truncated archive");
    }
    return tar_ok();
}

TarStatus TarReader::read_data(std::string& out) {
    if (remaining_ > TAR_MAX_META_SIZE) {
        return tar_error(ErrorKind::Structural, "extended header too large");
    }
    out.assign(static_cast<size_t>(remaining_), '\0');
    in_.read(out.data(), static_cast<std::streamsize>(remaining_));
    if (static_cast<uint64_t>(in_.gcount()) != remaining_) {
        return tar_error(ErrorKind::Structural, "truncated archive");
    }
    remaining_ = 0;
    return skip_data();
}

TarStatus TarReader::copy_data(std::ostream& out) {
    std::vector<char> buffer(COPY_CHUNK_SIZE);
    while (remaining_ > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(remaining_, buffer.size()));
        in_.read(buffer.data(), static_cast<std::streamsize>(want));
        size_t got = static_cast<size_t>(in_.gcount());
        if (got != want) {
            return tar_error(ErrorKind::Structural, "truncated archive");
        }
        out.write(buffer.data(), static_cast<std::streamsize>(got));
        if (!out) {
            return tar_error(ErrorKind::Io, "failed to write entry data");
        }
        remaining_ -= got;
    }
    return skip_data();
}

TarReadResult TarReader::next() {
    TarReadResult result;

    auto fail = [&result](const TarStatus& status) {
        result.kind = status.kind;
        result.error = status.error;
        return result;
    };

    auto skipped = skip_data();
    if (!skipped.ok) return fail(skipped);

    std::string long_name;
    std::string long_link;
    bool has_pax_size = false;
    uint64_t pax_size = 0;

    for (;;) {
        char block[TAR_BLOCK_SIZE];
        in_.read(block, TAR_BLOCK_SIZE);
        std::streamsize got = in_.gcount();

        if (got == 0) {
            result.ok = true;
            result.end = true;
            return result;
        }
        if (got != static_cast<std::streamsize>(TAR_BLOCK_SIZE)) {
            return fail(tar_error(ErrorKind::Structural, "truncated tar header"));
        }
        if (is_zero_block(block)) {
            result.ok = true;
            result.end = true;
            return result;
        }

        TarHeader header;
        std::memcpy(&header, block, TAR_BLOCK_SIZE);

        if (parse_numeric(header.chksum, TAR_CHKSUM_SIZE) != calculate_checksum(header)) {
            return fail(tar_error(ErrorKind::Structural, "invalid tar header checksum"));
        }

        std::string path;
        if (std::memcmp(header.magic, "ustar", 5) == 0 && header.prefix[0] != '\0') {
            path = field_string(header.prefix, TAR_PREFIX_SIZE) + "/";
        }
        path += field_string(header.name, TAR_NAME_SIZE);

        uint64_t size = parse_numeric(header.size, TAR_SIZE_SIZE);
        remaining_ = size;
        padding_ = padding_for(size);

        char typeflag = header.typeflag;

        if (typeflag == TAR_PAXTYPE) {
            std::string records;
            auto status = read_data(records);
            if (!status.ok) return fail(status);

            size_t pos = 0;
            while (pos < records.size()) {
                size_t space = records.find(' ', pos);
                if (space == std::string::npos) break;
                size_t length = 0;
                try {
                    length = std::stoul(records.substr(pos, space - pos));
                } catch (const std::exception&) {
                    return fail(tar_error(ErrorKind::Structural, "malformed PAX record"));
                }
                if (length == 0 || pos + length > records.size()) {
                    return fail(tar_error(ErrorKind::Structural, "malformed PAX record"));
                }
                std::string record = records.substr(space + 1, pos + length - space - 2);
                size_t eq = record.find('=');
                if (eq != std::string::npos) {
                    std::string key = record.substr(0, eq);
                    std::string value = record.substr(eq + 1);
                    if (key == "path") {
                        long_name = value;
                    } else if (key == "linkpath") {
                        long_link = value;
                    } else if (key == "size") {
                        try {
                            pax_size = std::stoull(value);
                            has_pax_size = true;
                        } catch (const std::exception&) {
                            return fail(tar_error(ErrorKind::Structural, "malformed PAX size"));
                        }
                    }
                }
                pos += length;
            }
            continue;
        }

        if (typeflag == TAR_PAXGLOBALTYPE) {
            auto status = skip_data();
            if (!status.ok) return fail(status);
            continue;
        }

        if (typeflag == TAR_GNU_LONGNAME || typeflag == TAR_GNU_LONGLINK) {
            std::string data;
            auto status = read_data(data);
            if (!status.ok) return fail(status);
            std::string value = data.substr(0, strnlen(data.c_str(), data.size()));
            if (typeflag == TAR_GNU_LONGNAME) {
                long_name = value;
            } else {
                long_link = value;
            }
            continue;
        }

        TarEntry& entry = result.entry;
        entry.path = normalize_entry_path(long_name.empty() ? path : long_name);
        entry.mode = static_cast<uint32_t>(parse_numeric(header.mode, TAR_MODE_SIZE) & 07777);
        entry.mtime = static_cast<int64_t>(parse_numeric(header.mtime, TAR_MTIME_SIZE));
        entry.link_target = long_link.empty() ? field_string(header.linkname, TAR_LINKNAME_SIZE)
                                              : long_link;

        if (has_pax_size) {
            size = pax_size;
            remaining_ = size;
            padding_ = padding_for(size);
        }

        switch (typeflag) {
            case TAR_REGTYPE:
            case TAR_AREGTYPE:
            case TAR_CONTTYPE:
                entry.type = TarEntryType::RegularFile;
                break;
            case TAR_DIRTYPE:
                entry.type = TarEntryType::Directory;
                break;
            case TAR_SYMTYPE:
                entry.type = TarEntryType::Symlink;
                break;
            case TAR_LNKTYPE:
                entry.type = TarEntryType::Hardlink;
                break;
            default:
                entry.type = TarEntryType::Other;
                break;
        }

        // Old-style archives mark directories only with a trailing slash
        if (typeflag == TAR_AREGTYPE && !path.empty() && path.back() == '/') {
            entry.type = TarEntryType::Directory;
        }

        entry.size = entry.type == TarEntryType::RegularFile ? size : 0;
        if (entry.type != TarEntryType::RegularFile) {
            // Directories and links carry no payload worth reading
            auto status = skip_data();
            if (!status.ok) return fail(status);
        }

        result.ok = true;
        return result;
    }
}

} // namespace imgkit
