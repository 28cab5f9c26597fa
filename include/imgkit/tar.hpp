#pragma once

#include "imgkit/types.hpp"

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

namespace imgkit {

// ============================================================================
// Canonical Tar Stream
// ============================================================================
//
// POSIX ustar records with normalized metadata:
//   - mode: directories 0700, regular files 0600
//   - mtime 0, uid/gid 0, empty uname/gname
//   - directory names carry a trailing '/'
//   - names that do not fit the ustar name/prefix fields are carried in a
//     PAX extended header holding a single "path" record
// The same logical entries always produce the same bytes.

inline constexpr uint32_t TAR_DIR_MODE = 0700;
inline constexpr uint32_t TAR_FILE_MODE = 0600;

enum class TarEntryType {
    RegularFile,
    Directory,
    Symlink,    // read-side detection only
    Hardlink,   // read-side detection only
    Other       // devices, fifos, unknown type flags
};

struct TarEntry {
    std::string path;           // Relative path, forward slashes, no trailing '/'
    TarEntryType type = TarEntryType::RegularFile;
    uint64_t size = 0;          // Data size (0 for directories)
    uint32_t mode = 0;          // Permission bits as recorded in the header
    int64_t mtime = 0;
    std::string link_target;    // Only for Symlink/Hardlink
};

struct TarStatus {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
};

// Streams entries into `out`. The writer never seeks, so `out` may be a file,
// a string stream or a pipe.
class TarWriter {
public:
    explicit TarWriter(std::ostream& out);

    TarWriter(const TarWriter&) = delete;
    TarWriter& operator=(const TarWriter&) = delete;

    // Directory record (mode TAR_DIR_MODE)
    TarStatus write_directory(const std::string& path);

    // Regular-file record (mode TAR_FILE_MODE) followed by exactly `size`
    // bytes read from `content`. Fails if `content` ends early.
    TarStatus write_file(const std::string& path, uint64_t size, std::istream& content);

    // Writes the two zero blocks terminating the archive
    TarStatus finish();

private:
    TarStatus write_header(const TarEntry& entry);
    TarStatus write_pax_path(const std::string& name);
    TarStatus write_block(const char* data, size_t size);

    std::ostream& out_;
    bool finished_ = false;
};

struct TarReadResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    bool end = false;           // True once the end-of-archive marker (or EOF) is reached
    TarEntry entry;
};

// Reads entries back from a tar stream. Understands ustar, PAX "path"/"size"
// records and GNU long names; PAX global headers are skipped.
class TarReader {
public:
    explicit TarReader(std::istream& in);

    TarReader(const TarReader&) = delete;
    TarReader& operator=(const TarReader&) = delete;

    // Advance to the next entry. Unread data of the previous entry is skipped.
    TarReadResult next();

    // Copy the current entry's data to `out` and position at the next header
    TarStatus copy_data(std::ostream& out);

    // Discard the current entry's data
    TarStatus skip_data();

private:
    TarStatus read_data(std::string& out);

    std::istream& in_;
    uint64_t remaining_ = 0;
    uint64_t padding_ = 0;
};

} // namespace imgkit
