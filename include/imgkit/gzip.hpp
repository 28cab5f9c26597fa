#pragma once

#include "imgkit/types.hpp"

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

namespace imgkit {

// ============================================================================
// Deterministic Gzip
// ============================================================================
//
// Compression writes a fixed member header: mtime=0, no original filename,
// no comment, OS=255 (unknown). Identical input yields identical output.

struct GzipResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    uint64_t bytes_in = 0;
    uint64_t bytes_out = 0;
};

GzipResult gzip_compress(std::istream& in, std::ostream& out);

// Accepts concatenated gzip members
GzipResult gzip_decompress(std::istream& in, std::ostream& out);

GzipResult gzip_compress_file(const std::string& src_path, const std::string& dst_path);
GzipResult gzip_decompress_file(const std::string& src_path, const std::string& dst_path);

// True if the file starts with the gzip magic bytes
bool has_gzip_magic(const std::string& path);

} // namespace imgkit
