#pragma once

#include "imgkit/types.hpp"

#include <cstdint>
#include <string>

namespace imgkit {

// ============================================================================
// Content Digests ("sha256:<64 lowercase hex>")
// ============================================================================

struct HashResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::string digest;         // "sha256:<hex>"
    uint64_t size = 0;          // Number of bytes hashed
};

HashResult digest_of_bytes(const std::string& data);
HashResult digest_of_file(const std::string& file_path);

// Accepts only "sha256:" followed by 64 lowercase hex characters
bool is_valid_digest(const std::string& digest);

} // namespace imgkit
