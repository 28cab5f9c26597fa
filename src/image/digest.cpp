#include "imgkit/digest.hpp"

#include <fstream>

#include <openssl/evp.h>

namespace imgkit {

// ============================================================================
// SHA-256 Implementation (using OpenSSL 3.0+ EVP API)
// ============================================================================

namespace {

constexpr const char* SHA256_PREFIX = "sha256:";

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

bool finish_digest(EvpMdCtx& ctx, HashResult& result) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        result.kind = ErrorKind::Io;
        result.error = "EVP_DigestFinal_ex failed";
        return false;
    }

    result.digest = SHA256_PREFIX + bytes_to_hex(hash, hash_len);
    return true;
}

} // namespace

HashResult digest_of_bytes(const std::string& data) {
    HashResult result;

    EvpMdCtx ctx;
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        result.kind = ErrorKind::Io;
        result.error = "EVP_DigestInit_ex failed";
        return result;
    }

    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        result.kind = ErrorKind::Io;
        result.error = "EVP_DigestUpdate failed";
        return result;
    }

    if (!finish_digest(ctx, result)) {
        return result;
    }

    result.size = data.size();
    result.ok = true;
    return result;
}

HashResult digest_of_file(const std::string& file_path) {
    HashResult result;

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        result.kind = ErrorKind::Io;
        result.error = "failed to open file: " + file_path;
        return result;
    }

    EvpMdCtx ctx;
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        result.kind = ErrorKind::Io;
        result.error = "EVP_DigestInit_ex failed";
        return result;
    }

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
            result.kind = ErrorKind::Io;
            result.error = "EVP_DigestUpdate failed";
            return result;
        }
        result.size += static_cast<uint64_t>(file.gcount());
    }

    if (file.bad()) {
        result.kind = ErrorKind::Io;
        result.error = "failed to read file: " + file_path;
        return result;
    }

    if (!finish_digest(ctx, result)) {
        return result;
    }

    result.ok = true;
    return result;
}

bool is_valid_digest(const std::string& digest) {
    std::string prefix = SHA256_PREFIX;
    if (digest.size() != prefix.size() + 64 || digest.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    for (size_t i = prefix.size(); i < digest.size(); ++i) {
        char c = digest[i];
        bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        if (!hex) return false;
    }
    return true;
}

} // namespace imgkit
