#pragma once

#include "imgkit/manifest.hpp"
#include "imgkit/reference.hpp"
#include "imgkit/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>

namespace imgkit {

// ============================================================================
// Registry Capabilities
// ============================================================================

struct ManifestResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    Manifest manifest;          // manifest.digest is the resolved digest
};

struct DigestResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::string digest;
};

struct ExistsResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    bool found = false;
};

struct BlobResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::string path;
};

struct PushResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::string digest;
};

// Read side of a registry
class ImagesMetadata {
public:
    virtual ~ImagesMetadata() = default;

    // Fetch and parse the manifest `reference` points at (tag or digest)
    virtual ManifestResult manifest(const Reference& reference) = 0;

    // Digest currently addressed by `reference`
    virtual DigestResult resolve(const Reference& reference) = 0;

    // Whether a manifest exists at a digest reference. A miss is ok with found=false.
    virtual ExistsResult exists(const Reference& reference) = 0;

    // Download `blob` from the repository of `reference` into `dest_path`,
    // verifying its digest
    virtual BlobResult fetch_blob(const Reference& reference, const Descriptor& blob,
                                  const std::string& dest_path) = 0;
};

// Write side of a registry
class ImagesWriter {
public:
    virtual ~ImagesWriter() = default;

    // Upload the file at `path` as `blob`; a blob already present is not re-sent
    virtual PushResult push_blob(const Reference& reference, const Descriptor& blob,
                                 const std::string& path) = 0;

    // Store `content` under the tag (or digest) of `reference`
    virtual PushResult push_manifest(const Reference& reference, const std::string& media_type,
                                     const std::string& content) = 0;
};

// ============================================================================
// Configuration
// ============================================================================

struct RegistryOptions {
    std::string username;
    std::string password;
    std::string token;              // Pre-issued bearer token
    std::string ca_cert_path;
    bool verify_certs = true;
    bool insecure = false;          // Plain HTTP for every registry
    long connect_timeout_seconds = 30;
    long timeout_seconds = 300;
};

// Values given on the command line; unset fields fall back to the environment
struct RegistryFlags {
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::string> token;
    std::optional<std::string> ca_cert_path;
    std::optional<bool> verify_certs;
    std::optional<bool> insecure;
};

// Priority: flag > IMGKIT_* environment variable > default
//   IMGKIT_USERNAME, IMGKIT_PASSWORD, IMGKIT_TOKEN,
//   IMGKIT_REGISTRY_CA_CERT_PATH, IMGKIT_REGISTRY_VERIFY_CERTS,
//   IMGKIT_REGISTRY_INSECURE
RegistryOptions resolve_registry_options(const RegistryFlags& flags);

// ============================================================================
// HTTP Registry Client
// ============================================================================

struct HttpRequest {
    std::string method = "GET";     // GET, HEAD, POST, PUT
    std::string url;
    std::vector<std::string> headers;
    std::string body;               // Request body for POST/PUT
    std::string upload_path;        // PUT body streamed from this file instead
    std::string download_path;      // Response body streamed to this file instead
};

struct HttpResponse {
    bool ok = false;                // Transport succeeded (any HTTP status)
    std::string error;
    long status = 0;
    std::map<std::string, std::string> headers;     // Lowercased names, last response only
    std::string body;
};

// OCI distribution API client (libcurl). Plain HTTP is used for localhost,
// 127.0.0.1 and when `insecure` is set. Handles Bearer token and Basic auth
// challenges; never retries otherwise.
class Registry : public ImagesMetadata, public ImagesWriter {
public:
    Registry(RegistryOptions options, spdlog::logger& log);

    ManifestResult manifest(const Reference& reference) override;
    DigestResult resolve(const Reference& reference) override;
    ExistsResult exists(const Reference& reference) override;
    BlobResult fetch_blob(const Reference& reference, const Descriptor& blob,
                          const std::string& dest_path) override;

    PushResult push_blob(const Reference& reference, const Descriptor& blob,
                         const std::string& path) override;
    PushResult push_manifest(const Reference& reference, const std::string& media_type,
                             const std::string& content) override;

private:
    std::string base_url(const Reference& reference) const;

    // Perform `request` against the repository of `reference`, answering an
    // auth challenge for `actions` ("pull" or "pull,push") once
    HttpResponse send(const Reference& reference, const std::string& actions, HttpRequest request);

    std::optional<std::string> fetch_token(const std::string& challenge, const std::string& scope,
                                           std::string& error);

    RegistryOptions options_;
    spdlog::logger& log_;
    std::map<std::string, std::string> tokens_;     // "<registry> <scope>" -> bearer token
};

} // namespace imgkit
