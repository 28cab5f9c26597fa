#pragma once

#include "imgkit/types.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace imgkit {

// ============================================================================
// OCI / Docker v2 Image Manifests
// ============================================================================

struct Descriptor {
    std::string media_type;
    std::string digest;
    int64_t size = 0;
    std::map<std::string, std::string> annotations;
};

struct Manifest {
    int schema_version = 2;
    std::string media_type;
    Descriptor config;
    std::vector<Descriptor> layers;
    std::map<std::string, std::string> annotations;

    // Filled by whoever fetched or serialized the manifest
    std::string digest;         // Digest of `raw`
    std::string raw;            // Bytes exactly as stored in the registry

    // True when the bundle annotation is present with the literal value "true"
    bool is_bundle() const;
};

struct ManifestParseResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    Manifest manifest;
};

// Parse an image manifest. `content_type` (from the registry response) is used
// when the document omits mediaType. Index / manifest-list documents are
// rejected.
ManifestParseResult parse_manifest(const std::string& json_str,
                                   const std::string& content_type = "");

// Compact JSON with sorted keys; the same manifest always yields the same bytes
std::string serialize_manifest(const Manifest& manifest);

bool is_index_media_type(const std::string& media_type);

// True for layer media types carrying gzip-compressed tar data
bool is_gzip_layer_media_type(const std::string& media_type);

// Minimal image config: no timestamps, no history, rootfs.diff_ids in layer order
std::string make_image_config(const std::vector<std::string>& diff_ids);

} // namespace imgkit
