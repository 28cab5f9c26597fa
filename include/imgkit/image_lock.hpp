#pragma once

#include "imgkit/types.hpp"

#include <string>
#include <vector>

namespace imgkit {

// ============================================================================
// ImagesLock (.imgpkg/images.yml)
// ============================================================================
//
//   apiVersion: imgpkg.k14s.io/v1alpha1
//   kind: ImagesLock
//   spec:
//     images:
//     - image: registry/repo@sha256:...
//       tag: v1
//       name: app
//       metadata: ...

struct ImageDesc {
    std::string image;          // Digest reference "repository@sha256:..."
    std::string tag;            // Tag the image was locked from, kept verbatim
    std::string name;
    std::string metadata;       // Opaque; a scalar value, or YAML text when metadata_is_yaml
    bool metadata_is_yaml = false;  // Mapping or sequence, written back as structured YAML
};

struct ImagesLock {
    std::string api_version = LOCK_API_VERSION;
    std::string kind = IMAGES_LOCK_KIND;
    std::vector<ImageDesc> images;
};

struct ImagesLockResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    ImagesLock lock;
};

ImagesLockResult parse_images_lock(const std::string& yaml_str);
ImagesLockResult read_images_lock(const std::string& path);

std::string serialize_images_lock(const ImagesLock& lock);

// ============================================================================
// BundleLock
// ============================================================================
//
//   apiVersion: imgpkg.k14s.io/v1alpha1
//   kind: BundleLock
//   spec:
//     image:
//       url: registry/repo@sha256:...
//       tag: v1

struct BundleLock {
    std::string api_version = LOCK_API_VERSION;
    std::string kind = BUNDLE_LOCK_KIND;
    std::string url;            // Digest reference of the bundle
    std::string tag;
};

struct BundleLockResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    BundleLock lock;
};

BundleLockResult parse_bundle_lock(const std::string& yaml_str);
BundleLockResult read_bundle_lock(const std::string& path);

std::string serialize_bundle_lock(const BundleLock& lock);

struct LockWriteResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
};

// Atomically replace `path` with `content`, owner read/write only
LockWriteResult write_lock_file(const std::string& path, const std::string& content);

} // namespace imgkit
