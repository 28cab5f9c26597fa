#pragma once

#include <string>

namespace imgkit {

// ============================================================================
// Error Classification
// ============================================================================

// Every fallible operation reports one of these alongside its message.
enum class ErrorKind {
    None,
    Usage,       // Caller asked for something inconsistent; nothing was touched
    Io,          // Filesystem stat/open/read/write failure (message names the path)
    Structural,  // Unsupported entry or malformed document
    Invariant,   // Internally constructed value failed validation
    Registry     // Transport, HTTP status, auth or digest verification failure
};

const char* error_kind_name(ErrorKind kind);

// ============================================================================
// Well-Known Names
// ============================================================================

// Manifest annotation marking an artifact as a bundle (value "true")
inline constexpr const char* BUNDLE_ANNOTATION = "io.k14s.imgpkg.bundle";

// Lock document location inside a materialized bundle
inline constexpr const char* BUNDLE_DIR = ".imgpkg";
inline constexpr const char* IMAGE_LOCK_FILE = "images.yml";

inline constexpr const char* LOCK_API_VERSION = "imgpkg.k14s.io/v1alpha1";
inline constexpr const char* BUNDLE_LOCK_KIND = "BundleLock";
inline constexpr const char* IMAGES_LOCK_KIND = "ImagesLock";

// Media types
inline constexpr const char* MEDIA_TYPE_OCI_MANIFEST = "application/vnd.oci.image.manifest.v1+json";
inline constexpr const char* MEDIA_TYPE_OCI_INDEX = "application/vnd.oci.image.index.v1+json";
inline constexpr const char* MEDIA_TYPE_OCI_CONFIG = "application/vnd.oci.image.config.v1+json";
inline constexpr const char* MEDIA_TYPE_OCI_LAYER = "application/vnd.oci.image.layer.v1.tar";
inline constexpr const char* MEDIA_TYPE_OCI_LAYER_GZIP = "application/vnd.oci.image.layer.v1.tar+gzip";
inline constexpr const char* MEDIA_TYPE_DOCKER_MANIFEST = "application/vnd.docker.distribution.manifest.v2+json";
inline constexpr const char* MEDIA_TYPE_DOCKER_MANIFEST_LIST = "application/vnd.docker.distribution.manifest.list.v2+json";
inline constexpr const char* MEDIA_TYPE_DOCKER_LAYER_GZIP = "application/vnd.docker.image.rootfs.diff.tar.gzip";

} // namespace imgkit
