#pragma once

#include "imgkit/types.hpp"

#include <string>

namespace imgkit {

// ============================================================================
// Image References
// ============================================================================
//
// Accepted forms:
//   [registry/]repository[:tag]
//   [registry/]repository[:tag]@sha256:<64 hex>
//
// The first path component is a registry when it contains '.' or ':' or is
// "localhost". Weak validation fills in defaults (registry index.docker.io,
// the implicit "library/" namespace on Docker Hub, tag "latest"). Strict
// validation requires the registry, the full repository path and a tag or
// digest to be spelled out.

inline constexpr const char* DEFAULT_REGISTRY = "index.docker.io";
inline constexpr const char* DEFAULT_TAG = "latest";

enum class ReferenceValidation {
    Weak,
    Strict
};

struct Reference {
    std::string registry;       // e.g. "index.docker.io", "localhost:5000"
    std::string repository;     // e.g. "library/ubuntu"
    std::string tag;            // empty when digest-qualified
    std::string digest;         // "sha256:..." or empty

    // "registry/repository"
    std::string context_name() const;

    // Tag or digest, whichever addresses the artifact
    std::string identifier() const;

    // Fully-qualified form: context_name() + ":" + tag, or "@" + digest
    std::string name() const;

    bool is_digest() const { return !digest.empty(); }
};

struct ReferenceResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    Reference reference;
};

// Tag or digest reference
ReferenceResult parse_reference(const std::string& text,
                                ReferenceValidation validation = ReferenceValidation::Weak);

// Digest reference only; a tag-only reference is rejected
ReferenceResult parse_digest_reference(const std::string& text,
                                       ReferenceValidation validation = ReferenceValidation::Weak);

// Copy of `reference` addressing `digest` instead of its tag
Reference with_digest(const Reference& reference, const std::string& digest);

struct RelocateResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::string reference;      // "<repository>@<digest>"
};

// Replace the repository part of a "repo@digest" reference, keeping the digest
RelocateResult image_with_repository(const std::string& digest_ref, const std::string& repository);

} // namespace imgkit
