#pragma once

#include "imgkit/lock_rewriter.hpp"
#include "imgkit/registry.hpp"
#include "imgkit/types.hpp"

#include <string>

#include <spdlog/logger.h>

namespace imgkit {

// ============================================================================
// Reference Source
// ============================================================================

enum class SourceKind {
    Image,
    Bundle,
    Lock        // Path to a BundleLock file
};

struct ReferenceSource {
    SourceKind kind = SourceKind::Image;
    std::string value;
};

struct SourceResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    ReferenceSource source;
};

// Exactly one of the three must be non-empty
SourceResult select_reference_source(const std::string& image, const std::string& bundle,
                                     const std::string& lock_path);

// "/", "." and ".." are never used as a pull destination
bool is_disallowed_output_path(const std::string& output_path);

// ============================================================================
// Pull
// ============================================================================

struct PullOptions {
    std::string image;
    std::string bundle;
    std::string lock_path;
    std::string output_path;
};

struct PullResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::string reference;      // "<registry/repository>@<digest>" that was pulled
    bool bundle = false;
    RewriteOutcome rewrite = RewriteOutcome::NoImages;  // Bundle source only
};

// Resolve the source, check the artifact kind, replace `output_path` with the
// artifact's contents and, for bundles named directly, relocate the bundle's
// image lock into the bundle repository. Source and output path problems are
// reported before the registry or the filesystem is touched.
PullResult run_pull(const PullOptions& options, ImagesMetadata& registry, spdlog::logger& ui);

} // namespace imgkit
