#pragma once

#include "imgkit/reference.hpp"
#include "imgkit/registry.hpp"
#include "imgkit/types.hpp"

#include <string>

#include <spdlog/logger.h>

namespace imgkit {

// ============================================================================
// Bundle Lock Relocation
// ============================================================================

enum class RewriteOutcome {
    NoImages,       // Lock lists no images; nothing was looked up
    Skipped,        // At least one image is missing from the bundle repo; file untouched
    Rewritten       // Every image relocated and the file replaced
};

struct RewriteResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    RewriteOutcome outcome = RewriteOutcome::NoImages;
};

// Point every image of `<bundle_dir>/.imgpkg/images.yml` at the repository of
// `bundle`, keeping digests, tags, names and metadata. Each relocated
// reference must exist in the registry; the first one that does not (or whose
// lookup fails) abandons the rewrite and leaves the file as it was.
RewriteResult rewrite_image_lock(const std::string& bundle_dir, const Reference& bundle,
                                 ImagesMetadata& metadata, spdlog::logger& ui);

} // namespace imgkit
