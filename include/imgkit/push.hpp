#pragma once

#include "imgkit/registry.hpp"
#include "imgkit/types.hpp"

#include <string>
#include <vector>

#include <spdlog/logger.h>

namespace imgkit {

// ============================================================================
// Push
// ============================================================================

struct PushOptions {
    std::string reference;              // Tag reference to push to
    std::vector<std::string> files;     // Files and directories, archived in order
    std::vector<std::string> exclusions;
    bool bundle = false;
    std::string lock_output;            // Optional lock file to write
};

struct PushOutcome {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::string reference;              // "<registry/repository>@<digest>"
    std::string manifest_digest;
    std::string layer_digest;
};

// Package the inputs as a single gzip layer, upload layer, config and OCI
// manifest, and tag the manifest. A bundle carries the bundle annotation and
// needs exactly one input directory holding .imgpkg/images.yml; a plain image
// must not contain one. With `lock_output` set, a BundleLock (bundle) or an
// ImagesLock with the single pushed image (image) is written there.
PushOutcome run_push(const PushOptions& options, ImagesWriter& registry, spdlog::logger& ui);

} // namespace imgkit
