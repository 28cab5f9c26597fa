#pragma once

#include "imgkit/manifest.hpp"
#include "imgkit/types.hpp"

#include <string>

namespace imgkit {

// What the caller said it is pulling
enum class PullIntent {
    Image,
    Bundle
};

struct ClassifyResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
};

// Bundles may only be pulled as bundles and plain images only as images.
// A manifest is a bundle when its bundle annotation is exactly "true".
ClassifyResult check_artifact_kind(const Manifest& manifest, PullIntent intent);

} // namespace imgkit
