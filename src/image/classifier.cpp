#include "imgkit/classifier.hpp"

namespace imgkit {

ClassifyResult check_artifact_kind(const Manifest& manifest, PullIntent intent) {
    ClassifyResult result;

    if (intent == PullIntent::Image && manifest.is_bundle()) {
        result.kind = ErrorKind::Usage;
        result.error = "Expected bundle flag when pulling a bundle, please use -b instead of --image";
        return result;
    }

    if (intent == PullIntent::Bundle && !manifest.is_bundle()) {
        result.kind = ErrorKind::Usage;
        result.error = "Expected image flag when pulling an image or index, please use --image instead of -b";
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace imgkit
