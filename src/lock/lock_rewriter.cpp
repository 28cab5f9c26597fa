#include "imgkit/lock_rewriter.hpp"
#include "imgkit/image_lock.hpp"
#include "imgkit/platform.hpp"

#include <vector>

namespace imgkit {

RewriteResult rewrite_image_lock(const std::string& bundle_dir, const Reference& bundle,
                                 ImagesMetadata& metadata, spdlog::logger& ui) {
    RewriteResult result;

    std::string lock_path = join_path(join_path(bundle_dir, BUNDLE_DIR), IMAGE_LOCK_FILE);
    auto loaded = read_images_lock(lock_path);
    if (!loaded.ok) {
        result.kind = loaded.kind;
        result.error = "Reading image lock file: " + loaded.error;
        return result;
    }

    ImagesLock lock = std::move(loaded.lock);
    if (lock.images.empty()) {
        result.outcome = RewriteOutcome::NoImages;
        result.ok = true;
        return result;
    }

    ui.info("Locating image lock file images...");

    std::string bundle_repo = bundle.context_name();
    std::vector<ImageDesc> relocated;
    relocated.reserve(lock.images.size());

    for (const auto& image : lock.images) {
        auto moved = image_with_repository(image.image, bundle_repo);
        if (!moved.ok) {
            result.kind = moved.kind;
            result.error = moved.error;
            return result;
        }

        auto candidate = parse_digest_reference(moved.reference, ReferenceValidation::Strict);
        if (!candidate.ok) {
            result.kind = ErrorKind::Invariant;
            result.error = "relocated reference '" + moved.reference + "' is invalid: " + candidate.error;
            return result;
        }

        auto found = metadata.exists(candidate.reference);
        if (!found.ok) {
            ui.debug("lookup of {} failed: {}", moved.reference, found.error);
        }
        if (!found.ok || !found.found) {
            ui.info("One or more images not found in bundle repo. Skipping lock file update");
            result.outcome = RewriteOutcome::Skipped;
            result.ok = true;
            return result;
        }

        ImageDesc desc;
        desc.image = moved.reference;
        desc.tag = image.tag;
        desc.name = image.name;
        desc.metadata = image.metadata;
        desc.metadata_is_yaml = image.metadata_is_yaml;
        relocated.push_back(std::move(desc));
    }

    lock.images = std::move(relocated);

    ui.info("All images found in bundle repo. Updating lock file");
    auto written = write_lock_file(lock_path, serialize_images_lock(lock));
    if (!written.ok) {
        result.kind = written.kind;
        result.error = written.error;
        return result;
    }

    result.outcome = RewriteOutcome::Rewritten;
    result.ok = true;
    return result;
}

} // namespace imgkit
