#include "imgkit/pull.hpp"
#include "imgkit/classifier.hpp"
#include "imgkit/dir_image.hpp"
#include "imgkit/image_lock.hpp"
#include "imgkit/platform.hpp"
#include "imgkit/reference.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace imgkit {

namespace {

PullResult pull_error(ErrorKind kind, const std::string& message) {
    PullResult result;
    result.kind = kind;
    result.error = message;
    return result;
}

} // namespace

SourceResult select_reference_source(const std::string& image, const std::string& bundle,
                                     const std::string& lock_path) {
    SourceResult result;

    int given = 0;
    if (!lock_path.empty()) {
        result.source = {SourceKind::Lock, lock_path};
        ++given;
    }
    if (!image.empty()) {
        result.source = {SourceKind::Image, image};
        ++given;
    }
    if (!bundle.empty()) {
        result.source = {SourceKind::Bundle, bundle};
        ++given;
    }

    if (given == 0) {
        result.kind = ErrorKind::Usage;
        result.error = "Expected either image, bundle, or lock";
        return result;
    }
    if (given > 1) {
        result.kind = ErrorKind::Usage;
        result.error = "Expected only one of image, bundle, or lock";
        return result;
    }

    result.ok = true;
    return result;
}

bool is_disallowed_output_path(const std::string& output_path) {
    return output_path == "/" || output_path == "." || output_path == "..";
}

PullResult run_pull(const PullOptions& options, ImagesMetadata& registry, spdlog::logger& ui) {
    auto selected = select_reference_source(options.image, options.bundle, options.lock_path);
    if (!selected.ok) {
        return pull_error(selected.kind, selected.error);
    }
    const ReferenceSource& source = selected.source;

    if (options.output_path.empty()) {
        return pull_error(ErrorKind::Usage, "Expected output directory");
    }
    if (is_disallowed_output_path(options.output_path)) {
        return pull_error(ErrorKind::Usage, "Disallowed output directory (trying to avoid accidental deletion)");
    }

    std::string ref_text = source.value;
    if (source.kind == SourceKind::Lock) {
        auto lock = read_bundle_lock(source.value);
        if (!lock.ok) {
            return pull_error(lock.kind, "Reading bundle lock file: " + lock.error);
        }
        ref_text = lock.lock.url;
    }

    auto parsed = parse_reference(ref_text, ReferenceValidation::Weak);
    if (!parsed.ok) {
        return pull_error(parsed.kind, parsed.error);
    }
    const Reference& reference = parsed.reference;

    auto fetched = registry.manifest(reference);
    if (!fetched.ok) {
        return pull_error(fetched.kind, "Getting image manifest: " + fetched.error);
    }
    Manifest& manifest = fetched.manifest;

    PullIntent intent = source.kind == SourceKind::Image ? PullIntent::Image : PullIntent::Bundle;
    auto classified = check_artifact_kind(manifest, intent);
    if (!classified.ok) {
        return pull_error(classified.kind, classified.error);
    }

    PullResult result;
    result.reference = reference.context_name() + "@" + manifest.digest;
    result.bundle = manifest.is_bundle();
    ui.info("Pulling image '{}'", result.reference);

    std::error_code ec;
    fs::remove_all(options.output_path, ec);
    if (ec) {
        return pull_error(ErrorKind::Io, "Removing output directory: " + ec.message());
    }
    fs::create_directories(options.output_path, ec);
    if (!ec) {
        fs::permissions(options.output_path, fs::perms::owner_all, fs::perm_options::replace, ec);
    }
    if (ec) {
        return pull_error(ErrorKind::Io, "Creating output directory: " + ec.message());
    }

    // Layers are fetched by digest from the repository that served the manifest
    Reference pinned = with_digest(reference, manifest.digest);
    DirImage dir_image(options.output_path, pinned, manifest, registry, ui);
    auto extracted = dir_image.as_directory();
    if (!extracted.ok) {
        return pull_error(extracted.kind, "Extracting image into directory: " + extracted.error);
    }

    if (source.kind == SourceKind::Bundle) {
        auto rewritten = rewrite_image_lock(options.output_path, reference, registry, ui);
        if (!rewritten.ok) {
            return pull_error(rewritten.kind, "Rewriting image lock file: " + rewritten.error);
        }
        result.rewrite = rewritten.outcome;
    }

    result.ok = true;
    return result;
}

} // namespace imgkit
