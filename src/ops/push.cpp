#include "imgkit/push.hpp"
#include "imgkit/digest.hpp"
#include "imgkit/gzip.hpp"
#include "imgkit/image_lock.hpp"
#include "imgkit/manifest.hpp"
#include "imgkit/platform.hpp"
#include "imgkit/reference.hpp"
#include "imgkit/tar_image.hpp"

namespace imgkit {

namespace {

PushOutcome push_error(ErrorKind kind, const std::string& message) {
    PushOutcome result;
    result.kind = kind;
    result.error = message;
    return result;
}

// Removes the listed files when it goes out of scope
class TempFiles {
public:
    TempFiles() = default;
    ~TempFiles() {
        for (const auto& path : paths_) remove_file(path);
    }

    TempFiles(const TempFiles&) = delete;
    TempFiles& operator=(const TempFiles&) = delete;

    void add(const std::string& path) { paths_.push_back(path); }

private:
    std::vector<std::string> paths_;
};

bool has_bundle_lock(const std::string& dir) {
    return is_directory(dir) &&
           path_exists(join_path(join_path(dir, BUNDLE_DIR), IMAGE_LOCK_FILE));
}

bool has_bundle_dir(const std::string& dir) {
    return is_directory(dir) && path_exists(join_path(dir, BUNDLE_DIR));
}

} // namespace

PushOutcome run_push(const PushOptions& options, ImagesWriter& registry, spdlog::logger& ui) {
    auto parsed = parse_reference(options.reference, ReferenceValidation::Weak);
    if (!parsed.ok) {
        return push_error(parsed.kind, parsed.error);
    }
    const Reference& reference = parsed.reference;
    if (reference.is_digest()) {
        return push_error(ErrorKind::Usage, "Expected a tag reference to push to, got digest reference " +
                                                options.reference);
    }

    if (options.files.empty()) {
        return push_error(ErrorKind::Usage, "Expected at least one input file");
    }

    if (options.bundle) {
        int lock_dirs = 0;
        for (const auto& path : options.files) {
            if (has_bundle_lock(path)) ++lock_dirs;
        }
        if (lock_dirs != 1) {
            return push_error(ErrorKind::Usage, "Expected one directory to contain .imgpkg/images.yml");
        }
    } else {
        for (const auto& path : options.files) {
            if (has_bundle_dir(path)) {
                return push_error(ErrorKind::Usage,
                                  "Images cannot be pushed with '.imgpkg' directories, consider using --bundle (-b) option");
            }
        }
    }

    // Package
    TarImage tar_image(options.files, options.exclusions, ui);
    auto packaged = options.bundle ? tar_image.as_file_bundle() : tar_image.as_file_image();
    if (!packaged.ok) {
        return push_error(packaged.kind, packaged.error);
    }

    auto diff_id = digest_of_file(packaged.image->path());
    if (!diff_id.ok) {
        return push_error(diff_id.kind, diff_id.error);
    }

    TempFiles temps;

    auto layer_file = create_temp_file("imgkit-layer");
    if (!layer_file.ok) {
        return push_error(ErrorKind::Io, layer_file.error);
    }
    temps.add(layer_file.path);

    auto compressed = gzip_compress_file(packaged.image->path(), layer_file.path);
    if (!compressed.ok) {
        return push_error(compressed.kind, compressed.error);
    }

    auto layer_hash = digest_of_file(layer_file.path);
    if (!layer_hash.ok) {
        return push_error(layer_hash.kind, layer_hash.error);
    }

    // Config
    std::string config = make_image_config({diff_id.digest});
    auto config_hash = digest_of_bytes(config);
    if (!config_hash.ok) {
        return push_error(config_hash.kind, config_hash.error);
    }

    auto config_file = create_temp_file("imgkit-config");
    if (!config_file.ok) {
        return push_error(ErrorKind::Io, config_file.error);
    }
    temps.add(config_file.path);

    auto config_written = atomic_write_file(config_file.path, config, 0600);
    if (!config_written.ok) {
        return push_error(ErrorKind::Io, config_written.error);
    }

    // Manifest
    Manifest manifest;
    manifest.media_type = MEDIA_TYPE_OCI_MANIFEST;
    manifest.config.media_type = MEDIA_TYPE_OCI_CONFIG;
    manifest.config.digest = config_hash.digest;
    manifest.config.size = static_cast<int64_t>(config_hash.size);

    Descriptor layer;
    layer.media_type = MEDIA_TYPE_OCI_LAYER_GZIP;
    layer.digest = layer_hash.digest;
    layer.size = static_cast<int64_t>(layer_hash.size);
    manifest.layers.push_back(layer);

    if (packaged.image->is_bundle()) {
        manifest.annotations[BUNDLE_ANNOTATION] = "true";
    }

    // Upload
    auto pushed_layer = registry.push_blob(reference, layer, layer_file.path);
    if (!pushed_layer.ok) {
        return push_error(pushed_layer.kind, pushed_layer.error);
    }

    auto pushed_config = registry.push_blob(reference, manifest.config, config_file.path);
    if (!pushed_config.ok) {
        return push_error(pushed_config.kind, pushed_config.error);
    }

    auto pushed_manifest = registry.push_manifest(reference, manifest.media_type,
                                                  serialize_manifest(manifest));
    if (!pushed_manifest.ok) {
        return push_error(pushed_manifest.kind, pushed_manifest.error);
    }

    PushOutcome result;
    result.manifest_digest = pushed_manifest.digest;
    result.layer_digest = layer.digest;
    result.reference = reference.context_name() + "@" + pushed_manifest.digest;
    ui.info("Pushed '{}'", result.reference);

    if (!options.lock_output.empty()) {
        std::string content;
        if (options.bundle) {
            BundleLock lock;
            lock.url = result.reference;
            lock.tag = reference.tag;
            content = serialize_bundle_lock(lock);
        } else {
            ImagesLock lock;
            ImageDesc desc;
            desc.image = result.reference;
            desc.tag = reference.tag;
            lock.images.push_back(desc);
            content = serialize_images_lock(lock);
        }

        auto written = write_lock_file(options.lock_output, content);
        if (!written.ok) {
            return push_error(written.kind, "Writing lock file: " + written.error);
        }
    }

    result.ok = true;
    return result;
}

} // namespace imgkit
